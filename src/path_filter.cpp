#include "textgate/path_filter.hpp"

#include <fnmatch.h>

namespace textgate {

std::vector<std::string> default_excludes() {
    return { ".git", ".hg", ".svn" };
}

PathFilter::PathFilter(std::vector<std::string> globs) {
    for (const auto& g : globs) add(g);
}

void PathFilter::add(const std::string& glob) {
    if (!glob.empty()) globs_.push_back(glob);
}

bool PathFilter::excluded(const std::string& relative_path, bool is_directory) const {
    for (std::string glob : globs_) {
        bool dir_only = glob.size() > 1 && glob.back() == '/';
        if (dir_only) {
            glob.pop_back();
            if (!is_directory) continue;
        }

        if (glob.find('/') != std::string::npos) {
            if (::fnmatch(glob.c_str(), relative_path.c_str(), 0) == 0) return true;
            continue;
        }

        // Component match. Only the last component can be a file.
        std::size_t start = 0;
        while (start <= relative_path.size()) {
            std::size_t end = relative_path.find('/', start);
            bool last = end == std::string::npos;
            if (last) end = relative_path.size();
            if (!dir_only || !last || is_directory) {
                std::string component = relative_path.substr(start, end - start);
                if (::fnmatch(glob.c_str(), component.c_str(), 0) == 0) return true;
            }
            if (last) break;
            start = end + 1;
        }
    }
    return false;
}

} // namespace textgate
