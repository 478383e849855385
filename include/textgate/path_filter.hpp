#pragma once

#include <string>
#include <vector>

namespace textgate {

/// Version-control metadata directories excluded unless disabled.
std::vector<std::string> default_excludes();

/**
 * PathFilter
 *
 * Decides whether a path relative to the scan root is excluded.
 *
 *   - A glob without '/' is tested against every path component, so
 *     ".git" or "*.png" exclude at any depth.
 *   - A glob with '/' is tested against the whole relative path; '*' may
 *     cross separators. A trailing '/' only matches directories.
 *   - A leading '.' is an ordinary character: "*.png" also excludes
 *     ".logo.png", and "*" excludes dot-files.
 */
class PathFilter {
public:
    PathFilter() = default;
    explicit PathFilter(std::vector<std::string> globs);

    void add(const std::string& glob);

    bool excluded(const std::string& relative_path, bool is_directory) const;

    const std::vector<std::string>& globs() const { return globs_; }

private:
    std::vector<std::string> globs_;
};

} // namespace textgate
