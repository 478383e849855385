#include "textgate/scanner.hpp"
#include "textgate/errors.hpp"
#include "textgate/log.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <functional>
#include <iterator>
#include <mutex>
#include <sstream>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace textgate {

namespace {

using Clock = std::chrono::steady_clock;

// Deadline checks inside a file happen once per this many lines.
constexpr std::size_t kDeadlineStride = 4096;
constexpr std::size_t kReadChunk = 64 * 1024;

struct Candidate {
    std::string    relative;
    fs::path       absolute;
    std::uintmax_t size = 0;
};

// Per-worker results, merged after join.
struct Partial {
    std::vector<Violation>   violations;
    std::vector<SkippedFile> skipped;
    std::size_t              scanned = 0;
};

class Deadline {
public:
    Deadline(Clock::time_point start, std::optional<std::chrono::milliseconds> budget)
        : budget_(budget) {
        if (!budget_) return;
        // Saturate instead of overflowing the clock's nanosecond count.
        auto room = std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::time_point::max() - start);
        if (*budget_ >= room) at_ = Clock::time_point::max();
        else at_ = start + std::chrono::duration_cast<Clock::duration>(*budget_);
    }

    bool expired() const { return budget_ && Clock::now() >= at_; }

    std::string describe() const {
        return "timeout of " + std::to_string(budget_ ? budget_->count() : 0) + " ms exceeded";
    }

private:
    std::optional<std::chrono::milliseconds> budget_;
    Clock::time_point                        at_;
};

void enter(ScanStage stage) {
    std::ostringstream os;
    os << "stage: " << stage;
    log::debug(os.str());
}

std::string io_error(const std::string& what, const std::error_code& ec) {
    return what + ": " + ec.message();
}

// "dir/" iterates as "dir//name"; strip the empty trailing element.
fs::path scan_base(const fs::path& root) {
    fs::path base = root.lexically_normal();
    if (!base.has_filename() && base.has_relative_path()) base = base.parent_path();
    return base;
}

void check_target(const fs::path& root) {
    std::error_code ec;
    auto st = fs::status(root, ec);
    bool missing = ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory;
    if (ec && !missing) throw InvalidTarget(io_error(root.string(), ec));
    if (!fs::exists(st)) throw InvalidTarget(root.string() + ": no such directory");
    if (!fs::is_directory(st)) throw InvalidTarget(root.string() + ": not a directory");

    fs::directory_iterator probe(root, ec);
    if (ec) throw InvalidTarget(io_error(root.string() + ": not readable", ec));
}

std::vector<Candidate> enumerate(const fs::path& base,
                                 const PathFilter& filter,
                                 const Deadline& deadline) {
    std::vector<Candidate> files;
    std::error_code ec;
    fs::recursive_directory_iterator it(base, fs::directory_options::none, ec);
    if (ec) throw ScanAborted(ScanStage::Enumerating, io_error(base.string(), ec));

    for (const fs::recursive_directory_iterator end {}; it != end;) {
        if (deadline.expired()) throw ScanAborted(ScanStage::Enumerating, deadline.describe());

        const fs::directory_entry& entry = *it;
        std::string relative = entry.path().lexically_relative(base).generic_string();

        auto st = entry.symlink_status(ec);
        if (ec) throw ScanAborted(ScanStage::Enumerating, io_error(relative, ec));

        if (fs::is_directory(st)) {
            if (filter.excluded(relative, true)) {
                log::debug("excluded directory " + relative);
                it.disable_recursion_pending();
            }
        } else if (fs::is_regular_file(st)) {
            if (filter.excluded(relative, false)) {
                log::debug("excluded " + relative);
            } else {
                auto size = entry.file_size(ec);
                if (ec) throw ScanAborted(ScanStage::Enumerating, io_error(relative, ec));
                files.push_back({ std::move(relative), entry.path(), size });
            }
        }
        // Symlinks, sockets and devices are never read.

        it.increment(ec);
        if (ec) throw ScanAborted(ScanStage::Enumerating, io_error(base.string(), ec));
    }

    std::sort(files.begin(), files.end(), [](const Candidate& a, const Candidate& b) {
        return a.relative < b.relative;
    });
    return files;
}

// Reads at most `limit` + 1 bytes, so a growing file cannot stall the scan.
bool read_bounded(const Candidate& file, std::uintmax_t limit, std::string& content) {
    std::ifstream in(file.absolute, std::ios::binary);
    if (!in.is_open()) {
        std::error_code ec(errno, std::generic_category());
        throw ScanAborted(ScanStage::Scanning, io_error(file.relative + ": cannot open", ec));
    }

    content.clear();
    char chunk[kReadChunk];
    while (in) {
        in.read(chunk, sizeof(chunk));
        content.append(chunk, static_cast<std::size_t>(in.gcount()));
        if (content.size() > limit) return false;
    }
    if (in.bad()) throw ScanAborted(ScanStage::Scanning, file.relative + ": read error");
    return true;
}

std::size_t longest_line(const std::string& content) {
    std::size_t longest = 0;
    std::size_t pos = 0;
    while (pos < content.size()) {
        std::size_t nl = content.find('\n', pos);
        std::size_t stop = nl == std::string::npos ? content.size() : nl;
        longest = std::max(longest, stop - pos);
        pos = stop + 1;
    }
    return longest;
}

void scan_lines(const Candidate& file,
                const std::string& content,
                const RuleSet& rules,
                const Deadline& deadline,
                std::vector<Violation>& out) {
    std::size_t pos = 0;
    // A UTF-8 byte-order mark is not part of the first line's text.
    if (content.compare(0, 3, "\xEF\xBB\xBF") == 0) pos = 3;

    std::size_t line_no = 0;
    std::string line;
    while (pos < content.size()) {
        std::size_t nl = content.find('\n', pos);
        std::size_t stop = nl == std::string::npos ? content.size() : nl;
        line.assign(content, pos, stop - pos);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        ++line_no;
        pos = stop + 1;

        if (line_no % kDeadlineStride == 0 && deadline.expired())
            throw ScanAborted(ScanStage::Scanning, deadline.describe());

        for (const auto& rule : rules) {
            if (auto hit = rule.match(line)) {
                out.push_back({ file.relative, line_no, rule.id, std::move(*hit), line });
            }
        }
    }
}

void scan_file(const Candidate& file,
               const RuleSet& rules,
               const ScanOptions& options,
               const Deadline& deadline,
               Partial& out) {
    auto skip = [&](SkipReason reason) {
        std::ostringstream os;
        os << "skipped " << file.relative << " (" << reason << ")";
        log::debug(os.str());
        out.skipped.push_back({ file.relative, reason });
    };

    if (file.size > options.max_file_size) return skip(SkipReason::TooLarge);

    std::string content;
    if (!read_bounded(file, options.max_file_size, content)) return skip(SkipReason::TooLarge);
    if (looks_binary(content)) return skip(SkipReason::Binary);
    if (!valid_utf8(content)) return skip(SkipReason::Undecodable);
    if (rules.has_regex() && longest_line(content) > options.max_line_length)
        return skip(SkipReason::LongLine);

    scan_lines(file, content, rules, deadline, out.violations);
    ++out.scanned;
}

unsigned worker_count(unsigned requested, std::size_t files) {
    unsigned n = requested;
    if (n == 0) n = std::max(1u, std::thread::hardware_concurrency());
    if (files < n) n = static_cast<unsigned>(std::max<std::size_t>(files, 1));
    return n;
}

} // namespace

// ── Content classification ────────────────────────────────────────────────────

bool looks_binary(const std::string& content) {
    std::size_t probe = std::min(content.size(), kBinaryProbeBytes);
    return std::memchr(content.data(), '\0', probe) != nullptr;
}

bool valid_utf8(const std::string& content) {
    const auto* s = reinterpret_cast<const unsigned char*>(content.data());
    const std::size_t n = content.size();
    std::size_t i = 0;
    while (i < n) {
        unsigned char c = s[i];
        if (c < 0x80) { ++i; continue; }

        std::size_t len;
        unsigned char lo = 0x80, hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF)      { len = 2; }
        else if (c == 0xE0)              { len = 3; lo = 0xA0; }
        else if (c == 0xED)              { len = 3; hi = 0x9F; }   // no surrogates
        else if (c >= 0xE1 && c <= 0xEF) { len = 3; }
        else if (c == 0xF0)              { len = 4; lo = 0x90; }
        else if (c >= 0xF1 && c <= 0xF3) { len = 4; }
        else if (c == 0xF4)              { len = 4; hi = 0x8F; }   // <= U+10FFFF
        else return false;

        if (i + len > n) return false;
        if (s[i + 1] < lo || s[i + 1] > hi) return false;
        for (std::size_t k = 2; k < len; ++k)
            if (s[i + k] < 0x80 || s[i + k] > 0xBF) return false;
        i += len;
    }
    return true;
}

// ── Scanner ───────────────────────────────────────────────────────────────────

Scanner::Scanner(ScanOptions options) : options_(std::move(options)) {}

ScanReport Scanner::scan(const fs::path& root, const RuleSet& rules) const {
    const Deadline deadline(Clock::now(), options_.timeout);

    enter(ScanStage::Initializing);
    check_target(root);
    const fs::path base = scan_base(root);

    enter(ScanStage::Enumerating);
    const std::vector<Candidate> files = enumerate(base, options_.excludes, deadline);
    log::debug("candidates: " + std::to_string(files.size()));

    enter(ScanStage::Scanning);
    const unsigned n = worker_count(options_.threads, files.size());
    std::vector<Partial> partials(n);
    std::atomic<std::size_t> next { 0 };
    std::atomic<bool> stop { false };
    std::mutex failure_mtx;
    std::optional<std::string> failure;

    auto abort_with = [&](const std::string& message) {
        std::lock_guard<std::mutex> lk(failure_mtx);
        if (!failure) failure = message;
        stop = true;
    };

    auto worker = [&](Partial& out) {
        while (!stop) {
            std::size_t i = next++;
            if (i >= files.size()) break;
            if (deadline.expired()) {
                abort_with(deadline.describe());
                break;
            }
            try {
                scan_file(files[i], rules, options_, deadline, out);
            } catch (const ScanAborted& e) {
                abort_with(e.detail());
            } catch (const std::exception& e) {
                abort_with(files[i].relative + ": " + e.what());
            }
        }
    };

    std::vector<std::thread> pool;
    try {
        for (unsigned t = 1; t < n; ++t) pool.emplace_back(worker, std::ref(partials[t]));
    } catch (const std::system_error& e) {
        abort_with(std::string("cannot start worker thread: ") + e.what());
    }
    worker(partials[0]);
    for (auto& th : pool) th.join();

    if (failure) {
        enter(ScanStage::Aborted);
        throw ScanAborted(ScanStage::Scanning, *failure);
    }

    enter(ScanStage::Reporting);
    ScanReport report;
    report.stats.candidates = files.size();
    for (auto& p : partials) {
        report.stats.scanned += p.scanned;
        std::move(p.violations.begin(), p.violations.end(), std::back_inserter(report.violations));
        std::move(p.skipped.begin(), p.skipped.end(), std::back_inserter(report.stats.skipped));
    }

    // One worker handles a whole file, so each file's violations are already
    // in (line, rule) order; a stable sort by path restores global order.
    std::stable_sort(report.violations.begin(), report.violations.end(),
                     [](const Violation& a, const Violation& b) { return a.path < b.path; });
    std::sort(report.stats.skipped.begin(), report.stats.skipped.end(),
              [](const SkippedFile& a, const SkippedFile& b) { return a.path < b.path; });

    enter(ScanStage::Done);
    return report;
}

ScanReport scan(const fs::path& root,
                const RuleSet& rules,
                const std::vector<std::string>& exclude_patterns) {
    ScanOptions options;
    for (const auto& glob : exclude_patterns) options.excludes.add(glob);
    return Scanner(std::move(options)).scan(root, rules);
}

} // namespace textgate
