#pragma once

#include <ostream>
#include <stdexcept>
#include <string>

namespace textgate {

enum class ScanStage { Initializing, Enumerating, Scanning, Reporting, Done, Aborted };

inline std::ostream& operator<<(std::ostream& os, ScanStage s) {
    switch (s) {
        case ScanStage::Initializing: return os << "initializing";
        case ScanStage::Enumerating:  return os << "enumerating";
        case ScanStage::Scanning:     return os << "scanning";
        case ScanStage::Reporting:    return os << "reporting";
        case ScanStage::Done:         return os << "done";
        case ScanStage::Aborted:      return os << "aborted";
        default:                      return os << "unknown";
    }
}

/**
 * GateError
 *
 * Base of every fatal error the gate can raise. A rule match is never an
 * error; it is reported through ScanReport instead.
 */
class GateError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Scan root is missing or is not a directory.
class InvalidTarget : public GateError {
public:
    explicit InvalidTarget(const std::string& what)
        : GateError("invalid target: " + what) {}
};

/// Rule definitions could not be read or are malformed.
class RuleSetError : public GateError {
public:
    explicit RuleSetError(const std::string& what)
        : GateError("rule set error: " + what), detail_(what) {}

    const std::string& detail() const { return detail_; }

private:
    std::string detail_;
};

/// Infrastructure fault during enumeration or scanning (I/O error, timeout).
class ScanAborted : public GateError {
public:
    ScanAborted(ScanStage stage, const std::string& what)
        : GateError("scan aborted: " + what), stage_(stage), detail_(what) {}

    ScanStage stage() const { return stage_; }
    const std::string& detail() const { return detail_; }

private:
    ScanStage   stage_;
    std::string detail_;
};

class UsageError : public GateError {
public:
    explicit UsageError(const std::string& what)
        : GateError("usage: " + what) {}
};

} // namespace textgate
