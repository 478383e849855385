#pragma once

#include "textgate/types.hpp"

#include <cstdio>
#include <sstream>
#include <string>

namespace textgate {

namespace json_detail {

inline std::string escape(const std::string& s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

inline std::string quoted(const std::string& s) {
    return "\"" + escape(s) + "\"";
}

template <typename T>
inline std::string str(const T& value) {
    std::ostringstream os;
    os << value;
    return os.str();
}

} // namespace json_detail

inline std::string to_json(const Violation& v) {
    std::ostringstream os;
    os << "{ \"path\": "  << json_detail::quoted(v.path)
       << ", \"line\": "  << v.line
       << ", \"rule\": "  << json_detail::quoted(v.rule_id)
       << ", \"match\": " << json_detail::quoted(v.matched)
       << ", \"text\": "  << json_detail::quoted(v.text)
       << " }";
    return os.str();
}

inline std::string to_json(const SkippedFile& s) {
    std::ostringstream os;
    os << "{ \"path\": "   << json_detail::quoted(s.path)
       << ", \"reason\": " << json_detail::quoted(json_detail::str(s.reason))
       << " }";
    return os.str();
}

inline std::string to_json(const ScanReport& report) {
    std::ostringstream os;
    os << "{\n"
       << "  \"verdict\": " << json_detail::quoted(json_detail::str(report.verdict())) << ",\n"
       << "  \"violations\": [";
    for (std::size_t i = 0; i < report.violations.size(); ++i) {
        os << "\n    " << to_json(report.violations[i]);
        if (i + 1 < report.violations.size()) os << ",";
    }
    os << (report.violations.empty() ? "],\n" : "\n  ],\n")
       << "  \"stats\": {\n"
       << "    \"candidates\": " << report.stats.candidates << ",\n"
       << "    \"scanned\": "    << report.stats.scanned << ",\n"
       << "    \"skipped\": [";
    const auto& skipped = report.stats.skipped;
    for (std::size_t i = 0; i < skipped.size(); ++i) {
        os << "\n      " << to_json(skipped[i]);
        if (i + 1 < skipped.size()) os << ",";
    }
    os << (skipped.empty() ? "]\n" : "\n    ]\n")
       << "  }\n"
       << "}";
    return os.str();
}

} // namespace textgate
