// -----------------------------------------------------------------------------
// errors.cpp: Error value helpers.
// See include/lorabroker/errors.hpp for the kind table.
// -----------------------------------------------------------------------------
#include "lorabroker/errors.hpp"

#include <utility>

namespace lorabroker {

Error::Error(ErrorKind k, std::string why)
: kind(k), reason(std::move(why)) {}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:        return "none";
        case ErrorKind::Structural:  return "structural";
        case ErrorKind::Behavioural: return "behavioural";
        case ErrorKind::Operational: return "operational";
    }
    return "unknown";
}

std::string to_pretty(const Error& err) {
    std::string s = "kind=";
    s += to_string(err.kind);
    if (!err.reason.empty()) {
        s += " reason=";
        s += err.reason;
    }
    return s;
}

} // namespace lorabroker
