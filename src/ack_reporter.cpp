// ack_reporter.cpp: StreamAckNacker
#include "lorabroker/ack_reporter.hpp"
#include "lorabroker/types.hpp"

#include <ostream>

namespace lorabroker {

Error StreamAckNacker::ack(const std::optional<std::vector<uint8_t>>& response) {
    if (answered_) return Error(ErrorKind::Operational, "outcome already reported");
    answered_ = true;
    outcome_  = Error();

    out_ << "status=ack";
    if (response && !response->empty())
        out_ << " response=" << bytes_to_hex(response->data(), response->size());
    out_ << '\n';
    out_.flush();
    return Error();
}

Error StreamAckNacker::nack(const Error& reason) {
    if (answered_) return Error(ErrorKind::Operational, "outcome already reported");
    answered_ = true;
    outcome_  = reason;

    out_ << "status=nack " << to_pretty(reason) << '\n';
    out_.flush();
    return Error();
}

int exit_code(const Error& err) {
    switch (err.kind) {
        case ErrorKind::None:        return 0;
        case ErrorKind::Structural:  return 2;
        case ErrorKind::Behavioural: return 3;
        case ErrorKind::Operational: return 4;
    }
    return 1;
}

} // namespace lorabroker
