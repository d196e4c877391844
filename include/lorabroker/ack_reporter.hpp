/**
 * @file ack_reporter.hpp
 * @brief AckNacker that prints the outcome as one key=value line.
 *
 * Output, one line per broker call:
 * ```
 * status=ack
 * status=nack kind=behavioural reason=no device authenticates this frame
 * ```
 * The outcome is also kept, so the CLI can turn it into an exit status.
 * A second ack()/nack() on the same instance is refused with Operational;
 * the first outcome stands.
 */
#ifndef LORABROKER_ACK_REPORTER_HPP
#define LORABROKER_ACK_REPORTER_HPP

#include "errors.hpp"
#include "interfaces.hpp"

#include <iosfwd>
#include <optional>
#include <vector>

namespace lorabroker {

class StreamAckNacker : public AckNacker {
public:
  explicit StreamAckNacker(std::ostream& out) : out_(out) {}

  Error ack(const std::optional<std::vector<uint8_t>>& response) override;
  Error nack(const Error& reason) override;

  bool answered() const { return answered_; }
  bool acked() const { return answered_ && !outcome_; }
  /// The nack reason; kind None after an ack or before any answer.
  const Error& outcome() const { return outcome_; }

private:
  std::ostream& out_;
  bool  answered_ = false;
  Error outcome_;
};

/// @brief CLI exit status for an outcome: 0 ack, 2 structural, 3 behavioural, 4 operational.
int exit_code(const Error& err);

} // namespace lorabroker

#endif // LORABROKER_ACK_REPORTER_HPP
