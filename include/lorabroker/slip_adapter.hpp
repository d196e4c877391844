/**
 * @file slip_adapter.hpp
 * @brief Adapter that delivers application packets as SLIP frames to files.
 *
 * @details
 * A recipient descriptor is the UTF-8 bytes of a path:
 *
 * | Descriptor          | Meaning                                   |
 * |---------------------|-------------------------------------------|
 * | `-`                 | the adapter's stdout stream               |
 * | `/abs/path`         | appended to; regular file, FIFO or tty    |
 * | empty, relative, control characters | Structural, not resolvable |
 *
 * send() encodes the packet once (see app_packet.hpp), frames it with SLIP
 * and appends the frame to every recipient in order. The first open or write
 * failure stops the loop and is reported as Operational.
 *
 * Paths are opened per send with O_APPEND so several broker processes can
 * share one handler file without interleaving inside a frame (for frames
 * up to PIPE_BUF on a FIFO, and in practice on local files).
 */
#ifndef LORABROKER_SLIP_ADAPTER_HPP
#define LORABROKER_SLIP_ADAPTER_HPP

#include "app_packet.hpp"
#include "errors.hpp"
#include "interfaces.hpp"
#include "log.hpp"
#include "types.hpp"

#include <iosfwd>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace lorabroker {

/// A recipient resolved by SlipFileAdapter.
class FileRecipient : public Recipient {
public:
  explicit FileRecipient(std::string path) : path_(std::move(path)) {}

  std::string describe() const override { return path_; }
  const std::string& path() const { return path_; }
  bool is_stdout() const { return path_ == "-"; }

private:
  std::string path_;
};

class SlipFileAdapter : public Adapter {
public:
  /// `out` backs the "-" descriptor and must outlive the adapter.
  SlipFileAdapter(std::ostream& out, const Logger& log);

  Error resolve_recipient(const RawRecipient& raw, RecipientPtr& out) override;
  Error send(const AppPacket& pkt, const std::vector<RecipientPtr>& recipients) override;

  /// Frames written since construction.
  size_t frames_sent() const { return frames_sent_; }

private:
  Error write_to(const FileRecipient& r, const std::vector<uint8_t>& frame);

  std::ostream& out_;
  Logger        log_;
  size_t        frames_sent_ = 0;
};

/// @brief Read every SLIP frame in `path`. Operational if the file cannot be read.
Error read_frames(const std::string& path, std::vector<std::vector<uint8_t>>& frames);

} // namespace lorabroker

#endif // LORABROKER_SLIP_ADAPTER_HPP
