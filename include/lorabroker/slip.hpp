#pragma once
/**
 * @file slip.hpp
 * @brief SLIP (RFC 1055) framing for handler-bound byte streams.
 *
 * @details
 * The broker hands application packets to handlers over plain byte streams:
 * a regular file, a FIFO, a tty, stdout piped into something else. SLIP puts
 * a boundary around each packet so the reading side never has to guess.
 *
 * | Byte    | Value | Meaning                              |
 * |---------|-------|--------------------------------------|
 * | END     | 0xC0  | frame boundary                       |
 * | ESC     | 0xDB  | next byte is an escape code          |
 * | ESC_END | 0xDC  | after ESC: literal 0xC0              |
 * | ESC_ESC | 0xDD  | after ESC: literal 0xDB              |
 *
 * Frames are written as `END payload END`. Leading END lets a reader that
 * attached mid-stream throw away the partial frame it walked into.
 *
 * Decoder behaviour:
 *  - bytes before the first END are ignored
 *  - `END END` is an empty frame and is skipped
 *  - ESC followed by anything but ESC_END/ESC_ESC drops the frame being built
 *    and counts one error; the decoder resyncs on the next END
 *
 * @code
 *   std::vector<uint8_t> wire;
 *   lorabroker::slip::append_frame(pkt.data(), pkt.size(), wire);
 *
 *   lorabroker::slip::Decoder dec;
 *   std::vector<uint8_t> frame;
 *   for (uint8_t b : wire)
 *     if (dec.feed(b, frame)) handle(frame);
 * @endcode
 */

#include <stdint.h>
#include <stddef.h>
#include <vector>

namespace lorabroker {
namespace slip {

static constexpr uint8_t END     = 0xC0;
static constexpr uint8_t ESC     = 0xDB;
static constexpr uint8_t ESC_END = 0xDC;
static constexpr uint8_t ESC_ESC = 0xDD;

/// @brief Append one framed copy of `in[0..n)` to `out`. Existing contents are kept.
inline void append_frame(const uint8_t* in, size_t n, std::vector<uint8_t>& out) {
    out.reserve(out.size() + n * 2 + 2);
    out.push_back(END);
    for (size_t i = 0; i < n; ++i) {
        switch (in[i]) {
            case END: out.push_back(ESC); out.push_back(ESC_END); break;
            case ESC: out.push_back(ESC); out.push_back(ESC_ESC); break;
            default:  out.push_back(in[i]);                       break;
        }
    }
    out.push_back(END);
}

/// @brief Frame `payload` into a fresh buffer.
inline std::vector<uint8_t> encode(const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> out;
    append_frame(payload.data(), payload.size(), out);
    return out;
}

/**
 * @brief Byte-at-a-time frame reassembly.
 *
 * Holds the partial frame between calls, so it can be fed straight from a
 * read() loop of any chunk size.
 */
class Decoder {
public:
  /// @return true when `b` closed a non-empty frame; `frame` then holds its payload.
  bool feed(uint8_t b, std::vector<uint8_t>& frame) {
    if (b == END) {
      bool done = in_frame_ && !buf_.empty();
      if (done) {
        frame.swap(buf_);
        in_frame_ = false;
      } else {
        in_frame_ = true;
      }
      buf_.clear();
      esc_ = false;
      return done;
    }
    if (!in_frame_) return false;

    if (esc_) {
      esc_ = false;
      if      (b == ESC_END) buf_.push_back(END);
      else if (b == ESC_ESC) buf_.push_back(ESC);
      else { buf_.clear(); in_frame_ = false; ++errors_; }
      return false;
    }
    if (b == ESC) { esc_ = true; return false; }

    buf_.push_back(b);
    return false;
  }

  /// @brief Feed a whole chunk, appending each completed frame to `frames`.
  size_t feed(const uint8_t* data, size_t n, std::vector<std::vector<uint8_t>>& frames) {
    size_t got = 0;
    std::vector<uint8_t> frame;
    for (size_t i = 0; i < n; ++i) {
      if (feed(data[i], frame)) { frames.push_back(frame); ++got; }
    }
    return got;
  }

  /// Malformed escapes seen so far.
  size_t errors() const { return errors_; }

  /// True while bytes of an unfinished frame are buffered.
  bool pending() const { return in_frame_ && !buf_.empty(); }

  void reset() { buf_.clear(); esc_ = false; in_frame_ = false; }

private:
  std::vector<uint8_t> buf_;
  bool   esc_      = false;
  bool   in_frame_ = false;
  size_t errors_   = 0;
};

} // namespace slip
} // namespace lorabroker
