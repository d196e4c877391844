// ============================================================================
// slip_adapter.cpp: implementation for slip_adapter.hpp
// ============================================================================
#include "lorabroker/slip_adapter.hpp"
#include "lorabroker/slip.hpp"

#include <fcntl.h>      // ::open flags
#include <unistd.h>     // ::write, ::read, ::close
#include <cerrno>
#include <cstring>      // strerror
#include <memory>
#include <ostream>

namespace lorabroker {

// Absolute, printable, no embedded NUL.
static bool valid_path(const RawRecipient& raw) {
    if (raw.empty()) return false;
    if (raw.size() == 1 && raw[0] == '-') return true;
    if (raw[0] != '/') return false;
    for (uint8_t c : raw) {
        if (c < 0x20 || c == 0x7F) return false;
    }
    return true;
}

static std::string errno_text(const char* what, const std::string& path) {
    return std::string(what) + " " + path + ": " + std::strerror(errno);
}

SlipFileAdapter::SlipFileAdapter(std::ostream& out, const Logger& log)
: out_(out), log_(log.with_tag("adapter")) {}

Error SlipFileAdapter::resolve_recipient(const RawRecipient& raw, RecipientPtr& out) {
    if (!valid_path(raw))
        return Error(ErrorKind::Structural, "recipient is not an absolute path or '-'");
    out = std::make_shared<FileRecipient>(std::string(raw.begin(), raw.end()));
    return Error();
}

Error SlipFileAdapter::write_to(const FileRecipient& r, const std::vector<uint8_t>& frame) {
    if (r.is_stdout()) {
        out_.write(reinterpret_cast<const char*>(frame.data()),
                   static_cast<std::streamsize>(frame.size()));
        out_.flush();
        if (!out_) return Error(ErrorKind::Operational, "write to stdout failed");
        return Error();
    }

    int fd = ::open(r.path().c_str(), O_WRONLY | O_APPEND | O_CREAT | O_NOCTTY, 0644);
    if (fd < 0) return Error(ErrorKind::Operational, errno_text("open", r.path()));

    // Loop until the whole frame is out; ::write may be partial on a FIFO or tty.
    size_t off = 0;
    while (off < frame.size()) {
        ssize_t n = ::write(fd, frame.data() + off, frame.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            Error err(ErrorKind::Operational, errno_text("write", r.path()));
            ::close(fd);
            return err;
        }
        off += static_cast<size_t>(n);
    }

    if (::close(fd) != 0) return Error(ErrorKind::Operational, errno_text("close", r.path()));
    return Error();
}

Error SlipFileAdapter::send(const AppPacket& pkt, const std::vector<RecipientPtr>& recipients) {
    if (recipients.empty()) return Error(ErrorKind::Structural, "no recipient");

    std::vector<uint8_t> body;
    encode_app_packet(pkt, body);
    std::vector<uint8_t> frame;
    slip::append_frame(body.data(), body.size(), frame);

    for (const auto& rp : recipients) {
        auto fr = std::dynamic_pointer_cast<const FileRecipient>(rp);
        if (!fr) return Error(ErrorKind::Structural, "recipient was not resolved by this adapter");
        if (Error err = write_to(*fr, frame)) return err;
        ++frames_sent_;
        log_.debug("frame bytes=" + std::to_string(frame.size()) + " to=" + fr->path());
    }
    return Error();
}

Error read_frames(const std::string& path, std::vector<std::vector<uint8_t>>& frames) {
    int fd = ::open(path.c_str(), O_RDONLY | O_NOCTTY);
    if (fd < 0) return Error(ErrorKind::Operational, errno_text("open", path));

    slip::Decoder dec;
    uint8_t buf[512];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            Error err(ErrorKind::Operational, errno_text("read", path));
            ::close(fd);
            return err;
        }
        dec.feed(buf, static_cast<size_t>(n), frames);
    }
    ::close(fd);

    if (dec.errors() > 0)
        return Error(ErrorKind::Structural, std::to_string(dec.errors()) + " malformed frame(s) in " + path);
    return Error();
}

} // namespace lorabroker
