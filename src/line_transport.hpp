#pragma once

#include "protocol.hpp"

#include <cstddef>
#include <functional>
#include <istream>
#include <mutex>
#include <ostream>
#include <string>

namespace taskbridge::transport {

constexpr std::size_t kMaxFrameBytes = 1024u * 1024u;

enum class FrameStatus {
    Ok,
    Eof,
    TooLong,
};

// Reads one newline-delimited frame into out, without the delimiter and any
// trailing '\r'. TooLong frames are consumed and dropped; reading can go on.
FrameStatus read_frame(std::istream& in, std::string& out, std::size_t max_len = kMaxFrameBytes);

// Writes line plus '\n' and flushes. Returns false and sets err on failure.
bool write_frame(std::ostream& out, const std::string& line, std::string& err);

/**
 * Single output path for every producer (host loop, tick workers, log
 * relays). One complete frame is written before the next one starts.
 */
class FrameWriter {
public:
    using LineHandler = std::function<void(const std::string& line)>;

    explicit FrameWriter(std::ostream& out);
    explicit FrameWriter(LineHandler handler);

    FrameWriter(const FrameWriter&) = delete;
    FrameWriter& operator=(const FrameWriter&) = delete;

    bool write(const Envelope& envelope);
    bool write_line(const std::string& line);

    /// False once the output stream has failed (e.g. the host closed the pipe).
    bool healthy() const;

private:
    mutable std::mutex mutex_;
    std::ostream* out_ = nullptr;
    LineHandler handler_;
    bool broken_ = false;
};

} // namespace taskbridge::transport
