#include "line_transport.hpp"

#include "json_codec.hpp"
#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <limits>

namespace taskbridge::transport {

FrameStatus read_frame(std::istream& in, std::string& out, std::size_t max_len) {
    out.clear();

    // One extra byte for a trailing '\r'.
    const std::size_t limit = max_len + 1;
    bool got_any = false;
    char ch;
    while (in.get(ch)) {
        got_any = true;
        if (ch == '\n') {
            break;
        }
        if (out.size() >= limit) {
            in.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
            out.clear();
            return FrameStatus::TooLong;
        }
        out.push_back(ch);
    }
    if (!got_any) {
        return FrameStatus::Eof;
    }

    if (!out.empty() && out.back() == '\r') {
        out.pop_back();
    }
    if (out.size() > max_len) {
        out.clear();
        return FrameStatus::TooLong;
    }
    return FrameStatus::Ok;
}

bool write_frame(std::ostream& out, const std::string& line, std::string& err) {
    err.clear();

    out.write(line.data(), static_cast<std::streamsize>(line.size()));
    out.put('\n');
    if (!out.good()) {
        err = "failed writing frame";
        return false;
    }

    out.flush();
    if (!out.good()) {
        err = "failed flushing output";
        return false;
    }

    return true;
}

FrameWriter::FrameWriter(std::ostream& out) : out_(&out) {}

FrameWriter::FrameWriter(LineHandler handler) : handler_(std::move(handler)) {}

bool FrameWriter::write(const Envelope& envelope) {
    return write_line(codec::encode(envelope));
}

bool FrameWriter::write_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (broken_) {
        return false;
    }

    if (handler_) {
        handler_(line);
        return true;
    }

    std::string err;
    if (!write_frame(*out_, line, err)) {
        LOG4CPLUS_ERROR(core_logger(), "write_frame error: " << err << "; dropping further output");
        broken_ = true;
        return false;
    }
    return true;
}

bool FrameWriter::healthy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !broken_;
}

} // namespace taskbridge::transport
