#include <procbridge/core/protocol/duplex_stream.hpp>
#include <procbridge/core/protocol/errors.hpp>
#include <procbridge/core/protocol/frame_parser.hpp>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace ProcBridge {

namespace {
constexpr int kPollSliceMs = 200;
constexpr size_t kReadChunk = 4096;
} // anonymous namespace

FdDuplexStream::FdDuplexStream(int inFd,
                               int outFd,
                               std::chrono::milliseconds idleTimeout,
                               const std::atomic<bool>* stopFlag)
    : in_fd_(inFd), out_fd_(outFd), idle_timeout_(idleTimeout), stop_flag_(stopFlag) {
}

void FdDuplexStream::fill() {
    // Compact consumed prefix before appending more data
    if (in_offset_ > 0) {
        in_buffer_.erase(0, in_offset_);
        in_offset_ = 0;
    }

    const bool bounded = idle_timeout_.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + idle_timeout_;

    while (true) {
        if (stop_flag_ && stop_flag_->load(std::memory_order_acquire))
            throw InterruptedError("Stop requested while waiting for event channel");

        int slice = kPollSliceMs;
        if (bounded) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0)
                throw TimeoutError("No data on event channel for " +
                                   std::to_string(idle_timeout_.count()) + " ms");
            slice = static_cast<int>(std::min<long long>(remaining, kPollSliceMs));
        }

        pollfd pfd{};
        pfd.fd = in_fd_;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, slice);
        if (rc < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("poll() on event channel failed: ") + std::strerror(errno));
        }
        if (rc == 0) continue;

        char chunk[kReadChunk];
        ssize_t n = ::read(in_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            throw TransportError(std::string("read() on event channel failed: ") + std::strerror(errno));
        }
        if (n == 0)
            throw TransportError("Event channel closed by peer");

        in_buffer_.append(chunk, static_cast<size_t>(n));
        return;
    }
}

std::string FdDuplexStream::readLine() {
    while (true) {
        auto pos = in_buffer_.find('\n', in_offset_);
        if (pos != std::string::npos) {
            std::string line = in_buffer_.substr(in_offset_, pos - in_offset_);
            in_offset_ = pos + 1;
            return line;
        }
        if (in_buffer_.size() - in_offset_ > kMaxHeaderLineBytes)
            throw ProtocolError("Header line exceeds " + std::to_string(kMaxHeaderLineBytes) +
                                " bytes without a newline");
        fill();
    }
}

std::string FdDuplexStream::readExact(size_t n) {
    while (in_buffer_.size() - in_offset_ < n) {
        fill();
    }
    std::string out = in_buffer_.substr(in_offset_, n);
    in_offset_ += n;
    return out;
}

void FdDuplexStream::write(const std::string& data) {
    out_buffer_ += data;
}

void FdDuplexStream::flush() {
    size_t written = 0;
    while (written < out_buffer_.size()) {
        ssize_t n = ::write(out_fd_, out_buffer_.data() + written, out_buffer_.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            out_buffer_.clear();
            throw TransportError(std::string("write() on event channel failed: ") + std::strerror(errno));
        }
        written += static_cast<size_t>(n);
    }
    out_buffer_.clear();
}

} // namespace ProcBridge
