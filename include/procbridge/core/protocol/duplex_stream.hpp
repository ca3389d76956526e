#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>

namespace ProcBridge {

/**
 * @class DuplexStream
 * @brief Byte-stream pair the listener protocol runs over
 *
 * Production uses the process stdin/stdout (FdDuplexStream); tests inject
 * a scripted in-memory stream.
 */
class DuplexStream {
public:
    virtual ~DuplexStream() = default;

    /**
     * @brief Read up to and excluding the next '\n'
     * @throws TransportError on EOF or read failure
     * @throws TimeoutError if the idle timeout expires
     * @throws InterruptedError if a stop was requested while waiting
     * @throws ProtocolError if the line grows past kMaxHeaderLineBytes
     */
    virtual std::string readLine() = 0;

    /**
     * @brief Read exactly n bytes
     * @throws same as readLine()
     */
    virtual std::string readExact(size_t n) = 0;

    /**
     * @brief Queue bytes for output; nothing is visible until flush()
     */
    virtual void write(const std::string& data) = 0;

    /**
     * @brief Push all queued bytes to the peer
     * @throws TransportError on write failure
     */
    virtual void flush() = 0;
};

/**
 * @class FdDuplexStream
 * @brief DuplexStream over two raw file descriptors
 *
 * Reads poll() in short slices so that the idle timeout and the stop flag
 * are honoured while blocked. An idle timeout of zero waits forever.
 */
class FdDuplexStream : public DuplexStream {
public:
    FdDuplexStream(int inFd,
                   int outFd,
                   std::chrono::milliseconds idleTimeout = std::chrono::milliseconds(0),
                   const std::atomic<bool>* stopFlag = nullptr);
    ~FdDuplexStream() override = default;

    FdDuplexStream(const FdDuplexStream&) = delete;
    FdDuplexStream& operator=(const FdDuplexStream&) = delete;

    std::string readLine() override;
    std::string readExact(size_t n) override;
    void write(const std::string& data) override;
    void flush() override;

private:
    void fill();

    int in_fd_;
    int out_fd_;
    std::chrono::milliseconds idle_timeout_;
    const std::atomic<bool>* stop_flag_;

    std::string in_buffer_;
    size_t in_offset_ = 0;
    std::string out_buffer_;
};

} // namespace ProcBridge
