#pragma once
#include <stdexcept>
#include <string>

namespace ProcBridge {

/**
 * @brief Malformed framing on the event channel (fatal to the bridge loop)
 */
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Read or write on the event channel failed (EOF, EIO, ...)
 */
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief No data arrived within the configured idle-read timeout
 */
class TimeoutError : public std::runtime_error {
public:
    explicit TimeoutError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Stop was requested (SIGTERM/SIGINT) while waiting for input
 */
class InterruptedError : public std::runtime_error {
public:
    explicit InterruptedError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace ProcBridge
