#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace ProcBridge {

// Upper bound for a single payload, checked before any allocation
constexpr size_t kDefaultMaxPayloadBytes = 10 * 1024 * 1024;
constexpr size_t kMaxHeaderLineBytes = 4096;

/**
 * @brief Parsed event header line
 *
 * All tokens are kept in `fields`, recognised ones are also exposed
 * through the accessors. Unknown keys are preserved but ignored.
 */
struct FrameHeader {
    std::map<std::string, std::string> fields;
    size_t len = 0;

    std::string get(const std::string& key) const;
    bool has(const std::string& key) const { return fields.count(key) != 0; }

    std::string eventName() const { return get("eventname"); }
    std::string serial() const { return get("serial"); }
    std::string version() const { return get("ver"); }
    std::string server() const { return get("server"); }
    std::string pool() const { return get("pool"); }
    std::string poolSerial() const { return get("poolserial"); }
};

/**
 * @brief Parse a `key:value key:value ...` header line (without newline)
 * @param line Header line as read from the event channel
 * @param maxPayload Largest accepted `len`
 * @return FrameHeader with `len` validated
 * @throws ProtocolError if a token has no ':' separator or `len` is
 *         missing, non-numeric or larger than maxPayload
 */
FrameHeader parseHeaderLine(const std::string& line, size_t maxPayload = kDefaultMaxPayloadBytes);

/**
 * @brief Split space separated `key:value` tokens into a map
 *
 * Tokens without ':' are skipped. Only the first ':' separates key from
 * value, so values may themselves contain ':'.
 */
std::map<std::string, std::string> parseKeyValueTokens(const std::string& text);

} // namespace ProcBridge
