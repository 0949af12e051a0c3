#pragma once

/**
 * @file Protocol.h
 * @brief Wire framing shared by sender and receiver
 *
 * One connection carries a sequence of units:
 * @code
 * sender:   <name>|<size>\n  <size raw bytes>
 * receiver: OK | BAD
 * ...
 * sender:   DONE\n
 * @endcode
 * The manifest unit is always first. Acknowledgement tokens are sent as
 * bare bytes without a terminator.
 */

#include "Result.h"

#include <cstdint>
#include <string>

namespace Chunkwise {
namespace Protocol {

constexpr const char* DONE_LINE = "DONE";
constexpr const char* ACK_OK = "OK";
constexpr const char* ACK_BAD = "BAD";
constexpr char FIELD_SEPARATOR = '|';

// Longer announcement lines mean the stream is out of sync
constexpr size_t MAX_LINE_LENGTH = 4096;

struct Announcement {
    std::string name;
    uint64_t size = 0;
};

/// "<name>|<size>\n"
std::string formatAnnouncement(const std::string& name, uint64_t size);

/**
 * @brief Parse an announcement line (without its trailing newline)
 *
 * Requires exactly one separator, a non-empty name and a decimal size.
 * Fails with InvalidHeader.
 */
Result<Announcement> parseAnnouncement(const std::string& line);

bool isDoneLine(const std::string& line);

/// Name usable as a file in the receiver's storage directory
bool isSafeUnitName(const std::string& name);

enum class AckMatch {
    Incomplete,   // a strict prefix of a token, need more bytes
    Ok,
    Bad,
    Garbled
};

/// Classify the bytes received so far (leading whitespace ignored)
AckMatch matchAck(const std::string& received);

} // namespace Protocol
} // namespace Chunkwise
