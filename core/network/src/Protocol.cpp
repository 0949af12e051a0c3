#include "Protocol.h"
#include "Manifest.h"

#include <cstring>
#include <limits>

namespace Chunkwise {
namespace Protocol {

std::string formatAnnouncement(const std::string& name, uint64_t size) {
    return name + FIELD_SEPARATOR + std::to_string(size) + "\n";
}

Result<Announcement> parseAnnouncement(const std::string& line) {
    std::string text = line;
    while (!text.empty() && (text.back() == '\r' || text.back() == ' ' || text.back() == '\t')) {
        text.pop_back();
    }

    auto sep = text.find(FIELD_SEPARATOR);
    if (sep == std::string::npos || text.find(FIELD_SEPARATOR, sep + 1) != std::string::npos) {
        return Err<Announcement>(ErrorCode::InvalidHeader, "Expected <name>|<size>, got '" + line + "'");
    }

    Announcement announcement;
    announcement.name = text.substr(0, sep);
    std::string sizeField = text.substr(sep + 1);
    if (announcement.name.empty()) {
        return Err<Announcement>(ErrorCode::InvalidHeader, "Empty unit name in '" + line + "'");
    }
    if (sizeField.empty()) {
        return Err<Announcement>(ErrorCode::InvalidHeader, "Missing size in '" + line + "'");
    }

    uint64_t size = 0;
    const uint64_t limit = std::numeric_limits<uint64_t>::max();
    for (char c : sizeField) {
        if (c < '0' || c > '9') {
            return Err<Announcement>(ErrorCode::InvalidHeader, "Size is not a number in '" + line + "'");
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (size > (limit - digit) / 10) {
            return Err<Announcement>(ErrorCode::InvalidHeader, "Size overflows in '" + line + "'");
        }
        size = size * 10 + digit;
    }
    announcement.size = size;
    return announcement;
}

bool isDoneLine(const std::string& line) {
    std::string text = line;
    while (!text.empty() && (text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    return text == DONE_LINE;
}

bool isSafeUnitName(const std::string& name) {
    return name == Manifest::UNIT_NAME || Manifest::isValidChunkName(name);
}

AckMatch matchAck(const std::string& received) {
    auto start = received.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return AckMatch::Incomplete;
    }
    std::string token = received.substr(start);

    auto check = [&token](const char* expected) -> int {
        size_t len = std::strlen(expected);
        if (token.size() <= len) {
            // -1: mismatch, 0: prefix so far, 1: complete
            if (token.compare(0, token.size(), expected, token.size()) != 0) return -1;
            return token.size() == len ? 1 : 0;
        }
        return token.compare(0, len, expected) == 0 ? 1 : -1;
    };

    int ok = check(ACK_OK);
    if (ok == 1) return AckMatch::Ok;
    int bad = check(ACK_BAD);
    if (bad == 1) return AckMatch::Bad;
    if (ok == 0 || bad == 0) return AckMatch::Incomplete;
    return AckMatch::Garbled;
}

} // namespace Protocol
} // namespace Chunkwise
