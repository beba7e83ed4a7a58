// File: src/core/types.cpp
#include "core/types.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace policyminer {

// ValidationError implementation

ValidationError::ValidationError(const std::string& field, const std::string& message)
    : std::invalid_argument(field + ": " + message),
      field_(field),
      message_(message)
{
}

// Timestamp implementations

Timestamp Timestamp::Now() {
    return Timestamp(ClockType::now());
}

Timestamp Timestamp::FromMicros(int64_t micros) {
    TimePoint tp{std::chrono::duration_cast<TimePoint::duration>(Duration(micros))};
    return Timestamp(tp);
}

int64_t Timestamp::ToMicros() const {
    auto duration = time_point_.time_since_epoch();
    return std::chrono::duration_cast<Duration>(duration).count();
}

std::string Timestamp::ToIsoString() const {
    int64_t micros = ToMicros();
    int64_t seconds = micros / 1000000;
    int64_t remaining_micros = micros % 1000000;

    // Floor towards negative infinity for pre-epoch values
    if (remaining_micros < 0) {
        remaining_micros += 1000000;
        seconds -= 1;
    }

    std::time_t tt = static_cast<std::time_t>(seconds);
    std::tm utc{};
    gmtime_r(&tt, &utc);

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << (utc.tm_year + 1900) << '-'
        << std::setw(2) << (utc.tm_mon + 1) << '-'
        << std::setw(2) << utc.tm_mday << 'T'
        << std::setw(2) << utc.tm_hour << ':'
        << std::setw(2) << utc.tm_min << ':'
        << std::setw(2) << utc.tm_sec;

    if (remaining_micros != 0) {
        oss << '.' << std::setw(6) << remaining_micros;
    }

    return oss.str();
}

bool IsWhitespaceCodePoint(uint32_t code_point) {
    switch (code_point) {
        case 0x09: case 0x0a: case 0x0b: case 0x0c: case 0x0d:
        case 0x1c: case 0x1d: case 0x1e: case 0x1f: case 0x20:
        case 0x85: case 0xa0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202f: case 0x205f: case 0x3000:
            return true;
        default:
            return code_point >= 0x2000 && code_point <= 0x200a;
    }
}

std::optional<uint32_t> DecodeUtf8(const std::string& text, size_t pos, size_t& length) {
    length = 1;
    auto byte = [&text](size_t i) { return static_cast<unsigned char>(text[i]); };

    unsigned char lead = byte(pos);
    if (lead < 0x80) {
        return lead;
    }

    size_t extra;
    uint32_t code_point;
    if ((lead & 0xe0) == 0xc0) {
        extra = 1;
        code_point = lead & 0x1f;
    } else if ((lead & 0xf0) == 0xe0) {
        extra = 2;
        code_point = lead & 0x0f;
    } else if ((lead & 0xf8) == 0xf0) {
        extra = 3;
        code_point = lead & 0x07;
    } else {
        return std::nullopt;
    }

    if (pos + extra >= text.size()) {
        return std::nullopt;
    }
    for (size_t i = 1; i <= extra; ++i) {
        unsigned char next = byte(pos + i);
        if ((next & 0xc0) != 0x80) {
            return std::nullopt;
        }
        code_point = (code_point << 6) | (next & 0x3f);
    }

    length = extra + 1;
    return code_point;
}

std::string Trim(const std::string& text) {
    size_t begin = 0;
    while (begin < text.size()) {
        size_t length;
        auto code_point = DecodeUtf8(text, begin, length);
        if (!code_point || !IsWhitespaceCodePoint(*code_point)) {
            break;
        }
        begin += length;
    }

    size_t end = text.size();
    while (end > begin) {
        // Back up to the lead byte of the last sequence
        size_t start = end - 1;
        while (start > begin && end - start < 4 &&
               (static_cast<unsigned char>(text[start]) & 0xc0) == 0x80) {
            start--;
        }
        size_t length;
        auto code_point = DecodeUtf8(text, start, length);
        if (!code_point || start + length != end || !IsWhitespaceCodePoint(*code_point)) {
            break;
        }
        end = start;
    }

    return text.substr(begin, end - begin);
}

} // namespace policyminer
