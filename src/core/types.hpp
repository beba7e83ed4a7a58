// File: src/core/types.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace policyminer {

// ValidationError: Raised when a record violates a data-model invariant
// Carries the name of the offending field
class ValidationError : public std::invalid_argument {
public:
    ValidationError(const std::string& field, const std::string& message);

    // Name of the field that failed validation
    const std::string& field() const { return field_; }

    // Reason without the field prefix
    const std::string& message() const { return message_; }

private:
    std::string field_;
    std::string message_;
};

// Timestamp: Microsecond-precision UTC wall-clock time point
class Timestamp {
public:
    using ClockType = std::chrono::system_clock;
    using TimePoint = ClockType::time_point;
    using Duration = std::chrono::microseconds;

    // Create timestamp for current time
    static Timestamp Now();

    // Create timestamp from microseconds since the Unix epoch
    static Timestamp FromMicros(int64_t micros);

    // Default constructor creates the epoch
    Timestamp() : time_point_(TimePoint{}) {}

    // Get microseconds since epoch
    int64_t ToMicros() const;

    // ISO-8601 form "YYYY-MM-DDTHH:MM:SS[.ffffff]", fraction omitted when zero
    std::string ToIsoString() const;

private:
    explicit Timestamp(TimePoint tp) : time_point_(tp) {}
    TimePoint time_point_;
};

// Strip leading and trailing whitespace from UTF-8 text
// Whitespace is the ASCII set plus the separators \x1c-\x1f, U+0085, U+00A0,
// U+1680, U+2000-U+200A, U+2028, U+2029, U+202F, U+205F and U+3000.
std::string Trim(const std::string& text);

// True for the code points Trim strips
bool IsWhitespaceCodePoint(uint32_t code_point);

// Decode the UTF-8 sequence starting at text[pos]
// Sets length to the number of bytes consumed; returns std::nullopt and
// length 1 for a malformed or truncated sequence.
std::optional<uint32_t> DecodeUtf8(const std::string& text, size_t pos, size_t& length);

} // namespace policyminer
