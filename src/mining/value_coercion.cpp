// File: src/mining/value_coercion.cpp
#include "mining/value_coercion.hpp"
#include "core/types.hpp"
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace policyminer {

namespace {

// Element rendering inside containers: strings are quoted, the rest is not
std::string RenderElement(const ContextValue& value) {
    if (value.is_string()) {
        return ReprQuote(value.get_ref<const std::string&>());
    }
    return ToAntecedentValue(value);
}

// Non-ASCII code points that repr() escapes: C1 controls, separators,
// format characters, private use and the noncharacters U+FFFE/U+FFFF
bool IsNonPrintable(uint32_t cp) {
    if (cp >= 0x80 && cp <= 0xa0) return true;
    if (cp == 0xad || cp == 0x61c || cp == 0x6dd || cp == 0x70f || cp == 0x8e2) return true;
    if (cp >= 0x600 && cp <= 0x605) return true;
    if (cp == 0x1680 || cp == 0x180e) return true;
    if (cp >= 0x2000 && cp <= 0x200f) return true;
    if (cp >= 0x2028 && cp <= 0x202f) return true;
    if (cp >= 0x205f && cp <= 0x206f) return true;
    if (cp == 0x3000 || cp == 0xfeff) return true;
    if (cp >= 0xe000 && cp <= 0xf8ff) return true;
    if (cp >= 0xfff9 && cp <= 0xfffb) return true;
    if (cp == 0xfffe || cp == 0xffff) return true;
    return cp >= 0xf0000;
}

std::string EscapeCodePoint(uint32_t cp) {
    char escape[16];
    if (cp <= 0xff) {
        std::snprintf(escape, sizeof(escape), "\\x%02x", static_cast<unsigned>(cp));
    } else if (cp <= 0xffff) {
        std::snprintf(escape, sizeof(escape), "\\u%04x", static_cast<unsigned>(cp));
    } else {
        std::snprintf(escape, sizeof(escape), "\\U%08x", static_cast<unsigned>(cp));
    }
    return escape;
}

} // namespace

std::string FormatReal(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value < 0 ? "-inf" : "inf";
    }

    // Shortest round-trip digits in scientific form, e.g. "-1.25e+02"
    char buffer[64];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), value,
                                std::chars_format::scientific);
    std::string scientific(buffer, result.ptr);

    bool negative = !scientific.empty() && scientific[0] == '-';
    size_t e_pos = scientific.find('e');
    std::string mantissa = scientific.substr(negative ? 1 : 0,
                                             e_pos - (negative ? 1 : 0));
    int exponent = std::atoi(scientific.c_str() + e_pos + 1);

    std::string digits;
    for (char c : mantissa) {
        if (c != '.') {
            digits.push_back(c);
        }
    }

    std::string out = negative ? "-" : "";

    if (exponent >= -4 && exponent < 16) {
        if (exponent >= 0) {
            size_t int_len = static_cast<size_t>(exponent) + 1;
            if (digits.size() <= int_len) {
                out += digits + std::string(int_len - digits.size(), '0') + ".0";
            } else {
                out += digits.substr(0, int_len) + "." + digits.substr(int_len);
            }
        } else {
            out += "0." + std::string(static_cast<size_t>(-exponent - 1), '0') + digits;
        }
        return out;
    }

    out += digits.substr(0, 1);
    if (digits.size() > 1) {
        out += "." + digits.substr(1);
    }

    char exp_buffer[16];
    std::snprintf(exp_buffer, sizeof(exp_buffer), "e%c%02d",
                  exponent < 0 ? '-' : '+', std::abs(exponent));
    out += exp_buffer;
    return out;
}

std::string ToAntecedentValue(const ContextValue& value) {
    switch (value.type()) {
        case ContextValue::value_t::string:
            return value.get_ref<const std::string&>();
        case ContextValue::value_t::boolean:
            return value.get<bool>() ? "True" : "False";
        case ContextValue::value_t::null:
            return "None";
        case ContextValue::value_t::number_integer:
            return std::to_string(value.get<int64_t>());
        case ContextValue::value_t::number_unsigned:
            return std::to_string(value.get<uint64_t>());
        case ContextValue::value_t::number_float:
            return FormatReal(value.get<double>());
        case ContextValue::value_t::array: {
            std::ostringstream oss;
            oss << "[";
            bool first = true;
            for (const auto& element : value) {
                if (!first) oss << ", ";
                oss << RenderElement(element);
                first = false;
            }
            oss << "]";
            return oss.str();
        }
        case ContextValue::value_t::object: {
            std::ostringstream oss;
            oss << "{";
            bool first = true;
            for (const auto& [key, element] : value.items()) {
                if (!first) oss << ", ";
                oss << ReprQuote(key) << ": " << RenderElement(element);
                first = false;
            }
            oss << "}";
            return oss.str();
        }
        default:
            return value.dump();
    }
}

std::string ReprQuote(const std::string& text) {
    bool has_single = text.find('\'') != std::string::npos;
    bool has_double = text.find('"') != std::string::npos;
    char quote = (has_single && !has_double) ? '"' : '\'';

    std::string out;
    out.reserve(text.size() + 2);
    out.push_back(quote);

    size_t pos = 0;
    while (pos < text.size()) {
        char c = text[pos];
        unsigned char byte = static_cast<unsigned char>(c);

        if (byte >= 0x80) {
            size_t length;
            auto code_point = DecodeUtf8(text, pos, length);
            if (code_point && IsNonPrintable(*code_point)) {
                out += EscapeCodePoint(*code_point);
            } else {
                out.append(text, pos, length);
            }
            pos += length;
            continue;
        }

        if (c == quote || c == '\\') {
            out.push_back('\\');
            out.push_back(c);
        } else if (c == '\n') {
            out += "\\n";
        } else if (c == '\r') {
            out += "\\r";
        } else if (c == '\t') {
            out += "\\t";
        } else if (byte < 0x20 || byte == 0x7f) {
            out += EscapeCodePoint(byte);
        } else {
            out.push_back(c);
        }
        pos++;
    }

    out.push_back(quote);
    return out;
}

} // namespace policyminer
