#pragma once

#include <unicode/unistr.h>
#include <unicode/utypes.h>
#include <algorithm>
#include <string>

namespace anndoc {
namespace unicode {

/**
 * Convert std::string (assumed UTF-8) to ICU UnicodeString
 */
inline icu::UnicodeString to_unicode_string(const std::string& utf8_str) {
    return icu::UnicodeString::fromUTF8(icu::StringPiece(utf8_str.c_str(), utf8_str.length()));
}

/**
 * Convert ICU UnicodeString to std::string (UTF-8)
 */
inline std::string from_unicode_string(const icu::UnicodeString& ustr) {
    std::string result;
    ustr.toUTF8String(result);
    return result;
}

/**
 * Slice a UTF-8 string by code point offsets [char_start, char_end).
 * Character offsets in annotations count code points, not bytes. Negative
 * offsets count from the end and out-of-range offsets are clamped, so the
 * result is empty rather than an error when the range falls outside the text.
 */
inline std::string substr_chars(const std::string& utf8_str, int char_start, int char_end) {
    if (utf8_str.empty()) {
        return "";
    }
    icu::UnicodeString ustr = to_unicode_string(utf8_str);
    int32_t length = ustr.countChar32();
    auto normalize = [length](int32_t pos) {
        if (pos < 0) {
            pos += length;
        }
        return std::min(std::max(pos, int32_t(0)), length);
    };
    int32_t start = normalize(char_start);
    int32_t end = normalize(char_end);
    if (start >= end) {
        return "";
    }
    int32_t begin_unit = ustr.moveIndex32(0, start);
    int32_t end_unit = ustr.moveIndex32(begin_unit, end - start);
    return from_unicode_string(ustr.tempSubStringBetween(begin_unit, end_unit));
}

/**
 * Sanitize a string to ensure it's valid UTF-8
 * Replaces invalid sequences with replacement character (U+FFFD)
 */
inline std::string sanitize_utf8(const std::string& str) {
    if (str.empty()) {
        return str;
    }
    // ICU automatically handles invalid UTF-8 by replacing with U+FFFD
    icu::UnicodeString ustr = to_unicode_string(str);
    return from_unicode_string(ustr);
}

}  // namespace unicode
}  // namespace anndoc
