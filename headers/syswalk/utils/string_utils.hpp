//
// Created by gregorian-rayne on 10/3/26.
//

#ifndef SYSWALK_STRING_UTILS_HPP
#define SYSWALK_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String helpers used by the extractors and the report.
 */

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <cctype>

namespace syswalk::string_utils {

    inline std::string_view trim_left(std::string_view s) noexcept {
        const auto it = std::ranges::find_if(s, [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(static_cast<std::size_t>(it - s.begin()));
    }

    inline std::string_view trim_right(std::string_view s) noexcept {
        const auto it = std::find_if(s.rbegin(), s.rend(), [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(0, static_cast<std::size_t>(s.rend() - it));
    }

    inline std::string_view trim(const std::string_view s) noexcept {
        return trim_left(trim_right(s));
    }

    /**
     * Splits on a delimiter, keeping empty parts.
     */
    inline std::vector<std::string_view> split(std::string_view s, const char delimiter) {
        std::vector<std::string_view> result;
        std::size_t start = 0;
        std::size_t end = s.find(delimiter);

        while (end != std::string_view::npos) {
            result.push_back(s.substr(start, end - start));
            start = end + 1;
            end = s.find(delimiter, start);
        }

        result.push_back(s.substr(start));
        return result;
    }

    /**
     * Splits a comma separated option value, trimming each item and
     * dropping empty ones ("a, b,,c" -> {"a", "b", "c"}).
     */
    inline std::vector<std::string> split_list(const std::string_view s) {
        std::vector<std::string> result;
        for (const auto part : split(s, ',')) {
            if (const auto item = trim(part); !item.empty()) {
                result.emplace_back(item);
            }
        }
        return result;
    }

    inline bool starts_with(const std::string_view s, const std::string_view prefix) noexcept {
        return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
    }

    inline bool ends_with(const std::string_view s, const std::string_view suffix) noexcept {
        return s.size() >= suffix.size() &&
               s.substr(s.size() - suffix.size()) == suffix;
    }

    inline bool contains(const std::string_view s, const std::string_view needle) noexcept {
        return s.find(needle) != std::string_view::npos;
    }

    inline std::string to_lower(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    /**
     * Orders strings case-insensitively, falling back to a byte-wise
     * comparison so that "A" and "a" still have a stable order.
     */
    inline bool less_case_insensitive(const std::string_view a, const std::string_view b) {
        const auto la = to_lower(a);
        const auto lb = to_lower(b);
        if (la != lb) {
            return la < lb;
        }
        return a < b;
    }

    inline std::string replace_all(std::string_view s, const std::string_view from, const std::string_view to) {
        if (from.empty()) {
            return std::string(s);
        }

        std::string result;
        std::size_t pos = 0;
        std::size_t found = s.find(from);

        while (found != std::string_view::npos) {
            result.append(s.substr(pos, found - pos));
            result.append(to);
            pos = found + from.size();
            found = s.find(from, pos);
        }

        result.append(s.substr(pos));
        return result;
    }

    /**
     * Checks that a byte sequence is well-formed UTF-8 (no overlongs,
     * no surrogates, nothing above U+10FFFF).
     */
    inline bool is_valid_utf8(const std::string_view s) noexcept {
        std::size_t i = 0;
        const std::size_t n = s.size();

        while (i < n) {
            const auto c = static_cast<unsigned char>(s[i]);
            std::size_t extra = 0;
            unsigned int code = 0;

            if (c < 0x80) {
                ++i;
                continue;
            }
            if ((c & 0xE0) == 0xC0) {
                extra = 1;
                code = c & 0x1F;
            } else if ((c & 0xF0) == 0xE0) {
                extra = 2;
                code = c & 0x0F;
            } else if ((c & 0xF8) == 0xF0) {
                extra = 3;
                code = c & 0x07;
            } else {
                return false;
            }

            if (i + extra >= n) {
                return false;
            }
            for (std::size_t k = 1; k <= extra; ++k) {
                const auto cc = static_cast<unsigned char>(s[i + k]);
                if ((cc & 0xC0) != 0x80) {
                    return false;
                }
                code = (code << 6) | (cc & 0x3F);
            }

            if ((extra == 1 && code < 0x80) ||
                (extra == 2 && code < 0x800) ||
                (extra == 3 && code < 0x10000) ||
                code > 0x10FFFF ||
                (code >= 0xD800 && code <= 0xDFFF)) {
                return false;
            }

            i += extra + 1;
        }

        return true;
    }

}  // namespace syswalk::string_utils

#endif //SYSWALK_STRING_UTILS_HPP
