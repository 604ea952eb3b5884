//
// Created by gregorian-rayne on 10/4/26.
//

#include "syswalk/extractors/stylesheet_extractor.hpp"
#include "syswalk/utils/string_utils.hpp"

#include <cctype>
#include <optional>

namespace syswalk::extractors {

    namespace {

    bool is_space(const char c) noexcept {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    bool is_quote(const char c) noexcept {
        return c == '\'' || c == '"';
    }

    std::size_t skip_whitespace(const std::string_view s, std::size_t pos) noexcept {
        while (pos < s.size() && is_space(s[pos])) {
            ++pos;
        }
        return pos;
    }

    /**
     * @p word must be lower case.
     */
    bool matches_icase(const std::string_view s, const std::size_t pos, const std::string_view word) noexcept {
        if (pos + word.size() > s.size()) {
            return false;
        }
        for (std::size_t i = 0; i < word.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(s[pos + i])) != word[i]) {
                return false;
            }
        }
        return true;
    }

    std::size_t find_icase(const std::string_view s, const std::string_view word, std::size_t from) noexcept {
        for (; from + word.size() <= s.size(); ++from) {
            if (matches_icase(s, from, word)) {
                return from;
            }
        }
        return std::string_view::npos;
    }

    /**
     * Target of an @import whose keyword ends at @p pos: at least one space,
     * an optional "url(" and quote, then everything up to a quote, ')', ';'
     * or whitespace.
     */
    std::optional<std::string_view> read_import_target(const std::string_view s, std::size_t pos) {
        if (pos >= s.size() || !is_space(s[pos])) {
            return std::nullopt;
        }
        pos = skip_whitespace(s, pos);
        if (matches_icase(s, pos, "url(")) {
            pos += 4;
        }
        if (pos < s.size() && is_quote(s[pos])) {
            ++pos;
        }

        auto end = pos;
        while (end < s.size() && !is_space(s[end]) && !is_quote(s[end]) && s[end] != ')' && s[end] != ';') {
            ++end;
        }
        if (end == pos) {
            return std::nullopt;
        }
        return s.substr(pos, end - pos);
    }

    /**
     * Target of a url( whose parenthesis ends at @p pos. The value runs to
     * the next quote or ')' and must be followed, after an optional quote
     * and whitespace, by the closing ')'.
     */
    std::optional<std::string_view> read_url_target(const std::string_view s, std::size_t pos) {
        pos = skip_whitespace(s, pos);
        if (pos < s.size() && is_quote(s[pos])) {
            ++pos;
        }

        const auto end = s.find_first_of("'\")", pos);
        if (end == std::string_view::npos || end == pos) {
            return std::nullopt;
        }

        auto close = is_quote(s[end]) ? end + 1 : end;
        close = skip_whitespace(s, close);
        if (close >= s.size() || s[close] != ')') {
            return std::nullopt;
        }
        return s.substr(pos, end - pos);
    }

    void add_if_relative(const std::string_view target, const fs::path& origin, std::vector<Reference>& out) {
        const auto specifier = string_utils::trim(target);
        if (looks_relative(specifier)) {
            out.push_back(Reference{origin, std::string(specifier), {}});
        }
    }

    }  // namespace

    Result<Extraction, Error> StylesheetExtractor::extract(
        const std::string_view content,
        const fs::path& origin
    ) const {
        Extraction extraction;

        constexpr std::string_view import_keyword = "@import";
        for (auto at = find_icase(content, import_keyword, 0); at != std::string_view::npos;
             at = find_icase(content, import_keyword, at + import_keyword.size())) {
            if (const auto target = read_import_target(content, at + import_keyword.size())) {
                add_if_relative(*target, origin, extraction.references);
            }
        }

        constexpr std::string_view url_keyword = "url(";
        for (auto at = find_icase(content, url_keyword, 0); at != std::string_view::npos;
             at = find_icase(content, url_keyword, at + url_keyword.size())) {
            if (const auto target = read_url_target(content, at + url_keyword.size())) {
                add_if_relative(*target, origin, extraction.references);
            }
        }

        return Result<Extraction, Error>::success(std::move(extraction));
    }

}  // namespace syswalk::extractors
