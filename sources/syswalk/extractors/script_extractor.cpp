//
// Created by gregorian-rayne on 10/4/26.
//

#include "syswalk/extractors/script_extractor.hpp"
#include "syswalk/utils/string_utils.hpp"

#include <cctype>
#include <optional>

namespace syswalk::extractors {

    namespace {

    bool is_ident_char(const char c) noexcept {
        const auto uc = static_cast<unsigned char>(c);
        return std::isalnum(uc) || c == '_' || c == '$';
    }

    bool is_quote(const char c) noexcept {
        return c == '\'' || c == '"';
    }

    std::size_t skip_whitespace(const std::string_view s, std::size_t pos) noexcept {
        while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) {
            ++pos;
        }
        return pos;
    }

    /**
     * Reads a specifier starting at an opening quote. The specifier ends at
     * the next quote of either kind and must not be empty.
     */
    std::optional<std::string> read_quoted(const std::string_view s, const std::size_t pos) {
        if (pos >= s.size() || !is_quote(s[pos])) {
            return std::nullopt;
        }
        const auto end = s.find_first_of("'\"", pos + 1);
        if (end == std::string_view::npos || end == pos + 1) {
            return std::nullopt;
        }
        return std::string(s.substr(pos + 1, end - pos - 1));
    }

    /**
     * For "import a, { b } from './x'" style clauses: scans to the first
     * quote and accepts it only if the clause before it ends in "from".
     */
    std::optional<std::string> read_from_clause(const std::string_view s, const std::size_t pos) {
        const auto quote = s.find_first_of("'\";", pos);
        if (quote == std::string_view::npos || s[quote] == ';') {
            return std::nullopt;
        }

        const auto clause = string_utils::trim_right(s.substr(pos, quote - pos));
        if (!string_utils::ends_with(clause, "from")) {
            return std::nullopt;
        }
        if (clause.size() > 4 && is_ident_char(clause[clause.size() - 5])) {
            return std::nullopt;
        }

        return read_quoted(s, quote);
    }

    }  // namespace

    std::vector<std::string> ScriptExtractor::find_specifiers(const std::string_view content) {
        std::vector<std::string> specifiers;
        std::size_t i = 0;

        while (i < content.size()) {
            if (!is_ident_char(content[i])) {
                ++i;
                continue;
            }

            const auto word_start = i;
            while (i < content.size() && is_ident_char(content[i])) {
                ++i;
            }
            const auto word = content.substr(word_start, i - word_start);

            std::optional<std::string> specifier;
            if (word == "require") {
                if (auto j = skip_whitespace(content, i); j < content.size() && content[j] == '(') {
                    specifier = read_quoted(content, skip_whitespace(content, j + 1));
                }
            } else if (word == "import") {
                const auto j = skip_whitespace(content, i);
                if (j < content.size() && content[j] == '(') {
                    specifier = read_quoted(content, skip_whitespace(content, j + 1));
                } else if (j < content.size() && is_quote(content[j])) {
                    specifier = read_quoted(content, j);
                } else if (j > i) {
                    specifier = read_from_clause(content, j);
                }
            } else if (word == "export") {
                specifier = read_from_clause(content, i);
            }

            if (specifier) {
                specifiers.push_back(std::move(*specifier));
            }
        }

        return specifiers;
    }

    Result<Extraction, Error> ScriptExtractor::extract(
        const std::string_view content,
        const fs::path& origin
    ) const {
        Extraction extraction;

        for (auto& specifier : find_specifiers(content)) {
            auto trimmed = std::string(string_utils::trim(specifier));
            if (!looks_relative(trimmed)) {
                continue;
            }
            extraction.references.push_back(Reference{origin, std::move(trimmed), {}});
        }

        return Result<Extraction, Error>::success(std::move(extraction));
    }

}  // namespace syswalk::extractors
