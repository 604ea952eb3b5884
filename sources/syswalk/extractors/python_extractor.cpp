//
// Created by gregorian-rayne on 10/4/26.
//

#include "syswalk/extractors/python_extractor.hpp"
#include "syswalk/utils/string_utils.hpp"

#include <cctype>
#include <optional>
#include <utility>

namespace syswalk::extractors {

    namespace {

    enum class TokenKind {
        Name,
        Number,
        String,
        Op,
        Boundary
    };

    struct Token {
        TokenKind kind;
        std::string_view text;
        std::size_t line;
    };

    bool is_name_start(const char c) noexcept {
        const auto uc = static_cast<unsigned char>(c);
        return std::isalpha(uc) || c == '_' || uc >= 0x80;
    }

    bool is_name_char(const char c) noexcept {
        const auto uc = static_cast<unsigned char>(c);
        return std::isalnum(uc) || c == '_' || uc >= 0x80;
    }

    bool is_string_prefix(std::string_view word) noexcept {
        if (word.empty() || word.size() > 2) {
            return false;
        }
        const auto lowered = string_utils::to_lower(word);
        return lowered == "r" || lowered == "u" || lowered == "b" || lowered == "f" ||
               lowered == "br" || lowered == "rb" || lowered == "fr" || lowered == "rf";
    }

    Error syntax_error(const std::string& what, const std::size_t line) {
        return Error::parse_error(what, "line " + std::to_string(line));
    }

    /**
     * Splits a module into tokens. Statement boundaries (logical newlines,
     * ';' and ':' outside brackets) are emitted as Boundary tokens;
     * everything else that is not a name, number or string becomes a
     * single-character Op.
     */
    class Tokenizer {
    public:
        explicit Tokenizer(const std::string_view source) : src_(source) {}

        Result<std::vector<Token>, Error> run() {
            const auto n = src_.size();

            while (pos_ < n) {
                const char c = src_[pos_];

                if (c == '#') {
                    while (pos_ < n && src_[pos_] != '\n') {
                        ++pos_;
                    }
                    continue;
                }

                if (c == '\\') {
                    auto next = pos_ + 1;
                    if (next < n && src_[next] == '\r') {
                        ++next;
                    }
                    if (next >= n || src_[next] != '\n') {
                        return Result<std::vector<Token>, Error>::failure(
                            syntax_error("unexpected character after line continuation", line_));
                    }
                    pos_ = next + 1;
                    ++line_;
                    continue;
                }

                if (c == '\n') {
                    if (brackets_.empty()) {
                        emit(TokenKind::Boundary, pos_, 1);
                    }
                    ++pos_;
                    ++line_;
                    continue;
                }

                if (std::isspace(static_cast<unsigned char>(c))) {
                    ++pos_;
                    continue;
                }

                if (c == '\'' || c == '"') {
                    if (auto r = read_string(pos_); r.is_err()) {
                        return Result<std::vector<Token>, Error>::failure(r.error());
                    }
                    continue;
                }

                if (is_name_start(c)) {
                    const auto start = pos_;
                    while (pos_ < n && is_name_char(src_[pos_])) {
                        ++pos_;
                    }
                    const auto word = src_.substr(start, pos_ - start);
                    if (pos_ < n && (src_[pos_] == '\'' || src_[pos_] == '"') && is_string_prefix(word)) {
                        if (auto r = read_string(start); r.is_err()) {
                            return Result<std::vector<Token>, Error>::failure(r.error());
                        }
                        continue;
                    }
                    emit(TokenKind::Name, start, pos_ - start);
                    continue;
                }

                if (std::isdigit(static_cast<unsigned char>(c))) {
                    const auto start = pos_;
                    while (pos_ < n && (is_name_char(src_[pos_]) || src_[pos_] == '.')) {
                        ++pos_;
                    }
                    emit(TokenKind::Number, start, pos_ - start);
                    continue;
                }

                if (c == '(' || c == '[' || c == '{') {
                    brackets_.push_back(Open{c, line_});
                    emit(TokenKind::Op, pos_++, 1);
                    continue;
                }

                if (c == ')' || c == ']' || c == '}') {
                    const char expected = c == ')' ? '(' : (c == ']' ? '[' : '{');
                    if (brackets_.empty()) {
                        return Result<std::vector<Token>, Error>::failure(
                            syntax_error(std::string("unmatched '") + c + "'", line_));
                    }
                    if (brackets_.back().bracket != expected) {
                        return Result<std::vector<Token>, Error>::failure(
                            syntax_error(std::string("closing '") + c + "' does not match '" +
                                         brackets_.back().bracket + "'", line_));
                    }
                    brackets_.pop_back();
                    emit(TokenKind::Op, pos_++, 1);
                    continue;
                }

                if ((c == ';' || c == ':') && brackets_.empty()) {
                    emit(TokenKind::Boundary, pos_++, 1);
                    continue;
                }

                emit(TokenKind::Op, pos_++, 1);
            }

            if (!brackets_.empty()) {
                return Result<std::vector<Token>, Error>::failure(
                    syntax_error(std::string("'") + brackets_.back().bracket + "' was never closed",
                                 brackets_.back().line));
            }

            return Result<std::vector<Token>, Error>::success(std::move(tokens_));
        }

    private:
        struct Open {
            char bracket;
            std::size_t line;
        };

        void emit(const TokenKind kind, const std::size_t start, const std::size_t length) {
            tokens_.push_back(Token{kind, src_.substr(start, length), line_});
        }

        /**
         * Reads a string literal whose prefix (if any) begins at @p start.
         * Backslash escapes the next character in every kind of literal,
         * raw ones included, as far as finding the end is concerned.
         */
        Result<void, Error> read_string(const std::size_t start) {
            const auto n = src_.size();
            const auto start_line = line_;
            auto p = start;
            while (src_[p] != '\'' && src_[p] != '"') {
                ++p;
            }

            const char quote = src_[p];
            const bool triple = p + 2 < n && src_[p + 1] == quote && src_[p + 2] == quote;
            p += triple ? 3 : 1;

            while (p < n) {
                const char c = src_[p];
                if (c == '\\') {
                    if (p + 1 < n && src_[p + 1] == '\n') {
                        ++line_;
                    }
                    p += 2;
                    continue;
                }
                if (c == '\n') {
                    if (!triple) {
                        return Result<void, Error>::failure(
                            syntax_error("unterminated string literal", start_line));
                    }
                    ++line_;
                    ++p;
                    continue;
                }
                if (c == quote) {
                    if (!triple) {
                        ++p;
                        emit(TokenKind::String, start, p - start);
                        pos_ = p;
                        return Result<void, Error>::success();
                    }
                    if (p + 2 < n && src_[p + 1] == quote && src_[p + 2] == quote) {
                        p += 3;
                        emit(TokenKind::String, start, p - start);
                        pos_ = p;
                        return Result<void, Error>::success();
                    }
                }
                ++p;
            }

            return Result<void, Error>::failure(
                syntax_error(triple ? "unterminated triple-quoted string literal"
                                    : "unterminated string literal",
                             start_line));
        }

        std::string_view src_;
        std::size_t pos_ = 0;
        std::size_t line_ = 1;
        std::vector<Open> brackets_;
        std::vector<Token> tokens_;
    };

    bool is_op(const Token& token, const char c) noexcept {
        return token.kind == TokenKind::Op && token.text.size() == 1 && token.text[0] == c;
    }

    bool is_name(const Token& token, const std::string_view word) noexcept {
        return token.kind == TokenKind::Name && token.text == word;
    }

    bool is_module_char(const char c) noexcept {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
    }

    std::size_t skip_spaces(const std::string_view s, std::size_t pos) noexcept {
        while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) {
            ++pos;
        }
        return pos;
    }

    /**
     * Matches "from <dots><name> import " at @p pos, where pos follows the
     * "from" keyword. Returns the dotted module and the end of the match.
     */
    std::optional<std::pair<std::string_view, std::size_t>> match_fallback_import(
        const std::string_view s,
        const std::size_t pos
    ) {
        auto p = skip_spaces(s, pos);
        if (p == pos || p >= s.size() || s[p] != '.') {
            return std::nullopt;
        }

        const auto module_start = p;
        while (p < s.size() && is_module_char(s[p])) {
            ++p;
        }
        const auto module_end = p;
        if (module_end - module_start < 2) {
            return std::nullopt;
        }

        p = skip_spaces(s, p);
        if (p == module_end || s.compare(p, 6, "import") != 0) {
            return std::nullopt;
        }
        p += 6;
        const auto end = skip_spaces(s, p);
        if (end == p) {
            return std::nullopt;
        }
        return std::make_pair(s.substr(module_start, module_end - module_start), end);
    }

    }  // namespace

    Result<std::vector<RelativeImport>, Error> parse_relative_imports(const std::string_view source) {
        auto tokenized = Tokenizer(source).run();
        if (tokenized.is_err()) {
            return Result<std::vector<RelativeImport>, Error>::failure(tokenized.error());
        }
        const auto& tokens = tokenized.value();

        std::vector<RelativeImport> imports;
        bool at_statement_start = true;
        std::size_t i = 0;

        while (i < tokens.size()) {
            const auto& token = tokens[i];

            if (token.kind == TokenKind::Boundary) {
                at_statement_start = true;
                ++i;
                continue;
            }

            if (!at_statement_start || !is_name(token, "from")) {
                at_statement_start = false;
                ++i;
                continue;
            }

            at_statement_start = false;
            ++i;

            std::size_t level = 0;
            while (i < tokens.size() && is_op(tokens[i], '.')) {
                ++level;
                ++i;
            }

            std::string module;
            if (i < tokens.size() && tokens[i].kind == TokenKind::Name && tokens[i].text != "import") {
                module.assign(tokens[i].text);
                ++i;
                while (i < tokens.size() && is_op(tokens[i], '.')) {
                    if (i + 1 >= tokens.size() || tokens[i + 1].kind != TokenKind::Name) {
                        return Result<std::vector<RelativeImport>, Error>::failure(
                            syntax_error("invalid module name in from-import", tokens[i].line));
                    }
                    module += '.';
                    module.append(tokens[i + 1].text);
                    i += 2;
                }
            }

            if (level == 0 && module.empty()) {
                return Result<std::vector<RelativeImport>, Error>::failure(
                    syntax_error("expected module name after 'from'", token.line));
            }
            if (i >= tokens.size() || !is_name(tokens[i], "import")) {
                return Result<std::vector<RelativeImport>, Error>::failure(
                    syntax_error("expected 'import' in from-import", token.line));
            }
            ++i;

            if (level > 0 && !module.empty()) {
                imports.push_back(RelativeImport{level, std::move(module)});
            }
        }

        return Result<std::vector<RelativeImport>, Error>::success(std::move(imports));
    }

    std::vector<RelativeImport> scan_relative_imports(const std::string_view source) {
        std::vector<RelativeImport> imports;
        constexpr std::string_view keyword = "from";

        auto at = source.find(keyword);
        while (at != std::string_view::npos) {
            const auto match = match_fallback_import(source, at + keyword.size());
            if (!match) {
                at = source.find(keyword, at + keyword.size());
                continue;
            }

            const auto dotted = match->first;
            const auto first = dotted.find_first_not_of('.');
            const auto last = dotted.find_last_not_of('.');
            if (first != std::string_view::npos) {
                imports.push_back(RelativeImport{first, std::string(dotted.substr(first, last - first + 1))});
            }
            at = source.find(keyword, match->second);
        }

        return imports;
    }

    std::vector<std::string> module_candidates(const RelativeImport& import) {
        std::string prefix;
        if (import.level <= 1) {
            prefix = "./";
        } else {
            for (std::size_t i = 1; i < import.level; ++i) {
                prefix += "../";
            }
        }

        const auto path = prefix + string_utils::replace_all(import.module, ".", "/");
        return {path + ".py", path};
    }

    Result<Extraction, Error> PythonExtractor::extract(
        const std::string_view content,
        const fs::path& origin
    ) const {
        Extraction extraction;

        auto parsed = parse_relative_imports(content);
        std::vector<RelativeImport> imports;
        if (parsed.is_ok()) {
            imports = std::move(parsed).value();
        } else {
            extraction.degraded = true;
            extraction.degraded_reason = parsed.error().to_string();
            imports = scan_relative_imports(content);
        }

        for (const auto& import : imports) {
            auto candidates = module_candidates(import);
            extraction.references.push_back(
                Reference{origin, candidates.front(), {candidates.back()}}
            );
        }

        return Result<Extraction, Error>::success(std::move(extraction));
    }

}  // namespace syswalk::extractors
