//
// Created by gregorian-rayne on 10/4/26.
//

#include "syswalk/extractors/markup_extractor.hpp"
#include "syswalk/utils/string_utils.hpp"

#include <array>
#include <cctype>
#include <charconv>

namespace syswalk::extractors {

    namespace {

    constexpr std::array<std::string_view, 4> REFERENCE_ATTRIBUTES = {
        "src", "href", "data-src", "poster"
    };

    bool is_space(const char c) noexcept {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    bool iequals_prefix(const std::string_view s, const std::size_t pos, const std::string_view word) noexcept {
        if (pos + word.size() > s.size()) {
            return false;
        }
        for (std::size_t i = 0; i < word.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(s[pos + i])) !=
                std::tolower(static_cast<unsigned char>(word[i]))) {
                return false;
            }
        }
        return true;
    }

    void append_utf8(std::string& out, const unsigned long cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    }  // namespace

    std::string decode_html_entities(const std::string_view text) {
        std::string out;
        out.reserve(text.size());

        std::size_t i = 0;
        while (i < text.size()) {
            if (text[i] != '&') {
                out += text[i++];
                continue;
            }

            const auto semi = text.find(';', i + 1);
            if (semi == std::string_view::npos || semi - i > 10) {
                out += text[i++];
                continue;
            }

            const auto entity = text.substr(i + 1, semi - i - 1);
            bool decoded = true;

            if (entity == "amp") {
                out += '&';
            } else if (entity == "lt") {
                out += '<';
            } else if (entity == "gt") {
                out += '>';
            } else if (entity == "quot") {
                out += '"';
            } else if (entity == "apos") {
                out += '\'';
            } else if (entity.size() > 1 && entity[0] == '#') {
                const bool hex = entity[1] == 'x' || entity[1] == 'X';
                const auto digits = entity.substr(hex ? 2 : 1);
                unsigned long cp = 0;
                const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(),
                                                       cp, hex ? 16 : 10);
                decoded = ec == std::errc{} && ptr == digits.data() + digits.size() &&
                          !digits.empty() && cp > 0 && cp <= 0x10FFFF;
                if (decoded) {
                    append_utf8(out, cp);
                }
            } else {
                decoded = false;
            }

            if (decoded) {
                i = semi + 1;
            } else {
                out += text[i++];
            }
        }

        return out;
    }

    std::optional<std::string> HtmlTag::attribute(const std::string_view attr_name) const {
        std::optional<std::string> result;
        for (const auto& [key, value] : attributes) {
            if (key == attr_name) {
                result = value;
            }
        }
        return result;
    }

    void HtmlTagScanner::skip_raw_text(const std::string_view tag_name) {
        auto search = pos_;
        while (true) {
            const auto lt = content_.find("</", search);
            if (lt == std::string_view::npos) {
                pos_ = content_.size();
                return;
            }
            if (iequals_prefix(content_, lt + 2, tag_name)) {
                pos_ = lt;
                return;
            }
            search = lt + 2;
        }
    }

    std::optional<HtmlTag> HtmlTagScanner::next() {
        const auto n = content_.size();

        while (pos_ < n) {
            const auto lt = content_.find('<', pos_);
            if (lt == std::string_view::npos || lt + 1 >= n) {
                pos_ = n;
                return std::nullopt;
            }

            if (content_.compare(lt, 4, "<!--") == 0) {
                const auto end = content_.find("-->", lt + 4);
                pos_ = end == std::string_view::npos ? n : end + 3;
                continue;
            }

            const char lead = content_[lt + 1];
            if (lead == '!' || lead == '?' || lead == '/') {
                const auto end = content_.find('>', lt + 2);
                pos_ = end == std::string_view::npos ? n : end + 1;
                continue;
            }

            if (!std::isalpha(static_cast<unsigned char>(lead))) {
                pos_ = lt + 1;
                continue;
            }

            HtmlTag tag;
            std::size_t p = lt + 1;
            while (p < n && !is_space(content_[p]) && content_[p] != '>' && content_[p] != '/') {
                ++p;
            }
            tag.name = string_utils::to_lower(content_.substr(lt + 1, p - lt - 1));

            bool closed = false;
            while (p < n) {
                while (p < n && (is_space(content_[p]) || content_[p] == '/')) {
                    ++p;
                }
                if (p >= n) {
                    break;
                }
                if (content_[p] == '>') {
                    ++p;
                    closed = true;
                    break;
                }

                const auto name_start = p;
                while (p < n && !is_space(content_[p]) && content_[p] != '=' && content_[p] != '>') {
                    ++p;
                }
                auto attr_name = string_utils::to_lower(content_.substr(name_start, p - name_start));

                while (p < n && is_space(content_[p])) {
                    ++p;
                }

                std::optional<std::string> value;
                if (p < n && content_[p] == '=') {
                    ++p;
                    while (p < n && is_space(content_[p])) {
                        ++p;
                    }
                    if (p < n && (content_[p] == '"' || content_[p] == '\'')) {
                        const auto quote = content_[p];
                        const auto end = content_.find(quote, p + 1);
                        if (end == std::string_view::npos) {
                            p = n;
                            break;
                        }
                        value = decode_html_entities(content_.substr(p + 1, end - p - 1));
                        p = end + 1;
                    } else {
                        const auto value_start = p;
                        while (p < n && !is_space(content_[p]) && content_[p] != '>') {
                            ++p;
                        }
                        value = decode_html_entities(content_.substr(value_start, p - value_start));
                    }
                }

                tag.attributes.emplace_back(std::move(attr_name), std::move(value));
            }

            if (!closed) {
                // Unterminated tag at end of input
                pos_ = n;
                return std::nullopt;
            }

            pos_ = p;
            if (tag.name == "script" || tag.name == "style") {
                skip_raw_text(tag.name);
            }
            return tag;
        }

        return std::nullopt;
    }

    Result<Extraction, Error> MarkupExtractor::extract(
        const std::string_view content,
        const fs::path& origin
    ) const {
        Extraction extraction;
        HtmlTagScanner scanner(content);

        while (auto tag = scanner.next()) {
            for (const auto attr : REFERENCE_ATTRIBUTES) {
                const auto value = tag->attribute(attr);
                if (!value) {
                    continue;
                }
                const auto specifier = string_utils::trim(*value);
                if (looks_relative(specifier)) {
                    extraction.references.push_back(Reference{origin, std::string(specifier), {}});
                }
            }
        }

        return Result<Extraction, Error>::success(std::move(extraction));
    }

}  // namespace syswalk::extractors
