//
// Created by gregorian-rayne on 10/4/26.
//

#ifndef SYSWALK_MARKUP_EXTRACTOR_HPP
#define SYSWALK_MARKUP_EXTRACTOR_HPP

/**
 * @file markup_extractor.hpp
 * @brief HTML reference extraction via a streaming tag scanner.
 */

#include "syswalk/extractors/extractor.hpp"

#include <optional>
#include <utility>

namespace syswalk::extractors {

    /**
     * A start tag with lower-cased name and attribute names. Attribute
     * values have character references decoded; valueless attributes
     * carry std::nullopt.
     */
    struct HtmlTag {
        std::string name;
        std::vector<std::pair<std::string, std::optional<std::string>>> attributes;

        /**
         * Value of the last attribute with this name, as an HTML parser
         * building an attribute map would report it.
         */
        [[nodiscard]] std::optional<std::string> attribute(std::string_view attr_name) const;
    };

    /**
     * Pull-style tokenizer yielding start tags only.
     *
     * Skips comments, doctype, processing instructions and end tags, and
     * treats the body of <script> and <style> as raw text. Never fails:
     * malformed markup ends the scan early.
     */
    class HtmlTagScanner {
    public:
        explicit HtmlTagScanner(std::string_view content) : content_(content) {}

        [[nodiscard]] std::optional<HtmlTag> next();

    private:
        void skip_raw_text(std::string_view tag_name);

        std::string_view content_;
        std::size_t pos_ = 0;
    };

    /**
     * Decodes &amp; &lt; &gt; &quot; &apos; &#NN; and &#xNN; entities.
     * Unknown entities are left as written.
     */
    [[nodiscard]] std::string decode_html_entities(std::string_view text);

    class MarkupExtractor final : public IReferenceExtractor {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "Markup";
        }

        [[nodiscard]] std::vector<std::string> supported_extensions() const override {
            return {".html", ".htm"};
        }

        [[nodiscard]] Result<Extraction, Error> extract(
            std::string_view content,
            const fs::path& origin
        ) const override;
    };

}  // namespace syswalk::extractors

#endif //SYSWALK_MARKUP_EXTRACTOR_HPP
