//
// Created by gregorian-rayne on 10/4/26.
//

#ifndef SYSWALK_STYLESHEET_EXTRACTOR_HPP
#define SYSWALK_STYLESHEET_EXTRACTOR_HPP

#include "syswalk/extractors/extractor.hpp"

namespace syswalk::extractors {

    /**
     * CSS / SCSS / LESS references: @import "x.css", @import url(x.css)
     * and url(...) in any declaration.
     */
    class StylesheetExtractor final : public IReferenceExtractor {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "Stylesheet";
        }

        [[nodiscard]] std::vector<std::string> supported_extensions() const override {
            return {".css", ".scss", ".less"};
        }

        [[nodiscard]] Result<Extraction, Error> extract(
            std::string_view content,
            const fs::path& origin
        ) const override;
    };

}  // namespace syswalk::extractors

#endif //SYSWALK_STYLESHEET_EXTRACTOR_HPP
