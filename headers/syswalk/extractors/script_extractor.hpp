//
// Created by gregorian-rayne on 10/4/26.
//

#ifndef SYSWALK_SCRIPT_EXTRACTOR_HPP
#define SYSWALK_SCRIPT_EXTRACTOR_HPP

#include "syswalk/extractors/extractor.hpp"

namespace syswalk::extractors {

    /**
     * JavaScript / TypeScript module references.
     *
     * Recognised forms:
     * - import x from './a'      import { x } from "./a"
     * - import './a'             import('./a')
     * - require('./a')           export * from './a'
     *
     * Only the quoted specifier is read; template literals and computed
     * arguments are ignored.
     */
    class ScriptExtractor final : public IReferenceExtractor {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "Script";
        }

        [[nodiscard]] std::vector<std::string> supported_extensions() const override {
            return {".js", ".jsx", ".ts", ".tsx", ".mjs", ".cjs"};
        }

        [[nodiscard]] Result<Extraction, Error> extract(
            std::string_view content,
            const fs::path& origin
        ) const override;

        /**
         * All module specifiers in the source, relative or not, in
         * order of appearance.
         */
        [[nodiscard]] static std::vector<std::string> find_specifiers(std::string_view content);
    };

}  // namespace syswalk::extractors

#endif //SYSWALK_SCRIPT_EXTRACTOR_HPP
