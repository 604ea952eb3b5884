//
// Created by gregorian-rayne on 10/4/26.
//

#ifndef SYSWALK_PYTHON_EXTRACTOR_HPP
#define SYSWALK_PYTHON_EXTRACTOR_HPP

/**
 * @file python_extractor.hpp
 * @brief Relative import extraction for Python modules.
 *
 * Two tiers:
 * 1. parse_relative_imports() tokenizes the module (strings, comments,
 *    brackets, continuations) and reads "from .x import y" statements.
 *    It fails on anything that would be a syntax error for the tokenizer.
 * 2. scan_relative_imports() looks for "from .x import " in the raw text, used
 *    when tier 1 fails so a broken file still contributes edges.
 */

#include "syswalk/extractors/extractor.hpp"

namespace syswalk::extractors {

    /**
     * "from ..pkg.mod import x" -> {level = 2, module = "pkg.mod"}
     */
    struct RelativeImport {
        std::size_t level = 0;
        std::string module;

        bool operator==(const RelativeImport& other) const {
            return level == other.level && module == other.module;
        }
    };

    /**
     * Structural pass. Imports without a module name ("from . import x")
     * are not reported.
     */
    [[nodiscard]] Result<std::vector<RelativeImport>, Error> parse_relative_imports(
        std::string_view source
    );

    /**
     * Lexical fallback. Matches inside strings and comments too.
     */
    [[nodiscard]] std::vector<RelativeImport> scan_relative_imports(std::string_view source);

    /**
     * Candidate paths for an import: "./pkg/mod.py" then "./pkg/mod" for
     * level 1, "../pkg/mod.py" then "../pkg/mod" for level 2.
     */
    [[nodiscard]] std::vector<std::string> module_candidates(const RelativeImport& import);

    class PythonExtractor final : public IReferenceExtractor {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "Python";
        }

        [[nodiscard]] std::vector<std::string> supported_extensions() const override {
            return {".py"};
        }

        [[nodiscard]] Result<Extraction, Error> extract(
            std::string_view content,
            const fs::path& origin
        ) const override;
    };

}  // namespace syswalk::extractors

#endif //SYSWALK_PYTHON_EXTRACTOR_HPP
