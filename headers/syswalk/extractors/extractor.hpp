//
// Created by gregorian-rayne on 10/4/26.
//

#ifndef SYSWALK_EXTRACTOR_HPP
#define SYSWALK_EXTRACTOR_HPP

/**
 * @file extractor.hpp
 * @brief Reference extractor interface and extension registry.
 *
 * An extractor turns the text of one file into the raw relative
 * references it contains. Extractors never touch the file system; the
 * resolver decides what a reference points at.
 *
 * Families:
 * - ScriptExtractor: import / export-from / require in JS and TS
 * - PythonExtractor: relative "from .x import y", with a lexical fallback
 * - MarkupExtractor: src / href / data-src / poster attributes
 * - StylesheetExtractor: @import and url(...)
 */

#include "syswalk/result.hpp"
#include "syswalk/error.hpp"
#include "syswalk/types.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace syswalk::extractors {

    /**
     * Output of one extraction.
     */
    struct Extraction {
        std::vector<Reference> references;

        /// True when a structural parse failed and a lexical scan was used
        bool degraded = false;

        /// Why the structural parse failed, when degraded
        std::string degraded_reason;
    };

    /**
     * True for "./x", "../x" and "/x". Bare module names and URLs are not
     * relative.
     */
    [[nodiscard]] bool looks_relative(std::string_view specifier) noexcept;

    class IReferenceExtractor {
    public:
        virtual ~IReferenceExtractor() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        /**
         * Lower-cased extensions including the dot (e.g. {".css", ".scss"}).
         */
        [[nodiscard]] virtual std::vector<std::string> supported_extensions() const = 0;

        /**
         * Extracts references from file content.
         *
         * Implementations must be stateless so one instance can serve
         * several threads.
         *
         * @param content UTF-8 text of the file.
         * @param origin Canonical path of the file, copied into each Reference.
         */
        [[nodiscard]] virtual Result<Extraction, Error> extract(
            std::string_view content,
            const fs::path& origin
        ) const = 0;
    };

    /**
     * Extension -> extractor mapping handed to the graph builder.
     *
     * Not a singleton: tests build their own sets.
     */
    class ExtractorSet {
    public:
        /**
         * Registers an extractor for each of its supported extensions,
         * replacing earlier registrations of the same extension.
         */
        void add(std::shared_ptr<const IReferenceExtractor> extractor);

        [[nodiscard]] const IReferenceExtractor* find(std::string_view extension) const;

        [[nodiscard]] std::vector<std::string> extensions() const;

        [[nodiscard]] bool empty() const noexcept {
            return by_extension_.empty();
        }

        /**
         * The four built-in families.
         */
        [[nodiscard]] static ExtractorSet defaults();

    private:
        std::map<std::string, std::shared_ptr<const IReferenceExtractor>, std::less<>> by_extension_;
    };

}  // namespace syswalk::extractors

#endif //SYSWALK_EXTRACTOR_HPP
