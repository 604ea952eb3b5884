//
// Created by gregorian-rayne on 10/3/26.
//

#ifndef SYSWALK_TYPES_HPP
#define SYSWALK_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data types for reachability analysis.
 *
 * Files are identified solely by their canonical absolute path. Everything
 * else a module needs to know about a file (extension, parser family,
 * whether a header comment can be stamped into it) is derived from that
 * path by the helpers below.
 */

#include <cstddef>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace syswalk {

    namespace fs = std::filesystem;

    /**
     * Ordered set of canonical file paths. Ordered so that iteration (and
     * therefore every rendered listing) is deterministic.
     */
    using FileSet = std::set<fs::path>;

    /**
     * Parser family selected by extension.
     */
    enum class FileFamily {
        Script,        ///< .js .jsx .ts .tsx .mjs .cjs
        PythonModule,  ///< .py
        Markup,        ///< .html .htm
        Stylesheet,    ///< .css .scss .less
        Other          ///< Known to the classifier but never parsed
    };

    [[nodiscard]] const char* file_family_to_string(FileFamily family) noexcept;

    /**
     * Returns the family for a lower-cased extension including the dot.
     */
    [[nodiscard]] FileFamily file_family_for(std::string_view extension) noexcept;

    /**
     * Line comment delimiters used by the header-stamping collaborator.
     */
    struct CommentStyle {
        std::string_view prefix;
        std::string_view suffix;
    };

    /**
     * Returns the comment style for an extension, or nullopt when the file
     * type has no comment syntax (.json) or is unknown.
     */
    [[nodiscard]] std::optional<CommentStyle> comment_style_for(std::string_view extension) noexcept;

    /**
     * Every extension syswalk parses or classifies. This is the default
     * extension allowlist.
     */
    [[nodiscard]] std::set<std::string> known_extensions();

    /**
     * Lower-cased extension of a path, including the leading dot.
     */
    [[nodiscard]] std::string lower_extension(const fs::path& path);

    /**
     * A discovered file with its derived attributes.
     */
    struct SourceFile {
        fs::path path;
        std::string extension;
        FileFamily family = FileFamily::Other;
        bool commentable = false;

        [[nodiscard]] static SourceFile from_path(const fs::path& path);

        bool operator==(const SourceFile& other) const {
            return path == other.path;
        }
    };

    /**
     * A raw reference found inside a file.
     *
     * text is tried first by the resolver, then each alternative in order.
     */
    struct Reference {
        fs::path origin;
        std::string text;
        std::vector<std::string> alternatives;
    };

    /**
     * Where the root set of a run came from.
     */
    enum class RootSource {
        Explicit,    ///< Supplied by the caller
        Convention,  ///< Well-known entry-point file names
        Fallback,    ///< First N markup files
        None         ///< Nothing could be found
    };

    [[nodiscard]] const char* root_source_to_string(RootSource source) noexcept;

    /**
     * Non-fatal per-file note produced during a run.
     */
    struct Diagnostic {
        enum class Kind {
            Unreadable,       ///< File could not be opened or read
            NotText,          ///< Binary or not valid UTF-8
            ParserFallback,   ///< Structural parse failed, lexical fallback used
            ExtractionFailed, ///< Extractor reported an error
            EnumerationFailed ///< Directory walk hit an error
        };

        Kind kind = Kind::Unreadable;
        fs::path file;
        std::string message;
    };

    [[nodiscard]] const char* diagnostic_kind_to_string(Diagnostic::Kind kind) noexcept;

    /**
     * Inputs of one walk.
     */
    struct WalkOptions {
        /// Project root; root-relative references and report paths use it
        fs::path root;

        /// Directories to scan; empty means the root itself
        std::vector<fs::path> scan_dirs;

        /// Lower-cased extensions (with dot); empty means known_extensions()
        std::set<std::string> extensions;

        /// Entry files relative to root or absolute; empty means auto-detect
        std::vector<std::string> explicit_roots;

        bool include_hidden = false;

        /// N for the "first N markup files" root heuristic
        std::size_t fallback_root_limit = 10;

        /// Extraction threads, 0 = hardware concurrency
        std::size_t max_threads = 1;
    };

}  // namespace syswalk

#endif //SYSWALK_TYPES_HPP
