//
// Created by gregorian-rayne on 10/3/26.
//

#include "syswalk/types.hpp"
#include "syswalk/utils/string_utils.hpp"

#include <array>
#include <utility>

namespace syswalk {

    namespace {

    struct CommentEntry {
        std::string_view extension;
        CommentStyle style;
    };

    constexpr std::array<CommentEntry, 31> COMMENT_STYLES = {{
        {".js", {"// ", ""}}, {".jsx", {"// ", ""}}, {".ts", {"// ", ""}}, {".tsx", {"// ", ""}},
        {".mjs", {"// ", ""}}, {".cjs", {"// ", ""}},
        {".c", {"// ", ""}}, {".cpp", {"// ", ""}}, {".h", {"// ", ""}}, {".hpp", {"// ", ""}},
        {".java", {"// ", ""}}, {".cs", {"// ", ""}},
        {".py", {"# ", ""}}, {".sh", {"# ", ""}}, {".rb", {"# ", ""}}, {".pl", {"# ", ""}},
        {".ps1", {"# ", ""}},
        {".css", {"/* ", " */"}}, {".scss", {"/* ", " */"}}, {".less", {"/* ", " */"}},
        {".html", {"<!-- ", " -->"}}, {".htm", {"<!-- ", " -->"}},
        {".php", {"// ", ""}},
        {".yml", {"# ", ""}}, {".yaml", {"# ", ""}}, {".toml", {"# ", ""}},
        {".ini", {"; ", ""}}, {".cfg", {"# ", ""}}, {".env", {"# ", ""}},
        {".sql", {"-- ", ""}}, {".md", {"<!-- ", " -->"}},
    }};

    constexpr std::array<std::string_view, 1> UNCOMMENTABLE = {".json"};

    }  // namespace

    const char* file_family_to_string(const FileFamily family) noexcept {
        switch (family) {
            case FileFamily::Script:       return "script";
            case FileFamily::PythonModule: return "python";
            case FileFamily::Markup:       return "markup";
            case FileFamily::Stylesheet:   return "stylesheet";
            case FileFamily::Other:        return "other";
        }
        return "other";
    }

    FileFamily file_family_for(const std::string_view extension) noexcept {
        if (extension == ".js" || extension == ".jsx" || extension == ".ts" ||
            extension == ".tsx" || extension == ".mjs" || extension == ".cjs") {
            return FileFamily::Script;
        }
        if (extension == ".py") {
            return FileFamily::PythonModule;
        }
        if (extension == ".html" || extension == ".htm") {
            return FileFamily::Markup;
        }
        if (extension == ".css" || extension == ".scss" || extension == ".less") {
            return FileFamily::Stylesheet;
        }
        return FileFamily::Other;
    }

    std::optional<CommentStyle> comment_style_for(const std::string_view extension) noexcept {
        for (const auto& [ext, style] : COMMENT_STYLES) {
            if (ext == extension) {
                return style;
            }
        }
        return std::nullopt;
    }

    std::set<std::string> known_extensions() {
        std::set<std::string> result;
        for (const auto& entry : COMMENT_STYLES) {
            result.emplace(entry.extension);
        }
        for (const auto ext : UNCOMMENTABLE) {
            result.emplace(ext);
        }
        return result;
    }

    std::string lower_extension(const fs::path& path) {
        return string_utils::to_lower(path.extension().string());
    }

    SourceFile SourceFile::from_path(const fs::path& path) {
        SourceFile file;
        file.path = path;
        file.extension = lower_extension(path);
        file.family = file_family_for(file.extension);
        file.commentable = comment_style_for(file.extension).has_value();
        return file;
    }

    const char* root_source_to_string(const RootSource source) noexcept {
        switch (source) {
            case RootSource::Explicit:   return "explicit";
            case RootSource::Convention: return "convention";
            case RootSource::Fallback:   return "fallback";
            case RootSource::None:       return "none";
        }
        return "none";
    }

    const char* diagnostic_kind_to_string(const Diagnostic::Kind kind) noexcept {
        switch (kind) {
            case Diagnostic::Kind::Unreadable:        return "unreadable";
            case Diagnostic::Kind::NotText:           return "not-text";
            case Diagnostic::Kind::ParserFallback:    return "parser-fallback";
            case Diagnostic::Kind::ExtractionFailed:  return "extraction-failed";
            case Diagnostic::Kind::EnumerationFailed: return "enumeration-failed";
        }
        return "unknown";
    }

}  // namespace syswalk
