//
// Created by gregorian-rayne on 10/4/26.
//

#include "syswalk/extractors/extractor.hpp"
#include "syswalk/extractors/script_extractor.hpp"
#include "syswalk/extractors/python_extractor.hpp"
#include "syswalk/extractors/markup_extractor.hpp"
#include "syswalk/extractors/stylesheet_extractor.hpp"
#include "syswalk/utils/string_utils.hpp"

namespace syswalk::extractors {

    bool looks_relative(const std::string_view specifier) noexcept {
        return string_utils::starts_with(specifier, "./") ||
               string_utils::starts_with(specifier, "../") ||
               string_utils::starts_with(specifier, "/");
    }

    void ExtractorSet::add(std::shared_ptr<const IReferenceExtractor> extractor) {
        if (!extractor) {
            return;
        }
        for (const auto& ext : extractor->supported_extensions()) {
            by_extension_[string_utils::to_lower(ext)] = extractor;
        }
    }

    const IReferenceExtractor* ExtractorSet::find(const std::string_view extension) const {
        if (const auto it = by_extension_.find(extension); it != by_extension_.end()) {
            return it->second.get();
        }
        return nullptr;
    }

    std::vector<std::string> ExtractorSet::extensions() const {
        std::vector<std::string> result;
        result.reserve(by_extension_.size());
        for (const auto& [ext, extractor] : by_extension_) {
            result.push_back(ext);
        }
        return result;
    }

    ExtractorSet ExtractorSet::defaults() {
        ExtractorSet set;
        set.add(std::make_shared<ScriptExtractor>());
        set.add(std::make_shared<PythonExtractor>());
        set.add(std::make_shared<MarkupExtractor>());
        set.add(std::make_shared<StylesheetExtractor>());
        return set;
    }

}  // namespace syswalk::extractors
