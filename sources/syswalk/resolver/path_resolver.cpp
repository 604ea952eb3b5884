//
// Created by gregorian-rayne on 10/5/26.
//

#include "syswalk/resolver/path_resolver.hpp"
#include "syswalk/utils/path_utils.hpp"

#include <algorithm>
#include <system_error>

namespace syswalk::resolver {

    namespace {

    bool is_regular_file(const fs::path& path) {
        std::error_code ec;
        return fs::is_regular_file(path, ec);
    }

    bool is_directory(const fs::path& path) {
        std::error_code ec;
        return fs::is_directory(path, ec);
    }

    std::optional<fs::path> try_extensions(const fs::path& candidate) {
        if (resolver::is_regular_file(candidate)) {
            return path_utils::canonical_path(candidate);
        }

        for (const auto ext : COMMON_EXTENSIONS) {
            fs::path with_ext = candidate;
            with_ext += std::string(ext);
            if (resolver::is_regular_file(with_ext)) {
                return path_utils::canonical_path(with_ext);
            }
        }

        if (resolver::is_directory(candidate)) {
            for (const auto ext : INDEX_EXTENSIONS) {
                auto index = candidate / ("index" + std::string(ext));
                if (resolver::is_regular_file(index)) {
                    return path_utils::canonical_path(index);
                }
            }
        }

        return std::nullopt;
    }

    }  // namespace

    std::string_view strip_query_and_fragment(std::string_view reference) noexcept {
        if (const auto hash = reference.find('#'); hash != std::string_view::npos) {
            reference = reference.substr(0, hash);
        }
        if (const auto query = reference.find('?'); query != std::string_view::npos) {
            reference = reference.substr(0, query);
        }
        return reference;
    }

    std::optional<fs::path> resolve_reference(
        const std::string_view text,
        const fs::path& origin,
        const fs::path& root
    ) {
        auto rel = strip_query_and_fragment(text);

        fs::path candidate;
        if (!rel.empty() && rel.front() == '/') {
            rel.remove_prefix(std::min(rel.find_first_not_of('/'), rel.size()));
            candidate = root / fs::path(std::string(rel));
        } else {
            candidate = origin.parent_path() / fs::path(std::string(rel));
        }

        candidate = path_utils::canonical_path(candidate);
        // "dir/" keeps an empty last component; the suffix probes need it gone
        if (!candidate.has_filename() && candidate.has_relative_path()) {
            candidate = candidate.parent_path();
        }

        return try_extensions(candidate);
    }

    std::optional<fs::path> resolve(const Reference& reference, const fs::path& root) {
        if (auto hit = resolve_reference(reference.text, reference.origin, root)) {
            return hit;
        }
        for (const auto& alternative : reference.alternatives) {
            if (auto hit = resolve_reference(alternative, reference.origin, root)) {
                return hit;
            }
        }
        return std::nullopt;
    }

}  // namespace syswalk::resolver
