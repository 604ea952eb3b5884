//
// Created by gregorian-rayne on 10/5/26.
//

#include "syswalk/graph/graph_builder.hpp"
#include "syswalk/resolver/path_resolver.hpp"
#include "syswalk/utils/file_utils.hpp"
#include "syswalk/utils/parallel.hpp"
#include "syswalk/utils/path_utils.hpp"

#include <algorithm>
#include <exception>
#include <system_error>

namespace syswalk::graph {

    namespace {

    Diagnostic make_diagnostic(const Diagnostic::Kind kind, const fs::path& file, std::string message) {
        return Diagnostic{kind, file, std::move(message)};
    }

    void walk_directory(
        const fs::path& dir,
        const std::set<std::string>& extensions,
        const bool include_hidden,
        FileCollection& out
    ) {
        std::error_code ec;
        fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            out.diagnostics.push_back(make_diagnostic(
                Diagnostic::Kind::EnumerationFailed, dir, ec.message()));
            return;
        }

        const fs::recursive_directory_iterator end;
        while (it != end) {
            const auto& entry = *it;
            const auto name = entry.path().filename();

            if (!include_hidden && file_utils::is_hidden_name(name)) {
                if (entry.is_directory(ec)) {
                    it.disable_recursion_pending();
                }
            } else if (entry.is_regular_file(ec) &&
                       (extensions.empty() || extensions.contains(lower_extension(entry.path())))) {
                out.files.insert(path_utils::canonical_path(entry.path()));
            }

            it.increment(ec);
            if (ec) {
                out.diagnostics.push_back(make_diagnostic(
                    Diagnostic::Kind::EnumerationFailed, dir, ec.message()));
                return;
            }
        }
    }

    }  // namespace

    FileCollection collect_files(
        const std::vector<fs::path>& scan_dirs,
        const std::set<std::string>& extensions,
        const bool include_hidden
    ) {
        FileCollection collection;
        for (const auto& dir : scan_dirs) {
            walk_directory(path_utils::canonical_path(dir), extensions, include_hidden, collection);
        }
        return collection;
    }

    GraphBuilder::GraphBuilder(const extractors::ExtractorSet& extractors, fs::path root)
        : extractors_(extractors)
        , root_(std::move(root)) {}

    FileAnalysis GraphBuilder::analyze_file(const fs::path& file) const {
        FileAnalysis analysis;
        analysis.file = file;

        const auto* extractor = extractors_.find(lower_extension(file));
        if (!extractor) {
            return analysis;
        }

        auto content = file_utils::read_text_file(file);
        if (content.is_err()) {
            const auto kind = content.error().code() == ErrorCode::ParseError
                ? Diagnostic::Kind::NotText
                : Diagnostic::Kind::Unreadable;
            analysis.diagnostics.push_back(make_diagnostic(kind, file, content.error().message()));
            return analysis;
        }

        try {
            auto extracted = extractor->extract(content.value(), file);
            if (extracted.is_err()) {
                analysis.diagnostics.push_back(make_diagnostic(
                    Diagnostic::Kind::ExtractionFailed, file, extracted.error().message()));
                return analysis;
            }

            const auto& extraction = extracted.value();
            if (extraction.degraded) {
                analysis.diagnostics.push_back(make_diagnostic(
                    Diagnostic::Kind::ParserFallback, file, extraction.degraded_reason));
            }

            for (const auto& reference : extraction.references) {
                if (auto target = resolver::resolve(reference, root_)) {
                    analysis.targets.push_back(std::move(*target));
                }
            }
        } catch (const std::exception& e) {
            analysis.targets.clear();
            analysis.diagnostics.push_back(make_diagnostic(
                Diagnostic::Kind::ExtractionFailed, file,
                std::string(extractor->name()) + " extractor threw: " + e.what()));
        }

        return analysis;
    }

    BuildOutput GraphBuilder::build(const FileSet& files) const {
        const std::vector<fs::path> ordered(files.begin(), files.end());

        std::vector<FileAnalysis> analyses;
        if (max_threads_ != 1 && ordered.size() > 1) {
            const std::size_t requested = max_threads_ == 0 ? parallel::hardware_concurrency() : max_threads_;
            const auto threads = std::min({requested, ordered.size(), std::size_t{parallel::max_pool_size()}});
            try {
                parallel::ThreadPool pool(static_cast<unsigned int>(threads));
                analyses = parallel::map(ordered, [this](const fs::path& file) {
                    return analyze_file(file);
                }, pool);
            } catch (const std::system_error&) {
                // No threads available; extract sequentially instead
                analyses.clear();
            }
        }

        if (analyses.size() != ordered.size()) {
            analyses.clear();
            analyses.reserve(ordered.size());
            for (const auto& file : ordered) {
                analyses.push_back(analyze_file(file));
            }
        }

        BuildOutput output;
        for (const auto& file : ordered) {
            output.graph.add_node(file);
        }
        for (auto& analysis : analyses) {
            for (const auto& target : analysis.targets) {
                output.graph.add_edge(analysis.file, target);
            }
            for (auto& diagnostic : analysis.diagnostics) {
                output.diagnostics.push_back(std::move(diagnostic));
            }
        }

        return output;
    }

}  // namespace syswalk::graph
