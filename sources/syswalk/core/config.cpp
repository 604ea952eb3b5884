//
// Created by gregorian-rayne on 10/8/26.
//

#include "syswalk/core/config.hpp"
#include "syswalk/utils/file_utils.hpp"
#include "syswalk/utils/string_utils.hpp"

#include <toml++/toml.h>

#include <sstream>
#include <system_error>

namespace syswalk::core {

    namespace {

    Error key_error(const std::string& key, const std::string& expected, const std::string_view source) {
        return Error::config_error("'" + key + "' must be " + expected, std::string(source));
    }

    template<typename View>
    Result<void, Error> read_string_array(View node, const std::string& key,
                                          std::vector<std::string>& out, const std::string_view source) {
        if (!node) {
            return Result<void, Error>::success();
        }
        const auto* array = node.as_array();
        if (!array) {
            return Result<void, Error>::failure(key_error(key, "an array of strings", source));
        }

        out.clear();
        for (const auto& element : *array) {
            if (!element.is_string()) {
                return Result<void, Error>::failure(key_error(key, "an array of strings", source));
            }
            out.emplace_back(element.value_or(""));
        }
        return Result<void, Error>::success();
    }

    template<typename View>
    Result<void, Error> read_bool(View node, const std::string& key, bool& out, const std::string_view source) {
        if (!node) {
            return Result<void, Error>::success();
        }
        if (!node.is_boolean()) {
            return Result<void, Error>::failure(key_error(key, "a boolean", source));
        }
        out = node.value_or(out);
        return Result<void, Error>::success();
    }

    template<typename View>
    Result<void, Error> read_integer(View node, const std::string& key, std::int64_t& out,
                                     const std::string_view source) {
        if (!node) {
            return Result<void, Error>::success();
        }
        if (!node.is_integer()) {
            return Result<void, Error>::failure(key_error(key, "an integer", source));
        }
        out = node.value_or(out);
        return Result<void, Error>::success();
    }

    template<typename View>
    Result<void, Error> read_string(View node, const std::string& key, std::string& out,
                                    const std::string_view source) {
        if (!node) {
            return Result<void, Error>::success();
        }
        if (!node.is_string()) {
            return Result<void, Error>::failure(key_error(key, "a string", source));
        }
        out = std::string(node.value_or(""));
        return Result<void, Error>::success();
    }

    }  // namespace

    Result<Config, Error> Config::load_from_file(const fs::path& path) {
        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<Config, Error>::failure(
                Error::config_error("Cannot read configuration file: " + content.error().message(),
                                    path.string())
            );
        }
        return load_from_string(content.value(), path.string());
    }

    Result<Config, Error> Config::load_from_string(const std::string_view content, const std::string_view source) {
        toml::table tbl;
        try {
            tbl = toml::parse(content, source);
        } catch (const toml::parse_error& err) {
            std::ostringstream message;
            message << "Failed to parse TOML configuration: " << err.description()
                    << " (line " << err.source().begin.line << ")";
            return Result<Config, Error>::failure(Error::config_error(message.str(), std::string(source)));
        }

        Config config;
        std::vector<Result<void, Error>> reads;

        if (tbl["scan"]) {
            if (!tbl["scan"].is_table()) {
                return Result<Config, Error>::failure(key_error("scan", "a table", source));
            }
            auto scan = tbl["scan"];
            reads.push_back(read_string_array(scan["dirs"], "scan.dirs", config.scan.dirs, source));
            reads.push_back(read_string_array(scan["extensions"], "scan.extensions", config.scan.extensions, source));
            reads.push_back(read_bool(scan["include_hidden"], "scan.include_hidden", config.scan.include_hidden, source));
            reads.push_back(read_integer(scan["threads"], "scan.threads", config.scan.threads, source));
        }

        if (tbl["roots"]) {
            if (!tbl["roots"].is_table()) {
                return Result<Config, Error>::failure(key_error("roots", "a table", source));
            }
            auto roots = tbl["roots"];
            reads.push_back(read_string_array(roots["entries"], "roots.entries", config.roots.entries, source));
            reads.push_back(read_integer(roots["fallback_limit"], "roots.fallback_limit",
                                         config.roots.fallback_limit, source));
        }

        if (tbl["report"]) {
            if (!tbl["report"].is_table()) {
                return Result<Config, Error>::failure(key_error("report", "a table", source));
            }
            auto report = tbl["report"];
            if (report["file"]) {
                std::string file;
                reads.push_back(read_string(report["file"], "report.file", file, source));
                config.report.file = std::move(file);
            }
            reads.push_back(read_string(report["format"], "report.format", config.report.format, source));
        }

        for (const auto& read : reads) {
            if (read.is_err()) {
                return Result<Config, Error>::failure(read.error());
            }
        }

        if (auto validation = config.validate(); validation.is_err()) {
            return Result<Config, Error>::failure(validation.error().with_context(std::string(source)));
        }

        return Result<Config, Error>::success(std::move(config));
    }

    Config Config::default_config() {
        return Config{};
    }

    Result<void, Error> Config::validate() const {
        if (scan.threads < 0) {
            return Result<void, Error>::failure(
                Error::config_error("scan.threads must not be negative", std::to_string(scan.threads)));
        }
        if (roots.fallback_limit < 0) {
            return Result<void, Error>::failure(
                Error::config_error("roots.fallback_limit must not be negative",
                                    std::to_string(roots.fallback_limit)));
        }
        if (report.file && report.file->empty()) {
            return Result<void, Error>::failure(
                Error::config_error("report.file must not be empty", "report.file"));
        }
        if (const auto format = string_utils::to_lower(report.format); format != "text" && format != "json") {
            return Result<void, Error>::failure(
                Error::config_error("report.format must be \"text\" or \"json\"", report.format));
        }
        return Result<void, Error>::success();
    }

    WalkOptions Config::to_walk_options(const fs::path& root) const {
        WalkOptions options;
        options.root = root;
        for (const auto& dir : scan.dirs) {
            options.scan_dirs.emplace_back(dir);
        }
        options.extensions.insert(scan.extensions.begin(), scan.extensions.end());
        options.explicit_roots = roots.entries;
        options.include_hidden = scan.include_hidden;
        options.fallback_root_limit = static_cast<std::size_t>(roots.fallback_limit);
        options.max_threads = static_cast<std::size_t>(scan.threads);
        return options;
    }

    Result<Config, Error> load_project_config(const fs::path& root, const fs::path& explicit_file) {
        if (!explicit_file.empty()) {
            return Config::load_from_file(explicit_file);
        }

        const auto default_file = root / fs::path(CONFIG_FILE_NAME);
        if (std::error_code ec; fs::is_regular_file(default_file, ec)) {
            return Config::load_from_file(default_file);
        }
        return Result<Config, Error>::success(Config::default_config());
    }

}  // namespace syswalk::core
