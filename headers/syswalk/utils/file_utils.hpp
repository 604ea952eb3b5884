//
// Created by gregorian-rayne on 10/3/26.
//

#ifndef SYSWALK_FILE_UTILS_HPP
#define SYSWALK_FILE_UTILS_HPP

/**
 * @file file_utils.hpp
 * @brief File system utilities.
 *
 * Reading, writing and sniffing files. All operations use
 * Result<T, Error> for error handling.
 */

#include "syswalk/result.hpp"
#include "syswalk/error.hpp"
#include "syswalk/utils/string_utils.hpp"

#include <string>
#include <string_view>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>

namespace syswalk::file_utils {

    namespace fs = std::filesystem;

    /// Number of leading bytes inspected by looks_binary()
    inline constexpr std::size_t BINARY_SNIFF_BYTES = 2048;

    /**
     * Reads an entire file into a string.
     *
     * @param path Path to the file.
     * @return The file contents or an error.
     */
    inline Result<std::string, Error> read_file(const fs::path& path) {
        if (std::error_code ec; !fs::exists(path, ec)) {
            return Result<std::string, Error>::failure(
                Error::not_found("File not found", path.string())
            );
        }

        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to open file", path.string())
            );
        }

        std::ostringstream oss;
        oss << file.rdbuf();

        if (file.bad()) {
            return Result<std::string, Error>::failure(
                Error::io_error("Failed to read file", path.string())
            );
        }

        return Result<std::string, Error>::success(oss.str());
    }

    /**
     * True when the first BINARY_SNIFF_BYTES contain a NUL byte.
     */
    inline bool looks_binary(const std::string_view content) noexcept {
        const auto head = content.substr(0, BINARY_SNIFF_BYTES);
        return head.find('\0') != std::string_view::npos;
    }

    /**
     * Reads a file that must be UTF-8 text.
     *
     * Binary content or invalid UTF-8 yields a ParseError so callers can
     * tell "not text" apart from an I/O failure.
     */
    inline Result<std::string, Error> read_text_file(const fs::path& path) {
        auto content = read_file(path);
        if (content.is_err()) {
            return content;
        }

        if (looks_binary(content.value())) {
            return Result<std::string, Error>::failure(
                Error::parse_error("Binary content", path.string())
            );
        }
        if (!string_utils::is_valid_utf8(content.value())) {
            return Result<std::string, Error>::failure(
                Error::parse_error("Not valid UTF-8", path.string())
            );
        }

        return content;
    }

    /**
     * Writes a string to a file, creating parent directories.
     */
    inline Result<void, Error> write_file(const fs::path& path, std::string_view content) {
        auto parent = path.parent_path();
        if (std::error_code ec; !parent.empty() && !fs::exists(parent, ec)) {
            fs::create_directories(parent, ec);
            if (ec) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to create directory", parent.string())
                );
            }
        }

        std::ofstream file(path, std::ios::binary);
        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to open file for writing", path.string())
            );
        }

        file.write(content.data(), static_cast<std::streamsize>(content.size()));

        if (!file) {
            return Result<void, Error>::failure(
                Error::io_error("Failed to write file", path.string())
            );
        }

        return Result<void, Error>::success();
    }

    /**
     * Checks if a name is a backup produced by the renaming collaborator:
     * "x.js.bak", "x.js.bak2", "X.BAK".
     */
    inline bool is_backup_file(const fs::path& path) {
        static const std::regex bak_re(R"(\.bak(\d+)?$)", std::regex::icase);
        return std::regex_search(path.filename().string(), bak_re);
    }

    /**
     * Dot-file or dot-directory name ("." and ".." excluded).
     */
    inline bool is_hidden_name(const fs::path& name) {
        const auto str = name.string();
        return str.size() > 1 && str[0] == '.' && str != "..";
    }

}  // namespace syswalk::file_utils

#endif //SYSWALK_FILE_UTILS_HPP
