//
// Created by gregorian-rayne on 10/3/26.
//

#ifndef SYSWALK_ERROR_HPP
#define SYSWALK_ERROR_HPP

/**
 * @file error.hpp
 * @brief Error type shared by every syswalk module.
 *
 * An Error carries a category, a message and an optional context string
 * (usually the offending path). Errors travel inside Result<T, Error>;
 * nothing in the analysis library throws across a module boundary.
 *
 * Categories:
 * - NotFound: a file or directory does not exist
 * - ParseError: content could not be parsed structurally
 * - IoError: reading, writing or enumerating failed
 * - ConfigError: the run configuration is unusable (fatal for a walk)
 * - AnalysisError: a per-file analysis step failed
 * - InternalError: unexpected failure
 *
 * @code
 *     auto result = run_walk(options);
 *     if (result.is_err()) {
 *         std::cerr << result.error() << std::endl;
 *         // [ConfigError] Scan directory does not exist (context: /proj/web)
 *     }
 * @endcode
 */

#include <string>
#include <optional>
#include <ostream>
#include <utility>

namespace syswalk {

    /**
     * Error category enumeration.
     */
    enum class ErrorCode {
        None,             ///< No error
        NotFound,         ///< Resource not found
        ParseError,       ///< Structural parsing failed
        IoError,          ///< I/O operation failed
        ConfigError,      ///< Run configuration is invalid
        AnalysisError,    ///< Per-file analysis failed
        InternalError     ///< Internal/unexpected error
    };

    inline const char* error_code_to_string(ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::None:            return "None";
            case ErrorCode::NotFound:        return "NotFound";
            case ErrorCode::ParseError:      return "ParseError";
            case ErrorCode::IoError:         return "IoError";
            case ErrorCode::ConfigError:     return "ConfigError";
            case ErrorCode::AnalysisError:   return "AnalysisError";
            case ErrorCode::InternalError:   return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Structured error with code, message, and optional context.
     *
     * Immutable after construction.
     */
    class Error {
    public:
        Error(ErrorCode code, std::string message)
            : code_(code)
            , message_(std::move(message))
            , context_(std::nullopt) {}

        Error(ErrorCode code, std::string message, std::string context)
            : code_(code)
            , message_(std::move(message))
            , context_(std::move(context)) {}

        static Error not_found(std::string message, std::string context) {
            return {ErrorCode::NotFound, std::move(message), std::move(context)};
        }

        static Error parse_error(std::string message) {
            return {ErrorCode::ParseError, std::move(message)};
        }

        static Error parse_error(std::string message, std::string context) {
            return {ErrorCode::ParseError, std::move(message), std::move(context)};
        }

        static Error io_error(std::string message, std::string context) {
            return {ErrorCode::IoError, std::move(message), std::move(context)};
        }

        /**
         * Creates a configuration error. The context should name the
         * offending path or option so the CLI can report it verbatim.
         */
        static Error config_error(std::string message, std::string context) {
            return {ErrorCode::ConfigError, std::move(message), std::move(context)};
        }

        static Error analysis_error(std::string message, std::string context) {
            return {ErrorCode::AnalysisError, std::move(message), std::move(context)};
        }

        static Error internal_error(std::string message) {
            return {ErrorCode::InternalError, std::move(message)};
        }

        [[nodiscard]] ErrorCode code() const noexcept {
            return code_;
        }

        [[nodiscard]] const std::string& message() const noexcept {
            return message_;
        }

        [[nodiscard]] const std::optional<std::string>& context() const noexcept {
            return context_;
        }

        [[nodiscard]] bool has_context() const noexcept {
            return context_.has_value();
        }

        /**
         * Returns a copy with additional context appended.
         */
        [[nodiscard]] Error with_context(std::string additional_context) const {
            if (context_.has_value()) {
                return {code_, message_, *context_ + "; " + std::move(additional_context)};
            }
            return {code_, message_, std::move(additional_context)};
        }

        /**
         * Format: "[ErrorCode] message" or "[ErrorCode] message (context: ...)"
         */
        [[nodiscard]] std::string to_string() const {
            std::string result = "[";
            result += error_code_to_string(code_);
            result += "] ";
            result += message_;
            if (context_.has_value()) {
                result += " (context: ";
                result += *context_;
                result += ")";
            }
            return result;
        }

        bool operator==(const Error& other) const {
            return code_ == other.code_ &&
                   message_ == other.message_ &&
                   context_ == other.context_;
        }

        bool operator!=(const Error& other) const {
            return !(*this == other);
        }

    private:
        ErrorCode code_;
        std::string message_;
        std::optional<std::string> context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

    inline std::ostream& operator<<(std::ostream& os, ErrorCode code) {
        return os << error_code_to_string(code);
    }

}  // namespace syswalk

#endif //SYSWALK_ERROR_HPP
