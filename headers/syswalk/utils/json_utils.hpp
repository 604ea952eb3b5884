//
// Created by gregorian-rayne on 10/7/26.
//

#ifndef SYSWALK_JSON_UTILS_HPP
#define SYSWALK_JSON_UTILS_HPP

/**
 * @file json_utils.hpp
 * @brief JSON serialization utilities.
 *
 * Thin helpers over nlohmann/json that report failures through
 * Result<T, Error>.
 */

#include "syswalk/result.hpp"
#include "syswalk/error.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace syswalk::json_utils {

    using json = nlohmann::json;

    /**
     * Serializes a JSON value.
     *
     * @param indent Indentation level (-1 for compact output).
     * @return The JSON text, or an error for invalid UTF-8 in strings.
     */
    inline Result<std::string, Error> dump(const json& data, const int indent = 2) {
        try {
            return Result<std::string, Error>::success(data.dump(indent));
        } catch (const json::type_error& e) {
            return Result<std::string, Error>::failure(
                Error::internal_error(std::string("JSON serialization error: ") + e.what())
            );
        }
    }

}  // namespace syswalk::json_utils

#endif //SYSWALK_JSON_UTILS_HPP
