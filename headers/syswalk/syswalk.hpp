//
// Created by gregorian-rayne on 10/3/26.
//

#ifndef SYSWALK_SYSWALK_HPP
#define SYSWALK_SYSWALK_HPP

/**
 * @file syswalk.hpp
 * @brief Main header for the syswalk library.
 *
 * Pulls in the core types and the analysis entry point. Include the
 * specific headers for narrower dependencies.
 */

#include "version.hpp"
#include "error.hpp"
#include "result.hpp"
#include "types.hpp"
#include "analysis/walker.hpp"

#endif //SYSWALK_SYSWALK_HPP
