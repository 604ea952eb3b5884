//
// Created by gregorian-rayne on 10/3/26.
//

#ifndef SYSWALK_VERSION_HPP
#define SYSWALK_VERSION_HPP

/**
 * @file version.hpp
 * @brief syswalk version information.
 */

namespace syswalk {

    constexpr int VERSION_MAJOR = 0;
    constexpr int VERSION_MINOR = 3;
    constexpr int VERSION_PATCH = 0;

    /**
     * Full version string in "major.minor.patch" format.
     */
    constexpr auto VERSION_STRING = "0.3.0";

    constexpr auto PROJECT_NAME = "System Walker";

    /**
     * Short project name for CLI usage.
     */
    constexpr auto PROJECT_SHORT_NAME = "syswalk";

}  // namespace syswalk

#endif //SYSWALK_VERSION_HPP
