//
// Created by gregorian-rayne on 10/19/26.
//

#ifndef PERFBUDGETREGISTRY_VERSION_HPP
#define PERFBUDGETREGISTRY_VERSION_HPP

/**
 * @file version.hpp
 * @brief Performance Budget Registry version information.
 */

namespace pbr {

    /**
     * Major version number.
     * Incremented for breaking API changes, including renaming or removing
     * a standard budget.
     */
    constexpr int VERSION_MAJOR = 1;

    /**
     * Minor version number.
     * Incremented for new features with backward compatibility.
     */
    constexpr int VERSION_MINOR = 0;

    /**
     * Patch version number.
     */
    constexpr int VERSION_PATCH = 0;

    constexpr auto VERSION_STRING = "1.0.0";

    constexpr auto PROJECT_NAME = "Performance Budget Registry";

    constexpr auto PROJECT_SHORT_NAME = "pbr";

}  // namespace pbr

#endif //PERFBUDGETREGISTRY_VERSION_HPP
