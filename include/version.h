#ifndef NOVAAT_VERSION_H
#define NOVAAT_VERSION_H

#include <string>

namespace at
{
    /** Major version, increment for API changes. */
    constexpr int kVersionMajor = 0;

    /** Minor version, increment for functionality changes. */
    constexpr int kVersionMinor = 1;

    /** Trivial version, increment for small fixes. */
    constexpr int kVersionTrivial = 0;

    /** Release tag appended to the version string, e.g. "b1". */
    constexpr const char *kVersionTag = "";

    /**
     * @brief Format a version number.
     *
     * Produces "major.minor.trivial" followed by 'tag' if it is not empty,
     * e.g. "1.2.3b1".
     */
    std::string version_string(
            int major = kVersionMajor,
            int minor = kVersionMinor,
            int trivial = kVersionTrivial,
            const char *tag = kVersionTag);
}

#endif // NOVAAT_VERSION_H
