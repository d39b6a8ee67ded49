/**
 * @file version.cpp
 * @brief Library version string.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#include <cstdio>

#include "version.h"

namespace at {

std::string version_string(int major, int minor, int trivial, const char *tag)
{
    char buffer[48];
    snprintf(buffer, sizeof(buffer), "%d.%d.%d%s",
            major, minor, trivial, (tag != nullptr) ? tag : "");

    return buffer;
}

} // namespace at
