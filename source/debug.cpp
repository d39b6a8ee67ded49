/**
 * @file debug.cpp
 * @brief Debug printing macros.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#include <cstdio>
#include <stdarg.h>
#include "debug.h"

#if (NOVAAT_DEBUG && NOVAAT_DEBUG > 0)

/**
 * @brief User defined function to print debug strings.
 * @param [in] level the log level of the message.
 * @param [in] str message c-string.
 */
extern void at_debug(int level, const char *str);

/**
 * @brief Handles debug formatting and passes string to user defined function.
 * @param [in] level the log level of the message.
 * @param [in] format standard c formatting string.
 * @see at_debug
 * @private
 */
void at_debug_print(int level, const char *format, ...)
{
    va_list argp;
    char buffer[256];

    va_start(argp, format);
    vsnprintf(buffer, sizeof(buffer), format, argp);
    va_end(argp);

    at_debug(level, buffer);
}

#endif // (NOVAAT_DEBUG && NOVAAT_DEBUG > 0)
