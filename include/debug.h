/**
 * @file debug.h
 * @brief Debug printing macros.
 * @author Wilkins White
 * @copyright 2026 Nova Dynamics LLC
 */

#ifndef NOVAAT_DEBUG_H_
#define NOVAAT_DEBUG_H_

#define NOVAAT_DEBUG_ERROR (1)
#define NOVAAT_DEBUG_WARN (2)
#define NOVAAT_DEBUG_INFO (3)
#define NOVAAT_DEBUG_VERBOSE (4)
#define NOVAAT_DEBUG_TRACE (5)

#ifndef NOVAAT_DEBUG
#define NOVAAT_DEBUG (0)
#endif

#if (NOVAAT_DEBUG > 0)
void at_debug_print(int level, const char *format, ...);
#endif

/**@{*/
/** Log problems that need to be resolved manually. */
#if (NOVAAT_DEBUG >= NOVAAT_DEBUG_ERROR)
#define LOG_ERROR(...) at_debug_print(NOVAAT_DEBUG_ERROR, __VA_ARGS__)
#else
#define LOG_ERROR(...) do {} while(0)
#endif
/**@}*/

/**@{*/
/** Log problems that will be resolved automatically. */
#if (NOVAAT_DEBUG >= NOVAAT_DEBUG_WARN)
#define LOG_WARN(...) at_debug_print(NOVAAT_DEBUG_WARN, __VA_ARGS__)
#else
#define LOG_WARN(...) do {} while(0)
#endif
/**@}*/

/**@{*/
/** Log one-shot informational messages. */
#if (NOVAAT_DEBUG >= NOVAAT_DEBUG_INFO)
#define LOG_INFO(...) at_debug_print(NOVAAT_DEBUG_INFO, __VA_ARGS__)
#else
#define LOG_INFO(...) do {} while(0)
#endif
/**@}*/

/**@{*/
/** Log verbose informational messages about internal operation. */
#if (NOVAAT_DEBUG >= NOVAAT_DEBUG_VERBOSE)
#define LOG_VERBOSE(...) at_debug_print(NOVAAT_DEBUG_VERBOSE, __VA_ARGS__)
#else
#define LOG_VERBOSE(...) do{} while(0)
#endif
/**@}*/

/**@{*/
/** Log every line passing through the dispatcher. */
#if (NOVAAT_DEBUG >= NOVAAT_DEBUG_TRACE)
#define LOG_TRACE(...) at_debug_print(NOVAAT_DEBUG_TRACE, __VA_ARGS__)
#else
#define LOG_TRACE(...) do{} while(0)
#endif
/**@}*/

#endif // NOVAAT_DEBUG_H_
