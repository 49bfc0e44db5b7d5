#ifndef RELIEF_ERROR_H
#define RELIEF_ERROR_H

#include <stdbool.h>
#include <stdarg.h>

/**
 * Relief Error Handling
 *
 * Thread-local last-error message. Functions that can fail return NULL,
 * false or 0 and leave a message here, prefixed with the module that failed
 * ("config: ...", "tile: ..."). Messages longer than the buffer end in "...".
 *
 * Usage:
 *   Relief_Terrain *terrain = relief_terrain_create(&cfg);
 *   if (!terrain) {
 *       printf("Error: %s\n", relief_get_last_error());
 *   }
 */

#ifdef __cplusplus
extern "C" {
#endif

/** Capacity of the message buffer, terminator included */
#define RELIEF_ERROR_MAX 1024

/** Set the error message (printf-style). A NULL format clears it. */
void relief_set_error(const char *fmt, ...);

/** va_list form of relief_set_error(). */
void relief_set_error_v(const char *fmt, va_list args);

/**
 * Last error message, "" when none is set.
 * Thread-local; valid until the next set or clear on this thread.
 */
const char *relief_get_last_error(void);

void relief_clear_error(void);

bool relief_has_error(void);

/**
 * Report the pending error at ERROR level under subsystem (NULL means
 * RELIEF_LOG_CORE) and clear it.
 *
 * @return true if an error was pending
 */
bool relief_log_and_clear_error(const char *subsystem);

#ifdef __cplusplus
}
#endif

#endif /* RELIEF_ERROR_H */
