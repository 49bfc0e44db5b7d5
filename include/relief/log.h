#ifndef RELIEF_LOG_H
#define RELIEF_LOG_H

#include <stdbool.h>
#include <stdarg.h>
#include <stdint.h>

/**
 * Relief Logging
 *
 * Leveled messages tagged with the subsystem that produced them. Every
 * message that passes the level filter goes to the SDL log (application
 * category), to the log file when one is open, and to registered callbacks.
 * Console output works before relief_log_init() has been called.
 *
 * Usage:
 *   relief_log_init();  // /tmp/relief.log, or relief.log on Windows
 *
 *   relief_log_info(RELIEF_LOG_TERRAIN, "Built %d tiles", count);
 *   relief_log_error(RELIEF_LOG_CONFIG, "Failed to parse %s", path);
 *
 *   relief_log_shutdown();
 *
 * File format:
 *   [2024-01-15 14:30:22] WARN  Material: thresholds out of order
 */

#ifdef __cplusplus
extern "C" {
#endif

/** Log levels. A level includes every level below it. */
typedef enum {
    RELIEF_LOG_LEVEL_ERROR = 0,    /**< Always logged, flushed immediately */
    RELIEF_LOG_LEVEL_WARNING = 1,
    RELIEF_LOG_LEVEL_INFO = 2,     /**< Build summaries (default) */
    RELIEF_LOG_LEVEL_DEBUG = 3     /**< Per-tile records */
} Relief_LogLevel;

/* Subsystem tags */
#define RELIEF_LOG_CORE       "Core"
#define RELIEF_LOG_NOISE      "Noise"
#define RELIEF_LOG_TERRAIN    "Terrain"
#define RELIEF_LOG_CONFIG     "Config"
#define RELIEF_LOG_MATERIAL   "Material"

/**
 * Callback invoked for every message that passes the level filter.
 *
 * @param level Message level
 * @param subsystem Subsystem tag as passed to the log call ("Core" for NULL)
 * @param message Formatted message
 * @param userdata User pointer given at registration
 */
typedef void (*Relief_LogCallback)(Relief_LogLevel level, const char *subsystem,
                                   const char *message, void *userdata);

/** Open the default log file. */
bool relief_log_init(void);

/**
 * Open a log file in append mode. Does nothing if a file is already open.
 *
 * @param path Path to the log file (NULL uses the default)
 * @return true on success, false if the file cannot be opened
 */
bool relief_log_init_with_path(const char *path);

/** Write the closing line and close the log file. */
void relief_log_shutdown(void);

bool relief_log_is_initialized(void);

/**
 * Set the level filter. Also sets the SDL priority of the application
 * category so that console output matches the filter.
 */
void relief_log_set_level(Relief_LogLevel level);

Relief_LogLevel relief_log_get_level(void);

/** True if a message at level would be emitted. */
bool relief_log_enabled(Relief_LogLevel level);

/** Enable or disable console output. Enabled by default. */
void relief_log_set_console_output(bool enabled);

/** Short level name ("ERROR", "WARN", "INFO", "DEBUG"). */
const char *relief_log_level_name(Relief_LogLevel level);

/**
 * Parse a level name, case-insensitive. Accepts the short names plus
 * "warning".
 *
 * @return true on success; *out is untouched on failure
 */
bool relief_log_level_parse(const char *name, Relief_LogLevel *out);

void relief_log_error(const char *subsystem, const char *fmt, ...);
void relief_log_warning(const char *subsystem, const char *fmt, ...);
void relief_log_info(const char *subsystem, const char *fmt, ...);
void relief_log_debug(const char *subsystem, const char *fmt, ...);

void relief_log_v(Relief_LogLevel level, const char *subsystem, const char *fmt, va_list args);

/** Path of the open log file, or NULL */
const char *relief_log_get_path(void);

/**
 * Register a log callback.
 *
 * @return Handle for removal, or 0 if no slot is free
 */
uint32_t relief_log_add_callback(Relief_LogCallback callback, void *userdata);

/** Remove a callback by handle. Unknown handles are ignored. */
void relief_log_remove_callback(uint32_t handle);

#ifdef __cplusplus
}
#endif

#endif /* RELIEF_LOG_H */
