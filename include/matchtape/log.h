#ifndef MATCHTAPE_LOG_H
#define MATCHTAPE_LOG_H

#include <stdbool.h>
#include <stdarg.h>
#include <stdint.h>

/**
 * Matchtape Logging
 *
 * File-based logging with subsystem tags and log levels. Recording and
 * replay faults (missing metadata, failed spawns, stale mappings) are
 * reported here.
 *
 * Usage:
 *   matchtape_log_init_with_path("matchtape.log");
 *   matchtape_log_info(MATCHTAPE_LOG_RECORD, "Recording started on %s", map);
 *   matchtape_log_warning(MATCHTAPE_LOG_REPLAY, "netid %u vanished", netid);
 *   matchtape_log_shutdown();
 *
 * File lines:
 *   2026-01-15 14:30:22 WARNING [Replay] netid 12 vanished
 *
 * Console output goes through SDL_LogMessage in SDL_LOG_CATEGORY_CUSTOM.
 */

#ifdef __cplusplus
extern "C" {
#endif

/**
 * Log levels - higher values include lower levels
 */
typedef enum {
    MATCHTAPE_LOG_LEVEL_ERROR = 0,    /**< Critical errors, always logged, auto-flush */
    MATCHTAPE_LOG_LEVEL_WARNING = 1,  /**< Faults the core recovered from */
    MATCHTAPE_LOG_LEVEL_INFO = 2,     /**< Mode transitions and file operations */
    MATCHTAPE_LOG_LEVEL_DEBUG = 3     /**< Per-tick detail */
} Matchtape_LogLevel;

/**
 * Subsystem identifiers
 */
#define MATCHTAPE_LOG_CORE      "Core"
#define MATCHTAPE_LOG_RECORD    "Record"
#define MATCHTAPE_LOG_REPLAY    "Replay"
#define MATCHTAPE_LOG_MODE      "Mode"
#define MATCHTAPE_LOG_FORMAT    "Format"
#define MATCHTAPE_LOG_CONFIG    "Config"
#define MATCHTAPE_LOG_STORAGE   "Storage"
#define MATCHTAPE_LOG_HOST      "Host"
#define MATCHTAPE_LOG_CONSOLE   "Console"

/**
 * Callback invoked for every message that passes the level filter.
 *
 * @param level     Message level
 * @param subsystem Subsystem tag (MATCHTAPE_LOG_CORE when none was given)
 * @param message   Formatted message (without timestamp)
 * @param userdata  User pointer given at registration
 */
typedef void (*Matchtape_LogCallback)(Matchtape_LogLevel level,
                                      const char *subsystem,
                                      const char *message,
                                      void *userdata);

/**
 * Initialize the logging system with a custom log file path.
 *
 * @param path Path to the log file (NULL uses /tmp/matchtape.log, or
 *             matchtape.log on Windows)
 * @return true on success, false on failure
 */
bool matchtape_log_init_with_path(const char *path);

/**
 * Shutdown the logging system.
 * Writes session end marker and closes the log file.
 */
void matchtape_log_shutdown(void);

/** @return true if a log file is open */
bool matchtape_log_is_initialized(void);

/**
 * Set the current log level filter. Messages above this level are
 * dropped; out-of-range values are ignored.
 */
void matchtape_log_set_level(Matchtape_LogLevel level);

/** @return The current log level */
Matchtape_LogLevel matchtape_log_get_level(void);

/**
 * Parse a level name ("error", "warning", "info", "debug").
 *
 * @param name Level name (case-insensitive)
 * @param out  Receives the level
 * @return true if the name is recognized
 */
bool matchtape_log_level_from_string(const char *name, Matchtape_LogLevel *out);

/**
 * Set whether to also output to console (SDL_Log).
 * Enabled by default.
 */
void matchtape_log_set_console_output(bool enabled);

/** Log an error message. Errors are always logged and auto-flush. */
void matchtape_log_error(const char *subsystem, const char *fmt, ...);

/** Log a warning message. */
void matchtape_log_warning(const char *subsystem, const char *fmt, ...);

/** Log an info message. */
void matchtape_log_info(const char *subsystem, const char *fmt, ...);

/** Log a debug message. */
void matchtape_log_debug(const char *subsystem, const char *fmt, ...);

/**
 * Log with explicit level (va_list version).
 */
void matchtape_log_v(Matchtape_LogLevel level, const char *subsystem, const char *fmt, va_list args);

/**
 * Get the path to the current log file.
 *
 * @return Path to log file, or NULL if not initialized
 */
const char *matchtape_log_get_path(void);

/**
 * Register a log callback.
 *
 * @param callback Function to call
 * @param userdata Passed back to the callback
 * @return Handle for removal, or 0 if no slot is free
 */
uint32_t matchtape_log_add_callback(Matchtape_LogCallback callback, void *userdata);

/**
 * Remove a previously registered callback.
 *
 * @param handle Handle returned by matchtape_log_add_callback (0 is ignored)
 */
void matchtape_log_remove_callback(uint32_t handle);

#ifdef __cplusplus
}
#endif

#endif /* MATCHTAPE_LOG_H */
