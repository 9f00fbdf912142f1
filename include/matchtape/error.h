#ifndef MATCHTAPE_ERROR_H
#define MATCHTAPE_ERROR_H

#include <stdbool.h>
#include <stdarg.h>

/**
 * Matchtape Error Handling
 *
 * Thread-local error storage with printf-style formatting.
 * Every fallible matchtape call returns false/NULL and leaves a
 * human-readable reason here.
 *
 * Usage:
 *   if (!matchtape_replay_start(replay, host)) {
 *       printf("replay failed: %s\n", matchtape_get_last_error());
 *   }
 */

#ifdef __cplusplus
extern "C" {
#endif

/**
 * Set an error message with printf-style formatting.
 * The message is stored in a thread-local buffer.
 *
 * @param fmt Format string (printf-style)
 * @param ... Format arguments
 */
void matchtape_set_error(const char *fmt, ...);

/**
 * Set an error message with va_list arguments.
 *
 * @param fmt Format string (printf-style)
 * @param args va_list of format arguments
 */
void matchtape_set_error_v(const char *fmt, va_list args);

/**
 * Get the last error message.
 * Returns an empty string if no error has been set.
 *
 * @return Pointer to the error message (thread-local, do not free)
 */
const char *matchtape_get_last_error(void);

/** Clear the last error message. */
void matchtape_clear_error(void);

/**
 * Check if an error is currently set.
 *
 * @return true if an error message is set, false otherwise
 */
bool matchtape_has_error(void);

/**
 * Set error from SDL_GetError().
 * Used after SDL filesystem calls fail.
 *
 * @param prefix Optional prefix to prepend (can be NULL)
 */
void matchtape_set_error_from_sdl(const char *prefix);

/**
 * Set an error from errno, as "<formatted context>: <strerror(errno)>".
 * Used after stdio calls fail.
 */
void matchtape_set_error_from_errno(const char *fmt, ...);

/**
 * Prepend formatted context to the current error, giving
 * "<context>: <previous error>". With no current error the context
 * becomes the whole message.
 *
 * Usage:
 *   if (!matchtape_storage_write(storage, name, text, len)) {
 *       matchtape_prefix_error("Failed to save recording");
 *   }
 */
void matchtape_prefix_error(const char *fmt, ...);

/**
 * Log the last error through the matchtape logger and clear it.
 *
 * @param subsystem Log subsystem tag
 */
void matchtape_log_and_clear_error(const char *subsystem);

#ifdef __cplusplus
}
#endif

#endif /* MATCHTAPE_ERROR_H */
