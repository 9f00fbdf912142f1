#include "matchtape/error.h"
#include "matchtape/log.h"
#include <SDL3/SDL.h>
#include <errno.h>
#include <stdio.h>
#include <string.h>

#define MATCHTAPE_ERROR_BUFFER_SIZE 1024

static thread_local char error_buffer[MATCHTAPE_ERROR_BUFFER_SIZE] = {0};

/* ============================================================================
 * Setting
 * ============================================================================ */

void matchtape_set_error(const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    matchtape_set_error_v(fmt, args);
    va_end(args);
}

void matchtape_set_error_v(const char *fmt, va_list args) {
    if (!fmt) {
        error_buffer[0] = '\0';
        return;
    }
    vsnprintf(error_buffer, sizeof(error_buffer), fmt, args);
}

void matchtape_set_error_from_sdl(const char *prefix) {
    const char *sdl_error = SDL_GetError();
    if (!sdl_error || sdl_error[0] == '\0') {
        sdl_error = "unknown SDL error";
    }

    if (prefix && prefix[0] != '\0') {
        snprintf(error_buffer, sizeof(error_buffer), "%s: %s", prefix, sdl_error);
    } else {
        snprintf(error_buffer, sizeof(error_buffer), "%s", sdl_error);
    }
}

void matchtape_set_error_from_errno(const char *fmt, ...) {
    /* Read errno before any formatting can touch it */
    int saved = errno;
    const char *reason = saved != 0 ? strerror(saved) : "unknown I/O error";

    char context[512];
    va_list args;
    va_start(args, fmt);
    vsnprintf(context, sizeof(context), fmt ? fmt : "", args);
    va_end(args);

    if (context[0] != '\0') {
        snprintf(error_buffer, sizeof(error_buffer), "%s: %s", context, reason);
    } else {
        snprintf(error_buffer, sizeof(error_buffer), "%s", reason);
    }
}

void matchtape_prefix_error(const char *fmt, ...) {
    if (!fmt) return;

    char context[512];
    va_list args;
    va_start(args, fmt);
    vsnprintf(context, sizeof(context), fmt, args);
    va_end(args);

    if (error_buffer[0] == '\0') {
        snprintf(error_buffer, sizeof(error_buffer), "%s", context);
        return;
    }

    char cause[MATCHTAPE_ERROR_BUFFER_SIZE];
    memcpy(cause, error_buffer, sizeof(cause));
    snprintf(error_buffer, sizeof(error_buffer), "%s: %s", context, cause);
}

/* ============================================================================
 * Querying
 * ============================================================================ */

const char *matchtape_get_last_error(void) {
    return error_buffer;
}

bool matchtape_has_error(void) {
    return error_buffer[0] != '\0';
}

void matchtape_clear_error(void) {
    error_buffer[0] = '\0';
}

void matchtape_log_and_clear_error(const char *subsystem) {
    if (error_buffer[0] == '\0') return;
    matchtape_log_error(subsystem ? subsystem : MATCHTAPE_LOG_CORE, "%s", error_buffer);
    error_buffer[0] = '\0';
}
