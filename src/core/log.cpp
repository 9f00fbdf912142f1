#include "matchtape/log.h"
#include <SDL3/SDL.h>
#include <stdio.h>
#include <string.h>
#include <strings.h>
#include <time.h>

#if defined(_WIN32)
    #define MATCHTAPE_DEFAULT_LOG_PATH "matchtape.log"
#else
    #define MATCHTAPE_DEFAULT_LOG_PATH "/tmp/matchtape.log"
#endif

#define MATCHTAPE_LOG_MAX_CALLBACKS 8

/* Matchtape messages go to their own SDL category so hosts can filter them */
#define MATCHTAPE_SDL_CATEGORY SDL_LOG_CATEGORY_CUSTOM

struct LevelInfo {
    const char *key;
    const char *label;
    SDL_LogPriority priority;
};

static const LevelInfo s_levels[] = {
    { "error",   "ERROR",   SDL_LOG_PRIORITY_ERROR },
    { "warning", "WARNING", SDL_LOG_PRIORITY_WARN },
    { "info",    "INFO",    SDL_LOG_PRIORITY_INFO },
    { "debug",   "DEBUG",   SDL_LOG_PRIORITY_DEBUG },
};

struct LogSink {
    Matchtape_LogCallback callback;
    void *userdata;
    uint32_t handle;
};

struct LogState {
    FILE *file;
    char path[512];
    Matchtape_LogLevel level;
    bool console;
    LogSink sinks[MATCHTAPE_LOG_MAX_CALLBACKS];
    uint32_t next_handle;
};

static LogState s_log = {
    NULL, {0}, MATCHTAPE_LOG_LEVEL_INFO, true, {}, 1
};

/* ============================================================================
 * File sink
 * ============================================================================ */

static void format_time(char *buf, size_t size) {
    time_t now = time(NULL);
    struct tm tm_now;
#if defined(_WIN32)
    localtime_s(&tm_now, &now);
#else
    localtime_r(&now, &tm_now);
#endif
    strftime(buf, size, "%Y-%m-%d %H:%M:%S", &tm_now);
}

static void file_marker(const char *what) {
    char stamp[32];
    format_time(stamp, sizeof(stamp));
    fprintf(s_log.file, "--- matchtape log %s %s ---\n", what, stamp);
    fflush(s_log.file);
}

static void file_write(Matchtape_LogLevel level, const char *subsystem, const char *message) {
    char stamp[32];
    format_time(stamp, sizeof(stamp));
    fprintf(s_log.file, "%s %-7s [%s] %s\n", stamp, s_levels[level].label, subsystem, message);

    if (level == MATCHTAPE_LOG_LEVEL_ERROR) {
        fflush(s_log.file);
    }
}

bool matchtape_log_init_with_path(const char *path) {
    if (s_log.file) {
        return true;
    }

    const char *use_path = (path && path[0] != '\0') ? path : MATCHTAPE_DEFAULT_LOG_PATH;
    FILE *fp = fopen(use_path, "a");
    if (!fp) {
        SDL_LogError(MATCHTAPE_SDL_CATEGORY, "Cannot open log file %s", use_path);
        return false;
    }

    s_log.file = fp;
    snprintf(s_log.path, sizeof(s_log.path), "%s", use_path);
    file_marker("opened");
    return true;
}

void matchtape_log_shutdown(void) {
    if (!s_log.file) return;

    file_marker("closed");
    fclose(s_log.file);
    s_log.file = NULL;
    s_log.path[0] = '\0';
}

bool matchtape_log_is_initialized(void) {
    return s_log.file != NULL;
}

const char *matchtape_log_get_path(void) {
    return s_log.file ? s_log.path : NULL;
}

/* ============================================================================
 * Levels and console
 * ============================================================================ */

void matchtape_log_set_level(Matchtape_LogLevel level) {
    if (level < MATCHTAPE_LOG_LEVEL_ERROR || level > MATCHTAPE_LOG_LEVEL_DEBUG) return;
    s_log.level = level;
    SDL_SetLogPriority(MATCHTAPE_SDL_CATEGORY, s_levels[level].priority);
}

Matchtape_LogLevel matchtape_log_get_level(void) {
    return s_log.level;
}

bool matchtape_log_level_from_string(const char *name, Matchtape_LogLevel *out) {
    if (!name || !out) return false;

    for (int i = MATCHTAPE_LOG_LEVEL_ERROR; i <= MATCHTAPE_LOG_LEVEL_DEBUG; i++) {
        if (strcasecmp(name, s_levels[i].key) == 0) {
            *out = (Matchtape_LogLevel)i;
            return true;
        }
    }
    return false;
}

void matchtape_log_set_console_output(bool enabled) {
    s_log.console = enabled;
}

/* ============================================================================
 * Emitting
 * ============================================================================ */

void matchtape_log_v(Matchtape_LogLevel level, const char *subsystem, const char *fmt, va_list args) {
    if (level < MATCHTAPE_LOG_LEVEL_ERROR || level > MATCHTAPE_LOG_LEVEL_DEBUG) return;
    /* Errors pass every filter */
    if (level != MATCHTAPE_LOG_LEVEL_ERROR && level > s_log.level) return;

    char message[1024];
    vsnprintf(message, sizeof(message), fmt ? fmt : "", args);
    const char *tag = (subsystem && subsystem[0] != '\0') ? subsystem : MATCHTAPE_LOG_CORE;

    if (s_log.file) {
        file_write(level, tag, message);
    }

    if (s_log.console) {
        SDL_LogMessage(MATCHTAPE_SDL_CATEGORY, s_levels[level].priority, "[%s] %s", tag, message);
    }

    for (const LogSink &sink : s_log.sinks) {
        if (sink.callback) {
            sink.callback(level, tag, message, sink.userdata);
        }
    }
}

void matchtape_log_error(const char *subsystem, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    matchtape_log_v(MATCHTAPE_LOG_LEVEL_ERROR, subsystem, fmt, args);
    va_end(args);
}

void matchtape_log_warning(const char *subsystem, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    matchtape_log_v(MATCHTAPE_LOG_LEVEL_WARNING, subsystem, fmt, args);
    va_end(args);
}

void matchtape_log_info(const char *subsystem, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    matchtape_log_v(MATCHTAPE_LOG_LEVEL_INFO, subsystem, fmt, args);
    va_end(args);
}

void matchtape_log_debug(const char *subsystem, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    matchtape_log_v(MATCHTAPE_LOG_LEVEL_DEBUG, subsystem, fmt, args);
    va_end(args);
}

/* ============================================================================
 * Callbacks
 * ============================================================================ */

uint32_t matchtape_log_add_callback(Matchtape_LogCallback callback, void *userdata) {
    if (!callback) return 0;

    for (LogSink &sink : s_log.sinks) {
        if (!sink.callback) {
            sink = LogSink{ callback, userdata, s_log.next_handle++ };
            return sink.handle;
        }
    }
    return 0;
}

void matchtape_log_remove_callback(uint32_t handle) {
    if (handle == 0) return;

    for (LogSink &sink : s_log.sinks) {
        if (sink.callback && sink.handle == handle) {
            sink = LogSink{};
            return;
        }
    }
}
