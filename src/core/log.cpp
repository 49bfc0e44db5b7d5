#include "relief/log.h"
#include "relief/relief.h"
#include <SDL3/SDL.h>
#include <stdio.h>
#include <string.h>
#include <time.h>

#if defined(_WIN32)
    #define DEFAULT_LOG_PATH "relief.log"
#else
    #define DEFAULT_LOG_PATH "/tmp/relief.log"
#endif

#define MAX_LOG_CALLBACKS 8
#define LOG_MESSAGE_MAX 1024

struct LogSink {
    Relief_LogCallback callback;
    void *userdata;
    uint32_t handle;
};

struct LogState {
    FILE *file;
    char path[512];
    Relief_LogLevel level;
    bool console;
    LogSink sinks[MAX_LOG_CALLBACKS];
    uint32_t next_handle;
};

static LogState s_log = {
    NULL, {0}, RELIEF_LOG_LEVEL_INFO, true, {}, 1
};

static const char *const LEVEL_NAMES[] = { "ERROR", "WARN", "INFO", "DEBUG" };

static const SDL_LogPriority LEVEL_PRIORITIES[] = {
    SDL_LOG_PRIORITY_ERROR,
    SDL_LOG_PRIORITY_WARN,
    SDL_LOG_PRIORITY_INFO,
    SDL_LOG_PRIORITY_DEBUG
};

static bool level_valid(Relief_LogLevel level) {
    return level >= RELIEF_LOG_LEVEL_ERROR && level <= RELIEF_LOG_LEVEL_DEBUG;
}

static void file_line(Relief_LogLevel level, const char *subsystem, const char *message) {
    if (!s_log.file) return;

    char timestamp[32];
    time_t now = time(NULL);
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", localtime(&now));

    fprintf(s_log.file, "[%s] %-5s %s: %s\n", timestamp, LEVEL_NAMES[level], subsystem, message);
    if (level == RELIEF_LOG_LEVEL_ERROR) {
        fflush(s_log.file);
    }
}

bool relief_log_init(void) {
    return relief_log_init_with_path(NULL);
}

bool relief_log_init_with_path(const char *path) {
    if (s_log.file) return true;

    snprintf(s_log.path, sizeof(s_log.path), "%s", path ? path : DEFAULT_LOG_PATH);
    s_log.file = fopen(s_log.path, "a");
    if (!s_log.file) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "[%s] cannot open log file %s",
                     RELIEF_LOG_CORE, s_log.path);
        s_log.path[0] = '\0';
        return false;
    }

    char opened[64];
    snprintf(opened, sizeof(opened), "Relief %d.%d.%d log opened",
             RELIEF_VERSION_MAJOR, RELIEF_VERSION_MINOR, RELIEF_VERSION_PATCH);
    file_line(RELIEF_LOG_LEVEL_INFO, RELIEF_LOG_CORE, opened);
    fflush(s_log.file);
    return true;
}

void relief_log_shutdown(void) {
    if (!s_log.file) return;

    file_line(RELIEF_LOG_LEVEL_INFO, RELIEF_LOG_CORE, "log closed");
    fclose(s_log.file);
    s_log.file = NULL;
    s_log.path[0] = '\0';
}

bool relief_log_is_initialized(void) {
    return s_log.file != NULL;
}

void relief_log_set_level(Relief_LogLevel level) {
    if (!level_valid(level)) return;
    s_log.level = level;
    SDL_SetLogPriority(SDL_LOG_CATEGORY_APPLICATION, LEVEL_PRIORITIES[level]);
}

Relief_LogLevel relief_log_get_level(void) {
    return s_log.level;
}

bool relief_log_enabled(Relief_LogLevel level) {
    return level == RELIEF_LOG_LEVEL_ERROR || (level_valid(level) && level <= s_log.level);
}

void relief_log_set_console_output(bool enabled) {
    s_log.console = enabled;
}

const char *relief_log_level_name(Relief_LogLevel level) {
    return level_valid(level) ? LEVEL_NAMES[level] : "UNKNOWN";
}

bool relief_log_level_parse(const char *name, Relief_LogLevel *out) {
    if (!name || !out) return false;

    if (SDL_strcasecmp(name, "warning") == 0) {
        *out = RELIEF_LOG_LEVEL_WARNING;
        return true;
    }
    for (int i = RELIEF_LOG_LEVEL_ERROR; i <= RELIEF_LOG_LEVEL_DEBUG; i++) {
        if (SDL_strcasecmp(name, LEVEL_NAMES[i]) == 0) {
            *out = (Relief_LogLevel)i;
            return true;
        }
    }
    return false;
}

void relief_log_v(Relief_LogLevel level, const char *subsystem, const char *fmt, va_list args) {
    if (!relief_log_enabled(level)) return;
    if (!subsystem) subsystem = RELIEF_LOG_CORE;

    char message[LOG_MESSAGE_MAX];
    vsnprintf(message, sizeof(message), fmt, args);

    file_line(level, subsystem, message);

    if (s_log.console) {
        SDL_LogMessage(SDL_LOG_CATEGORY_APPLICATION, LEVEL_PRIORITIES[level],
                       "[%s] %s", subsystem, message);
    }

    for (int i = 0; i < MAX_LOG_CALLBACKS; i++) {
        const LogSink &sink = s_log.sinks[i];
        if (sink.handle != 0) {
            sink.callback(level, subsystem, message, sink.userdata);
        }
    }
}

void relief_log_error(const char *subsystem, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    relief_log_v(RELIEF_LOG_LEVEL_ERROR, subsystem, fmt, args);
    va_end(args);
}

void relief_log_warning(const char *subsystem, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    relief_log_v(RELIEF_LOG_LEVEL_WARNING, subsystem, fmt, args);
    va_end(args);
}

void relief_log_info(const char *subsystem, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    relief_log_v(RELIEF_LOG_LEVEL_INFO, subsystem, fmt, args);
    va_end(args);
}

void relief_log_debug(const char *subsystem, const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    relief_log_v(RELIEF_LOG_LEVEL_DEBUG, subsystem, fmt, args);
    va_end(args);
}

const char *relief_log_get_path(void) {
    return s_log.file ? s_log.path : NULL;
}

uint32_t relief_log_add_callback(Relief_LogCallback callback, void *userdata) {
    if (!callback) return 0;

    for (int i = 0; i < MAX_LOG_CALLBACKS; i++) {
        LogSink &sink = s_log.sinks[i];
        if (sink.handle == 0) {
            sink.callback = callback;
            sink.userdata = userdata;
            sink.handle = s_log.next_handle++;
            return sink.handle;
        }
    }
    return 0;
}

void relief_log_remove_callback(uint32_t handle) {
    if (handle == 0) return;

    for (int i = 0; i < MAX_LOG_CALLBACKS; i++) {
        if (s_log.sinks[i].handle == handle) {
            s_log.sinks[i] = LogSink{};
            return;
        }
    }
}
