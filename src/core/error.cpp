#include "relief/error.h"
#include "relief/log.h"
#include <stdio.h>
#include <string.h>

static thread_local char s_error[RELIEF_ERROR_MAX] = {0};

static const char TRUNCATION_MARK[] = "...";

void relief_set_error(const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    relief_set_error_v(fmt, args);
    va_end(args);
}

void relief_set_error_v(const char *fmt, va_list args) {
    if (!fmt) {
        s_error[0] = '\0';
        return;
    }

    int needed = vsnprintf(s_error, sizeof(s_error), fmt, args);
    if (needed >= (int)sizeof(s_error)) {
        memcpy(s_error + sizeof(s_error) - sizeof(TRUNCATION_MARK),
               TRUNCATION_MARK, sizeof(TRUNCATION_MARK));
    }
}

const char *relief_get_last_error(void) {
    return s_error;
}

void relief_clear_error(void) {
    s_error[0] = '\0';
}

bool relief_has_error(void) {
    return s_error[0] != '\0';
}

bool relief_log_and_clear_error(const char *subsystem) {
    if (s_error[0] == '\0') return false;

    relief_log_error(subsystem ? subsystem : RELIEF_LOG_CORE, "%s", s_error);
    s_error[0] = '\0';
    return true;
}
