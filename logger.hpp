#pragma once

typedef enum class log_level {
    FATAL,
    ERROR,
    WARNING,
    NOTICE,
    INFO,
    DEBUG,
} log_level_t;


typedef enum class log_type {
    SYSLOG,
    PRINTF,
    FILE,
} log_type_t;


void logger_setup(log_type_t type, log_level_t level);
bool logger_setup_file(const char *path, log_level_t level);
void logger_set_level(log_level_t level);
void logger_log(log_level_t log_level, const char *fmt, ...)
    __attribute__((format(printf, 2, 3)));
