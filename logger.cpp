#include "logger.hpp"
#include <syslog.h>
#include <stdio.h>
#include <stdarg.h>
#include <string.h>
#include <errno.h>
#include <time.h>
#include <cassert>
#include <stdlib.h>

namespace {
    log_level_t g_log_level = log_level_t::INFO;
    log_type_t g_log_type = log_type_t::SYSLOG;
    FILE *g_log_file = nullptr;

    int log_level_to_syslog(log_level_t log_level) {
        switch(log_level) {
            case log_level_t::FATAL:
                return LOG_CRIT;

            case log_level_t::ERROR:
                return LOG_ERR;

            case log_level_t::WARNING:
                return LOG_WARNING;

            case log_level_t::NOTICE:
                return LOG_NOTICE;

            case log_level_t::INFO:
                return LOG_INFO;

            case log_level_t::DEBUG:
                return LOG_DEBUG;
        }

        // Should never be reached.
        assert(false);
        return -1;
    }

    const char *log_level_to_tag(log_level_t log_level) {
        switch(log_level) {
            case log_level_t::FATAL:
                return "FATAL";
            case log_level_t::ERROR:
                return "ERROR";
            case log_level_t::WARNING:
                return "WARN";
            case log_level_t::NOTICE:
                return "NOTICE";
            case log_level_t::INFO:
                return "INFO";
            case log_level_t::DEBUG:
                return "DEBUG";
        }
        return "?";
    }

    void close_log_file() {
        if (g_log_file) {
            fclose(g_log_file);
            g_log_file = nullptr;
        }
    }
};


void logger_setup(log_type_t type, log_level_t level) {
    if (type != log_type_t::FILE) {
        close_log_file();
    }
    g_log_type = type;
    g_log_level = level;
}

bool logger_setup_file(const char *path, log_level_t level) {
    FILE *f = fopen(path, "a");
    if (!f) {
        logger_log(log_level_t::ERROR, "Could not open log file '%s': '%s' (%d)",
                path, strerror(errno), errno);
        return false;
    }
    close_log_file();
    g_log_file = f;
    g_log_type = log_type_t::FILE;
    g_log_level = level;
    return true;
}

void logger_set_level(log_level_t level) {
    g_log_level = level;
}

void logger_log(log_level_t log_level, const char *fmt, ...) {
    if (log_level > g_log_level) {
        return;
    }

    switch (g_log_type) {
        case log_type_t::SYSLOG:
        {
            va_list ap;
            va_start(ap, fmt);
            vsyslog(log_level_to_syslog(log_level), fmt, ap);
            va_end(ap);
        }
        break;
        case log_type_t::PRINTF:
        {
            va_list ap;
            va_start(ap, fmt);
            const int len = strlen(fmt);
            char fmt_newline[len + 2];
            memcpy(fmt_newline, fmt, len);
            memcpy(fmt_newline + len, "\n", 2);
            vprintf(fmt_newline, ap);
            va_end(ap);
            fflush(stdout);
        }
        break;
        case log_type_t::FILE:
        {
            char stamp[32];
            const time_t now = time(nullptr);
            struct tm tm_now;
            localtime_r(&now, &tm_now);
            strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm_now);

            FILE *out = g_log_file ? g_log_file : stdout;
            va_list ap;
            va_start(ap, fmt);
            fprintf(out, "%s [%s] ", stamp, log_level_to_tag(log_level));
            vfprintf(out, fmt, ap);
            fputc('\n', out);
            fflush(out);
            va_end(ap);
        }
        break;
    }
}
