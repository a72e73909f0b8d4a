#pragma once
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <string>

// All diagnostics go to stderr; stdout carries the JSON documents.
inline void log_msg(const char* tag, const char* fmt, ...) {
    char body[2048];
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(body, sizeof(body), fmt, ap);
    va_end(ap);
    fprintf(stderr, "[%s] %s\n", tag, body);
    fflush(stderr);
}

inline std::string clock_hms() {
    std::time_t t = std::time(nullptr);
    std::tm tmv{};
    localtime_r(&t, &tmv);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tmv);
    return buf;
}
