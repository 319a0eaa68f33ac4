#pragma once
#include <cstdio>
#include <cstdarg>

// 0 = errors only, 1 = normal, 2 = debug
inline int& log_verbosity(){
    static int level = 1;
    return level;
}

inline void log_vprint(const char* tag, const char* fmt, va_list ap){
    fprintf(stderr, "[%s] ", tag);
    vfprintf(stderr, fmt, ap);
    fputc('\n', stderr);
}

inline void log_error(const char* fmt, ...){
    va_list ap; va_start(ap, fmt); log_vprint("error", fmt, ap); va_end(ap);
}
inline void log_warn(const char* fmt, ...){
    if (log_verbosity() < 1) return;
    va_list ap; va_start(ap, fmt); log_vprint("warn", fmt, ap); va_end(ap);
}
inline void log_info(const char* fmt, ...){
    if (log_verbosity() < 1) return;
    va_list ap; va_start(ap, fmt); log_vprint("info", fmt, ap); va_end(ap);
}
inline void log_debug(const char* fmt, ...){
    if (log_verbosity() < 2) return;
    va_list ap; va_start(ap, fmt); log_vprint("debug", fmt, ap); va_end(ap);
}
