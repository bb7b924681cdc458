/**
 * @file error_format.cpp
 * @brief Error message formatting implementation
 * @author TCMU Team
 * @date 2025
 */

#include "error_format.h"

#include <cstdarg>
#include <cstdio>
#include <cstring>

extern "C" {

void format_error_message(char* buf, size_t len, const char* code, const char* fmt, ...)
{
    if (buf == nullptr || len == 0) {
        return;
    }

    int written = snprintf(buf, len, "%s ", code != nullptr ? code : "");
    if (written < 0 || static_cast<size_t>(written) >= len) {
        buf[len - 1] = '\0';
        return;
    }

    if (fmt == nullptr) {
        return;
    }

    va_list args;
    va_start(args, fmt);
    vsnprintf(buf + written, len - static_cast<size_t>(written), fmt, args);
    va_end(args);
}

void copy_error_message(char* buf, size_t len, const char* msg)
{
    if (buf == nullptr || len == 0) {
        return;
    }

    if (msg == nullptr) {
        buf[0] = '\0';
        return;
    }

    strncpy(buf, msg, len - 1);
    buf[len - 1] = '\0';
}

}  // extern "C"
