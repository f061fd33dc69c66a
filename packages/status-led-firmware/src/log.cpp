#include "log.h"
#include "hal/hal.h"
#include <cstdarg>
#include <cstdio>

static char log_buffer[128];

void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vsnprintf(log_buffer, sizeof(log_buffer), fmt, args);
    va_end(args);

    hal::serial_println(log_buffer);
}
