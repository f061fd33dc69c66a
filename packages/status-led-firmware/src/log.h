#pragma once

// Format a diagnostic line and send it to the serial port.
// Lines longer than the internal buffer are truncated.
void log_info(const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 1, 2)))
#endif
    ;
