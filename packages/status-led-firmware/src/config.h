#pragma once

#include <cstdint>

// Build-time defaults. Any of these can be overridden with -D build flags.

// Number of pixels on the status strip
#ifndef STATUS_LED_COUNT
#define STATUS_LED_COUNT 14
#endif

// Upper bound for the strip frame buffer
#ifndef STATUS_LED_MAX
#define STATUS_LED_MAX 64
#endif

// Teensy pin for the strip power gate. The strip itself is OctoWS2811
// output 0, whose pin is fixed by the library.
#ifndef STATUS_POWER_GATE_PIN
#define STATUS_POWER_GATE_PIN 23
#endif

// Boot animation timing
#ifndef BOOT_STEP_INTERVAL_MS
#define BOOT_STEP_INTERVAL_MS 100
#endif

#ifndef BOOT_FLASH_HOLD_MS
#define BOOT_FLASH_HOLD_MS 300
#endif

#ifndef BOOT_CLEAR_HOLD_MS
#define BOOT_CLEAR_HOLD_MS 50
#endif

// Status controller timing
#ifndef STATUS_POLL_INTERVAL_MS
#define STATUS_POLL_INTERVAL_MS 700
#endif

#ifndef STATUS_CONFIRM_INTERVAL_MS
#define STATUS_CONFIRM_INTERVAL_MS 500
#endif

#ifndef STATUS_CONFIRM_BLINKS
#define STATUS_CONFIRM_BLINKS 4
#endif

// Battery gauge thresholds (percent)
#ifndef BATTERY_LOW_PERCENT
#define BATTERY_LOW_PERCENT 30
#endif

#ifndef BATTERY_FULL_PERCENT
#define BATTERY_FULL_PERCENT 89
#endif

// 1: a 0% reading lights the whole gauge, 0: a single pixel
#ifndef BATTERY_ZERO_SHOWS_FULL_STRIP
#define BATTERY_ZERO_SHOWS_FULL_STRIP 0
#endif

// User action bound to the "show battery" key
#ifndef STATUS_SHOW_BATTERY_USER_ID
#define STATUS_SHOW_BATTERY_USER_ID 7
#endif

// Depth of the status event queue
#ifndef STATUS_EVENT_QUEUE_DEPTH
#define STATUS_EVENT_QUEUE_DEPTH 16
#endif

static_assert(STATUS_LED_COUNT > 0, "status strip needs at least one pixel");
static_assert(STATUS_LED_COUNT <= STATUS_LED_MAX, "STATUS_LED_COUNT exceeds STATUS_LED_MAX");
