#pragma once

#include <cstdint>
#include <cstddef>

struct Rgb {
    uint8_t r;
    uint8_t g;
    uint8_t b;
};

inline bool operator==(const Rgb& a, const Rgb& b) {
    return a.r == b.r && a.g == b.g && a.b == b.b;
}

inline bool operator!=(const Rgb& a, const Rgb& b) {
    return !(a == b);
}

// Fixed palette
static const Rgb COLOR_OFF = {0, 0, 0};
static const Rgb COLOR_BOOT_ACCENT = {60, 20, 0};
static const Rgb COLOR_BOOT_FLASH = {0, 0, 50};
static const Rgb COLOR_ADVERTISING = {0, 0, 70};
static const Rgb COLOR_CONFIRM = {0, 70, 0};
static const Rgb COLOR_BATTERY_OK = {0, 70, 0};
static const Rgb COLOR_BATTERY_LOW = {70, 0, 0};

// What a 0% battery reading lights up. Firmware revisions disagreed on
// this, so it is chosen per build.
enum class ZeroBatteryPolicy {
    SinglePixel,  // near-empty: one pixel
    FullStrip     // all pixels
};

// Pixel used for a pairing profile, clamped to the last pixel
size_t profile_pixel_index(uint8_t profile, size_t led_count);

// Number of gauge pixels lit for a charge level.
//   0%                 -> per zero_policy
//   >= full_percent    -> led_count
//   1 .. full_percent-1 -> ((p - 1) * (led_count - 1)) / (full_percent - 1) + 1
size_t battery_gauge_lit_count(uint8_t percent, size_t led_count,
                               ZeroBatteryPolicy zero_policy,
                               uint8_t full_percent);

// Red below low_percent, green otherwise
Rgb battery_gauge_color(uint8_t percent, uint8_t low_percent);

// Frame helpers
void frame_clear(Rgb* frame, size_t led_count);
void frame_fill(Rgb* frame, size_t led_count, Rgb color);

// Light the first lit_count pixels, clear the rest
void frame_fill_prefix(Rgb* frame, size_t led_count, size_t lit_count, Rgb color);

bool frame_is_dark(const Rgb* frame, size_t led_count);
