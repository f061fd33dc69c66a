#include "led_render.h"

size_t profile_pixel_index(uint8_t profile, size_t led_count) {
    if (led_count == 0) {
        return 0;
    }
    size_t index = profile;
    return index < led_count ? index : led_count - 1;
}

size_t battery_gauge_lit_count(uint8_t percent, size_t led_count,
                               ZeroBatteryPolicy zero_policy,
                               uint8_t full_percent) {
    if (led_count == 0) {
        return 0;
    }

    if (percent == 0) {
        return zero_policy == ZeroBatteryPolicy::FullStrip ? led_count : 1;
    }

    if (full_percent <= 1 || percent >= full_percent) {
        return led_count;
    }

    // 1 .. full_percent-1 ramps from 1 to led_count-1 pixels
    size_t span = static_cast<size_t>(full_percent) - 1;
    return ((static_cast<size_t>(percent) - 1) * (led_count - 1)) / span + 1;
}

Rgb battery_gauge_color(uint8_t percent, uint8_t low_percent) {
    return percent < low_percent ? COLOR_BATTERY_LOW : COLOR_BATTERY_OK;
}

void frame_clear(Rgb* frame, size_t led_count) {
    frame_fill(frame, led_count, COLOR_OFF);
}

void frame_fill(Rgb* frame, size_t led_count, Rgb color) {
    for (size_t i = 0; i < led_count; i++) {
        frame[i] = color;
    }
}

void frame_fill_prefix(Rgb* frame, size_t led_count, size_t lit_count, Rgb color) {
    for (size_t i = 0; i < led_count; i++) {
        frame[i] = i < lit_count ? color : COLOR_OFF;
    }
}

bool frame_is_dark(const Rgb* frame, size_t led_count) {
    for (size_t i = 0; i < led_count; i++) {
        if (frame[i] != COLOR_OFF) {
            return false;
        }
    }
    return true;
}
