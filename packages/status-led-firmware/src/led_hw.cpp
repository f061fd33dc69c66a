#include "led_hw.h"
#include "config.h"
#include "hal/hal.h"

LedStrip LedStrip::open(size_t led_count) {
    if (led_count > STATUS_LED_MAX) {
        led_count = STATUS_LED_MAX;
    }
    hal::strip_init(static_cast<int>(led_count));
    return LedStrip(led_count);
}

LedStrip::LedStrip(LedStrip&& other) noexcept
    : led_count_(other.led_count_) {
    other.led_count_ = 0;
}

LedStrip& LedStrip::operator=(LedStrip&& other) noexcept {
    if (this != &other) {
        led_count_ = other.led_count_;
        other.led_count_ = 0;
    }
    return *this;
}

bool LedStrip::write(const Rgb* pixels, size_t count) {
    if (!valid() || pixels == nullptr || count != led_count_) {
        return false;
    }

    for (size_t i = 0; i < count; i++) {
        hal::strip_set_pixel(static_cast<int>(i), pixels[i].r, pixels[i].g, pixels[i].b);
    }
    return hal::strip_show();
}

PowerGate PowerGate::open() {
    hal::power_gate_init();
    return PowerGate(true);
}

PowerGate::PowerGate(PowerGate&& other) noexcept
    : valid_(other.valid_), high_(other.high_) {
    other.valid_ = false;
    other.high_ = false;
}

PowerGate& PowerGate::operator=(PowerGate&& other) noexcept {
    if (this != &other) {
        valid_ = other.valid_;
        high_ = other.high_;
        other.valid_ = false;
        other.high_ = false;
    }
    return *this;
}

void PowerGate::set_high() {
    if (!valid_) {
        return;
    }
    hal::power_gate_set(true);
    high_ = true;
}

void PowerGate::set_low() {
    if (!valid_) {
        return;
    }
    hal::power_gate_set(false);
    high_ = false;
}
