#pragma once

#include "led_render.h"
#include <cstdint>
#include <cstddef>

// Exclusive handle to the status strip. Move-only: whoever holds the
// live handle is the only code allowed to write frames. A moved-from
// handle is inert and every write on it fails.
class LedStrip {
public:
    // Initialize the strip hardware for led_count pixels (clamped to STATUS_LED_MAX)
    static LedStrip open(size_t led_count);

    LedStrip() = default;
    LedStrip(LedStrip&& other) noexcept;
    LedStrip& operator=(LedStrip&& other) noexcept;
    LedStrip(const LedStrip&) = delete;
    LedStrip& operator=(const LedStrip&) = delete;

    size_t size() const { return led_count_; }
    bool valid() const { return led_count_ > 0; }

    // Write a whole frame. count must equal size(); anything else is
    // rejected before the hardware is touched. Returns false on failure.
    bool write(const Rgb* pixels, size_t count);

private:
    explicit LedStrip(size_t led_count) : led_count_(led_count) {}

    size_t led_count_ = 0;
};

// Exclusive handle to the strip power gate pin
class PowerGate {
public:
    static PowerGate open();

    PowerGate() = default;
    PowerGate(PowerGate&& other) noexcept;
    PowerGate& operator=(PowerGate&& other) noexcept;
    PowerGate(const PowerGate&) = delete;
    PowerGate& operator=(const PowerGate&) = delete;

    void set_high();
    void set_low();
    bool is_high() const { return high_; }
    bool valid() const { return valid_; }

private:
    explicit PowerGate(bool valid) : valid_(valid) {}

    bool valid_ = false;
    bool high_ = false;
};

// Unit handed from one owner of the strip hardware to the next
struct LedResources {
    LedStrip strip;
    PowerGate gate;
};
