#pragma once

#include <cstdint>
#include <cstddef>

namespace hal {
    // Time
    uint32_t millis();
    void delay_ms(uint32_t ms);

    // Status strip output
    void strip_init(int led_count);
    void strip_set_pixel(int index, uint8_t r, uint8_t g, uint8_t b);
    // True while the previous frame is still being clocked out
    bool strip_busy();
    // Latch the staged pixels. Returns false if the frame could not be sent.
    bool strip_show();

    // Strip power gate
    void power_gate_init();
    void power_gate_set(bool on);

    // Serial output (for debugging)
    void serial_init(uint32_t baud);
    void serial_println(const char* str);
}

#ifdef NATIVE_BUILD
namespace hal::test {
    // Time control
    void set_time(uint32_t ms);
    void advance_time(uint32_t ms);

    // LED state capture (last latched frame)
    struct LedState { uint8_t r, g, b; };
    const LedState& get_led(int index);
    int get_led_count();
    int lit_led_count();
    int get_show_count();
    int get_failed_show_count();

    // Fault injection: the strip stays busy and every strip_show() fails while set
    void set_strip_show_fails(bool fail);

    // Power gate state
    bool get_power_gate();
    int get_power_gate_toggles();

    // Serial capture: true if any logged line contains needle
    bool serial_contains(const char* needle);

    // Hook run at the start of every delay_ms() call (nullptr to clear)
    using DelayHook = void(*)(uint32_t now_ms);
    void set_delay_hook(DelayHook hook);

    // Reset all state
    void reset();
}
#endif
