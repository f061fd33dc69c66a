#ifdef NATIVE_BUILD

#include "hal.h"
#include <vector>
#include <string>
#include <cstring>

// Simulated state
static uint32_t simulated_time_ms = 0;
static hal::test::DelayHook delay_hook = nullptr;

// Strip state: staged pixels and the frame the strip is actually showing
static int led_count = 0;
static std::vector<hal::test::LedState> staged_buffer;
static std::vector<hal::test::LedState> shown_buffer;
static int show_count = 0;
static int failed_show_count = 0;
static bool show_fails = false;

// Power gate
static bool power_gate_state = false;
static int power_gate_toggles = 0;

// Serial capture
static std::vector<std::string> serial_lines;

namespace hal {

// Time functions
uint32_t millis() {
    return simulated_time_ms;
}

void delay_ms(uint32_t ms) {
    if (delay_hook != nullptr) {
        delay_hook(simulated_time_ms);
    }
    simulated_time_ms += ms;
}

// Strip functions
void strip_init(int count) {
    led_count = count > 0 ? count : 0;
    staged_buffer.assign(led_count, {0, 0, 0});
    shown_buffer.assign(led_count, {0, 0, 0});
    show_count = 0;
    failed_show_count = 0;
}

void strip_set_pixel(int index, uint8_t r, uint8_t g, uint8_t b) {
    if (index < 0 || index >= led_count) {
        return;
    }
    staged_buffer[index] = {r, g, b};
}

bool strip_busy() {
    return show_fails;
}

bool strip_show() {
    if (strip_busy()) {
        failed_show_count++;
        return false;
    }
    shown_buffer = staged_buffer;
    show_count++;
    return true;
}

// Power gate functions
void power_gate_init() {
    power_gate_state = false;
}

void power_gate_set(bool on) {
    if (on != power_gate_state) {
        power_gate_toggles++;
    }
    power_gate_state = on;
}

// Serial functions: lines are captured for tests
void serial_init(uint32_t) {}

void serial_println(const char* str) {
    serial_lines.emplace_back(str);
}

} // namespace hal

namespace hal::test {

void set_time(uint32_t ms) {
    simulated_time_ms = ms;
}

void advance_time(uint32_t ms) {
    simulated_time_ms += ms;
}

const LedState& get_led(int index) {
    static LedState black = {0, 0, 0};
    if (index < 0 || index >= led_count) {
        return black;
    }
    return shown_buffer[index];
}

int get_led_count() {
    return led_count;
}

int lit_led_count() {
    int lit = 0;
    for (const auto& led : shown_buffer) {
        if (led.r != 0 || led.g != 0 || led.b != 0) {
            lit++;
        }
    }
    return lit;
}

int get_show_count() {
    return show_count;
}

int get_failed_show_count() {
    return failed_show_count;
}

void set_strip_show_fails(bool fail) {
    show_fails = fail;
}

bool get_power_gate() {
    return power_gate_state;
}

int get_power_gate_toggles() {
    return power_gate_toggles;
}

bool serial_contains(const char* needle) {
    for (const auto& line : serial_lines) {
        if (line.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

void set_delay_hook(DelayHook hook) {
    delay_hook = hook;
}

void reset() {
    simulated_time_ms = 0;
    delay_hook = nullptr;
    show_fails = false;
    show_count = 0;
    failed_show_count = 0;
    power_gate_state = false;
    power_gate_toggles = 0;

    // Clear LED buffers
    for (auto& led : staged_buffer) {
        led = {0, 0, 0};
    }
    for (auto& led : shown_buffer) {
        led = {0, 0, 0};
    }

    // Clear serial capture
    serial_lines.clear();
}

} // namespace hal::test

#endif // NATIVE_BUILD
