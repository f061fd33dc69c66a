#ifndef NATIVE_BUILD

#include "hal.h"
#include "../config.h"
#include <Arduino.h>
#include <OctoWS2811.h>

// OctoWS2811 always drives 8 parallel outputs; the status strip is strip 0
static int leds_per_strip = 0;

// OctoWS2811 memory (allocated in strip_init)
static int* display_memory = nullptr;
static int* drawing_memory = nullptr;
static OctoWS2811* leds = nullptr;

// Longest we wait for the previous DMA transfer before dropping a frame
static const uint32_t SHOW_BUSY_TIMEOUT_US = 2000;

namespace hal {

// Time functions
uint32_t millis() {
    return ::millis();
}

void delay_ms(uint32_t ms) {
    ::delay(ms);
}

// Strip functions
void strip_init(int led_count) {
    leds_per_strip = led_count;

    // OctoWS2811 requires 6 integers per LED for double buffering
    display_memory = new int[leds_per_strip * 6];
    drawing_memory = new int[leds_per_strip * 6];

    leds = new OctoWS2811(leds_per_strip, display_memory, drawing_memory,
                          WS2811_GRB | WS2811_800kHz);
    leds->begin();
}

void strip_set_pixel(int index, uint8_t r, uint8_t g, uint8_t b) {
    if (leds == nullptr || index < 0 || index >= leds_per_strip) {
        return;
    }

    // Color is packed as 0x00RRGGBB (OctoWS2811 handles GRB conversion)
    int color = (r << 16) | (g << 8) | b;
    leds->setPixel(index, color);
}

bool strip_busy() {
    return leds != nullptr ? leds->busy() : false;
}

bool strip_show() {
    if (leds == nullptr) {
        return false;
    }

    // show() would block on a running transfer; bound the wait instead
    uint32_t start = ::micros();
    while (strip_busy()) {
        if (::micros() - start >= SHOW_BUSY_TIMEOUT_US) {
            return false;
        }
    }

    leds->show();
    return true;
}

// Power gate functions
void power_gate_init() {
    pinMode(STATUS_POWER_GATE_PIN, OUTPUT);
    digitalWrite(STATUS_POWER_GATE_PIN, LOW);
}

void power_gate_set(bool on) {
    digitalWrite(STATUS_POWER_GATE_PIN, on ? HIGH : LOW);
}

// Serial functions
void serial_init(uint32_t baud) {
    Serial.begin(baud);
}

void serial_println(const char* str) {
    Serial.println(str);
}

} // namespace hal

#endif // !NATIVE_BUILD
