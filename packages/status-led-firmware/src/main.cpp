#include "config.h"
#include "hal/hal.h"
#include "boot_animation.h"
#include "event_channel.h"
#include "led_hw.h"
#include "log.h"
#include "status_controller.h"
#include <utility>

// Owns the strip after boot; lives for the rest of device lifetime
static StatusController* status_controller = nullptr;

extern "C" void setup() {
    // Initialize serial for debugging (optional)
    hal::serial_init(115200);

    // Events published during boot wait for the controller
    event_channel_init();

    LedResources resources{LedStrip::open(STATUS_LED_COUNT), PowerGate::open()};

    // Boot animation runs once and hands the hardware back dark
    resources = run_boot_animation(std::move(resources));

    status_controller = new StatusController(std::move(resources.strip),
                                             std::move(resources.gate));

    log_info("Status LED controller initialized");
    log_info("LEDs: %d", STATUS_LED_COUNT);
    log_info("Poll interval: %d ms", STATUS_POLL_INTERVAL_MS);
}

extern "C" void loop() {
    // One event or one blink tick per pass
    status_controller->poll();
}
