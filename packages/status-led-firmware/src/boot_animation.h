#pragma once

#include "config.h"
#include "led_hw.h"
#include <cstdint>

struct BootAnimationConfig {
    uint32_t step_interval_ms = BOOT_STEP_INTERVAL_MS;
    uint32_t flash_hold_ms = BOOT_FLASH_HOLD_MS;
    uint32_t clear_hold_ms = BOOT_CLEAR_HOLD_MS;
};

// One-shot startup choreography on the status strip. Holds the strip and
// power gate while it runs, then hands both back dark and unpowered.
class BootAnimator {
public:
    BootAnimator(LedStrip strip, PowerGate gate,
                 const BootAnimationConfig& config = BootAnimationConfig());

    // Wave fill in the accent colour, full-strip flash, then dark.
    // Blocks for the whole sequence.
    void run();

    // Release the strip and power gate to the next owner
    LedResources take();

private:
    void show(const char* what);

    LedStrip strip_;
    PowerGate gate_;
    BootAnimationConfig config_;
    Rgb frame_[STATUS_LED_MAX];
};

// Run the boot animation and return the resources it borrowed
LedResources run_boot_animation(LedResources resources,
                                const BootAnimationConfig& config = BootAnimationConfig());
