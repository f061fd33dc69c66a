#include "boot_animation.h"
#include "hal/hal.h"
#include "log.h"
#include <utility>

BootAnimator::BootAnimator(LedStrip strip, PowerGate gate,
                           const BootAnimationConfig& config)
    : strip_(std::move(strip)),
      gate_(std::move(gate)),
      config_(config),
      frame_{} {
}

void BootAnimator::show(const char* what) {
    // Boot frames are cosmetic; a dropped one is logged and skipped
    if (!strip_.write(frame_, strip_.size())) {
        log_info("boot: %s frame write failed", what);
    }
}

void BootAnimator::run() {
    size_t led_count = strip_.size();

    gate_.set_high();

    // Wave: pixels 0..i lit at step i
    for (size_t i = 0; i < led_count; i++) {
        frame_fill_prefix(frame_, led_count, i + 1, COLOR_BOOT_ACCENT);
        show("wave");
        hal::delay_ms(config_.step_interval_ms);
    }

    frame_fill(frame_, led_count, COLOR_BOOT_FLASH);
    show("flash");
    hal::delay_ms(config_.flash_hold_ms);

    frame_clear(frame_, led_count);
    show("clear");
    hal::delay_ms(config_.clear_hold_ms);

    gate_.set_low();
    log_info("boot: animation complete (%u leds)", static_cast<unsigned>(led_count));
}

LedResources BootAnimator::take() {
    return LedResources{std::move(strip_), std::move(gate_)};
}

LedResources run_boot_animation(LedResources resources,
                                const BootAnimationConfig& config) {
    BootAnimator animator(std::move(resources.strip), std::move(resources.gate), config);
    animator.run();
    return animator.take();
}
