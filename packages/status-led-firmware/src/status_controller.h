#pragma once

#include "config.h"
#include "events.h"
#include "led_hw.h"
#include "led_render.h"
#include <cstdint>

struct StatusConfig {
    uint32_t poll_interval_ms = STATUS_POLL_INTERVAL_MS;
    uint32_t confirm_interval_ms = STATUS_CONFIRM_INTERVAL_MS;
    uint8_t confirm_blinks = STATUS_CONFIRM_BLINKS;
    uint8_t battery_low_percent = BATTERY_LOW_PERCENT;
    uint8_t battery_full_percent = BATTERY_FULL_PERCENT;
    uint16_t show_battery_user_id = STATUS_SHOW_BATTERY_USER_ID;
    ZeroBatteryPolicy zero_battery_policy =
        BATTERY_ZERO_SHOWS_FULL_STRIP ? ZeroBatteryPolicy::FullStrip
                                      : ZeroBatteryPolicy::SinglePixel;
};

struct ControllerState {
    bool should_blink;        // advertising indicator active
    bool leds_on;             // current blink phase is lit
    uint8_t current_profile;  // raw profile index, clamped only when rendered
    uint8_t battery_percent;  // last known charge, 0..100
    bool is_showing_battery;  // battery overlay suppresses blinking
    bool key_held;            // show-battery key latch
};

// Renders connectivity, pairing profile and battery state on the status
// strip. Owns the strip and power gate for the rest of device lifetime.
//
// Two triggers drive it: status events from the event channel and a
// periodic blink tick. poll() and run_once() multiplex them so exactly one
// handler runs at a time; all state lives here and is touched only from
// that single context.
class StatusController {
public:
    StatusController(LedStrip strip, PowerGate gate,
                     const StatusConfig& config = StatusConfig());

    StatusController(const StatusController&) = delete;
    StatusController& operator=(const StatusController&) = delete;

    // Service at most one trigger without waiting: a queued event first,
    // otherwise the tick if it is due. Returns true if a handler ran.
    bool poll();

    // Wait until an event or the tick is available, then service one
    void run_once();

    // Wait for the next event. Ticks that fall due while waiting are
    // still serviced.
    StatusEvent next_event();

    // Apply one event to the state machine and the strip
    void process_event(const StatusEvent& event);

    // Blink tick: toggle the profile pixel while advertising
    void tick();

    const ControllerState& state() const { return state_; }
    uint32_t next_tick_ms() const { return next_tick_ms_; }
    size_t led_count() const { return strip_.size(); }

private:
    bool tick_due(uint32_t now) const;
    void run_tick(uint32_t now);

    void on_connection_changed(const ConnectionPayload& ev);
    void on_pairing_state_changed(const PairingPayload& ev);
    void on_battery(const BatteryPayload& ev);
    void on_profile_changed(const ProfilePayload& ev);
    void on_key(const KeyPayload& ev);

    // Rendering primitives
    void render_profile_pixel(Rgb color);
    void render_battery_gauge();
    void clear();
    void run_confirmation_sequence();
    void write_frame(const char* what);

    LedStrip strip_;
    PowerGate gate_;
    StatusConfig config_;
    ControllerState state_;
    uint32_t next_tick_ms_;
    Rgb frame_[STATUS_LED_MAX];
};
