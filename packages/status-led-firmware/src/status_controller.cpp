#include "status_controller.h"
#include "event_channel.h"
#include "hal/hal.h"
#include "log.h"
#include <utility>

static const char* connection_name(ConnectionType type) {
    return type == ConnectionType::Wired ? "wired" : "wireless";
}

StatusController::StatusController(LedStrip strip, PowerGate gate,
                                   const StatusConfig& config)
    : strip_(std::move(strip)),
      gate_(std::move(gate)),
      config_(config),
      state_{},
      next_tick_ms_(0),
      frame_{} {
    // Start blinking: the first advertising event can race ahead of us
    state_.should_blink = true;
    state_.leds_on = false;
    state_.current_profile = 0;
    state_.battery_percent = 100;
    state_.is_showing_battery = false;
    state_.key_held = false;

    next_tick_ms_ = hal::millis() + config_.poll_interval_ms;
}

// ---------------------------------------------------------------------------
// Trigger multiplexing

bool StatusController::tick_due(uint32_t now) const {
    return static_cast<int32_t>(now - next_tick_ms_) >= 0;
}

void StatusController::run_tick(uint32_t now) {
    // Keep the cadence, but an overdue tick fires once rather than in a burst
    next_tick_ms_ += config_.poll_interval_ms;
    if (tick_due(now)) {
        next_tick_ms_ = now + config_.poll_interval_ms;
    }
    tick();
}

bool StatusController::poll() {
    StatusEvent event;
    if (event_channel_pop(event)) {
        process_event(event);
        return true;
    }

    uint32_t now = hal::millis();
    if (tick_due(now)) {
        run_tick(now);
        return true;
    }

    return false;
}

void StatusController::run_once() {
    while (!poll()) {
        hal::delay_ms(1);
    }
}

StatusEvent StatusController::next_event() {
    StatusEvent event;
    while (!event_channel_pop(event)) {
        uint32_t now = hal::millis();
        if (tick_due(now)) {
            run_tick(now);
        } else {
            hal::delay_ms(1);
        }
    }
    return event;
}

// ---------------------------------------------------------------------------
// State machine

void StatusController::process_event(const StatusEvent& event) {
    switch (event.type) {
        case StatusEventType::ConnectionChanged:
            on_connection_changed(event.connection);
            break;

        case StatusEventType::PairingStateChanged:
            on_pairing_state_changed(event.pairing);
            break;

        case StatusEventType::Battery:
            on_battery(event.battery);
            break;

        case StatusEventType::PairingProfileChanged:
            on_profile_changed(event.profile);
            break;

        case StatusEventType::Key:
            on_key(event.key);
            break;

        default:
            // Unknown event kinds are not ours to handle
            break;
    }
}

void StatusController::on_connection_changed(const ConnectionPayload& ev) {
    log_info("status: connection -> %s", connection_name(ev.type));

    switch (ev.type) {
        case ConnectionType::Wireless:
            state_.should_blink = true;
            break;

        case ConnectionType::Wired:
            state_.should_blink = false;
            if (!state_.is_showing_battery) {
                clear();
            }
            break;
    }
}

void StatusController::on_pairing_state_changed(const PairingPayload& ev) {
    switch (ev.state) {
        case PairingState::Advertising:
            log_info("status: advertising on profile %u", static_cast<unsigned>(ev.profile));
            state_.current_profile = ev.profile;
            state_.should_blink = true;
            break;

        case PairingState::Connected:
            log_info("status: connected on profile %u", static_cast<unsigned>(ev.profile));
            state_.current_profile = ev.profile;
            state_.should_blink = false;
            run_confirmation_sequence();
            break;

        case PairingState::None:
            log_info("status: pairing inactive");
            state_.should_blink = false;
            clear();
            break;
    }
}

void StatusController::on_battery(const BatteryPayload& ev) {
    switch (ev.state) {
        case BatteryState::Normal:
            state_.battery_percent = ev.percent > 100 ? 100 : ev.percent;
            log_info("status: battery %u%%", static_cast<unsigned>(state_.battery_percent));
            break;

        case BatteryState::Charged:
            state_.battery_percent = 100;
            log_info("status: battery charged");
            break;

        case BatteryState::Charging:
            log_info("status: battery charging");
            break;

        case BatteryState::NotAvailable:
            log_info("status: battery not available");
            break;
    }
}

void StatusController::on_profile_changed(const ProfilePayload& ev) {
    log_info("status: profile -> %u", static_cast<unsigned>(ev.profile));
    state_.current_profile = ev.profile;
}

void StatusController::on_key(const KeyPayload& ev) {
    if (!is_single_user_action(ev.action, config_.show_battery_user_id)) {
        return;
    }

    // Every matching event toggles the latch: press shows, release hides
    if (!state_.key_held) {
        log_info("status: show battery pressed");
        state_.key_held = true;
        state_.is_showing_battery = true;
        render_battery_gauge();
    } else {
        log_info("status: show battery released");
        state_.key_held = false;
        state_.is_showing_battery = false;
        clear();
    }
}

void StatusController::tick() {
    if (!state_.should_blink || state_.is_showing_battery) {
        return;
    }

    if (state_.leds_on) {
        clear();
    } else {
        render_profile_pixel(COLOR_ADVERTISING);
    }
}

// ---------------------------------------------------------------------------
// Rendering

void StatusController::write_frame(const char* what) {
    // Not retried; tracked state moves on as if the frame landed
    if (!strip_.write(frame_, strip_.size())) {
        log_info("status: %s frame write failed", what);
    }
}

void StatusController::render_profile_pixel(Rgb color) {
    size_t led_count = strip_.size();
    frame_clear(frame_, led_count);
    if (led_count > 0) {
        frame_[profile_pixel_index(state_.current_profile, led_count)] = color;
    }

    gate_.set_high();
    write_frame("profile");
    state_.leds_on = true;
}

void StatusController::render_battery_gauge() {
    size_t led_count = strip_.size();
    uint8_t percent = state_.battery_percent;
    size_t lit = battery_gauge_lit_count(percent, led_count,
                                         config_.zero_battery_policy,
                                         config_.battery_full_percent);
    Rgb color = battery_gauge_color(percent, config_.battery_low_percent);

    frame_fill_prefix(frame_, led_count, lit, color);

    gate_.set_high();
    write_frame("battery");
    state_.leds_on = true;

    log_info("status: battery gauge %u%% (%u leds, %s)",
             static_cast<unsigned>(percent),
             static_cast<unsigned>(lit),
             color == COLOR_BATTERY_LOW ? "red" : "green");
}

void StatusController::clear() {
    frame_clear(frame_, strip_.size());
    write_frame("clear");
    gate_.set_low();
    state_.leds_on = false;
}

void StatusController::run_confirmation_sequence() {
    // Blocking: events queue up in the channel until this finishes
    for (uint8_t i = 0; i < config_.confirm_blinks; i++) {
        render_profile_pixel(COLOR_CONFIRM);
        hal::delay_ms(config_.confirm_interval_ms);
        clear();
        hal::delay_ms(config_.confirm_interval_ms);
    }

    if (config_.confirm_blinks == 0) {
        clear();
    }
}
