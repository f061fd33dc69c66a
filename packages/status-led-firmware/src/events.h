#pragma once

#include <cstdint>

// Device status events published by the connectivity, battery and key
// handling code and consumed by the status LED controller.

enum class ConnectionType : uint8_t {
    Wired,
    Wireless
};

enum class PairingState : uint8_t {
    Advertising,
    Connected,
    None
};

enum class BatteryState : uint8_t {
    Normal,        // percent is valid
    Charging,
    Charged,
    NotAvailable
};

// Decoded key action (subset of the keymap engine's action model)
enum class ActionKind : uint8_t {
    None,
    Key,   // plain HID keycode
    User   // user-defined action, code = user id
};

struct Action {
    ActionKind kind;
    uint16_t code;
};

enum class KeyActionKind : uint8_t {
    None,
    Single,
    Tap,
    Hold
};

struct KeyAction {
    KeyActionKind kind;
    Action action;
};

// Raw matrix event
struct RawKeyEvent {
    uint8_t row;
    uint8_t col;
    bool pressed;
};

enum class StatusEventType : uint8_t {
    ConnectionChanged,
    PairingStateChanged,
    Battery,
    PairingProfileChanged,
    Key
};

struct ConnectionPayload {
    ConnectionType type;
};

struct PairingPayload {
    PairingState state;
    uint8_t profile;
};

struct BatteryPayload {
    BatteryState state;
    uint8_t percent;
};

struct ProfilePayload {
    uint8_t profile;
};

struct KeyPayload {
    RawKeyEvent raw;
    KeyAction action;
};

// Tagged event record; only the member selected by type is meaningful
struct StatusEvent {
    StatusEventType type;
    union {
        ConnectionPayload connection;
        PairingPayload pairing;
        BatteryPayload battery;
        ProfilePayload profile;
        KeyPayload key;
    };
};

// Constructors for each event kind
inline StatusEvent make_connection_event(ConnectionType type) {
    StatusEvent ev{};
    ev.type = StatusEventType::ConnectionChanged;
    ev.connection.type = type;
    return ev;
}

inline StatusEvent make_pairing_event(PairingState state, uint8_t profile) {
    StatusEvent ev{};
    ev.type = StatusEventType::PairingStateChanged;
    ev.pairing.state = state;
    ev.pairing.profile = profile;
    return ev;
}

inline StatusEvent make_battery_event(BatteryState state, uint8_t percent = 0) {
    StatusEvent ev{};
    ev.type = StatusEventType::Battery;
    ev.battery.state = state;
    ev.battery.percent = percent;
    return ev;
}

inline StatusEvent make_battery_level_event(uint8_t percent) {
    return make_battery_event(BatteryState::Normal, percent);
}

inline StatusEvent make_profile_event(uint8_t profile) {
    StatusEvent ev{};
    ev.type = StatusEventType::PairingProfileChanged;
    ev.profile.profile = profile;
    return ev;
}

inline StatusEvent make_key_event(RawKeyEvent raw, KeyAction action) {
    StatusEvent ev{};
    ev.type = StatusEventType::Key;
    ev.key.raw = raw;
    ev.key.action = action;
    return ev;
}

inline KeyAction single_user_action(uint16_t user_id) {
    return KeyAction{KeyActionKind::Single, Action{ActionKind::User, user_id}};
}

// True for Single(User(user_id))
inline bool is_single_user_action(const KeyAction& action, uint16_t user_id) {
    return action.kind == KeyActionKind::Single &&
           action.action.kind == ActionKind::User &&
           action.action.code == user_id;
}
