#include "event_channel.h"

static StatusEvent queue[EVENT_CHANNEL_CAPACITY];
static size_t queue_head = 0;
static size_t queue_count = 0;
static uint32_t dropped_events = 0;

void event_channel_init() {
    queue_head = 0;
    queue_count = 0;
    dropped_events = 0;
}

bool event_channel_publish(const StatusEvent& event) {
    if (queue_count >= EVENT_CHANNEL_CAPACITY) {
        dropped_events++;
        return false;
    }

    queue[(queue_head + queue_count) % EVENT_CHANNEL_CAPACITY] = event;
    queue_count++;
    return true;
}

bool event_channel_pop(StatusEvent& out) {
    if (queue_count == 0) {
        return false;
    }

    out = queue[queue_head];
    queue_head = (queue_head + 1) % EVENT_CHANNEL_CAPACITY;
    queue_count--;
    return true;
}

size_t event_channel_size() {
    return queue_count;
}

uint32_t event_channel_dropped() {
    return dropped_events;
}
