#pragma once

#include "config.h"
#include "events.h"
#include <cstdint>
#include <cstddef>

// Bounded, order-preserving queue of status events. Publishers push from
// the main loop context; the status controller is the single consumer.

static const size_t EVENT_CHANNEL_CAPACITY = STATUS_EVENT_QUEUE_DEPTH;

// Empty the queue and reset the drop counter
void event_channel_init();

// Queue an event. When the queue is full the event is dropped, counted
// and false is returned.
bool event_channel_publish(const StatusEvent& event);

// Pop the oldest event. Returns false if the queue is empty.
bool event_channel_pop(StatusEvent& out);

// Number of queued events
size_t event_channel_size();

// Events dropped since the last init
uint32_t event_channel_dropped();
