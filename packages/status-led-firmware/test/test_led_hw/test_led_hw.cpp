#include <unity.h>
#include "../../src/hal/hal.h"
#include "../../src/led_hw.h"
#include "../../src/config.h"
#include <utility>

static Rgb frame[STATUS_LED_MAX + 1];

static void assert_all_pixels(int count, uint8_t r, uint8_t g, uint8_t b) {
    for (int i = 0; i < count; i++) {
        const auto& led = hal::test::get_led(i);
        TEST_ASSERT_EQUAL(r, led.r);
        TEST_ASSERT_EQUAL(g, led.g);
        TEST_ASSERT_EQUAL(b, led.b);
    }
}

void setUp(void) {
    hal::test::reset();
    frame_clear(frame, STATUS_LED_MAX + 1);
}

void tearDown(void) {
}

// Test: a full frame is latched in one show
void test_write_full_frame(void) {
    LedStrip strip = LedStrip::open(STATUS_LED_COUNT);
    frame_fill(frame, strip.size(), COLOR_ADVERTISING);

    TEST_ASSERT_TRUE(strip.write(frame, strip.size()));
    TEST_ASSERT_EQUAL(1, hal::test::get_show_count());
    assert_all_pixels(STATUS_LED_COUNT, 0, 0, 70);
}

// Test: short and long frames are rejected before reaching the strip
void test_wrong_length_frame_rejected(void) {
    LedStrip strip = LedStrip::open(STATUS_LED_COUNT);
    frame_fill(frame, strip.size(), COLOR_ADVERTISING);
    TEST_ASSERT_TRUE(strip.write(frame, strip.size()));

    frame_fill(frame, STATUS_LED_MAX + 1, COLOR_BATTERY_LOW);

    TEST_ASSERT_FALSE(strip.write(frame, strip.size() - 1));
    TEST_ASSERT_FALSE(strip.write(frame, strip.size() + 1));
    TEST_ASSERT_FALSE(strip.write(nullptr, strip.size()));

    TEST_ASSERT_EQUAL(1, hal::test::get_show_count());
    TEST_ASSERT_EQUAL(0, hal::test::get_failed_show_count());
    assert_all_pixels(STATUS_LED_COUNT, 0, 0, 70);

    // The next good frame replaces every pixel
    TEST_ASSERT_TRUE(strip.write(frame, strip.size()));
    assert_all_pixels(STATUS_LED_COUNT, 70, 0, 0);
}

// Test: pixel count is capped at the frame buffer size
void test_open_clamps_to_max(void) {
    LedStrip strip = LedStrip::open(STATUS_LED_MAX + 10);

    TEST_ASSERT_EQUAL(STATUS_LED_MAX, strip.size());
    TEST_ASSERT_EQUAL(STATUS_LED_MAX, hal::test::get_led_count());
}

// Test: busy strip reports the failed write
void test_write_fails_while_busy(void) {
    LedStrip strip = LedStrip::open(STATUS_LED_COUNT);
    frame_fill(frame, strip.size(), COLOR_ADVERTISING);
    hal::test::set_strip_show_fails(true);

    TEST_ASSERT_FALSE(strip.write(frame, strip.size()));
    TEST_ASSERT_EQUAL(0, hal::test::get_show_count());
    TEST_ASSERT_EQUAL(1, hal::test::get_failed_show_count());
    TEST_ASSERT_EQUAL(0, hal::test::lit_led_count());
}

// Test: moving the strip leaves the old handle inert
void test_moved_strip_is_inert(void) {
    LedStrip first = LedStrip::open(STATUS_LED_COUNT);
    LedStrip second = std::move(first);
    frame_fill(frame, STATUS_LED_COUNT, COLOR_CONFIRM);

    TEST_ASSERT_FALSE(first.valid());
    TEST_ASSERT_EQUAL(0, first.size());
    TEST_ASSERT_FALSE(first.write(frame, STATUS_LED_COUNT));
    TEST_ASSERT_EQUAL(0, hal::test::get_show_count());

    TEST_ASSERT_TRUE(second.write(frame, STATUS_LED_COUNT));
    TEST_ASSERT_EQUAL(STATUS_LED_COUNT, hal::test::lit_led_count());
}

// Test: power gate drives the pin and only the live handle can
void test_power_gate_handles(void) {
    PowerGate gate = PowerGate::open();
    TEST_ASSERT_FALSE(gate.is_high());

    gate.set_high();
    TEST_ASSERT_TRUE(hal::test::get_power_gate());
    gate.set_low();
    TEST_ASSERT_FALSE(hal::test::get_power_gate());
    TEST_ASSERT_EQUAL(2, hal::test::get_power_gate_toggles());

    PowerGate owner = std::move(gate);
    gate.set_high();
    TEST_ASSERT_FALSE(gate.valid());
    TEST_ASSERT_FALSE(hal::test::get_power_gate());
    TEST_ASSERT_EQUAL(2, hal::test::get_power_gate_toggles());

    owner.set_high();
    TEST_ASSERT_TRUE(owner.is_high());
    TEST_ASSERT_TRUE(hal::test::get_power_gate());
    TEST_ASSERT_EQUAL(3, hal::test::get_power_gate_toggles());
}

int main(int argc, char** argv) {
    UNITY_BEGIN();

    RUN_TEST(test_write_full_frame);
    RUN_TEST(test_wrong_length_frame_rejected);
    RUN_TEST(test_open_clamps_to_max);
    RUN_TEST(test_write_fails_while_busy);
    RUN_TEST(test_moved_strip_is_inert);
    RUN_TEST(test_power_gate_handles);

    return UNITY_END();
}
