#include <unity.h>
#include "../../src/led_render.h"

static const size_t LEDS = 14;
static const uint8_t FULL = 89;

void setUp(void) {
}

void tearDown(void) {
}

static size_t lit(uint8_t percent) {
    return battery_gauge_lit_count(percent, LEDS, ZeroBatteryPolicy::SinglePixel, FULL);
}

// Test: 1% lights one pixel, 88% lights all but one
void test_gauge_ramp_endpoints(void) {
    TEST_ASSERT_EQUAL(1, lit(1));
    TEST_ASSERT_EQUAL(LEDS - 1, lit(88));
}

// Test: ramp never goes backwards and stays inside 1..N-1
void test_gauge_ramp_monotonic(void) {
    size_t previous = lit(1);
    for (int p = 2; p <= 88; p++) {
        size_t current = lit(static_cast<uint8_t>(p));
        TEST_ASSERT_TRUE_MESSAGE(current >= previous, "gauge went backwards");
        TEST_ASSERT_TRUE(current >= 1);
        TEST_ASSERT_TRUE(current <= LEDS - 1);
        previous = current;
    }
}

// Test: 89% and above light the whole strip
void test_gauge_full_above_threshold(void) {
    for (int p = 89; p <= 255; p++) {
        TEST_ASSERT_EQUAL(LEDS, lit(static_cast<uint8_t>(p)));
    }
}

// Test: reference points for a 14 pixel strip
void test_gauge_reference_points(void) {
    TEST_ASSERT_EQUAL(7, lit(45));
    TEST_ASSERT_EQUAL(4, lit(25));
    TEST_ASSERT_EQUAL(14, lit(100));
}

// Test: the two zero-percent policies are distinguishable
void test_gauge_zero_policy(void) {
    TEST_ASSERT_EQUAL(1, battery_gauge_lit_count(0, LEDS, ZeroBatteryPolicy::SinglePixel, FULL));
    TEST_ASSERT_EQUAL(LEDS, battery_gauge_lit_count(0, LEDS, ZeroBatteryPolicy::FullStrip, FULL));
}

// Test: ramp scales with strip length
void test_gauge_other_strip_lengths(void) {
    TEST_ASSERT_EQUAL(1, battery_gauge_lit_count(88, 1, ZeroBatteryPolicy::SinglePixel, FULL));
    TEST_ASSERT_EQUAL(1, battery_gauge_lit_count(100, 1, ZeroBatteryPolicy::SinglePixel, FULL));
    TEST_ASSERT_EQUAL(7, battery_gauge_lit_count(88, 8, ZeroBatteryPolicy::SinglePixel, FULL));
    TEST_ASSERT_EQUAL(8, battery_gauge_lit_count(89, 8, ZeroBatteryPolicy::SinglePixel, FULL));
    TEST_ASSERT_EQUAL(0, battery_gauge_lit_count(50, 0, ZeroBatteryPolicy::SinglePixel, FULL));
}

// Test: colour switches at the low threshold only
void test_gauge_color(void) {
    TEST_ASSERT_TRUE(battery_gauge_color(0, 30) == COLOR_BATTERY_LOW);
    TEST_ASSERT_TRUE(battery_gauge_color(25, 30) == COLOR_BATTERY_LOW);
    TEST_ASSERT_TRUE(battery_gauge_color(29, 30) == COLOR_BATTERY_LOW);
    TEST_ASSERT_TRUE(battery_gauge_color(30, 30) == COLOR_BATTERY_OK);
    TEST_ASSERT_TRUE(battery_gauge_color(45, 30) == COLOR_BATTERY_OK);
    TEST_ASSERT_TRUE(battery_gauge_color(100, 30) == COLOR_BATTERY_OK);
}

// Test: profile index is clamped for every u8 value
void test_profile_index_clamped(void) {
    for (int profile = 0; profile <= 255; profile++) {
        size_t index = profile_pixel_index(static_cast<uint8_t>(profile), LEDS);
        size_t expected = static_cast<size_t>(profile) < LEDS ? profile : LEDS - 1;
        TEST_ASSERT_EQUAL(expected, index);
    }
}

// Test: frame helpers
void test_frame_fill_prefix(void) {
    Rgb frame[LEDS];
    frame_fill(frame, LEDS, COLOR_ADVERTISING);
    TEST_ASSERT_FALSE(frame_is_dark(frame, LEDS));

    frame_fill_prefix(frame, LEDS, 3, COLOR_BATTERY_LOW);
    for (size_t i = 0; i < LEDS; i++) {
        if (i < 3) {
            TEST_ASSERT_TRUE(frame[i] == COLOR_BATTERY_LOW);
        } else {
            TEST_ASSERT_TRUE(frame[i] == COLOR_OFF);
        }
    }

    frame_clear(frame, LEDS);
    TEST_ASSERT_TRUE(frame_is_dark(frame, LEDS));
}

int main(int argc, char** argv) {
    UNITY_BEGIN();

    RUN_TEST(test_gauge_ramp_endpoints);
    RUN_TEST(test_gauge_ramp_monotonic);
    RUN_TEST(test_gauge_full_above_threshold);
    RUN_TEST(test_gauge_reference_points);
    RUN_TEST(test_gauge_zero_policy);
    RUN_TEST(test_gauge_other_strip_lengths);
    RUN_TEST(test_gauge_color);
    RUN_TEST(test_profile_index_clamped);
    RUN_TEST(test_frame_fill_prefix);

    return UNITY_END();
}
