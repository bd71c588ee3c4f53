#include <unity.h>
#include "light/lightSchedule.hpp"
#include "climate/temperatureSchedule.hpp"
#include "utils/clockTime.hpp"
#include <string.h>

using namespace GrowClimate;

void setUp(void) {}
void tearDown(void) {}

static LightSchedule makeLight(bool enabled, uint8_t onH, uint8_t onM, uint8_t offH, uint8_t offM) {
    LightSchedule schedule;
    schedule.enabled = enabled;
    schedule.onTime = ClockTime(onH, onM);
    schedule.offTime = ClockTime(offH, offM);
    return schedule;
}

// --- ClockTime ---

void test_clock_time_parse(void) {
    ClockTime t;
    TEST_ASSERT_TRUE(ClockTime::parse("06:30", t));
    TEST_ASSERT_EQUAL_UINT8(6, t.hour);
    TEST_ASSERT_EQUAL_UINT8(30, t.minute);
    TEST_ASSERT_EQUAL_UINT16(390, t.minutesOfDay());

    TEST_ASSERT_TRUE(ClockTime::parse("23:59", t));
    TEST_ASSERT_TRUE(ClockTime::parse("0:05", t));

    ClockTime untouched(1, 2);
    TEST_ASSERT_FALSE(ClockTime::parse("24:00", untouched));
    TEST_ASSERT_FALSE(ClockTime::parse("12:60", untouched));
    TEST_ASSERT_FALSE(ClockTime::parse("12-00", untouched));
    TEST_ASSERT_FALSE(ClockTime::parse("12:00x", untouched));
    TEST_ASSERT_FALSE(ClockTime::parse("", untouched));
    TEST_ASSERT_FALSE(ClockTime::parse(nullptr, untouched));
    TEST_ASSERT_TRUE(untouched == ClockTime(1, 2));
}

void test_clock_time_format(void) {
    char buffer[6];
    ClockTime(7, 5).format(buffer, sizeof(buffer));
    TEST_ASSERT_EQUAL_STRING("07:05", buffer);
}

// --- LightScheduleMachine ---

void test_light_daytime_window(void) {
    const LightSchedule s = makeLight(true, 6, 0, 18, 0);
    TEST_ASSERT_FALSE(LightScheduleMachine::shouldBeOn(s, ClockTime(5, 59)));
    TEST_ASSERT_TRUE(LightScheduleMachine::shouldBeOn(s, ClockTime(6, 0)));
    TEST_ASSERT_TRUE(LightScheduleMachine::shouldBeOn(s, ClockTime(17, 59)));
    TEST_ASSERT_FALSE(LightScheduleMachine::shouldBeOn(s, ClockTime(18, 0)));
}

void test_light_window_crossing_midnight(void) {
    const LightSchedule s = makeLight(true, 22, 0, 6, 0);
    TEST_ASSERT_TRUE(LightScheduleMachine::shouldBeOn(s, ClockTime(23, 30)));
    TEST_ASSERT_TRUE(LightScheduleMachine::shouldBeOn(s, ClockTime(2, 0)));
    TEST_ASSERT_TRUE(LightScheduleMachine::shouldBeOn(s, ClockTime(22, 0)));
    TEST_ASSERT_FALSE(LightScheduleMachine::shouldBeOn(s, ClockTime(6, 0)));
    TEST_ASSERT_FALSE(LightScheduleMachine::shouldBeOn(s, ClockTime(12, 0)));
    TEST_ASSERT_EQUAL(LightPhase::ScheduledOff, LightScheduleMachine::phaseAt(s, ClockTime(12, 0)));
}

void test_light_equal_times_means_always_on(void) {
    const LightSchedule s = makeLight(true, 8, 0, 8, 0);
    for (uint8_t hour = 0; hour < 24; ++hour) {
        TEST_ASSERT_TRUE(LightScheduleMachine::shouldBeOn(s, ClockTime(hour, 0)));
    }
}

void test_light_disabled_schedule(void) {
    const LightSchedule s = makeLight(false, 0, 0, 23, 59);
    TEST_ASSERT_EQUAL(LightPhase::Disabled, LightScheduleMachine::phaseAt(s, ClockTime(12, 0)));
    TEST_ASSERT_FALSE(LightScheduleMachine::shouldBeOn(s, ClockTime(12, 0)));
    TEST_ASSERT_EQUAL_STRING("disabled", lightPhaseName(LightPhase::Disabled));
}

// --- TemperatureSchedule ---

void test_temperature_schedule_disabled_or_empty(void) {
    TemperatureSchedule schedule;
    float target = -1.0f;
    TEST_ASSERT_FALSE(schedule.targetAt(ClockTime(12, 0), target));

    schedule.enabled = true;
    TEST_ASSERT_FALSE(schedule.targetAt(ClockTime(12, 0), target));
    TEST_ASSERT_EQUAL_FLOAT(-1.0f, target);
}

void test_temperature_schedule_periods(void) {
    TemperatureSchedule schedule;
    schedule.enabled = true;
    // Fora de ordem de propósito
    TEST_ASSERT_TRUE(schedule.addPeriod(ClockTime(20, 0), 18.0f));
    TEST_ASSERT_TRUE(schedule.addPeriod(ClockTime(6, 0), 24.0f));
    TEST_ASSERT_TRUE(schedule.addPeriod(ClockTime(12, 0), 26.0f));

    float target = 0.0f;
    TEST_ASSERT_TRUE(schedule.targetAt(ClockTime(6, 0), target));
    TEST_ASSERT_EQUAL_FLOAT(24.0f, target);
    TEST_ASSERT_TRUE(schedule.targetAt(ClockTime(11, 59), target));
    TEST_ASSERT_EQUAL_FLOAT(24.0f, target);
    TEST_ASSERT_TRUE(schedule.targetAt(ClockTime(15, 0), target));
    TEST_ASSERT_EQUAL_FLOAT(26.0f, target);
    TEST_ASSERT_TRUE(schedule.targetAt(ClockTime(23, 0), target));
    TEST_ASSERT_EQUAL_FLOAT(18.0f, target);
    // Antes do primeiro período: continua o último da véspera
    TEST_ASSERT_TRUE(schedule.targetAt(ClockTime(3, 0), target));
    TEST_ASSERT_EQUAL_FLOAT(18.0f, target);
}

void test_temperature_schedule_capacity(void) {
    TemperatureSchedule schedule;
    for (uint8_t i = 0; i < TemperatureSchedule::MAX_PERIODS; ++i) {
        TEST_ASSERT_TRUE(schedule.addPeriod(ClockTime(i * 4, 0), 20.0f + i));
    }
    TEST_ASSERT_FALSE(schedule.addPeriod(ClockTime(22, 0), 30.0f));
    TEST_ASSERT_EQUAL_UINT8(TemperatureSchedule::MAX_PERIODS, schedule.periodCount);
}

static void runAllTests() {
    UNITY_BEGIN();
    RUN_TEST(test_clock_time_parse);
    RUN_TEST(test_clock_time_format);
    RUN_TEST(test_light_daytime_window);
    RUN_TEST(test_light_window_crossing_midnight);
    RUN_TEST(test_light_equal_times_means_always_on);
    RUN_TEST(test_light_disabled_schedule);
    RUN_TEST(test_temperature_schedule_disabled_or_empty);
    RUN_TEST(test_temperature_schedule_periods);
    RUN_TEST(test_temperature_schedule_capacity);
}

#ifdef ARDUINO
#include <Arduino.h>
void setup() {
    delay(2000);
    runAllTests();
    UNITY_END();
}

void loop() {
    delay(500);
}
#else
int main(void) {
    runAllTests();
    return UNITY_END();
}
#endif
