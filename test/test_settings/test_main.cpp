#include <unity.h>
#include <ArduinoJson.h>
#include "data/settingsManager.hpp"
#include "../support/inMemorySettingsStore.hpp"

using namespace GrowClimate;

static InMemorySettingsStore* store;
static SettingsManager* settings;

void setUp(void) {
    store = new InMemorySettingsStore();
    settings = new SettingsManager(*store);
}

void tearDown(void) {
    delete settings;
    delete store;
}

static JsonDocument parse(const char* json) {
    JsonDocument doc;
    DeserializationError error = deserializeJson(doc, json);
    TEST_ASSERT_FALSE_MESSAGE(error, "fixture JSON must be valid");
    return doc;
}

void test_empty_store_yields_defaults(void) {
    ClimateSettings loaded = settings->loadClimateSettings(ClimateSettings());
    TEST_ASSERT_EQUAL_FLOAT(22.0f, loaded.targetTemperature);
    TEST_ASSERT_EQUAL_FLOAT(0.5f, loaded.temperatureTolerance);
    TEST_ASSERT_EQUAL_FLOAT(60.0f, loaded.targetHumidity);
    TEST_ASSERT_EQUAL_FLOAT(5.0f, loaded.humidityTolerance);
    TEST_ASSERT_TRUE(loaded.predictiveControlEnabled);

    TEST_ASSERT_FALSE(settings->isClimateAuto());
    TEST_ASSERT_TRUE(settings->isLightScheduled());

    LightSchedule light = settings->loadLightSchedule(LightSchedule());
    TEST_ASSERT_FALSE(light.enabled);
    TEST_ASSERT_TRUE(light.onTime == ClockTime(6, 0));
    TEST_ASSERT_TRUE(light.offTime == ClockTime(22, 0));
}

void test_initialize_defaults_only_fills_missing(void) {
    store->values["target_temp"] = "25.0";
    TEST_ASSERT_TRUE(settings->initializeDefaults());
    TEST_ASSERT_EQUAL_STRING("25.0", store->get("target_temp"));
    TEST_ASSERT_EQUAL_STRING("manual", store->get("mode"));
    TEST_ASSERT_EQUAL_STRING("schedule", store->get("light_mode"));
    TEST_ASSERT_EQUAL_STRING("06:00", store->get("light_on_time"));

    // Segunda chamada não escreve nada
    const int writes = store->putCount;
    TEST_ASSERT_TRUE(settings->initializeDefaults());
    TEST_ASSERT_EQUAL(writes, store->putCount);
}

void test_malformed_values_keep_last_good(void) {
    ClimateSettings lastGood;
    lastGood.targetTemperature = 24.0f;
    lastGood.temperatureTolerance = 1.0f;
    lastGood.targetHumidity = 55.0f;

    store->values["target_temp"] = "warm";
    store->values["temp_tolerance"] = "-0.5";
    store->values["target_humidity"] = "120";
    store->values["humidity_tolerance"] = "3.5";
    store->values["use_ml"] = "maybe";

    ClimateSettings loaded = settings->loadClimateSettings(lastGood);
    TEST_ASSERT_EQUAL_FLOAT(24.0f, loaded.targetTemperature);
    TEST_ASSERT_EQUAL_FLOAT(1.0f, loaded.temperatureTolerance);
    TEST_ASSERT_EQUAL_FLOAT(55.0f, loaded.targetHumidity);
    TEST_ASSERT_EQUAL_FLOAT(3.5f, loaded.humidityTolerance);
    TEST_ASSERT_TRUE(loaded.predictiveControlEnabled);
}

void test_unreadable_store_returns_fallback(void) {
    store->values["target_temp"] = "30.0";
    store->failReads = true;
    ClimateSettings fallback;
    fallback.targetTemperature = 21.0f;
    TEST_ASSERT_EQUAL_FLOAT(21.0f, settings->loadClimateSettings(fallback).targetTemperature);
    TEST_ASSERT_FALSE(settings->isClimateAuto());
}

void test_update_from_json_persists_valid_values(void) {
    JsonDocument doc = parse("{\"target_temp\":24.5,\"temp_tolerance\":\"1.0\",\"use_ml\":false,\"unknown\":1}");
    TEST_ASSERT_TRUE(settings->updateFromJson(doc.as<JsonVariantConst>()));
    TEST_ASSERT_EQUAL_STRING("24.50", store->get("target_temp"));
    TEST_ASSERT_EQUAL_STRING("1.00", store->get("temp_tolerance"));
    TEST_ASSERT_EQUAL_STRING("false", store->get("use_ml"));
    TEST_ASSERT_NULL(store->get("unknown"));
    TEST_ASSERT_EQUAL(1, store->putCount);

    ClimateSettings loaded = settings->loadClimateSettings(ClimateSettings());
    TEST_ASSERT_EQUAL_FLOAT(24.5f, loaded.targetTemperature);
    TEST_ASSERT_FALSE(loaded.predictiveControlEnabled);
}

void test_update_from_json_rejects_invalid_values(void) {
    JsonDocument mixed = parse("{\"temp_tolerance\":-1,\"target_humidity\":65}");
    TEST_ASSERT_TRUE(settings->updateFromJson(mixed.as<JsonVariantConst>()));
    TEST_ASSERT_NULL(store->get("temp_tolerance"));
    TEST_ASSERT_EQUAL_STRING("65.00", store->get("target_humidity"));

    JsonDocument invalid = parse("{\"target_temp\":\"hot\",\"humidity_tolerance\":-2,\"target_humidity\":101}");
    TEST_ASSERT_FALSE(settings->updateFromJson(invalid.as<JsonVariantConst>()));
    TEST_ASSERT_EQUAL(1, store->putCount);

    JsonDocument notObject = parse("[1,2,3]");
    TEST_ASSERT_FALSE(settings->updateFromJson(notObject.as<JsonVariantConst>()));
}

void test_update_from_json_reports_store_failure(void) {
    store->failWrites = true;
    JsonDocument doc = parse("{\"target_temp\":24}");
    TEST_ASSERT_FALSE(settings->updateFromJson(doc.as<JsonVariantConst>()));
}

void test_light_schedule_update_merges_members(void) {
    JsonDocument doc = parse("{\"enabled\":true,\"on_time\":\"07:30\"}");
    TEST_ASSERT_TRUE(settings->updateLightScheduleFromJson(doc.as<JsonVariantConst>()));

    LightSchedule loaded = settings->loadLightSchedule(LightSchedule());
    TEST_ASSERT_TRUE(loaded.enabled);
    TEST_ASSERT_TRUE(loaded.onTime == ClockTime(7, 30));
    TEST_ASSERT_TRUE(loaded.offTime == ClockTime(22, 0));
    TEST_ASSERT_EQUAL_STRING("22:00", store->get("light_off_time"));
}

void test_light_schedule_update_rejects_bad_time(void) {
    JsonDocument doc = parse("{\"enabled\":true,\"on_time\":\"25:00\"}");
    TEST_ASSERT_FALSE(settings->updateLightScheduleFromJson(doc.as<JsonVariantConst>()));
    TEST_ASSERT_EQUAL(0, store->putCount);

    JsonDocument badFlag = parse("{\"enabled\":\"yes\"}");
    TEST_ASSERT_FALSE(settings->updateLightScheduleFromJson(badFlag.as<JsonVariantConst>()));
}

void test_malformed_stored_time_keeps_fallback(void) {
    store->values["light_enabled"] = "true";
    store->values["light_on_time"] = "7h";
    LightSchedule fallback;
    fallback.onTime = ClockTime(5, 0);
    LightSchedule loaded = settings->loadLightSchedule(fallback);
    TEST_ASSERT_TRUE(loaded.enabled);
    TEST_ASSERT_TRUE(loaded.onTime == ClockTime(5, 0));
}

void test_temperature_schedule_stored_and_loaded(void) {
    JsonDocument doc = parse("{\"enabled\":true,\"periods\":[{\"time\":\"06:00\",\"temperature\":24},"
                             "{\"time\":\"20:00\",\"temperature\":19.5}]}");
    TEST_ASSERT_TRUE(settings->updateTemperatureScheduleFromJson(doc.as<JsonVariantConst>()));
    TEST_ASSERT_NOT_NULL(store->get("temp_schedule"));

    TemperatureSchedule loaded = settings->loadTemperatureSchedule(TemperatureSchedule());
    TEST_ASSERT_TRUE(loaded.enabled);
    TEST_ASSERT_EQUAL_UINT8(2, loaded.periodCount);
    float target = 0.0f;
    TEST_ASSERT_TRUE(loaded.targetAt(ClockTime(21, 0), target));
    TEST_ASSERT_EQUAL_FLOAT(19.5f, target);
}

void test_temperature_schedule_validation(void) {
    TemperatureSchedule out;
    JsonDocument tooMany = parse("{\"periods\":[{\"time\":\"00:00\",\"temperature\":20},"
                                 "{\"time\":\"04:00\",\"temperature\":20},{\"time\":\"08:00\",\"temperature\":20},"
                                 "{\"time\":\"12:00\",\"temperature\":20},{\"time\":\"16:00\",\"temperature\":20}]}");
    TEST_ASSERT_FALSE(SettingsManager::parseTemperatureSchedule(tooMany.as<JsonVariantConst>(), out));

    JsonDocument empty = parse("{\"enabled\":true,\"periods\":[]}");
    TEST_ASSERT_FALSE(SettingsManager::parseTemperatureSchedule(empty.as<JsonVariantConst>(), out));

    JsonDocument badTime = parse("{\"periods\":[{\"time\":\"6\",\"temperature\":20}]}");
    TEST_ASSERT_FALSE(SettingsManager::parseTemperatureSchedule(badTime.as<JsonVariantConst>(), out));

    JsonDocument disabled = parse("{\"enabled\":false,\"periods\":[]}");
    TEST_ASSERT_TRUE(SettingsManager::parseTemperatureSchedule(disabled.as<JsonVariantConst>(), out));
    TEST_ASSERT_FALSE(out.enabled);

    TEST_ASSERT_FALSE(settings->updateTemperatureScheduleFromJson(tooMany.as<JsonVariantConst>()));
    TEST_ASSERT_EQUAL(0, store->putCount);
}

void test_corrupt_stored_schedule_keeps_fallback(void) {
    TemperatureSchedule fallback;
    fallback.enabled = true;
    fallback.addPeriod(ClockTime(0, 0), 23.0f);

    store->values["temp_schedule"] = "{not json";
    TemperatureSchedule loaded = settings->loadTemperatureSchedule(fallback);
    TEST_ASSERT_TRUE(loaded.enabled);
    TEST_ASSERT_EQUAL_UINT8(1, loaded.periodCount);

    // Chave ausente: sem agenda
    store->values.erase("temp_schedule");
    TEST_ASSERT_FALSE(settings->loadTemperatureSchedule(fallback).enabled);
}

void test_modes_round_trip(void) {
    TEST_ASSERT_TRUE(settings->setClimateMode(true));
    TEST_ASSERT_TRUE(settings->isClimateAuto());
    TEST_ASSERT_TRUE(settings->setLightMode(false));
    TEST_ASSERT_FALSE(settings->isLightScheduled());

    store->values["mode"] = "AUTO";
    TEST_ASSERT_TRUE(settings->isClimateAuto());
}

static void runAllTests() {
    UNITY_BEGIN();
    RUN_TEST(test_empty_store_yields_defaults);
    RUN_TEST(test_initialize_defaults_only_fills_missing);
    RUN_TEST(test_malformed_values_keep_last_good);
    RUN_TEST(test_unreadable_store_returns_fallback);
    RUN_TEST(test_update_from_json_persists_valid_values);
    RUN_TEST(test_update_from_json_rejects_invalid_values);
    RUN_TEST(test_update_from_json_reports_store_failure);
    RUN_TEST(test_light_schedule_update_merges_members);
    RUN_TEST(test_light_schedule_update_rejects_bad_time);
    RUN_TEST(test_malformed_stored_time_keeps_fallback);
    RUN_TEST(test_temperature_schedule_stored_and_loaded);
    RUN_TEST(test_temperature_schedule_validation);
    RUN_TEST(test_corrupt_stored_schedule_keeps_fallback);
    RUN_TEST(test_modes_round_trip);
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
