#include <unity.h>
#include "climate/decisionEngine.hpp"
#include <cmath>

using namespace GrowClimate;

void setUp(void) {}
void tearDown(void) {}

static ClimateSettings defaultSettings() {
    ClimateSettings settings; // 22.0 +/- 0.5, 60 +/- 5
    return settings;
}

void test_heater_reactive_band(void) {
    const ClimateSettings s = defaultSettings();

    struct Case {
        float temperature;
        bool heaterOn;
        bool expected;
    };
    // low = 21.5, target = 22.0, high = 22.5
    const Case cases[] = {
        {20.0f, false, true},
        {21.4f, false, true},
        {21.5f, false, false}, // exatamente no limite inferior: não liga
        {21.8f, false, false},
        {21.8f, true, true},   // histerese: continua ligado até o alvo
        {21.99f, true, true},
        {22.0f, true, false},
        {22.3f, true, false},
        {22.6f, false, false},
        {22.6f, true, false},
    };
    for (size_t i = 0; i < sizeof(cases) / sizeof(cases[0]); ++i) {
        const bool actual = ClimateDecisionEngine::decideHeater(cases[i].temperature, cases[i].heaterOn, s, nullptr);
        TEST_ASSERT_EQUAL_MESSAGE(cases[i].expected, actual, "heater case");
    }
}

void test_heater_predictive_override(void) {
    const ClimateSettings s = defaultSettings();

    // Leitura no alvo, mas previsão de queda para abaixo da banda
    Prediction cooling(-1.0f, 0.0f);
    TEST_ASSERT_TRUE(ClimateDecisionEngine::decideHeater(22.2f, false, s, &cooling));

    // Leitura abaixo da banda, mas previsão acima da banda
    Prediction warming(2.0f, 0.0f);
    TEST_ASSERT_FALSE(ClimateDecisionEngine::decideHeater(21.0f, true, s, &warming));

    // Leitura acima da banda desliga mesmo com previsão de queda abaixo do alvo
    Prediction dropIntoBand(-1.0f, 0.0f);
    TEST_ASSERT_FALSE(ClimateDecisionEngine::decideHeater(22.8f, true, s, &dropIntoBand));

    // Dentro da banda decide o lado do alvo
    Prediction slightDrop(-0.3f, 0.0f);
    TEST_ASSERT_TRUE(ClimateDecisionEngine::decideHeater(22.1f, false, s, &slightDrop));
    Prediction slightRise(0.3f, 0.0f);
    TEST_ASSERT_FALSE(ClimateDecisionEngine::decideHeater(21.9f, true, s, &slightRise));
}

void test_humidity_band(void) {
    const ClimateSettings s = defaultSettings();
    bool humidifier = false;
    bool dehumidifier = false;

    ClimateDecisionEngine::decideHumidity(54.0f, s, nullptr, humidifier, dehumidifier);
    TEST_ASSERT_TRUE(humidifier);
    TEST_ASSERT_FALSE(dehumidifier);

    ClimateDecisionEngine::decideHumidity(66.0f, s, nullptr, humidifier, dehumidifier);
    TEST_ASSERT_FALSE(humidifier);
    TEST_ASSERT_TRUE(dehumidifier);

    ClimateDecisionEngine::decideHumidity(58.0f, s, nullptr, humidifier, dehumidifier);
    TEST_ASSERT_FALSE(humidifier);
    TEST_ASSERT_FALSE(dehumidifier);

    ClimateDecisionEngine::decideHumidity(65.0f, s, nullptr, humidifier, dehumidifier);
    TEST_ASSERT_FALSE(dehumidifier); // Limite superior ainda está na banda
}

void test_humidifier_and_dehumidifier_never_both_on(void) {
    const float tolerances[] = {0.0f, 2.0f, 5.0f};
    const float deltas[] = {-10.0f, -1.0f, 0.0f, 1.0f, 10.0f};
    ClimateSettings s = defaultSettings();

    for (size_t t = 0; t < sizeof(tolerances) / sizeof(tolerances[0]); ++t) {
        s.humidityTolerance = tolerances[t];
        for (float humidity = 0.0f; humidity <= 100.0f; humidity += 0.5f) {
            ActuatorStates reactive =
                ClimateDecisionEngine::decide(ClimateReading(22.0f, humidity), ActuatorStates(), s, nullptr);
            TEST_ASSERT_FALSE(reactive.humidifier && reactive.dehumidifier);

            for (size_t d = 0; d < sizeof(deltas) / sizeof(deltas[0]); ++d) {
                Prediction p(0.0f, deltas[d]);
                ActuatorStates predictive =
                    ClimateDecisionEngine::decide(ClimateReading(22.0f, humidity), ActuatorStates(), s, &p);
                TEST_ASSERT_FALSE(predictive.humidifier && predictive.dehumidifier);
            }
        }
    }
}

void test_incomplete_reading_turns_nothing_on(void) {
    const ClimateSettings s = defaultSettings();
    ActuatorStates current(true, true, false);

    ActuatorStates desired = ClimateDecisionEngine::decide(ClimateReading(NAN, 40.0f), current, s, nullptr);
    TEST_ASSERT_FALSE(desired.heater);
    TEST_ASSERT_FALSE(desired.humidifier);
    TEST_ASSERT_FALSE(desired.dehumidifier);

    desired = ClimateDecisionEngine::decide(ClimateReading(15.0f, NAN), current, s, nullptr);
    TEST_ASSERT_FALSE(desired.heater);
}

void test_decide_uses_current_heater_state(void) {
    const ClimateSettings s = defaultSettings();
    ActuatorStates off;
    ActuatorStates on(true, false, false);

    TEST_ASSERT_FALSE(ClimateDecisionEngine::decide(ClimateReading(21.7f, 60.0f), off, s).heater);
    TEST_ASSERT_TRUE(ClimateDecisionEngine::decide(ClimateReading(21.7f, 60.0f), on, s).heater);
}

static void runAllTests() {
    UNITY_BEGIN();
    RUN_TEST(test_heater_reactive_band);
    RUN_TEST(test_heater_predictive_override);
    RUN_TEST(test_humidity_band);
    RUN_TEST(test_humidifier_and_dehumidifier_never_both_on);
    RUN_TEST(test_incomplete_reading_turns_nothing_on);
    RUN_TEST(test_decide_uses_current_heater_state);
}

#ifdef ARDUINO
#include <Arduino.h>
void setup() {
    delay(2000); // Tempo para o monitor serial conectar
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
