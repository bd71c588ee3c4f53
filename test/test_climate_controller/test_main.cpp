#include <unity.h>
#include "climate/climateController.hpp"
#include "../support/fixedPredictor.hpp"
#include "../support/inMemorySettingsStore.hpp"
#include "../support/recordingHistory.hpp"
#include "../support/scriptedGateway.hpp"

using namespace GrowClimate;

static InMemorySettingsStore* store;
static SettingsManager* settings;
static ScriptedGateway* gateway;
static RecordingHistory* history;
static FixedPredictor* predictor;
static ClimateController* controller;

void setUp(void) {
    store = new InMemorySettingsStore();
    store->values["target_temp"] = "22.0";
    store->values["temp_tolerance"] = "0.5";
    store->values["target_humidity"] = "60.0";
    store->values["humidity_tolerance"] = "5.0";
    store->values["use_ml"] = "false";
    settings = new SettingsManager(*store);
    gateway = new ScriptedGateway();
    history = new RecordingHistory();
    predictor = new FixedPredictor();
    controller = new ClimateController(*gateway, *settings, history, predictor);
}

void tearDown(void) {
    delete controller;
    delete predictor;
    delete history;
    delete gateway;
    delete settings;
    delete store;
}

static CycleClock at(uint32_t monotonic, bool wallClock = true) {
    CycleClock clock;
    clock.monotonicSeconds = monotonic;
    clock.wallClockValid = wallClock;
    if (wallClock) {
        clock.epochSeconds = 1700000000 + monotonic;
        clock.localTime = ClockTime(12, 0);
    }
    return clock;
}

static CycleOutcome cycleWith(float temperature, float humidity, uint32_t monotonic) {
    gateway->reading = ClimateReading(temperature, humidity);
    return controller->runCycle(at(monotonic));
}

void test_disabled_controller_skips_cycle(void) {
    TEST_ASSERT_EQUAL(CycleOutcome::Disabled, cycleWith(15.0f, 60.0f, 100));
    TEST_ASSERT_EQUAL(0, gateway->setActuatorsCalls);
    TEST_ASSERT_EQUAL(CycleOutcome::Disabled, controller->status().lastOutcome);
}

void test_heats_until_target_then_stops_immediately(void) {
    TEST_ASSERT_TRUE(controller->start());

    TEST_ASSERT_EQUAL(CycleOutcome::Applied, cycleWith(20.0f, 60.0f, 100));
    TEST_ASSERT_TRUE(gateway->relays.climate.heater);
    TEST_ASSERT_FALSE(gateway->relays.climate.humidifier);
    TEST_ASSERT_FALSE(gateway->relays.climate.dehumidifier);

    // Dentro da histerese: continua ligado
    TEST_ASSERT_EQUAL(CycleOutcome::NoChange, cycleWith(21.0f, 60.0f, 130));
    TEST_ASSERT_TRUE(gateway->relays.climate.heater);

    // Alvo atingido bem antes do tempo mínimo ligado
    TEST_ASSERT_EQUAL(CycleOutcome::Applied, cycleWith(22.0f, 60.0f, 200));
    TEST_ASSERT_FALSE(gateway->relays.climate.heater);

    TEST_ASSERT_EQUAL(2, (int)history->events.size());
    TEST_ASSERT_EQUAL(Actuator::Heater, history->events[0].actuator);
    TEST_ASSERT_TRUE(history->events[0].state);
    TEST_ASSERT_EQUAL(ControlMode::Auto, history->events[0].mode);
    TEST_ASSERT_EQUAL_UINT32(1700000100, history->events[0].timestamp);
    TEST_ASSERT_FALSE(history->events[1].state);
}

void test_gateway_write_failure_is_retried(void) {
    TEST_ASSERT_TRUE(controller->start());
    gateway->writeOk = false;
    TEST_ASSERT_EQUAL(CycleOutcome::GatewayWriteFailed, cycleWith(20.0f, 60.0f, 100));
    TEST_ASSERT_FALSE(controller->status().applied.heater);
    TEST_ASSERT_FALSE(controller->status().hasActed);
    TEST_ASSERT_EQUAL(0, (int)history->events.size());

    gateway->writeOk = true;
    TEST_ASSERT_EQUAL(CycleOutcome::Applied, cycleWith(20.0f, 60.0f, 110));
    TEST_ASSERT_TRUE(gateway->relays.climate.heater);
    TEST_ASSERT_EQUAL_UINT32(110, controller->status().lastActionAt);
}

void test_action_interval_defers_all_but_safety_shutoffs(void) {
    TEST_ASSERT_TRUE(controller->start());
    TEST_ASSERT_EQUAL(CycleOutcome::Applied, cycleWith(20.0f, 60.0f, 100));

    // 20 s depois: o desligamento por alvo atingido passa mesmo assim
    TEST_ASSERT_EQUAL(CycleOutcome::Applied, cycleWith(22.0f, 60.0f, 120));
    TEST_ASSERT_FALSE(gateway->relays.climate.heater);

    // Umidificador pedido 10 s depois da última ação
    TEST_ASSERT_EQUAL(CycleOutcome::RateLimited, cycleWith(22.0f, 40.0f, 130));
    TEST_ASSERT_FALSE(gateway->relays.climate.humidifier);
    TEST_ASSERT_EQUAL(2, gateway->setActuatorsCalls);

    TEST_ASSERT_EQUAL(CycleOutcome::Applied, cycleWith(22.0f, 40.0f, 180));
    TEST_ASSERT_TRUE(gateway->relays.climate.humidifier);
}

void test_sensor_fault_aborts_cycle(void) {
    TEST_ASSERT_TRUE(controller->start());
    gateway->readOk = false;
    TEST_ASSERT_EQUAL(CycleOutcome::SensorFault, controller->runCycle(at(100)));
    TEST_ASSERT_EQUAL(0, gateway->setActuatorsCalls);
}

void test_incomplete_reading_changes_nothing(void) {
    TEST_ASSERT_TRUE(controller->start());
    TEST_ASSERT_EQUAL(CycleOutcome::Applied, cycleWith(20.0f, 60.0f, 100));

    TEST_ASSERT_EQUAL(CycleOutcome::MissingData, cycleWith(NAN, 60.0f, 400));
    TEST_ASSERT_EQUAL(CycleOutcome::MissingData, cycleWith(23.0f, NAN, 430));
    TEST_ASSERT_TRUE(gateway->relays.climate.heater);
    TEST_ASSERT_EQUAL(1, gateway->setActuatorsCalls);
}

void test_prediction_used_when_available(void) {
    store->values["use_ml"] = "true";
    TEST_ASSERT_TRUE(controller->start());

    // Reativo manteria desligado (21.8 acima do limite inferior)
    predictor->prediction = Prediction(-1.0f, 0.0f);
    TEST_ASSERT_EQUAL(CycleOutcome::Applied, cycleWith(21.8f, 60.0f, 100));
    TEST_ASSERT_TRUE(gateway->relays.climate.heater);
    TEST_ASSERT_TRUE(controller->status().usedPrediction);
}

void test_unavailable_prediction_falls_back_to_reactive(void) {
    store->values["use_ml"] = "true";
    TEST_ASSERT_TRUE(controller->start());
    predictor->available = false;

    TEST_ASSERT_EQUAL(CycleOutcome::NoChange, cycleWith(21.8f, 60.0f, 100));
    TEST_ASSERT_EQUAL(1, predictor->calls);
    TEST_ASSERT_FALSE(controller->status().usedPrediction);

    TEST_ASSERT_EQUAL(CycleOutcome::Applied, cycleWith(21.0f, 60.0f, 130));
    TEST_ASSERT_TRUE(gateway->relays.climate.heater);
}

void test_prediction_disabled_in_settings(void) {
    TEST_ASSERT_TRUE(controller->start());
    predictor->prediction = Prediction(-5.0f, 0.0f);
    TEST_ASSERT_EQUAL(CycleOutcome::NoChange, cycleWith(21.8f, 60.0f, 100));
    TEST_ASSERT_EQUAL(0, predictor->calls);
}

void test_temperature_schedule_overrides_target(void) {
    store->values["temp_schedule"] = "{\"enabled\":true,\"periods\":[{\"time\":\"00:00\",\"temperature\":26}]}";
    TEST_ASSERT_TRUE(controller->start());

    // Sem relógio de parede a agenda não se aplica
    gateway->reading = ClimateReading(24.0f, 60.0f);
    TEST_ASSERT_EQUAL(CycleOutcome::NoChange, controller->runCycle(at(100, false)));
    TEST_ASSERT_EQUAL_FLOAT(22.0f, controller->status().settings.targetTemperature);

    TEST_ASSERT_EQUAL(CycleOutcome::Applied, controller->runCycle(at(130)));
    TEST_ASSERT_TRUE(gateway->relays.climate.heater);
    TEST_ASSERT_EQUAL_FLOAT(26.0f, controller->status().settings.targetTemperature);
}

void test_settings_reloaded_every_cycle(void) {
    TEST_ASSERT_TRUE(controller->start());
    TEST_ASSERT_EQUAL(CycleOutcome::NoChange, cycleWith(21.6f, 60.0f, 100));

    store->values["target_temp"] = "25.0";
    TEST_ASSERT_EQUAL(CycleOutcome::Applied, cycleWith(21.6f, 60.0f, 130));
    TEST_ASSERT_TRUE(gateway->relays.climate.heater);

    // Valor inválido: mantém o último válido
    store->values["target_temp"] = "abc";
    TEST_ASSERT_EQUAL(CycleOutcome::NoChange, cycleWith(21.6f, 60.0f, 160));
    TEST_ASSERT_EQUAL_FLOAT(25.0f, controller->status().settings.targetTemperature);
}

void test_mode_persisted_and_restored(void) {
    TEST_ASSERT_TRUE(controller->start());
    TEST_ASSERT_EQUAL_STRING("auto", store->get("mode"));

    ClimateController other(*gateway, *settings);
    other.restoreMode();
    TEST_ASSERT_TRUE(other.isEnabled());

    TEST_ASSERT_TRUE(controller->stop());
    TEST_ASSERT_EQUAL_STRING("manual", store->get("mode"));
    other.restoreMode();
    TEST_ASSERT_FALSE(other.isEnabled());
}

void test_mode_change_reports_persist_failure(void) {
    store->failWrites = true;
    TEST_ASSERT_FALSE(controller->start());
    TEST_ASSERT_TRUE(controller->isEnabled());
}

void test_stop_leaves_relays_and_timers(void) {
    TEST_ASSERT_TRUE(controller->start());
    TEST_ASSERT_EQUAL(CycleOutcome::Applied, cycleWith(20.0f, 60.0f, 100));

    TEST_ASSERT_TRUE(controller->stop());
    TEST_ASSERT_EQUAL(CycleOutcome::Disabled, cycleWith(25.0f, 60.0f, 130));
    TEST_ASSERT_TRUE(gateway->relays.climate.heater);
    TEST_ASSERT_TRUE(controller->dutyCycle().timing(Actuator::Heater).on);
    TEST_ASSERT_EQUAL_UINT32(100, controller->dutyCycle().timing(Actuator::Heater).lastTurnedOnAt);
}

void test_adopts_relays_found_on(void) {
    gateway->relays.climate = ActuatorStates(true, false, false);
    TEST_ASSERT_TRUE(controller->adoptHardwareState(50));
    TEST_ASSERT_TRUE(controller->status().applied.heater);

    TEST_ASSERT_TRUE(controller->start());
    TEST_ASSERT_EQUAL(CycleOutcome::Applied, cycleWith(22.5f, 60.0f, 60));
    TEST_ASSERT_FALSE(gateway->relays.climate.heater);
    TEST_ASSERT_EQUAL(1, (int)history->countFor(Actuator::Heater));
    TEST_ASSERT_FALSE(history->events[0].state);

    gateway->relaysOk = false;
    TEST_ASSERT_FALSE(controller->adoptHardwareState(70));
}

void test_partial_write_resyncs_from_board(void) {
    TEST_ASSERT_TRUE(controller->start());

    // A placa ligou o aquecedor antes de a escrita falhar
    gateway->writeOk = false;
    gateway->partialWrite = true;
    TEST_ASSERT_EQUAL(CycleOutcome::GatewayWriteFailed, cycleWith(20.0f, 60.0f, 100));
    TEST_ASSERT_TRUE(gateway->relays.climate.heater);
    TEST_ASSERT_FALSE(controller->status().applied.heater);

    // Próximo ciclo relê os relés e passa a cronometrar o aquecedor
    gateway->writeOk = true;
    TEST_ASSERT_EQUAL(CycleOutcome::NoChange, cycleWith(20.0f, 60.0f, 110));
    TEST_ASSERT_TRUE(controller->status().applied.heater);
    TEST_ASSERT_EQUAL_UINT32(110, controller->dutyCycle().timing(Actuator::Heater).lastTurnedOnAt);
    TEST_ASSERT_EQUAL(1, (int)history->events.size());
    TEST_ASSERT_TRUE(history->events[0].state);

    // O limite de tempo contínuo desliga o aquecedor
    TEST_ASSERT_EQUAL(CycleOutcome::Applied, cycleWith(20.0f, 60.0f, 110 + MAX_CONTINUOUS_RUNTIME_S));
    TEST_ASSERT_FALSE(gateway->relays.climate.heater);
    TEST_ASSERT_EQUAL(2, (int)history->events.size());
}

void test_partial_write_rewritten_when_board_unreadable(void) {
    TEST_ASSERT_TRUE(controller->start());
    gateway->writeOk = false;
    gateway->partialWrite = true;
    TEST_ASSERT_EQUAL(CycleOutcome::GatewayWriteFailed, cycleWith(20.0f, 60.0f, 100));

    // Sem get_relays o estado decidido é escrito de novo por inteiro
    gateway->writeOk = true;
    gateway->relaysOk = false;
    TEST_ASSERT_EQUAL(CycleOutcome::Applied, cycleWith(23.0f, 60.0f, 110));
    TEST_ASSERT_FALSE(gateway->relays.climate.heater);
    TEST_ASSERT_EQUAL(2, gateway->setActuatorsCalls);

    TEST_ASSERT_EQUAL(CycleOutcome::NoChange, cycleWith(23.0f, 60.0f, 120));
    TEST_ASSERT_EQUAL(2, gateway->setActuatorsCalls);
}

void test_manual_relay_refused_in_auto_mode(void) {
    TEST_ASSERT_TRUE(controller->start());
    TEST_ASSERT_FALSE(controller->setManualState(Actuator::Heater, true, at(100)));
    TEST_ASSERT_EQUAL(0, gateway->setActuatorsCalls);
    TEST_ASSERT_EQUAL(0, (int)history->events.size());
}

void test_manual_relay_switches_and_logs(void) {
    TEST_ASSERT_TRUE(controller->setManualState(Actuator::Humidifier, true, at(100)));
    TEST_ASSERT_TRUE(gateway->relays.climate.humidifier);
    TEST_ASSERT_FALSE(gateway->relays.climate.heater);
    TEST_ASSERT_TRUE(controller->status().applied.humidifier);
    TEST_ASSERT_EQUAL_UINT32(100, controller->dutyCycle().timing(Actuator::Humidifier).lastTurnedOnAt);

    TEST_ASSERT_EQUAL(1, (int)history->events.size());
    TEST_ASSERT_EQUAL(Actuator::Humidifier, history->events[0].actuator);
    TEST_ASSERT_EQUAL(ControlMode::Manual, history->events[0].mode);
    TEST_ASSERT_EQUAL_UINT32(1700000100, history->events[0].timestamp);

    // A luz não pertence a este controlador
    TEST_ASSERT_FALSE(controller->setManualState(Actuator::Light, true, at(110)));

    gateway->writeOk = false;
    TEST_ASSERT_FALSE(controller->setManualState(Actuator::Humidifier, false, at(120)));
    TEST_ASSERT_EQUAL(1, (int)history->events.size());
    TEST_ASSERT_TRUE(controller->dutyCycle().needsResync());
}

void test_history_failure_keeps_actuation(void) {
    TEST_ASSERT_TRUE(controller->start());
    history->failWrites = true;
    TEST_ASSERT_EQUAL(CycleOutcome::Applied, cycleWith(20.0f, 60.0f, 100));
    TEST_ASSERT_TRUE(gateway->relays.climate.heater);
}

void test_event_timestamp_zero_without_wall_clock(void) {
    TEST_ASSERT_TRUE(controller->start());
    gateway->reading = ClimateReading(20.0f, 60.0f);
    TEST_ASSERT_EQUAL(CycleOutcome::Applied, controller->runCycle(at(100, false)));
    TEST_ASSERT_EQUAL(1, (int)history->events.size());
    TEST_ASSERT_EQUAL_UINT32(0, history->events[0].timestamp);
}

void test_never_heats_and_humidifies_against_each_other(void) {
    TEST_ASSERT_TRUE(controller->start());
    const float humidities[] = {40.0f, 58.0f, 62.0f, 80.0f, 60.0f, 30.0f};
    uint32_t now = 100;
    for (unsigned i = 0; i < sizeof(humidities) / sizeof(humidities[0]); ++i) {
        cycleWith(22.0f, humidities[i], now);
        now += 4000;
        TEST_ASSERT_FALSE(gateway->relays.climate.humidifier && gateway->relays.climate.dehumidifier);
    }
}

static void runAllTests() {
    UNITY_BEGIN();
    RUN_TEST(test_disabled_controller_skips_cycle);
    RUN_TEST(test_heats_until_target_then_stops_immediately);
    RUN_TEST(test_gateway_write_failure_is_retried);
    RUN_TEST(test_action_interval_defers_all_but_safety_shutoffs);
    RUN_TEST(test_sensor_fault_aborts_cycle);
    RUN_TEST(test_incomplete_reading_changes_nothing);
    RUN_TEST(test_prediction_used_when_available);
    RUN_TEST(test_unavailable_prediction_falls_back_to_reactive);
    RUN_TEST(test_prediction_disabled_in_settings);
    RUN_TEST(test_temperature_schedule_overrides_target);
    RUN_TEST(test_settings_reloaded_every_cycle);
    RUN_TEST(test_mode_persisted_and_restored);
    RUN_TEST(test_mode_change_reports_persist_failure);
    RUN_TEST(test_stop_leaves_relays_and_timers);
    RUN_TEST(test_adopts_relays_found_on);
    RUN_TEST(test_partial_write_resyncs_from_board);
    RUN_TEST(test_partial_write_rewritten_when_board_unreadable);
    RUN_TEST(test_manual_relay_refused_in_auto_mode);
    RUN_TEST(test_manual_relay_switches_and_logs);
    RUN_TEST(test_history_failure_keeps_actuation);
    RUN_TEST(test_event_timestamp_zero_without_wall_clock);
    RUN_TEST(test_never_heats_and_humidifies_against_each_other);
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
