// src/control/controlTaskManager.cpp
#include "controlTaskManager.hpp"
#include "utils/logger.hpp"

namespace GrowClimate {

namespace {

const EventBits_t CLIMATE_TASK_BIT = BIT0;
const EventBits_t LIGHT_TASK_BIT = BIT1;
const EventBits_t SAMPLER_TASK_BIT = BIT2;
const EventBits_t TRAINING_TASK_BIT = BIT3;

} // namespace

// --- Construtor e Destrutor ---

ControlTaskManager::ControlTaskManager(const TaskConfig& config,
                                       ActuatorGateway& gatewayRef,
                                       ClimateController& climate,
                                       LightController& light,
                                       TimeService& timeSvc,
                                       DataHistoryManager* historyMgr,
                                       TrendPredictor* trendPredictor) :
    taskConfig(config),
    gateway(gatewayRef),
    climateController(climate),
    lightController(light),
    timeService(timeSvc),
    history(historyMgr),
    predictor(trendPredictor),
    running(false),
    trainingRequested(false),
    climateTaskHandle(nullptr),
    lightTaskHandle(nullptr),
    samplerTaskHandle(nullptr),
    trainingTaskHandle(nullptr),
    exitedTasks(xEventGroupCreate()),
    startedTasks(0)
{}

ControlTaskManager::~ControlTaskManager() {
    if (running.load() && !stopTasks()) {
        Logger::error("ControlTaskManager: Tasks still running at destruction.");
    }
    if (exitedTasks != nullptr) {
        vEventGroupDelete(exitedTasks);
    }
}

// --- Gerenciamento das Tarefas ---

bool ControlTaskManager::createTask(TaskFunction_t function, const char* name, uint32_t stackSize,
                                    UBaseType_t priority, TaskHandle_t& handle) {
    BaseType_t result = xTaskCreate(function, name, stackSize, this, priority, &handle);
    if (result != pdPASS) {
        handle = nullptr;
        Logger::error("ControlTaskManager: Failed to create %s! Code: %d", name, result);
        return false;
    }
    return true;
}

bool ControlTaskManager::startTasks() {
    if (exitedTasks == nullptr) {
        Logger::error("ControlTaskManager: Cannot start tasks, event group not created.");
        return false;
    }
    if (running.load()) {
        Logger::warn("ControlTaskManager: Tasks already started.");
        return true;
    }

    Logger::info("ControlTaskManager: Starting control tasks...");
    xEventGroupClearBits(exitedTasks, CLIMATE_TASK_BIT | LIGHT_TASK_BIT | SAMPLER_TASK_BIT | TRAINING_TASK_BIT);
    running.store(true);
    startedTasks = 0;

    const UBaseType_t controlPriority = taskConfig.controlPriority;
    if (createTask(climateTaskWrapper, "ClimateTask", taskConfig.controlStackSize, controlPriority, climateTaskHandle)) {
        startedTasks |= CLIMATE_TASK_BIT;
    }
    if (createTask(lightTaskWrapper, "LightTask", taskConfig.controlStackSize, controlPriority, lightTaskHandle)) {
        startedTasks |= LIGHT_TASK_BIT;
    }
    if ((startedTasks & (CLIMATE_TASK_BIT | LIGHT_TASK_BIT)) != (CLIMATE_TASK_BIT | LIGHT_TASK_BIT)) {
        stopTasks();
        return false;
    }

    if (history != nullptr) {
        if (createTask(samplerTaskWrapper, "SamplerTask", taskConfig.controlStackSize, controlPriority,
                       samplerTaskHandle)) {
            startedTasks |= SAMPLER_TASK_BIT;
        }
        if (predictor != nullptr &&
            createTask(trainingTaskWrapper, "TrainingTask", taskConfig.trainingStackSize,
                       taskConfig.trainingPriority, trainingTaskHandle)) {
            startedTasks |= TRAINING_TASK_BIT;
        }
    } else {
        Logger::warn("ControlTaskManager: No history, sampling and training disabled.");
    }

    Logger::info("ControlTaskManager: Control tasks started.");
    return true;
}

void ControlTaskManager::wakeAll() {
    TaskHandle_t handles[4] = {climateTaskHandle, lightTaskHandle, samplerTaskHandle, trainingTaskHandle};
    for (int i = 0; i < 4; ++i) {
        if (handles[i] != nullptr) {
            xTaskNotifyGive(handles[i]);
        }
    }
}

bool ControlTaskManager::stopTasks() {
    if (startedTasks == 0) {
        running.store(false);
        return true;
    }
    Logger::info("ControlTaskManager: Stopping control tasks...");
    running.store(false);
    wakeAll();

    const EventBits_t exited = xEventGroupWaitBits(exitedTasks, startedTasks, pdFALSE, pdTRUE,
                                                   pdMS_TO_TICKS(taskConfig.shutdownTimeoutMs));
    if ((exited & startedTasks) != startedTasks) {
        Logger::error("ControlTaskManager: Tasks did not stop in %lu ms (pending 0x%x).",
                      (unsigned long)taskConfig.shutdownTimeoutMs, (unsigned)(startedTasks & ~exited));
        return false;
    }

    climateTaskHandle = nullptr;
    lightTaskHandle = nullptr;
    samplerTaskHandle = nullptr;
    trainingTaskHandle = nullptr;
    startedTasks = 0;
    Logger::info("ControlTaskManager: Control tasks stopped.");
    return true;
}

bool ControlTaskManager::waitNextCycle(uint32_t intervalMs) {
    // Notificação acorda a tarefa antes do tempo (parada ou pedido de treino)
    ulTaskNotifyTake(pdTRUE, pdMS_TO_TICKS(intervalMs));
    return running.load();
}

void ControlTaskManager::requestTraining() {
    trainingRequested.store(true);
    TaskHandle_t handle = trainingTaskHandle;
    if (handle != nullptr) {
        xTaskNotifyGive(handle);
    } else {
        Logger::warn("ControlTaskManager: Training task not running.");
    }
}

void ControlTaskManager::requestTrainingCallback(void* context) {
    ControlTaskManager* instance = static_cast<ControlTaskManager*>(context);
    if (instance) {
        instance->requestTraining();
    }
}

// --- Implementação das Tarefas (Wrappers e Loops) ---

void ControlTaskManager::climateTaskWrapper(void* pvParameters) {
    ControlTaskManager* instance = static_cast<ControlTaskManager*>(pvParameters);
    if (instance) {
        instance->runClimateTask();
        xEventGroupSetBits(instance->exitedTasks, CLIMATE_TASK_BIT);
    }
    vTaskDelete(NULL);
}

void ControlTaskManager::runClimateTask() {
    Logger::info("ControlTaskManager: Climate task started.");
    climateController.adoptHardwareState(TimeService::monotonicSeconds());

    do {
        const CycleOutcome outcome = climateController.runCycle(timeService.cycleClock());
        if (outcome == CycleOutcome::SensorFault || outcome == CycleOutcome::GatewayWriteFailed) {
            Logger::warn("ControlTaskManager: Climate cycle ended with %s.", cycleOutcomeName(outcome));
        }
    } while (waitNextCycle(taskConfig.climateIntervalMs));

    Logger::info("ControlTaskManager: Climate task finished.");
}

void ControlTaskManager::lightTaskWrapper(void* pvParameters) {
    ControlTaskManager* instance = static_cast<ControlTaskManager*>(pvParameters);
    if (instance) {
        instance->runLightTask();
        xEventGroupSetBits(instance->exitedTasks, LIGHT_TASK_BIT);
    }
    vTaskDelete(NULL);
}

void ControlTaskManager::runLightTask() {
    Logger::info("ControlTaskManager: Light task started.");
    do {
        lightController.runCycle(timeService.cycleClock());
    } while (waitNextCycle(taskConfig.lightIntervalMs));
    Logger::info("ControlTaskManager: Light task finished.");
}

void ControlTaskManager::samplerTaskWrapper(void* pvParameters) {
    ControlTaskManager* instance = static_cast<ControlTaskManager*>(pvParameters);
    if (instance) {
        instance->runSamplerTask();
        xEventGroupSetBits(instance->exitedTasks, SAMPLER_TASK_BIT);
    }
    vTaskDelete(NULL);
}

void ControlTaskManager::runSamplerTask() {
    Logger::info("ControlTaskManager: Sampler task started.");
    while (waitNextCycle(taskConfig.samplingIntervalMs)) {
        sampleOnce();
    }
    Logger::info("ControlTaskManager: Sampler task finished.");
}

void ControlTaskManager::sampleOnce() {
    ClimateReading reading;
    RelayStates relays;
    if (!gateway.readClimate(reading) || !gateway.getActuatorStates(relays)) {
        Logger::warn("ControlTaskManager: Sample skipped, board unavailable.");
        return;
    }
    if (!reading.isComplete()) {
        return;
    }
    const CycleClock clock = timeService.cycleClock();
    if (!clock.wallClockValid) {
        return; // Sem hora não dá para parear amostras no treino
    }

    SensorSample sample;
    sample.timestamp = clock.epochSeconds;
    sample.temperature = reading.temperature;
    sample.humidity = reading.humidity;
    sample.relayMask = relays.climate.toMask();
    if (!history->logSensorSample(sample)) {
        Logger::warn("ControlTaskManager: Failed to store sensor sample.");
    }
}

void ControlTaskManager::trainingTaskWrapper(void* pvParameters) {
    ControlTaskManager* instance = static_cast<ControlTaskManager*>(pvParameters);
    if (instance) {
        instance->runTrainingTask();
        xEventGroupSetBits(instance->exitedTasks, TRAINING_TASK_BIT);
    }
    vTaskDelete(NULL);
}

void ControlTaskManager::runTrainingTask() {
    Logger::info("ControlTaskManager: Training task started.");
    while (waitNextCycle(taskConfig.trainingCheckIntervalMs)) {
        const bool requested = trainingRequested.exchange(false);
        if (requested || predictor->shouldRetrain(TimeService::monotonicSeconds())) {
            trainOnce(requested);
        }
    }
    Logger::info("ControlTaskManager: Training task finished.");
}

void ControlTaskManager::trainOnce(bool requested) {
    Logger::info("ControlTaskManager: Training predictor (%s).", requested ? "requested" : "scheduled");
    const std::vector<SensorSample> samples = history->getSamples();
    if (!running.load()) {
        return;
    }
    if (!predictor->train(samples, TimeService::monotonicSeconds())) {
        Logger::debug("ControlTaskManager: Keeping previous model (%s).", predictor->hasModel() ? "trained" : "none");
    }
}

} // namespace GrowClimate
