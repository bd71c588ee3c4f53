// src/control/controlTaskManager.hpp
#ifndef CONTROL_TASK_MANAGER_HPP
#define CONTROL_TASK_MANAGER_HPP

#include "config.hpp"
#include "climate/climateController.hpp"
#include "data/dataHistoryManager.hpp"
#include "gateway/actuatorGateway.hpp"
#include "light/lightController.hpp"
#include "prediction/trendPredictor.hpp"
#include "utils/timeService.hpp"
#include <atomic>
#include "freertos/FreeRTOS.h"
#include "freertos/event_groups.h"
#include "freertos/task.h"

namespace GrowClimate {

/**
 * @brief Runs the control loops as FreeRTOS tasks.
 *
 * Four independent tasks:
 *  - climate: ClimateController::runCycle every TaskConfig::climateIntervalMs,
 *  - light: LightController::runCycle every TaskConfig::lightIntervalMs,
 *  - sampler: one SensorSample into the history every samplingIntervalMs,
 *  - training: retrains the TrendPredictor when due or when requested.
 *
 * Shutdown is cooperative: stopTasks() clears the running flag, wakes every
 * task and waits (bounded) for each one to finish its current cycle.
 */
class ControlTaskManager {
public:
    ControlTaskManager(const TaskConfig& config,
                       ActuatorGateway& gateway,
                       ClimateController& climate,
                       LightController& light,
                       TimeService& timeService,
                       DataHistoryManager* history,
                       TrendPredictor* predictor);

    ~ControlTaskManager();

    ControlTaskManager(const ControlTaskManager&) = delete;
    ControlTaskManager& operator=(const ControlTaskManager&) = delete;

    /**
     * @brief Creates the tasks. Tasks that need the history (sampler,
     * training) are skipped when it is not available.
     * @return false if a required task could not be created; nothing keeps running then.
     */
    bool startTasks();

    /**
     * @brief Signals every task to stop and waits up to TaskConfig::shutdownTimeoutMs.
     * @return false if a task did not finish in time.
     */
    bool stopTasks();

    bool isRunning() const { return running.load(); }

    /** @brief Asks the training task to retrain now. Safe from any task. */
    void requestTraining();

    /** @brief CommandHandler::TrainingRequestFn adapter; context is the manager. */
    static void requestTrainingCallback(void* context);

private:
    void runClimateTask();
    void runLightTask();
    void runSamplerTask();
    void runTrainingTask();

    void sampleOnce();
    void trainOnce(bool requested);

    /** @brief Sleeps for one interval; returns false once shutdown was requested. */
    bool waitNextCycle(uint32_t intervalMs);

    bool createTask(TaskFunction_t function, const char* name, uint32_t stackSize, UBaseType_t priority,
                    TaskHandle_t& handle);
    void wakeAll();

    static void climateTaskWrapper(void* pvParameters);
    static void lightTaskWrapper(void* pvParameters);
    static void samplerTaskWrapper(void* pvParameters);
    static void trainingTaskWrapper(void* pvParameters);

    const TaskConfig& taskConfig;
    ActuatorGateway& gateway;
    ClimateController& climateController;
    LightController& lightController;
    TimeService& timeService;
    DataHistoryManager* history;
    TrendPredictor* predictor;

    std::atomic<bool> running;
    std::atomic<bool> trainingRequested;

    TaskHandle_t climateTaskHandle;
    TaskHandle_t lightTaskHandle;
    TaskHandle_t samplerTaskHandle;
    TaskHandle_t trainingTaskHandle;
    EventGroupHandle_t exitedTasks; ///< One bit per task, set when its loop returns
    EventBits_t startedTasks;
};

} // namespace GrowClimate

#endif // CONTROL_TASK_MANAGER_HPP
