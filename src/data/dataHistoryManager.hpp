// src/data/dataHistoryManager.hpp
#ifndef DATA_HISTORY_MANAGER_HPP
#define DATA_HISTORY_MANAGER_HPP

#include "historyLog.hpp"
#include <LittleFS.h>
#include <Preferences.h>
#include <vector>
#include "utils/freeRTOSMutex.hpp"

namespace GrowClimate {

/** Registro de tamanho fixo gravado no arquivo circular. */
struct HistoryRecord {
    uint32_t timestamp;
    uint8_t kind;      ///< HistoryRecord::SAMPLE ou HistoryRecord::EVENT
    uint8_t actuator;  ///< Evento: Actuator
    uint8_t value;     ///< Evento: novo estado. Amostra: máscara dos relés
    uint8_t mode;      ///< Evento: ControlMode
    float temperature; ///< Amostra
    float humidity;    ///< Amostra

    static const uint8_t SAMPLE = 0;
    static const uint8_t EVENT = 1;
};

/**
 * @brief HistoryLog em um arquivo circular no LittleFS.
 *
 * Amostras e transições de atuadores dividem o mesmo anel; os registros mais
 * novos sobrescrevem os mais antigos. Os índices ficam na NVS para
 * sobreviver a reinicializações. LittleFS.begin() deve ser chamado antes.
 */
class DataHistoryManager : public HistoryLog {
public:
    DataHistoryManager();

    DataHistoryManager(const DataHistoryManager&) = delete;
    DataHistoryManager& operator=(const DataHistoryManager&) = delete;

    bool initialize(const char* nvs_namespace = "grow_hist_v1");

    bool logActuatorChange(const ActuatorEvent& event) override;
    bool logSensorSample(const SensorSample& sample) override;

    /** @brief Amostras em ordem cronológica (para o treino do preditor). */
    std::vector<SensorSample> getSamples();

    size_t getRecordCount() const;

    static const uint16_t MAX_RECORDS = 2048; // ~17 h de amostras a cada 30 s

private:
    bool appendRecord(const HistoryRecord& record);
    bool readAllRecords(std::vector<HistoryRecord>& out);

    static const char* LOG_FILE_NAME;
    static const char* NVS_KEY_NEXT_INDEX;
    static const char* NVS_KEY_RECORD_COUNT;
    static const TickType_t MUTEX_TIMEOUT;

    Preferences preferences;
    uint16_t nextWriteIndex;
    uint16_t recordCount;
    bool initializedState;
    const char* nvsNamespace;

    mutable FreeRTOSMutex dataMutex;
};

} // namespace GrowClimate

#endif // DATA_HISTORY_MANAGER_HPP
