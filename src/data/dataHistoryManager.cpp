// src/data/dataHistoryManager.cpp
#include "dataHistoryManager.hpp"
#include "utils/logger.hpp"

namespace GrowClimate {

const char* DataHistoryManager::LOG_FILE_NAME = "/history.dat";
const char* DataHistoryManager::NVS_KEY_NEXT_INDEX = "hist_next_idx";
const char* DataHistoryManager::NVS_KEY_RECORD_COUNT = "hist_rec_cnt";
const TickType_t DataHistoryManager::MUTEX_TIMEOUT = pdMS_TO_TICKS(200);
const uint16_t DataHistoryManager::MAX_RECORDS;

DataHistoryManager::DataHistoryManager() :
    nextWriteIndex(0),
    recordCount(0),
    initializedState(false),
    nvsNamespace(nullptr)
{}

bool DataHistoryManager::initialize(const char* nvs_name) {
    if (initializedState) {
        Logger::warn("DataHistoryManager: Already initialized.");
        return true;
    }
    if (!dataMutex) {
        Logger::error("DataHistoryManager: Failed to create dataMutex!");
        return false;
    }

    nvsNamespace = nvs_name;
    Logger::info("DataHistoryManager: Initializing with NVS namespace '%s'...", nvsNamespace);

    if (!LittleFS.exists(LOG_FILE_NAME)) {
        File file = LittleFS.open(LOG_FILE_NAME, "w");
        if (!file) {
            Logger::error("DataHistoryManager: Failed to create log file '%s'.", LOG_FILE_NAME);
            return false;
        }
        file.close();
        Logger::info("DataHistoryManager: Created log file '%s'.", LOG_FILE_NAME);
    }

    FreeRTOSLock lock(dataMutex, MUTEX_TIMEOUT);
    if (!lock) {
        Logger::error("DataHistoryManager: Timed out acquiring mutex for initialization.");
        return false;
    }
    if (!preferences.begin(nvsNamespace, false)) {
        Logger::error("DataHistoryManager: Failed to open NVS namespace '%s'.", nvsNamespace);
        return false;
    }
    nextWriteIndex = preferences.getUShort(NVS_KEY_NEXT_INDEX, 0);
    recordCount = preferences.getUShort(NVS_KEY_RECORD_COUNT, 0);
    preferences.end();

    if (nextWriteIndex >= MAX_RECORDS || recordCount > MAX_RECORDS) {
        Logger::warn("DataHistoryManager: Invalid indices in NVS (next %u, count %u). Starting over.",
                     nextWriteIndex, recordCount);
        nextWriteIndex = 0;
        recordCount = 0;
    }

    // O arquivo pode ter ficado menor que os índices (ex.: formatação do LittleFS)
    File file = LittleFS.open(LOG_FILE_NAME, "r");
    if (file) {
        const size_t storedRecords = file.size() / sizeof(HistoryRecord);
        file.close();
        if (storedRecords < recordCount) {
            Logger::warn("DataHistoryManager: Log file holds %u records, NVS says %u. Starting over.",
                         (unsigned)storedRecords, recordCount);
            nextWriteIndex = 0;
            recordCount = 0;
        }
    }

    initializedState = true;
    Logger::info("DataHistoryManager: Initialized. NextWriteIndex: %u, RecordCount: %u", nextWriteIndex, recordCount);
    return true;
}

bool DataHistoryManager::logActuatorChange(const ActuatorEvent& event) {
    HistoryRecord record = {};
    record.timestamp = event.timestamp;
    record.kind = HistoryRecord::EVENT;
    record.actuator = static_cast<uint8_t>(event.actuator);
    record.value = event.state ? 1 : 0;
    record.mode = static_cast<uint8_t>(event.mode);
    record.temperature = NAN;
    record.humidity = NAN;
    return appendRecord(record);
}

bool DataHistoryManager::logSensorSample(const SensorSample& sample) {
    HistoryRecord record = {};
    record.timestamp = sample.timestamp;
    record.kind = HistoryRecord::SAMPLE;
    record.value = sample.relayMask;
    record.temperature = sample.temperature;
    record.humidity = sample.humidity;
    return appendRecord(record);
}

bool DataHistoryManager::appendRecord(const HistoryRecord& record) {
    if (!initializedState) {
        Logger::error("DataHistoryManager: Not initialized. Cannot add record.");
        return false;
    }
    FreeRTOSLock lock(dataMutex, MUTEX_TIMEOUT);
    if (!lock) {
        Logger::error("DataHistoryManager: Timed out acquiring mutex for appendRecord.");
        return false;
    }

    File file = LittleFS.open(LOG_FILE_NAME, "r+");
    if (!file) {
        file = LittleFS.open(LOG_FILE_NAME, "w+");
        if (!file) {
            Logger::error("DataHistoryManager: Failed to open log file '%s' for writing.", LOG_FILE_NAME);
            return false;
        }
    }

    const size_t seekPosition = (size_t)nextWriteIndex * sizeof(HistoryRecord);
    if (!file.seek(seekPosition)) {
        Logger::error("DataHistoryManager: Failed to seek to record %u.", nextWriteIndex);
        file.close();
        return false;
    }
    const size_t bytesWritten = file.write(reinterpret_cast<const uint8_t*>(&record), sizeof(HistoryRecord));
    file.flush();
    file.close();
    if (bytesWritten != sizeof(HistoryRecord)) {
        Logger::error("DataHistoryManager: Short write (%u of %u bytes).", (unsigned)bytesWritten,
                      (unsigned)sizeof(HistoryRecord));
        return false;
    }

    nextWriteIndex = (nextWriteIndex + 1) % MAX_RECORDS;
    if (recordCount < MAX_RECORDS) {
        recordCount++;
    }

    // O registro já está no arquivo: falha na NVS só é avisada
    bool nvsOk = false;
    if (preferences.begin(nvsNamespace, false)) {
        nvsOk = preferences.putUShort(NVS_KEY_NEXT_INDEX, nextWriteIndex) > 0 &&
                preferences.putUShort(NVS_KEY_RECORD_COUNT, recordCount) > 0;
        preferences.end();
    }
    if (!nvsOk) {
        Logger::warn("DataHistoryManager: NVS save failed. In-memory indices (next:%u, count:%u) are ahead of NVS.",
                     nextWriteIndex, recordCount);
        return false;
    }
    return true;
}

bool DataHistoryManager::readAllRecords(std::vector<HistoryRecord>& out) {
    // Segura o mutex durante toda a leitura para não ler um registro pela metade
    FreeRTOSLock lock(dataMutex, MUTEX_TIMEOUT);
    if (!lock) {
        Logger::error("DataHistoryManager: Timed out acquiring mutex for reading.");
        return false;
    }
    const uint16_t localNextWriteIndex = nextWriteIndex;
    const uint16_t localRecordCount = recordCount;
    out.clear();
    if (localRecordCount == 0) {
        return true;
    }

    File file = LittleFS.open(LOG_FILE_NAME, "r");
    if (!file) {
        Logger::error("DataHistoryManager: Failed to open log file '%s' for reading.", LOG_FILE_NAME);
        return false;
    }

    // Anel cheio: o mais antigo está em nextWriteIndex
    const uint16_t oldest = localRecordCount < MAX_RECORDS ? 0 : localNextWriteIndex;
    out.reserve(localRecordCount);
    HistoryRecord record;
    for (uint16_t i = 0; i < localRecordCount; ++i) {
        const uint16_t fileIndex = (oldest + i) % MAX_RECORDS;
        if (i == 0 || fileIndex == 0) {
            if (!file.seek((size_t)fileIndex * sizeof(HistoryRecord))) {
                Logger::error("DataHistoryManager: Failed to seek to record %u.", fileIndex);
                break;
            }
        }
        if (file.read(reinterpret_cast<uint8_t*>(&record), sizeof(HistoryRecord)) != sizeof(HistoryRecord)) {
            Logger::error("DataHistoryManager: Failed to read record %u.", fileIndex);
            break;
        }
        out.push_back(record);
    }
    file.close();
    return true;
}

std::vector<SensorSample> DataHistoryManager::getSamples() {
    std::vector<SensorSample> samples;
    std::vector<HistoryRecord> records;
    if (!initializedState || !readAllRecords(records)) {
        return samples;
    }
    samples.reserve(records.size());
    for (size_t i = 0; i < records.size(); ++i) {
        if (records[i].kind != HistoryRecord::SAMPLE) {
            continue;
        }
        SensorSample sample;
        sample.timestamp = records[i].timestamp;
        sample.temperature = records[i].temperature;
        sample.humidity = records[i].humidity;
        sample.relayMask = records[i].value;
        samples.push_back(sample);
    }
    return samples;
}

size_t DataHistoryManager::getRecordCount() const {
    FreeRTOSLock lock(dataMutex, MUTEX_TIMEOUT);
    return lock ? recordCount : 0;
}

} // namespace GrowClimate
