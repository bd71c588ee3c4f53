// src/data/nvsSettingsStore.cpp
#include "nvsSettingsStore.hpp"
#include "settingsManager.hpp" // Para SettingsKeys
#include "utils/logger.hpp"

namespace GrowClimate {

const TickType_t NvsSettingsStore::MUTEX_TIMEOUT = pdMS_TO_TICKS(200);

namespace {

const char* const KNOWN_KEYS[] = {
    SettingsKeys::MODE,
    SettingsKeys::LIGHT_MODE,
    SettingsKeys::TARGET_TEMP,
    SettingsKeys::TEMP_TOLERANCE,
    SettingsKeys::TARGET_HUMIDITY,
    SettingsKeys::HUMIDITY_TOLERANCE,
    SettingsKeys::USE_ML,
    SettingsKeys::LIGHT_ENABLED,
    SettingsKeys::LIGHT_ON_TIME,
    SettingsKeys::LIGHT_OFF_TIME,
    SettingsKeys::TEMP_SCHEDULE,
};

} // namespace

NvsSettingsStore::NvsSettingsStore(const char* nvsName) :
    nvsNamespace(nvsName),
    initializedState(false)
{}

bool NvsSettingsStore::initialize() {
    if (!storeMutex) {
        Logger::error("NvsSettingsStore: Failed to create mutex!");
        return false;
    }
    FreeRTOSLock lock(storeMutex, MUTEX_TIMEOUT);
    if (!lock) {
        Logger::error("NvsSettingsStore: Timed out acquiring mutex for initialization.");
        return false;
    }
    // Abrir em modo escrita cria o namespace na primeira execução
    if (!preferences.begin(nvsNamespace, false)) {
        Logger::error("NvsSettingsStore: Failed to open NVS namespace '%s'.", nvsNamespace);
        return false;
    }
    preferences.end();
    initializedState = true;
    Logger::info("NvsSettingsStore: Using NVS namespace '%s'.", nvsNamespace);
    return true;
}

bool NvsSettingsStore::snapshot(SettingsMap& out) const {
    if (!initializedState) {
        return false;
    }
    FreeRTOSLock lock(storeMutex, MUTEX_TIMEOUT);
    if (!lock) {
        Logger::warn("NvsSettingsStore: Timed out acquiring mutex for snapshot.");
        return false;
    }
    if (!preferences.begin(nvsNamespace, true)) {
        return false;
    }
    out.clear();
    for (size_t i = 0; i < sizeof(KNOWN_KEYS) / sizeof(KNOWN_KEYS[0]); ++i) {
        if (preferences.isKey(KNOWN_KEYS[i])) {
            out[KNOWN_KEYS[i]] = preferences.getString(KNOWN_KEYS[i], "").c_str();
        }
    }
    preferences.end();
    return true;
}

bool NvsSettingsStore::put(const SettingsMap& values) {
    if (!initializedState) {
        return false;
    }
    FreeRTOSLock lock(storeMutex, MUTEX_TIMEOUT);
    if (!lock) {
        Logger::error("NvsSettingsStore: Timed out acquiring mutex for put.");
        return false;
    }
    if (!preferences.begin(nvsNamespace, false)) {
        Logger::error("NvsSettingsStore: Failed to open NVS namespace '%s' for writing.", nvsNamespace);
        return false;
    }
    bool ok = true;
    for (SettingsMap::const_iterator it = values.begin(); it != values.end(); ++it) {
        // putString retorna 0 bytes em falha (strings vazias não são usadas)
        if (preferences.putString(it->first.c_str(), it->second.c_str()) == 0) {
            Logger::error("NvsSettingsStore: Failed to write key '%s'.", it->first.c_str());
            ok = false;
        }
    }
    preferences.end();
    return ok;
}

} // namespace GrowClimate
