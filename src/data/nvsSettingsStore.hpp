// src/data/nvsSettingsStore.hpp
#ifndef NVS_SETTINGS_STORE_HPP
#define NVS_SETTINGS_STORE_HPP

#include <Preferences.h>
#include "settingsStore.hpp"
#include "utils/freeRTOSMutex.hpp"

namespace GrowClimate {

/**
 * @brief SettingsStore na NVS do ESP32 (Preferences), uma string por chave.
 *
 * A NVS não permite listar chaves, então snapshot() lê apenas as chaves
 * conhecidas (SettingsKeys). O mutex garante que um snapshot nunca veja um
 * put() pela metade.
 */
class NvsSettingsStore : public SettingsStore {
public:
    explicit NvsSettingsStore(const char* nvsNamespace);

    NvsSettingsStore(const NvsSettingsStore&) = delete;
    NvsSettingsStore& operator=(const NvsSettingsStore&) = delete;

    /** @brief Abre (e cria, se preciso) o namespace. */
    bool initialize();

    bool snapshot(SettingsMap& out) const override;
    bool put(const SettingsMap& values) override;

private:
    const char* nvsNamespace;
    mutable Preferences preferences;
    mutable FreeRTOSMutex storeMutex;
    bool initializedState;

    static const TickType_t MUTEX_TIMEOUT;
};

} // namespace GrowClimate

#endif // NVS_SETTINGS_STORE_HPP
