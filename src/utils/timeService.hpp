// src/utils/timeService.hpp
#ifndef TIME_SERVICE_HPP
#define TIME_SERVICE_HPP

#include "config.hpp"    // Para a struct TimeConfig
#include "clockTime.hpp" // Para CycleClock
#include <time.h>

namespace GrowClimate {

/**
 * @brief Relógio do firmware: SNTP para a hora local e esp_timer para os
 * temporizadores de ciclo.
 */
class TimeService {
public:
    TimeService();

    TimeService(const TimeService&) = delete;
    TimeService& operator=(const TimeService&) = delete;

    /**
     * @brief Configura o SNTP e espera até ~10 s pela primeira sincronização.
     * Deve ser chamado depois que o WiFi conectar.
     * @return false se a configuração for inválida. Sincronização pendente não é erro.
     */
    bool initialize(const TimeConfig& config);

    /**
     * @brief Hora local, se o SNTP já sincronizou.
     */
    bool getCurrentTime(struct tm& timeinfo) const;

    /**
     * @brief Referências de tempo para um ciclo de controle.
     * monotonicSeconds é sempre preenchido; o relógio de parede só quando sincronizado.
     */
    CycleClock cycleClock() const;

    /** @brief Segundos desde o boot (não sofre ajustes do NTP nem estoura como millis()). */
    static uint32_t monotonicSeconds();

    bool isInitialized() const;

private:
    bool serviceInitializedState;
};

} // namespace GrowClimate

#endif // TIME_SERVICE_HPP
