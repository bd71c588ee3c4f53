// src/utils/freeRTOSMutex.hpp
#ifndef FREERTOS_MUTEX_HPP
#define FREERTOS_MUTEX_HPP

#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"

namespace GrowClimate {

/**
 * @brief Dono RAII de um mutex FreeRTOS (SemaphoreHandle_t).
 * O mutex é criado no construtor e apagado no destrutor.
 */
class FreeRTOSMutex {
public:
    FreeRTOSMutex() : handle(xSemaphoreCreateMutex()) {}

    ~FreeRTOSMutex() {
        if (handle != nullptr) {
            vSemaphoreDelete(handle);
        }
    }

    FreeRTOSMutex(const FreeRTOSMutex&) = delete;
    FreeRTOSMutex& operator=(const FreeRTOSMutex&) = delete;

    FreeRTOSMutex(FreeRTOSMutex&& other) noexcept : handle(other.handle) {
        other.handle = nullptr;
    }

    FreeRTOSMutex& operator=(FreeRTOSMutex&& other) noexcept {
        if (this != &other) {
            if (handle != nullptr) {
                vSemaphoreDelete(handle);
            }
            handle = other.handle;
            other.handle = nullptr;
        }
        return *this;
    }

    SemaphoreHandle_t get() const { return handle; }

    /** @return false se a criação do mutex falhou. */
    explicit operator bool() const { return handle != nullptr; }

private:
    SemaphoreHandle_t handle;
};

/**
 * @brief Tenta obter o mutex por um tempo limitado e o libera ao sair de escopo.
 *
 * @code
 * FreeRTOSLock lock(mutex, pdMS_TO_TICKS(200));
 * if (!lock) { return false; } // timeout
 * @endcode
 */
class FreeRTOSLock {
public:
    FreeRTOSLock(const FreeRTOSMutex& mutex, TickType_t timeout)
        : handle(mutex.get()),
          locked(handle != nullptr && xSemaphoreTake(handle, timeout) == pdTRUE) {}

    ~FreeRTOSLock() {
        if (locked) {
            xSemaphoreGive(handle);
        }
    }

    FreeRTOSLock(const FreeRTOSLock&) = delete;
    FreeRTOSLock& operator=(const FreeRTOSLock&) = delete;

    explicit operator bool() const { return locked; }

private:
    SemaphoreHandle_t handle;
    bool locked;
};

} // namespace GrowClimate

#endif // FREERTOS_MUTEX_HPP
