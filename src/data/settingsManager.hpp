// src/data/settingsManager.hpp
#ifndef SETTINGS_MANAGER_HPP
#define SETTINGS_MANAGER_HPP

#include <ArduinoJson.h> // Para desserialização das atualizações
#include "settingsStore.hpp"
#include "settingsTypes.hpp"
#include "climate/temperatureSchedule.hpp"

namespace GrowClimate
{

  /** Keys of the Settings Store. Values are always strings. */
  namespace SettingsKeys
  {
    extern const char *const MODE;
    extern const char *const LIGHT_MODE;
    extern const char *const TARGET_TEMP;
    extern const char *const TEMP_TOLERANCE;
    extern const char *const TARGET_HUMIDITY;
    extern const char *const HUMIDITY_TOLERANCE;
    extern const char *const USE_ML;
    extern const char *const LIGHT_ENABLED;
    extern const char *const LIGHT_ON_TIME;
    extern const char *const LIGHT_OFF_TIME;
    extern const char *const TEMP_SCHEDULE;
  } // namespace SettingsKeys

  /**
   * @brief Typed view over the Settings Store.
   *
   * Every load takes one snapshot of the store and parses the strings it
   * contains. A value that is missing, malformed or out of range leaves the
   * corresponding field of the caller's fallback (its last known good value)
   * untouched, so a bad write can never take a control loop down.
   */
  class SettingsManager
  {
  public:
    explicit SettingsManager(SettingsStore &store);

    SettingsManager(const SettingsManager &) = delete;
    SettingsManager &operator=(const SettingsManager &) = delete;

    /**
     * @brief Writes the default value of every key that is not stored yet.
     * @return false if the store could not be read or written.
     */
    bool initializeDefaults();

    ClimateSettings loadClimateSettings(const ClimateSettings &fallback) const;
    LightSchedule loadLightSchedule(const LightSchedule &fallback) const;
    TemperatureSchedule loadTemperatureSchedule(const TemperatureSchedule &fallback) const;

    /** @brief true when `mode` is "auto" (default manual). */
    bool isClimateAuto() const;

    /** @brief true when `light_mode` is "schedule" (default schedule). */
    bool isLightScheduled() const;

    /**
     * @brief Applies setpoint updates from a JSON object.
     *
     * Recognized keys: target_temp, temp_tolerance, target_humidity,
     * humidity_tolerance (numbers or numeric strings) and use_ml (bool or
     * "true"/"false"). Invalid values are rejected individually; the
     * accepted ones are persisted as a single batch.
     *
     * @return true if at least one value was persisted.
     */
    bool updateFromJson(JsonVariantConst json);

    /**
     * @brief Replaces the light schedule from {"enabled", "on_time", "off_time"}.
     * Missing members keep their stored value.
     */
    bool updateLightScheduleFromJson(JsonVariantConst json);

    /**
     * @brief Replaces the temperature schedule from
     * {"enabled": bool, "periods": [{"time": "HH:MM", "temperature": n}, ...]}.
     */
    bool updateTemperatureScheduleFromJson(JsonVariantConst json);

    /** @brief Persists the schedule; it takes effect only once this succeeds. */
    bool setLightSchedule(const LightSchedule &schedule);
    bool setTemperatureSchedule(const TemperatureSchedule &schedule);

    bool setClimateMode(bool automatic);
    bool setLightMode(bool scheduled);

    /**
     * @brief Parses the JSON form of a temperature schedule.
     * @return false if the text is not a valid schedule (1 to 4 periods when enabled).
     */
    static bool parseTemperatureSchedule(JsonVariantConst json, TemperatureSchedule &out);

  private:
    bool _snapshot(SettingsMap &out) const;
    static bool _parseFloat(const SettingsMap &values, const char *key, float &outValue);
    static bool _parseBool(const SettingsMap &values, const char *key, bool &outValue);
    static bool _parseTime(const SettingsMap &values, const char *key, ClockTime &outValue);
    static bool _jsonFloat(JsonVariantConst json, const char *key, float &outValue);
    static std::string _formatFloat(float value);

    SettingsStore &store;
  };

} // namespace GrowClimate
#endif // SETTINGS_MANAGER_HPP
