// src/data/settingsManager.cpp
#include "settingsManager.hpp"
#include "utils/logger.hpp"
#include <cmath>
#include <stdio.h>   // Para snprintf
#include <stdlib.h>  // Para strtof
#include <string.h>  // Para strcmp
#include <strings.h> // Para strcasecmp

namespace GrowClimate
{

  namespace SettingsKeys
  {
    const char *const MODE = "mode";
    const char *const LIGHT_MODE = "light_mode";
    const char *const TARGET_TEMP = "target_temp";
    const char *const TEMP_TOLERANCE = "temp_tolerance";
    const char *const TARGET_HUMIDITY = "target_humidity";
    const char *const HUMIDITY_TOLERANCE = "humidity_tolerance";
    const char *const USE_ML = "use_ml";
    const char *const LIGHT_ENABLED = "light_enabled";
    const char *const LIGHT_ON_TIME = "light_on_time";
    const char *const LIGHT_OFF_TIME = "light_off_time";
    const char *const TEMP_SCHEDULE = "temp_schedule";
  } // namespace SettingsKeys

  // --- Construtor ---
  SettingsManager::SettingsManager(SettingsStore &settingsStore) : store(settingsStore)
  {
  }

  // --- initializeDefaults ---
  bool SettingsManager::initializeDefaults()
  {
    SettingsMap current;
    if (!_snapshot(current))
    {
      return false;
    }

    SettingsMap defaults;
    defaults[SettingsKeys::MODE] = "manual";
    defaults[SettingsKeys::LIGHT_MODE] = "schedule";
    defaults[SettingsKeys::TARGET_TEMP] = "22.0";
    defaults[SettingsKeys::TEMP_TOLERANCE] = "0.5";
    defaults[SettingsKeys::TARGET_HUMIDITY] = "60.0";
    defaults[SettingsKeys::HUMIDITY_TOLERANCE] = "5.0";
    defaults[SettingsKeys::USE_ML] = "true";
    defaults[SettingsKeys::LIGHT_ENABLED] = "false";
    defaults[SettingsKeys::LIGHT_ON_TIME] = "06:00";
    defaults[SettingsKeys::LIGHT_OFF_TIME] = "22:00";

    SettingsMap missing;
    for (SettingsMap::const_iterator it = defaults.begin(); it != defaults.end(); ++it)
    {
      if (current.find(it->first) == current.end())
      {
        missing[it->first] = it->second;
      }
    }
    if (missing.empty())
    {
      return true;
    }

    Logger::info("SettingsManager: Writing %u default setting(s).", (unsigned)missing.size());
    if (!store.put(missing))
    {
      Logger::error("SettingsManager: Failed to persist default settings.");
      return false;
    }
    return true;
  }

  // --- Leituras ---
  ClimateSettings SettingsManager::loadClimateSettings(const ClimateSettings &fallback) const
  {
    ClimateSettings loaded = fallback;
    SettingsMap values;
    if (!_snapshot(values))
    {
      Logger::warn("SettingsManager: Store unreadable, keeping last known climate settings.");
      return loaded;
    }

    float value = 0.0f;
    if (_parseFloat(values, SettingsKeys::TARGET_TEMP, value))
    {
      loaded.targetTemperature = value;
    }
    if (_parseFloat(values, SettingsKeys::TEMP_TOLERANCE, value))
    {
      if (value >= 0.0f)
      {
        loaded.temperatureTolerance = value;
      }
      else
      {
        Logger::warn("SettingsManager: Ignoring negative %s (%.2f).", SettingsKeys::TEMP_TOLERANCE, value);
      }
    }
    if (_parseFloat(values, SettingsKeys::TARGET_HUMIDITY, value))
    {
      if (value >= 0.0f && value <= 100.0f)
      {
        loaded.targetHumidity = value;
      }
      else
      {
        Logger::warn("SettingsManager: Ignoring out of range %s (%.2f).", SettingsKeys::TARGET_HUMIDITY, value);
      }
    }
    if (_parseFloat(values, SettingsKeys::HUMIDITY_TOLERANCE, value))
    {
      if (value >= 0.0f)
      {
        loaded.humidityTolerance = value;
      }
      else
      {
        Logger::warn("SettingsManager: Ignoring negative %s (%.2f).", SettingsKeys::HUMIDITY_TOLERANCE, value);
      }
    }
    bool flag = false;
    if (_parseBool(values, SettingsKeys::USE_ML, flag))
    {
      loaded.predictiveControlEnabled = flag;
    }
    return loaded;
  }

  LightSchedule SettingsManager::loadLightSchedule(const LightSchedule &fallback) const
  {
    LightSchedule loaded = fallback;
    SettingsMap values;
    if (!_snapshot(values))
    {
      Logger::warn("SettingsManager: Store unreadable, keeping last known light schedule.");
      return loaded;
    }

    bool enabled = false;
    if (_parseBool(values, SettingsKeys::LIGHT_ENABLED, enabled))
    {
      loaded.enabled = enabled;
    }
    ClockTime time;
    if (_parseTime(values, SettingsKeys::LIGHT_ON_TIME, time))
    {
      loaded.onTime = time;
    }
    if (_parseTime(values, SettingsKeys::LIGHT_OFF_TIME, time))
    {
      loaded.offTime = time;
    }
    return loaded;
  }

  TemperatureSchedule SettingsManager::loadTemperatureSchedule(const TemperatureSchedule &fallback) const
  {
    SettingsMap values;
    if (!_snapshot(values))
    {
      return fallback;
    }
    SettingsMap::const_iterator it = values.find(SettingsKeys::TEMP_SCHEDULE);
    if (it == values.end() || it->second.empty())
    {
      return TemperatureSchedule(); // Sem agenda: desabilitada
    }

    JsonDocument doc;
    DeserializationError error = deserializeJson(doc, it->second.c_str());
    if (error)
    {
      Logger::warn("SettingsManager: Stored %s is not valid JSON (%s).", SettingsKeys::TEMP_SCHEDULE, error.c_str());
      return fallback;
    }
    TemperatureSchedule parsed;
    if (!parseTemperatureSchedule(doc.as<JsonVariantConst>(), parsed))
    {
      Logger::warn("SettingsManager: Stored %s is invalid, keeping last known schedule.", SettingsKeys::TEMP_SCHEDULE);
      return fallback;
    }
    return parsed;
  }

  bool SettingsManager::isClimateAuto() const
  {
    SettingsMap values;
    if (!_snapshot(values))
    {
      return false;
    }
    SettingsMap::const_iterator it = values.find(SettingsKeys::MODE);
    return it != values.end() && strcasecmp(it->second.c_str(), "auto") == 0;
  }

  bool SettingsManager::isLightScheduled() const
  {
    SettingsMap values;
    if (!_snapshot(values))
    {
      return false;
    }
    SettingsMap::const_iterator it = values.find(SettingsKeys::LIGHT_MODE);
    return it == values.end() || strcasecmp(it->second.c_str(), "schedule") == 0;
  }

  // --- updateFromJson ---
  bool SettingsManager::updateFromJson(JsonVariantConst json)
  {
    if (!json.is<JsonObjectConst>())
    {
      Logger::warn("SettingsManager: Settings update is not a JSON object.");
      return false;
    }

    SettingsMap accepted;
    float value = 0.0f;
    if (_jsonFloat(json, SettingsKeys::TARGET_TEMP, value))
    {
      accepted[SettingsKeys::TARGET_TEMP] = _formatFloat(value);
    }
    if (_jsonFloat(json, SettingsKeys::TEMP_TOLERANCE, value))
    {
      if (value >= 0.0f)
        accepted[SettingsKeys::TEMP_TOLERANCE] = _formatFloat(value);
      else
        Logger::warn("SettingsManager: Rejected negative %s.", SettingsKeys::TEMP_TOLERANCE);
    }
    if (_jsonFloat(json, SettingsKeys::TARGET_HUMIDITY, value))
    {
      if (value >= 0.0f && value <= 100.0f)
        accepted[SettingsKeys::TARGET_HUMIDITY] = _formatFloat(value);
      else
        Logger::warn("SettingsManager: Rejected out of range %s.", SettingsKeys::TARGET_HUMIDITY);
    }
    if (_jsonFloat(json, SettingsKeys::HUMIDITY_TOLERANCE, value))
    {
      if (value >= 0.0f)
        accepted[SettingsKeys::HUMIDITY_TOLERANCE] = _formatFloat(value);
      else
        Logger::warn("SettingsManager: Rejected negative %s.", SettingsKeys::HUMIDITY_TOLERANCE);
    }

    JsonVariantConst useMl = json[SettingsKeys::USE_ML];
    if (useMl.is<bool>())
    {
      accepted[SettingsKeys::USE_ML] = useMl.as<bool>() ? "true" : "false";
    }
    else if (useMl.is<const char *>())
    {
      const char *text = useMl.as<const char *>();
      if (strcasecmp(text, "true") == 0 || strcasecmp(text, "false") == 0)
        accepted[SettingsKeys::USE_ML] = strcasecmp(text, "true") == 0 ? "true" : "false";
      else
        Logger::warn("SettingsManager: Rejected %s value '%s'.", SettingsKeys::USE_ML, text);
    }

    if (accepted.empty())
    {
      Logger::warn("SettingsManager: Update did not contain valid setting keys/values.");
      return false;
    }
    if (!store.put(accepted))
    {
      Logger::error("SettingsManager: Failed to persist %u setting(s).", (unsigned)accepted.size());
      return false;
    }
    Logger::info("SettingsManager: %u setting(s) updated.", (unsigned)accepted.size());
    return true;
  }

  bool SettingsManager::updateLightScheduleFromJson(JsonVariantConst json)
  {
    if (!json.is<JsonObjectConst>())
    {
      Logger::warn("SettingsManager: Light schedule update is not a JSON object.");
      return false;
    }

    LightSchedule schedule = loadLightSchedule(LightSchedule());
    JsonVariantConst enabled = json["enabled"];
    if (!enabled.isNull())
    {
      if (!enabled.is<bool>())
      {
        Logger::warn("SettingsManager: Light schedule 'enabled' must be a boolean.");
        return false;
      }
      schedule.enabled = enabled.as<bool>();
    }

    const char *timeKeys[2] = {"on_time", "off_time"};
    ClockTime *targets[2] = {&schedule.onTime, &schedule.offTime};
    for (int i = 0; i < 2; ++i)
    {
      JsonVariantConst value = json[timeKeys[i]];
      if (value.isNull())
      {
        continue;
      }
      if (!value.is<const char *>() || !ClockTime::parse(value.as<const char *>(), *targets[i]))
      {
        Logger::warn("SettingsManager: Failed to parse '%s'. Expected HH:MM.", timeKeys[i]);
        return false;
      }
    }
    return setLightSchedule(schedule);
  }

  bool SettingsManager::updateTemperatureScheduleFromJson(JsonVariantConst json)
  {
    TemperatureSchedule schedule;
    if (!parseTemperatureSchedule(json, schedule))
    {
      Logger::warn("SettingsManager: Rejected temperature schedule (need 1 to %u periods with time and temperature).",
                   (unsigned)TemperatureSchedule::MAX_PERIODS);
      return false;
    }
    return setTemperatureSchedule(schedule);
  }

  // --- Escritas ---
  bool SettingsManager::setLightSchedule(const LightSchedule &schedule)
  {
    char onBuf[6];
    char offBuf[6];
    schedule.onTime.format(onBuf, sizeof(onBuf));
    schedule.offTime.format(offBuf, sizeof(offBuf));

    SettingsMap batch;
    batch[SettingsKeys::LIGHT_ENABLED] = schedule.enabled ? "true" : "false";
    batch[SettingsKeys::LIGHT_ON_TIME] = onBuf;
    batch[SettingsKeys::LIGHT_OFF_TIME] = offBuf;
    if (!store.put(batch))
    {
      Logger::error("SettingsManager: Failed to persist light schedule.");
      return false;
    }
    Logger::info("SettingsManager: Light schedule set to %s-%s (%s).", onBuf, offBuf, schedule.enabled ? "enabled" : "disabled");
    return true;
  }

  bool SettingsManager::setTemperatureSchedule(const TemperatureSchedule &schedule)
  {
    JsonDocument doc;
    doc["enabled"] = schedule.enabled;
    JsonArray periods = doc["periods"].to<JsonArray>();
    for (uint8_t i = 0; i < schedule.periodCount; ++i)
    {
      char timeBuf[6];
      schedule.periods[i].start.format(timeBuf, sizeof(timeBuf));
      JsonObject period = periods.add<JsonObject>();
      period["time"] = timeBuf;
      period["temperature"] = schedule.periods[i].temperature;
    }

    char buffer[256];
    size_t written = serializeJson(doc, buffer, sizeof(buffer));
    if (written == 0 || written >= sizeof(buffer))
    {
      Logger::error("SettingsManager: Temperature schedule does not fit in %u bytes.", (unsigned)sizeof(buffer));
      return false;
    }

    SettingsMap batch;
    batch[SettingsKeys::TEMP_SCHEDULE] = buffer;
    if (!store.put(batch))
    {
      Logger::error("SettingsManager: Failed to persist temperature schedule.");
      return false;
    }
    Logger::info("SettingsManager: Temperature schedule stored (%u periods, %s).", (unsigned)schedule.periodCount,
                 schedule.enabled ? "enabled" : "disabled");
    return true;
  }

  bool SettingsManager::setClimateMode(bool automatic)
  {
    SettingsMap batch;
    batch[SettingsKeys::MODE] = automatic ? "auto" : "manual";
    return store.put(batch);
  }

  bool SettingsManager::setLightMode(bool scheduled)
  {
    SettingsMap batch;
    batch[SettingsKeys::LIGHT_MODE] = scheduled ? "schedule" : "manual";
    return store.put(batch);
  }

  // --- parseTemperatureSchedule ---
  bool SettingsManager::parseTemperatureSchedule(JsonVariantConst json, TemperatureSchedule &out)
  {
    if (!json.is<JsonObjectConst>())
    {
      return false;
    }
    TemperatureSchedule parsed;
    JsonVariantConst enabled = json["enabled"];
    parsed.enabled = enabled.isNull() ? true : enabled.as<bool>();

    JsonArrayConst periods = json["periods"].as<JsonArrayConst>();
    if (periods.isNull() || periods.size() > TemperatureSchedule::MAX_PERIODS)
    {
      return false;
    }
    for (JsonVariantConst period : periods)
    {
      ClockTime start;
      JsonVariantConst time = period["time"];
      JsonVariantConst temperature = period["temperature"];
      if (!time.is<const char *>() || !ClockTime::parse(time.as<const char *>(), start) || !temperature.is<float>())
      {
        return false;
      }
      parsed.addPeriod(start, temperature.as<float>());
    }
    if (parsed.enabled && parsed.periodCount == 0)
    {
      return false;
    }
    out = parsed;
    return true;
  }

  // --- Helpers ---
  bool SettingsManager::_snapshot(SettingsMap &out) const
  {
    if (!store.snapshot(out))
    {
      Logger::error("SettingsManager: Failed to read settings store.");
      return false;
    }
    return true;
  }

  bool SettingsManager::_parseFloat(const SettingsMap &values, const char *key, float &outValue)
  {
    SettingsMap::const_iterator it = values.find(key);
    if (it == values.end())
    {
      return false; // Chave ausente não é erro
    }
    const char *text = it->second.c_str();
    char *end = nullptr;
    float parsed = strtof(text, &end);
    if (end == text || *end != '\0' || !std::isfinite(parsed))
    {
      Logger::warn("SettingsManager: Value of '%s' is not a number: '%s'.", key, text);
      return false;
    }
    outValue = parsed;
    return true;
  }

  bool SettingsManager::_parseBool(const SettingsMap &values, const char *key, bool &outValue)
  {
    SettingsMap::const_iterator it = values.find(key);
    if (it == values.end())
    {
      return false;
    }
    const char *text = it->second.c_str();
    if (strcasecmp(text, "true") == 0 || strcmp(text, "1") == 0)
    {
      outValue = true;
      return true;
    }
    if (strcasecmp(text, "false") == 0 || strcmp(text, "0") == 0)
    {
      outValue = false;
      return true;
    }
    Logger::warn("SettingsManager: Value of '%s' is not a boolean: '%s'.", key, text);
    return false;
  }

  bool SettingsManager::_parseTime(const SettingsMap &values, const char *key, ClockTime &outValue)
  {
    SettingsMap::const_iterator it = values.find(key);
    if (it == values.end())
    {
      return false;
    }
    if (!ClockTime::parse(it->second.c_str(), outValue))
    {
      Logger::warn("SettingsManager: Failed to parse time for key '%s'. Expected HH:MM, got: %s", key, it->second.c_str());
      return false;
    }
    return true;
  }

  bool SettingsManager::_jsonFloat(JsonVariantConst json, const char *key, float &outValue)
  {
    JsonVariantConst value = json[key];
    if (value.isNull())
    {
      return false;
    }
    if (value.is<float>())
    {
      outValue = value.as<float>();
    }
    else if (value.is<const char *>())
    {
      const char *text = value.as<const char *>();
      char *end = nullptr;
      outValue = strtof(text, &end);
      if (end == text || *end != '\0')
      {
        Logger::warn("SettingsManager: JSON key '%s' is not numeric: '%s'.", key, text);
        return false;
      }
    }
    else
    {
      Logger::warn("SettingsManager: JSON key '%s' exists but is not a number.", key);
      return false;
    }
    if (!std::isfinite(outValue))
    {
      Logger::warn("SettingsManager: JSON key '%s' is not finite.", key);
      return false;
    }
    return true;
  }

  std::string SettingsManager::_formatFloat(float value)
  {
    char buffer[24];
    snprintf(buffer, sizeof(buffer), "%.2f", value);
    return std::string(buffer);
  }

} // namespace GrowClimate
