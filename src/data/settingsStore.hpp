// src/data/settingsStore.hpp
#ifndef SETTINGS_STORE_HPP
#define SETTINGS_STORE_HPP

#include <map>
#include <string>

namespace GrowClimate {

typedef std::map<std::string, std::string> SettingsMap;

/**
 * @brief Durable key/value store holding every runtime setting as a string.
 *
 * snapshot() and put() are each atomic with respect to one another, so a
 * reader never observes half of a batch written concurrently.
 */
class SettingsStore {
public:
    virtual ~SettingsStore() {}

    /**
     * @brief Copies every stored key into out (existing entries are replaced).
     * @return false if the store could not be read.
     */
    virtual bool snapshot(SettingsMap& out) const = 0;

    /**
     * @brief Writes all given keys as one batch.
     * @return false if any key could not be persisted.
     */
    virtual bool put(const SettingsMap& values) = 0;
};

} // namespace GrowClimate

#endif // SETTINGS_STORE_HPP
