#pragma once

#include "deskpilot/api/deskpilot.hpp"

#include <toml++/toml.h>

class ConfigManager;

/**
 * @brief The [automation] table of config.toml
 *
 * Keys map one-to-one onto deskpilot::Config. Missing or out-of-range values
 * keep their defaults; every rejected value is reported once per load.
 */
class AutomationSettings
{
public:
    static constexpr const char* kTablePath = "automation";

    void registerConfigHandler(ConfigManager& config);

    const deskpilot::Config& engineConfig() const { return cfg_; }
    void setEngineConfig(const deskpilot::Config& cfg) { cfg_ = cfg; }

    /// Incremented on every load so callers can tell a reload happened.
    unsigned generation() const { return generation_; }

    static void deserialize(const toml::table& section, deskpilot::Config& cfg);
    static toml::table serialize(const deskpilot::Config& cfg);

private:
    deskpilot::Config cfg_{};
    unsigned generation_ = 0;
};
