#pragma once

#include <string>
#include <functional>
#include <memory>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
    std::function<toml::table()> save;
};

/**
 * @brief Owner of config.toml
 *
 * Subsystems register the table they own (dotted path) together with the keys
 * they write. load() hands each handler its section, or an empty table when
 * the section or the file is missing so handlers fall back to defaults.
 * save() merges the handlers' output into the parsed document, leaving keys
 * nobody owns untouched, and replaces the file atomically.
 */
class ConfigManager
{
public:
    explicit ConfigManager(std::string path = "config.toml");
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);
    bool load();
    bool reloadIfChanged();
    bool save();
    const toml::table& root() const;

    const std::string& path() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    void dispatchLoad();

    std::string config_path_;
    std::string last_error_;
    long long last_mtime_ = 0;

    struct HandlerEntry
    {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};
