#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <toml++/toml.h>
#include <plog/Log.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace
{

long long file_mtime_ms(const fs::path& p)
{
    std::error_code ec;
    auto tp = fs::last_write_time(p, ec);
    if (ec)
        return 0;
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::vector<std::string> split_path(const std::string& path)
{
    std::vector<std::string> segments;
    std::istringstream ss(path);
    std::string segment;
    while (std::getline(ss, segment, '.'))
        segments.push_back(segment);
    return segments;
}

// Read-only lookup; nullptr when any segment is missing or not a table
const toml::table* find_table(const toml::table& root, const std::string& path)
{
    const toml::table* current = &root;
    for (const auto& segment : split_path(path))
    {
        if (segment.empty())
            return nullptr;
        current = (*current)[segment].as_table();
        if (!current)
            return nullptr;
    }
    return current;
}

// Creates missing segments; nullptr when a segment holds a non-table value
toml::table* ensure_table(toml::table& root, const std::string& path)
{
    toml::table* current = &root;
    for (const auto& segment : split_path(path))
    {
        if (segment.empty())
        {
            PLOG_WARNING << "Invalid path segment (empty) in path: " << path;
            return nullptr;
        }
        auto [it, inserted] = current->insert(segment, toml::table{});
        current = it->second.as_table();
        if (!current)
        {
            PLOG_WARNING << "Path segment '" << segment << "' exists but is not a table";
            return nullptr;
        }
    }
    return current;
}

} // namespace

ConfigManager::ConfigManager(std::string path)
    : config_path_(std::move(path))
{
    last_mtime_ = file_mtime_ms(config_path_);
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    for (const auto& handler : handlers_)
    {
        if (handler.path != path)
            continue;
        for (const auto& key : ownedKeys)
        {
            if (std::find(handler.ownedKeys.begin(), handler.ownedKeys.end(), key) != handler.ownedKeys.end())
            {
                last_error_ = "Duplicate ownership: key '" + key + "' at path '" + path + "' already registered";
                PLOG_ERROR << last_error_;
                return false;
            }
        }
    }

    handlers_.push_back({ path, std::move(cb), std::move(ownedKeys) });
    return true;
}

void ConfigManager::dispatchLoad()
{
    static const toml::table empty;
    for (const auto& handler : handlers_)
    {
        const toml::table* section = find_table(*root_, handler.path);
        if (handler.callbacks.load)
            handler.callbacks.load(section ? *section : empty);
    }
}

bool ConfigManager::load()
{
    last_error_.clear();

    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_INFO << "No config at " << config_path_ << ", using defaults";
        root_ = std::make_unique<toml::table>();
        dispatchLoad();
        return true;
    }

    try
    {
        root_ = std::make_unique<toml::table>(toml::parse(ifs, config_path_));
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        PLOG_WARNING << last_error_;

        std::string details(pe.description());
        if (pe.source().begin.line > 0)
            details = "Error at line " + std::to_string(pe.source().begin.line) + ": " + details;

        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using defaults.",
                                            details + "\nFile: " + config_path_);

        root_ = std::make_unique<toml::table>();
        dispatchLoad();
        return false;
    }

    dispatchLoad();
    last_mtime_ = file_mtime_ms(config_path_);
    return true;
}

bool ConfigManager::reloadIfChanged()
{
    const auto mtime = file_mtime_ms(config_path_);
    if (mtime == 0 || mtime == last_mtime_)
        return false;

    if (!load())
    {
        // Don't retry the same broken file on every poll
        last_mtime_ = mtime;
        return false;
    }

    PLOG_INFO << "Config reloaded from " << config_path_;
    return true;
}

bool ConfigManager::save()
{
    last_error_.clear();

    if (!root_)
        root_ = std::make_unique<toml::table>();

    toml::table output = *root_;
    for (const auto& handler : handlers_)
    {
        if (!handler.callbacks.save)
            continue;

        toml::table produced = handler.callbacks.save();
        toml::table* target = ensure_table(output, handler.path);
        if (!target)
        {
            last_error_ = "Cannot write table '" + handler.path + "'";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              last_error_);
            return false;
        }

        for (const auto& [key, value] : produced)
        {
            if (std::find(handler.ownedKeys.begin(), handler.ownedKeys.end(), key.str()) == handler.ownedKeys.end())
                PLOG_WARNING << "Handler at path '" << handler.path << "' returned unexpected key '" << key.str()
                             << "' (not in ownedKeys); stripping it";
        }

        for (const auto& key : handler.ownedKeys)
        {
            if (produced.contains(key))
                target->insert_or_assign(key, produced[key]);
            else
                target->erase(key);
        }
    }

    const std::string tmp = config_path_ + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
        {
            last_error_ = "Failed to open temp file for writing";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              "Could not create temporary file for writing: " + tmp);
            return false;
        }
        ofs << output << '\n';
    }

    std::error_code ec;
    fs::rename(tmp, config_path_, ec);
    if (ec)
    {
        last_error_ = std::string("Failed to rename: ") + ec.message();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                          "Could not rename temporary file: " + ec.message());
        return false;
    }

    last_mtime_ = file_mtime_ms(config_path_);
    *root_ = std::move(output);
    PLOG_INFO << "Saved config to " << config_path_;
    return true;
}

const toml::table& ConfigManager::root() const
{
    static const toml::table empty;
    return root_ ? *root_ : empty;
}
