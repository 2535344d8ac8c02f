#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace deskpilot
{
class Engine;
class IUiTree;
class IClock;
struct Config;
} // namespace deskpilot

// Hosts the automation engine: log/error bridges, notifications, config reloads
class AutomationService
{
public:
    explicit AutomationService(deskpilot::IUiTree& tree, deskpilot::IClock* clock = nullptr);
    ~AutomationService();

    bool initialize(const deskpilot::Config& cfg);

    // Apply a changed configuration; an active session is reconnected
    bool reinitialize(const deskpilot::Config& cfg);

    // Stop the engine session (used during shutdown)
    void shutdown();

    deskpilot::Engine& engine();

    // Messages handed to the user ("Connection accepted", ...)
    std::vector<std::string> notifications() const;

    // Last error emitted by the engine (empty if none)
    std::string getLastErrorMessage() const;

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
};
