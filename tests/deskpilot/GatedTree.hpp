#pragma once

#include "deskpilot/tree/MemoryUiTree.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

// Forwards to a MemoryUiTree; can park callers in AcquireRoot and make Release throw
namespace testwin
{

struct ForeignFault
{
    int code = 0;
};

class GatedTree final : public deskpilot::IUiTree
{
public:
    explicit GatedTree(deskpilot::MemoryUiTree& inner)
        : inner_(inner)
    {
    }

    // Callers of AcquireRoot block until Open()
    void Close()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }

    void Open()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = false;
        }
        cv_.notify_all();
    }

    // True once a caller is parked at the gate
    bool WaitForParked(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return parked_ > 0; });
    }

    // Release throws a type unrelated to std::exception
    void ThrowForeignOnRelease(bool on) { throw_foreign_ = on; }

    deskpilot::NodeRef AcquireRoot() override
    {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            ++parked_;
            cv_.notify_all();
            cv_.wait(lock, [this] { return !closed_; });
            --parked_;
        }
        return inner_.AcquireRoot();
    }

    std::vector<deskpilot::NodeRef> FindByViewId(deskpilot::NodeRef scope, const std::string& view_id) override
    {
        return inner_.FindByViewId(scope, view_id);
    }

    std::vector<deskpilot::NodeRef> FindByText(deskpilot::NodeRef scope, const std::string& text) override
    {
        return inner_.FindByText(scope, text);
    }

    deskpilot::NodeRef GetParent(deskpilot::NodeRef node) override { return inner_.GetParent(node); }
    int ChildCount(deskpilot::NodeRef node) override { return inner_.ChildCount(node); }
    deskpilot::NodeRef GetChild(deskpilot::NodeRef node, int index) override { return inner_.GetChild(node, index); }
    deskpilot::NodeInfo Describe(deskpilot::NodeRef node) override { return inner_.Describe(node); }

    bool PerformAction(deskpilot::NodeRef node, deskpilot::NodeAction action) override
    {
        return inner_.PerformAction(node, action);
    }

    void Release(deskpilot::NodeRef node) override
    {
        if (throw_foreign_)
            throw ForeignFault{ 7 };
        inner_.Release(node);
    }

private:
    deskpilot::MemoryUiTree& inner_;

    std::mutex mutex_;
    std::condition_variable cv_;
    bool closed_ = false;
    int parked_ = 0;
    bool throw_foreign_ = false;
};

} // namespace testwin
