/**
 * @file attempt_poller.cpp
 * @brief Poll / claim / dispatch loop
 * @date 2025
 */

#include "overseer/core/attempt_poller.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <thread>

namespace overseer {
namespace core {

namespace fs = std::filesystem;

AttemptPoller::AttemptPoller(PollerSettings settings,
                             std::shared_ptr<api::ControlPlaneClient> client,
                             AttemptHandler handler)
    : settings_(std::move(settings))
    , client_(std::move(client))
    , handler_(std::move(handler)) {
    settings_.max_concurrency = std::max<std::size_t>(settings_.max_concurrency, 1);
}

AttemptPoller::~AttemptPoller() {
    Stop();
    CancelAll();
    // Remaining futures block in their destructors until the attempts finish
}

// ============================================================================
// MAIN LOOP
// ============================================================================

void AttemptPoller::Run() {
    spdlog::info("Polling for pending tasks every {} ms (max concurrency {}{})",
                 settings_.poll_interval.count(), settings_.max_concurrency,
                 settings_.environment_id ? ", environment " + *settings_.environment_id : std::string());
    
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                break;
            }
        }
        
        try {
            std::size_t dispatched = PollOnce();
            if (dispatched > 0) {
                spdlog::debug("Dispatched {} attempt(s), {} in flight", dispatched, InFlight());
            }
        } catch (const api::ControlPlaneError& e) {
            spdlog::warn("Poll cycle failed: {}", e.what());
        }
        
        // Between polls keep reaping and honoring cancellation markers
        auto next_poll = std::chrono::steady_clock::now() + settings_.poll_interval;
        bool stop = false;
        while (!stop) {
            auto now = std::chrono::steady_clock::now();
            if (now >= next_poll) {
                break;
            }
            auto slice = std::min(settings_.observation_interval,
                                  std::chrono::duration_cast<std::chrono::milliseconds>(next_poll - now));
            {
                std::unique_lock<std::mutex> lock(mutex_);
                stop = stop_cv_.wait_for(lock, slice, [this] { return stopping_; });
            }
            if (!stop) {
                Reap();
                ApplyCancelMarkers();
            }
        }
        if (stop) {
            break;
        }
    }
    
    spdlog::info("Attempt poller stopped ({} attempt(s) still in flight)", InFlight());
}

void AttemptPoller::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    stop_cv_.notify_all();
}

std::size_t AttemptPoller::PollOnce() {
    Reap();
    ApplyCancelMarkers();
    
    std::size_t capacity = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t busy = in_flight_.size() + reserved_.size();
        if (busy >= settings_.max_concurrency) {
            spdlog::debug("At capacity ({} in flight), not polling", busy);
            return 0;
        }
        capacity = settings_.max_concurrency - busy;
    }
    
    auto tasks = client_->ListPendingTasks(settings_.environment_id);
    if (tasks.empty()) {
        spdlog::debug("No pending tasks");
        return 0;
    }
    
    std::size_t dispatched = 0;
    for (const auto& task : tasks) {
        if (dispatched >= capacity) {
            break;
        }
        try {
            if (ClaimAndDispatch(task)) {
                ++dispatched;
            }
        } catch (const api::ControlPlaneError& e) {
            spdlog::warn("Claiming task {} failed: {}", task.id, e.what());
        }
    }
    return dispatched;
}

// ============================================================================
// CLAIMING
// ============================================================================

bool AttemptPoller::ReserveTask(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_flight_.count(task_id) > 0 || reserved_.count(task_id) > 0) {
        return false;
    }
    reserved_.insert(task_id);
    return true;
}

void AttemptPoller::ReleaseReservation(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    reserved_.erase(task_id);
}

bool AttemptPoller::ClaimAndDispatch(const TaskSummary& summary) {
    if (!ReserveTask(summary.id)) {
        spdlog::debug("Task {} already has an attempt in flight, not claiming", summary.id);
        return false;
    }
    
    try {
        TaskRecord task(summary.id);
        
        if (!client_->ClaimTask(summary.id)) {
            ReleaseReservation(summary.id);
            return false;
        }
        task.Transition(TaskStatus::CLAIMED);
        
        auto attempt_id = client_->CreateAttempt(summary.id, summary.environment_id);
        if (!attempt_id) {
            ReleaseReservation(summary.id);
            return false;
        }
        task.Transition(TaskStatus::RUNNING);
        
        AttemptContext context;
        context.attempt_id = *attempt_id;
        std::optional<std::string> claim_error;
        try {
            context.task = client_->GetTask(summary.id);
        } catch (const api::ControlPlaneError& e) {
            // The attempt exists remotely; it still has to reach a terminal state
            claim_error = e.what();
            context.task.id = summary.id;
            context.task.title = summary.title;
            context.task.environment_id = summary.environment_id;
        }
        
        auto handle = std::make_shared<AttemptHandle>(std::move(context), task);
        handle->claim_error = claim_error;
        
        spdlog::info("Claimed task {} ({}), attempt {}", summary.id, summary.title, *attempt_id);
        
        std::lock_guard<std::mutex> lock(mutex_);
        reserved_.erase(summary.id);
        InFlightEntry entry;
        entry.handle = handle;
        entry.done = std::async(std::launch::async, [handler = handler_, handle] {
            handler(handle);
        });
        in_flight_.emplace(summary.id, std::move(entry));
        return true;
    } catch (const std::exception&) {
        ReleaseReservation(summary.id);
        throw;
    }
}

// ============================================================================
// CANCELLATION AND REAPING
// ============================================================================

bool AttemptPoller::Cancel(const std::string& attempt_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [task_id, entry] : in_flight_) {
        if (entry.handle->context.attempt_id == attempt_id) {
            entry.handle->cancel.store(true);
            spdlog::info("Cancellation requested for attempt {} (task {})", attempt_id, task_id);
            return true;
        }
    }
    return false;
}

void AttemptPoller::CancelAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [task_id, entry] : in_flight_) {
        entry.handle->cancel.store(true);
    }
}

std::size_t AttemptPoller::ApplyCancelMarkers() {
    if (settings_.cancel_dir.empty()) {
        return 0;
    }
    
    std::error_code ec;
    if (!fs::is_directory(settings_.cancel_dir, ec)) {
        return 0;
    }
    
    std::size_t applied = 0;
    for (fs::directory_iterator it(settings_.cancel_dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        std::string attempt_id = it->path().filename().string();
        if (Cancel(attempt_id)) {
            ++applied;
            std::error_code remove_ec;
            fs::remove(it->path(), remove_ec);
            if (remove_ec) {
                spdlog::warn("Could not remove cancel marker {}: {}", it->path().string(), remove_ec.message());
            }
        }
    }
    return applied;
}

std::size_t AttemptPoller::Reap() {
    std::vector<InFlightEntry> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = in_flight_.begin(); it != in_flight_.end();) {
            if (it->second.done.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                finished.push_back(std::move(it->second));
                it = in_flight_.erase(it);
            } else {
                ++it;
            }
        }
    }
    
    for (auto& entry : finished) {
        try {
            entry.done.get();
        } catch (const std::exception& e) {
            spdlog::error("Attempt {} handler failed: {}", entry.handle->context.attempt_id, e.what());
        }
        spdlog::debug("Reaped attempt {} for task {}", entry.handle->context.attempt_id,
                      entry.handle->context.task.id);
    }
    return finished.size();
}

bool AttemptPoller::Drain(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        Reap();
        if (InFlight() == 0) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

std::size_t AttemptPoller::InFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}

bool AttemptPoller::IsTaskInFlight(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.count(task_id) > 0;
}

std::vector<std::string> AttemptPoller::InFlightAttempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& [task_id, entry] : in_flight_) {
        ids.push_back(entry.handle->context.attempt_id);
    }
    return ids;
}

} // namespace core
} // namespace overseer
