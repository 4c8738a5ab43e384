/**
 * @file AsyncTaskManager.hpp
 * @brief Centralized management for background tasks.
 */

#pragma once

#include <string>
#include <vector>
#include <functional>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <memory>
#include <algorithm>
#include <chrono>

namespace symbolgate::application {

/**
 * @enum TaskType
 * @brief Categories of background work.
 */
enum class TaskType {
    SymbolValidation
};

/**
 * @struct TaskStatus
 * @brief Information about a running or completed task.
 */
struct TaskStatus {
    int id;
    TaskType type;
    std::string description;
    std::atomic<float> progress{0.0f};
    std::atomic<bool> isCompleted{false};
    std::atomic<bool> failed{false};
    std::string errorMessage;
};

/**
 * @class AsyncTaskManager
 * @brief Manages background execution and provides unified status tracking.
 */
class AsyncTaskManager {
public:
    AsyncTaskManager() = default;
    ~AsyncTaskManager() {
        WaitIdle();
    }

    AsyncTaskManager(const AsyncTaskManager&) = delete;
    AsyncTaskManager& operator=(const AsyncTaskManager&) = delete;

    /**
     * @brief Submits a new task to be executed in the background.
     * @throws std::system_error if no thread can be started; the task is not tracked then.
     */
    template<typename F, typename... Args>
    std::shared_ptr<TaskStatus> SubmitTask(TaskType type, const std::string& description, F&& f, Args&&... args) {
        auto status = std::make_shared<TaskStatus>();
        status->id = m_nextId++;
        status->type = type;
        status->description = description;

        {
            std::lock_guard<std::mutex> lock(m_tasksMutex);
            m_activeTasks.push_back(status);
        }

        try {
            std::thread([this, status](auto userFunc, auto... userArgs) {
                try {
                    // Call the user function with status as first arg, followed by other args
                    userFunc(status, std::move(userArgs)...);
                    status->progress = 1.0f;
                } catch (const std::exception& e) {
                    status->failed = true;
                    status->errorMessage = e.what();
                }
                status->isCompleted = true;
                CleanupCompletedTasks();
            }, std::forward<F>(f), std::forward<Args>(args)...).detach();
        } catch (const std::exception&) {
            // Thread never started (std::system_error) or the arguments failed to copy
            Forget(status);
            throw;
        }

        return status;
    }

    /** @brief Blocks until every submitted task has finished. */
    void WaitIdle() {
        std::unique_lock<std::mutex> lock(m_tasksMutex);
        m_idle.wait(lock, [this] { return m_activeTasks.empty(); });
    }

    /**
     * @brief Waits up to `timeout` for the manager to become idle.
     * @return True if no task is running anymore.
     */
    bool WaitIdleFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(m_tasksMutex);
        return m_idle.wait_for(lock, timeout, [this] { return m_activeTasks.empty(); });
    }

private:
    void Forget(const std::shared_ptr<TaskStatus>& status) {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.erase(std::remove(m_activeTasks.begin(), m_activeTasks.end(), status), m_activeTasks.end());
        if (m_activeTasks.empty()) {
            m_idle.notify_all();
        }
    }

    void CleanupCompletedTasks() {
        std::lock_guard<std::mutex> lock(m_tasksMutex);
        m_activeTasks.erase(
            std::remove_if(m_activeTasks.begin(), m_activeTasks.end(), 
                [](const auto& s) { return s->isCompleted.load(); }),
            m_activeTasks.end()
        );
        if (m_activeTasks.empty()) {
            m_idle.notify_all();
        }
    }

    std::atomic<int> m_nextId{0};
    std::vector<std::shared_ptr<TaskStatus>> m_activeTasks;
    std::mutex m_tasksMutex;
    std::condition_variable m_idle;
};

} // namespace symbolgate::application
