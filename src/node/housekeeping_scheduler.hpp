#ifndef LSNP_NODE_HOUSEKEEPING_SCHEDULER_HPP
#define LSNP_NODE_HOUSEKEEPING_SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "util/logger.hpp"

namespace lsnp {
namespace node {

/*
  HousekeepingScheduler
  --------------------------------
  Background timer thread running a fixed list of periodic tasks (presence announce,
  stale peer sweep, expired post pruning). The first round runs immediately on start,
  then once per interval until StopScheduling(). A task that throws is logged and the
  round continues with the next task.
*/
class HousekeepingScheduler {
  public:
    using Task = std::function<void()>;

    HousekeepingScheduler() : m_isRunning(false), m_interval(std::chrono::seconds(30)) {}

    ~HousekeepingScheduler() { StopScheduling(); }

    // Throws std::runtime_error for a non-positive interval
    void ConfigureInterval(std::chrono::milliseconds interval) {
        if (interval.count() <= 0) {
            throw std::runtime_error("HousekeepingScheduler: interval must be positive");
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_interval = interval;
    }

    // Tasks run in registration order
    void AddTask(const std::string& name, Task task) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_tasks.emplace_back(name, std::move(task));
    }

    bool StartScheduling() {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (m_isRunning) {
            lsnp::util::logger::Logger::getInstance().warn(
                "[HousekeepingScheduler] StartScheduling called but scheduler is already running.");
            return true;
        }

        m_isRunning = true;
        m_schedulerThread = std::thread(&HousekeepingScheduler::schedulerLoop, this);

        lsnp::util::logger::Logger::getInstance().info(
            "[HousekeepingScheduler] Scheduling thread started, interval " +
            std::to_string(m_interval.count()) + " ms.");
        return true;
    }

    bool StopScheduling() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_isRunning) {
                return true;
            }
            m_isRunning = false;
            m_cv.notify_all();
        }

        if (m_schedulerThread.joinable()) {
            m_schedulerThread.join();
        }

        lsnp::util::logger::Logger::getInstance().info(
            "[HousekeepingScheduler] Scheduling thread stopped.");
        return true;
    }

    bool IsRunning() const { return m_isRunning; }

    // Runs every task once on the calling thread
    void RunOnce() {
        std::vector<std::pair<std::string, Task>> tasks;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            tasks = m_tasks;
        }
        for (auto& entry : tasks) {
            try {
                entry.second();
            } catch (const std::exception& ex) {
                lsnp::util::logger::Logger::getInstance().error(
                    "[HousekeepingScheduler] Task '" + entry.first + "' failed: " + ex.what());
            }
        }
    }

  private:
    void schedulerLoop() {
        while (true) {
            RunOnce();

            std::unique_lock<std::mutex> lock(m_mutex);
            auto nextWake = std::chrono::steady_clock::now() + m_interval;
            m_cv.wait_until(lock, nextWake, [this] { return !m_isRunning; });
            if (!m_isRunning) {
                break;
            }
        }
    }

    std::atomic<bool> m_isRunning;
    std::chrono::milliseconds m_interval;
    std::vector<std::pair<std::string, Task>> m_tasks;
    std::thread m_schedulerThread;
    std::mutex m_mutex;
    std::condition_variable m_cv;
};

} // namespace node
} // namespace lsnp

#endif // LSNP_NODE_HOUSEKEEPING_SCHEDULER_HPP
