#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace ldaproute::util {

// Runs a callback every `interval` on a dedicated thread until stopped.
// A callback that throws is logged and rescheduled. The callback may stop or
// even destroy its owner; the worker thread then winds down on its own.
class PeriodicTask {
public:
    PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> task);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    // Idempotent. Waits for an in-flight run to finish unless called from the task itself.
    void stop();

    [[nodiscard]] bool running() const noexcept { return !state_->stopped.load(); }
    [[nodiscard]] std::chrono::milliseconds interval() const noexcept { return state_->interval; }
    [[nodiscard]] const std::string& name() const noexcept { return state_->name; }

private:
    // Shared with the worker thread, which keeps it alive until run() returns.
    struct State {
        State(std::string name, std::chrono::milliseconds interval, std::function<void()> task);

        std::string name;
        std::chrono::milliseconds interval;
        std::function<void()> task;
        boost::asio::io_context io;
        boost::asio::steady_timer timer;
        std::atomic<bool> stopped{false};
    };

    static void arm(State& state);
    static void runOnce(State& state);

    std::shared_ptr<State> state_;
    std::mutex stopMutex_;
    std::thread thread_;
};

} // namespace ldaproute::util
