#include "ldaproute/util/PeriodicTask.hpp"
#include "ldaproute/util/Logging.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

namespace ldaproute::util {

PeriodicTask::State::State(std::string name, std::chrono::milliseconds interval, std::function<void()> task)
    : name(std::move(name))
    , interval(interval)
    , task(std::move(task))
    , timer(io) {}

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> task) {
    if (interval.count() <= 0) {
        throw std::invalid_argument("PeriodicTask interval must be positive: " + name);
    }
    if (!task) {
        throw std::invalid_argument("PeriodicTask requires a callback: " + name);
    }
    state_ = std::make_shared<State>(std::move(name), interval, std::move(task));
    arm(*state_);
    thread_ = std::thread([state = state_]() { state->io.run(); });
}

PeriodicTask::~PeriodicTask() {
    stop();
    if (thread_.joinable()) {
        // Destroyed from inside the callback: the thread holds its own reference to state_.
        thread_.detach();
    }
}

void PeriodicTask::stop() {
    std::scoped_lock lock(stopMutex_);
    state_->stopped.store(true);
    state_->io.stop();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void PeriodicTask::arm(State& state) {
    state.timer.expires_after(state.interval);
    state.timer.async_wait([&state](const boost::system::error_code& ec) {
        if (ec || state.stopped.load()) {
            return;
        }
        runOnce(state);
        if (!state.stopped.load()) {
            arm(state);
        }
    });
}

void PeriodicTask::runOnce(State& state) {
    try {
        state.task();
    } catch (const std::exception& ex) {
        log(LogLevel::warn, state.name + " iteration failed: " + ex.what());
    }
}

} // namespace ldaproute::util
