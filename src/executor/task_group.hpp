/**
 * @file task_group.hpp
 * @brief Structured fan-out/fan-in of independent units under one Deadline.
 *
 * Every unit spawned into a TaskGroup runs on its own thread and receives
 * the same Deadline, so no unit ever queues behind another group's work. A
 * unit that throws is isolated: its exception becomes that unit's Internal
 * error and the other units are untouched. wait() returns only after every
 * spawned unit has returned, in spawn order.
 */

#pragma once

#include <exception>
#include <functional>
#include <future>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "core/result.hpp"
#include "executor/deadline.hpp"

namespace openstack_exporter {

template <typename T>
class TaskGroup {
public:
    using Unit = std::function<Result<T>(const Deadline&)>;

    /**
     * @param timeout  Shared bound for every unit in the group.
     * @param parent   Stop token of the enclosing scope (e.g. process shutdown).
     */
    explicit TaskGroup(Duration timeout, std::stop_token parent = {})
        : parent_link_(std::in_place, std::move(parent), StopForwarder{&stop_source_})
        , deadline_(Deadline::after(timeout, stop_source_.get_token())) {}

    ~TaskGroup() {
        if (!threads_.empty()) stop_source_.request_stop();
        // jthread members join on destruction.
    }

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    void spawn(std::string name, Unit unit) {
        std::promise<Result<T>> promise;
        futures_.push_back(promise.get_future());
        names_.push_back(name);
        threads_.emplace_back(
            [deadline = deadline_, unit = std::move(unit), name = std::move(name),
             promise = std::move(promise)]() mutable {
                try {
                    promise.set_value(unit(deadline));
                } catch (const std::exception& ex) {
                    promise.set_value(Error{ErrorKind::Internal, name + " failed: " + ex.what()});
                } catch (...) {
                    promise.set_value(
                        Error{ErrorKind::Internal, name + " failed with a non-standard exception"});
                }
            });
    }

    /// Cancel all units cooperatively; they observe it through the Deadline.
    void cancel() { stop_source_.request_stop(); }

    /// Block until every spawned unit has returned.
    std::vector<Result<T>> wait() {
        std::vector<Result<T>> results;
        results.reserve(futures_.size());
        for (size_t i = 0; i < futures_.size(); ++i) {
            try {
                results.push_back(futures_[i].get());
            } catch (const std::exception& ex) {
                results.push_back(Error{ErrorKind::Internal, names_[i] + " failed: " + ex.what()});
            }
        }
        threads_.clear();
        futures_.clear();
        names_.clear();
        return results;
    }

    [[nodiscard]] const Deadline& deadline() const noexcept { return deadline_; }
    [[nodiscard]] size_t size() const noexcept { return futures_.size(); }

private:
    struct StopForwarder {
        std::stop_source* target;
        void operator()() const noexcept { target->request_stop(); }
    };

    std::stop_source stop_source_;
    std::optional<std::stop_callback<StopForwarder>> parent_link_;
    Deadline deadline_;
    std::vector<std::string> names_;
    std::vector<std::future<Result<T>>> futures_;
    std::vector<std::jthread> threads_;
};

}  // namespace openstack_exporter
