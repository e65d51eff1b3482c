#pragma once

#include "task.h"

#include <optional>
#include <string>

namespace pyexec {

// Task record store shared by every orchestration instance using it.
// Implementations must make create() and compare_and_set() atomic with
// respect to all other writers, including writers in other processes.
class StatusBackend {
public:
    virtual ~StatusBackend() = default;

    // Unconditional write
    virtual void put(const Task& task) = 0;

    // Insert only if no record with this id exists
    virtual bool create(const Task& task) = 0;

    // Replace the record only if its current state equals expected_state.
    // Returns false when the record is absent or in another state.
    virtual bool compare_and_set(const std::string& task_id,
                                 TaskState expected_state,
                                 const Task& new_record) = 0;

    virtual std::optional<Task> get(const std::string& task_id) = 0;

    // Named pointer at a task id, such as the per-session install id.
    // Moves to task_id only if it currently points at expected (nullopt:
    // unset). Aliases expire like records.
    virtual bool compare_and_set_alias(const std::string& alias,
                                       const std::optional<std::string>& expected,
                                       const std::string& task_id) = 0;

    virtual std::optional<std::string> resolve_alias(const std::string& alias) = 0;

    virtual std::string name() const = 0;
};

} // namespace pyexec
