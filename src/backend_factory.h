#pragma once

#include "config.h"
#include "sandbox_runtime.h"
#include "session_slots.h"
#include "status_backend.h"
#include "storage_backend.h"

#include <memory>

namespace pyexec {

// Concrete backends selected by configuration
std::unique_ptr<StatusBackend> make_status_backend(const Config& config);
std::unique_ptr<StorageBackend> make_storage_backend(const Config& config);
std::unique_ptr<SandboxRuntime> make_sandbox_runtime(const Config& config);

// Cross-instance session lock; null when the status store is process-local
std::unique_ptr<SlotLock> make_slot_lock(const Config& config);

} // namespace pyexec
