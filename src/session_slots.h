#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace pyexec {

// Exclusion for a session shared with other orchestration instances.
// Locks expire on their own so a crashed holder cannot wedge a session.
class SlotLock {
public:
    virtual ~SlotLock() = default;

    // Ownership token, or nullopt when another holder has the session.
    // Throws when the lock service cannot be reached.
    virtual std::optional<std::string> try_lock(const std::string& session_id) = 0;

    // Releases only if token still owns the lock
    virtual void unlock(const std::string& session_id, const std::string& token) = 0;
};

// One execution token per session. Holding a Lease is the only way to run
// work against a session's workspace.
class SessionSlots {
public:
    class Lease {
    public:
        Lease() = default;
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        ~Lease();

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        const std::string& session_id() const { return session_id_; }
        bool valid() const { return owner_ != nullptr; }

        // Release early; also happens on destruction
        void release();

    private:
        friend class SessionSlots;
        Lease(SessionSlots* owner, std::string session_id, std::string token);

        SessionSlots* owner_ = nullptr;
        std::string session_id_;
        std::string token_;
    };

    SessionSlots() = default;
    // With a shared lock a lease is held only while both the local slot and
    // the shared lock are
    explicit SessionSlots(std::unique_ptr<SlotLock> shared);
    SessionSlots(const SessionSlots&) = delete;
    SessionSlots& operator=(const SessionSlots&) = delete;

    // Wait at most `wait` for the session's slot. zero = try once.
    std::optional<Lease> try_acquire(const std::string& session_id,
                                     std::chrono::milliseconds wait);

    bool is_held(const std::string& session_id) const;

    // Number of sessions currently tracked (held or awaited)
    size_t tracked() const;

private:
    struct Slot {
        bool held = false;
        size_t waiters = 0;
        std::condition_variable released;
    };

    void release(const std::string& session_id, const std::string& token);
    void release_local(const std::string& session_id);

    // Polls the shared lock until deadline. Lock service errors count as busy.
    std::optional<std::string> acquire_shared(const std::string& session_id,
                                              std::chrono::steady_clock::time_point deadline);

    std::unique_ptr<SlotLock> shared_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Slot> slots_;
};

} // namespace pyexec
