#include "session_slots.h"

#include <algorithm>
#include <iostream>
#include <thread>

namespace pyexec {

namespace {

const auto SHARED_POLL_INTERVAL = std::chrono::milliseconds(10);

} // anonymous namespace

SessionSlots::Lease::Lease(SessionSlots* owner, std::string session_id, std::string token)
    : owner_(owner), session_id_(std::move(session_id)), token_(std::move(token)) {}

SessionSlots::Lease::Lease(Lease&& other) noexcept
    : owner_(other.owner_), session_id_(std::move(other.session_id_)),
      token_(std::move(other.token_)) {
    other.owner_ = nullptr;
}

SessionSlots::Lease& SessionSlots::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        session_id_ = std::move(other.session_id_);
        token_ = std::move(other.token_);
        other.owner_ = nullptr;
    }
    return *this;
}

SessionSlots::Lease::~Lease() {
    release();
}

void SessionSlots::Lease::release() {
    if (owner_) {
        owner_->release(session_id_, token_);
        owner_ = nullptr;
    }
}

SessionSlots::SessionSlots(std::unique_ptr<SlotLock> shared)
    : shared_(std::move(shared)) {}

std::optional<SessionSlots::Lease> SessionSlots::try_acquire(
    const std::string& session_id,
    std::chrono::milliseconds wait
) {
    auto deadline = std::chrono::steady_clock::now() + wait;
    std::unique_lock<std::mutex> lock(mutex_);
    Slot& slot = slots_[session_id];

    if (slot.held) {
        // unordered_map references stay valid across rehash, and the entry
        // is not erased while waiters > 0
        slot.waiters++;
        bool acquired = slot.released.wait_until(lock, deadline, [&slot] { return !slot.held; });
        slot.waiters--;

        if (!acquired) {
            if (!slot.held && slot.waiters == 0) slots_.erase(session_id);
            return std::nullopt;
        }
    }

    slot.held = true;
    if (!shared_) {
        return Lease(this, session_id, "");
    }
    lock.unlock();

    auto token = acquire_shared(session_id, deadline);
    if (!token) {
        release_local(session_id);
        return std::nullopt;
    }
    return Lease(this, session_id, *token);
}

std::optional<std::string> SessionSlots::acquire_shared(
    const std::string& session_id,
    std::chrono::steady_clock::time_point deadline
) {
    while (true) {
        try {
            if (auto token = shared_->try_lock(session_id)) {
                return token;
            }
        } catch (const std::exception& e) {
            std::cerr << "[Slots] Shared lock for " << session_id
                      << " unavailable: " << e.what() << std::endl;
            return std::nullopt;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
            SHARED_POLL_INTERVAL, deadline - now));
    }
}

void SessionSlots::release(const std::string& session_id, const std::string& token) {
    if (shared_ && !token.empty()) {
        try {
            shared_->unlock(session_id, token);
        } catch (const std::exception& e) {
            // Left to expire
            std::cerr << "[Slots] Could not release shared lock for " << session_id
                      << ": " << e.what() << std::endl;
        }
    }
    release_local(session_id);
}

void SessionSlots::release_local(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(session_id);
    if (it == slots_.end()) return;

    it->second.held = false;
    if (it->second.waiters == 0) {
        slots_.erase(it);
    } else {
        it->second.released.notify_all();
    }
}

bool SessionSlots::is_held(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(session_id);
    return it != slots_.end() && it->second.held;
}

size_t SessionSlots::tracked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

} // namespace pyexec
