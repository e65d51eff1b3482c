#pragma once

#include "session_slots.h"
#include "storage_backend.h"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pyexec {

// A client's persistent workspace
struct Session {
    std::string session_id;
    std::string workspace_ref;             // storage namespace key
    std::string local_path;                // directory bind-mounted into sandboxes
    bool environment_ready = false;        // venv provisioned
    std::chrono::steady_clock::time_point created_at;
    std::chrono::steady_clock::time_point last_used_at;
};

// Session manager - maps session ids to workspaces and tracks their state
class SessionManager {
public:
    SessionManager(const std::string& base_path,
                   StorageBackend& storage,
                   SessionSlots& slots,
                   std::chrono::seconds terminate_wait);

    // Validate a client-supplied id for use as a path component.
    // Throws InvalidSessionId.
    static void validate_session_id(const std::string& session_id);

    // Existing session, or a new one with its workspace created
    Session resolve_or_create(const std::string& session_id);

    void mark_environment_ready(const std::string& session_id);
    void touch(const std::string& session_id);

    std::optional<Session> get(const std::string& session_id) const;
    std::vector<Session> list() const;

    // Wait for the running task (bounded by terminate_wait), then delete the
    // workspace and storage namespace. Absent sessions are not an error.
    // Throws SessionBusy when the slot cannot be acquired in time.
    void terminate(const std::string& session_id);

    // Upload / download through the storage backend
    void store_file(const std::string& session_id,
                    const std::string& relative_path,
                    const std::string& bytes);
    std::string load_file(const std::string& session_id,
                          const std::string& relative_path);

    // Object-store mode: mirror the namespace into local_path before a task,
    // publish workspace files (minus venv/, reserved names and exclude)
    // afterwards. sync_down also unpacks the published environment when the
    // local cache has none. Symlinks left in the workspace are never followed.
    void sync_down(const Session& session);
    void sync_up(const Session& session, const std::string& exclude = "");

    // Object-store mode: archive venv/ as ENVIRONMENT_ARCHIVE so any
    // instance can run the session's execute tasks
    void publish_environment(const Session& session);

    static bool environment_present(const Session& session);

    // Terminate sessions idle longer than max_idle; busy ones are skipped
    size_t collect_idle(std::chrono::seconds max_idle);

    std::string local_path_for(const std::string& session_id) const;
    const StorageBackend& storage() const { return storage_; }

private:
    // Caller holds no lock; slot lease already held
    void destroy(const std::string& session_id);

    void restore_environment(const Session& session);

    std::string base_path_;
    StorageBackend& storage_;
    SessionSlots& slots_;
    std::chrono::seconds terminate_wait_;

    mutable std::mutex mutex_;
    std::map<std::string, Session> sessions_;
};

} // namespace pyexec
