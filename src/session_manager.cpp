#include "session_manager.h"
#include "constants.h"
#include "errors.h"
#include "file_utils.h"
#include "process.h"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace pyexec {

namespace {

bool is_reserved_name(const std::string& relative_path) {
    return relative_path.compare(0, std::string(RESERVED_FILE_PREFIX).size(), RESERVED_FILE_PREFIX) == 0;
}

// Deletes a scratch file on scope exit
class TempFile {
public:
    TempFile()
        : path_((fs::temp_directory_path() /
                 ("pyexec-venv-" + FileUtils::random_hex(8) + ".tar.gz")).string()) {}
    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

void run_tar(const std::vector<std::string>& argv) {
    ProcessOptions options;
    options.timeout = std::chrono::seconds(ENVIRONMENT_ARCHIVE_TIMEOUT_SECONDS);
    options.max_output_bytes = 64 * 1024;

    ProcessResult result;
    try {
        result = run_process(argv, options);
    } catch (const LaunchError& e) {
        throw StorageError(std::string("tar: ") + e.what());
    }
    if (result.timed_out || result.exit_code != 0) {
        throw StorageError("tar exited with code " + std::to_string(result.exit_code) +
                           (result.timed_out ? " (timed out)" : "") + ": " + result.stderr_output);
    }
}

} // anonymous namespace

SessionManager::SessionManager(const std::string& base_path,
                               StorageBackend& storage,
                               SessionSlots& slots,
                               std::chrono::seconds terminate_wait)
    : base_path_(base_path), storage_(storage), slots_(slots), terminate_wait_(terminate_wait) {
    std::error_code ec;
    fs::create_directories(base_path_, ec);
    if (ec) {
        throw StorageError("cannot create " + base_path_ + ": " + ec.message());
    }
    std::cout << "[SessionManager] Workspaces under " << base_path_
              << " (storage: " << storage_.name() << ")" << std::endl;
}

void SessionManager::validate_session_id(const std::string& session_id) {
    if (session_id.empty()) {
        throw InvalidSessionId("empty");
    }
    if (session_id.size() > MAX_SESSION_ID_LENGTH) {
        throw InvalidSessionId("longer than " + std::to_string(MAX_SESSION_ID_LENGTH) + " characters");
    }
    if (session_id == "." || session_id == "..") {
        throw InvalidSessionId("'" + session_id + "'");
    }
    for (char c : session_id) {
        bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                  (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
        if (!ok) {
            throw InvalidSessionId("unsupported character in '" + session_id + "'");
        }
    }
}

std::string SessionManager::local_path_for(const std::string& session_id) const {
    return base_path_ + "/" + session_id;
}

Session SessionManager::resolve_or_create(const std::string& session_id) {
    validate_session_id(session_id);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        return it->second;
    }

    Session session;
    session.session_id = session_id;
    session.workspace_ref = session_id;
    session.local_path = local_path_for(session_id);
    session.created_at = std::chrono::steady_clock::now();
    session.last_used_at = session.created_at;

    storage_.ensure_namespace(session.workspace_ref);

    std::error_code ec;
    fs::create_directories(session.local_path, ec);
    if (ec) {
        throw StorageError("cannot create " + session.local_path + ": " + ec.message());
    }

    // A venv left by an earlier process still counts
    session.environment_ready = environment_present(session);

    sessions_[session_id] = session;
    std::cout << "[SessionManager] Created session " << session_id
              << (session.environment_ready ? " (existing environment)" : "") << std::endl;
    return session;
}

void SessionManager::mark_environment_ready(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end() && !it->second.environment_ready) {
        it->second.environment_ready = true;
        std::cout << "[SessionManager] Environment ready for " << session_id << std::endl;
    }
}

void SessionManager::touch(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
        it->second.last_used_at = std::chrono::steady_clock::now();
    }
}

std::optional<Session> SessionManager::get(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return std::nullopt;
    return it->second;
}

std::vector<Session> SessionManager::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Session> result;
    result.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        result.push_back(session);
    }
    return result;
}

void SessionManager::destroy(const std::string& session_id) {
    std::error_code ec;
    fs::remove_all(local_path_for(session_id), ec);
    if (ec) {
        throw StorageError("cannot remove " + local_path_for(session_id) + ": " + ec.message());
    }
    storage_.remove_tree(session_id);

    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(session_id);
}

void SessionManager::terminate(const std::string& session_id) {
    validate_session_id(session_id);

    auto lease = slots_.try_acquire(session_id,
        std::chrono::duration_cast<std::chrono::milliseconds>(terminate_wait_));
    if (!lease) {
        throw SessionBusy(session_id);
    }

    destroy(session_id);
    std::cout << "[SessionManager] Terminated session " << session_id << std::endl;
}

void SessionManager::store_file(const std::string& session_id,
                                const std::string& relative_path,
                                const std::string& bytes) {
    if (!FileUtils::is_safe_relative_path(relative_path) || is_reserved_name(relative_path)) {
        throw InvalidRequest("invalid filename: " + relative_path);
    }
    Session session = resolve_or_create(session_id);
    storage_.write_file(session.workspace_ref, relative_path, bytes);
    touch(session_id);

    std::cout << "[SessionManager] Stored " << relative_path << " ("
              << FileUtils::format_file_size(bytes.size()) << ") in " << session_id << std::endl;
}

std::string SessionManager::load_file(const std::string& session_id,
                                      const std::string& relative_path) {
    validate_session_id(session_id);
    if (!FileUtils::is_safe_relative_path(relative_path)) {
        throw InvalidRequest("invalid filename: " + relative_path);
    }
    if (is_reserved_name(relative_path)) {
        throw FileNotFound(relative_path);
    }
    return storage_.read_file(session_id, relative_path);
}

void SessionManager::sync_down(const Session& session) {
    if (storage_.is_local()) return;

    size_t count = 0;
    bool has_environment = false;
    for (const auto& relative : storage_.list_files(session.workspace_ref)) {
        if (relative == ENVIRONMENT_ARCHIVE) {
            has_environment = true;
            continue;
        }
        if (!FileUtils::is_safe_relative_path(relative) || is_reserved_name(relative)) {
            std::cerr << "[SessionManager] Skipping object " << relative << " of "
                      << session.session_id << std::endl;
            continue;
        }
        std::string bytes = storage_.read_file(session.workspace_ref, relative);
        FileUtils::write_file_beneath(session.local_path, relative, bytes);
        count++;
    }
    std::cout << "[SessionManager] Synced " << count << " files down for "
              << session.session_id << std::endl;

    if (has_environment && !environment_present(session)) {
        restore_environment(session);
    }
}

void SessionManager::sync_up(const Session& session, const std::string& exclude) {
    if (storage_.is_local()) return;

    fs::path root = session.local_path;
    std::error_code ec;
    if (!fs::is_directory(root, ec)) return;

    size_t count = 0;
    auto it = fs::recursive_directory_iterator(root, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::string relative = fs::relative(it->path(), root).generic_string();
        if (it->is_symlink(ec)) {
            if (it->is_directory(ec)) it.disable_recursion_pending();
            continue;
        }
        if (it->is_directory(ec)) {
            if (relative == VENV_DIR) it.disable_recursion_pending();
            continue;
        }
        if (!it->is_regular_file(ec) || relative == exclude || is_reserved_name(relative)) continue;

        // Re-opened without following links: the walk and the read can race
        // with whatever the sandbox left behind
        std::string bytes;
        try {
            bytes = FileUtils::read_file_beneath(root.string(), relative);
        } catch (const StorageError& e) {
            std::cerr << "[SessionManager] Not publishing " << relative << ": " << e.what() << std::endl;
            continue;
        }
        storage_.write_file(session.workspace_ref, relative, bytes);
        count++;
    }
    if (ec) {
        throw StorageError("cannot walk " + root.string() + ": " + ec.message());
    }
    std::cout << "[SessionManager] Synced " << count << " files up for "
              << session.session_id << std::endl;
}

void SessionManager::publish_environment(const Session& session) {
    if (storage_.is_local() || !environment_present(session)) return;

    TempFile archive;
    run_tar({"tar", "-czf", archive.path(), "-C", session.local_path, VENV_DIR});

    std::string bytes = FileUtils::read_file(archive.path());
    storage_.write_file(session.workspace_ref, ENVIRONMENT_ARCHIVE, bytes);
    std::cout << "[SessionManager] Published environment of " << session.session_id << " ("
              << FileUtils::format_file_size(bytes.size()) << ")" << std::endl;
}

void SessionManager::restore_environment(const Session& session) {
    TempFile archive;
    FileUtils::write_file(archive.path(), storage_.read_file(session.workspace_ref, ENVIRONMENT_ARCHIVE));

    // Whatever stands at venv/ now, including a symlink, is replaced
    std::error_code ec;
    fs::remove_all(session.local_path + "/" + VENV_DIR, ec);
    if (ec) {
        throw StorageError("cannot clear " + session.local_path + "/" + VENV_DIR + ": " + ec.message());
    }

    // GNU tar strips absolute names, refuses ".." members and defers
    // symlinks until regular members are written
    run_tar({"tar", "-xzf", archive.path(), "-C", session.local_path,
             "--no-same-owner", "--no-overwrite-dir", VENV_DIR});

    std::cout << "[SessionManager] Restored environment of " << session.session_id << std::endl;
    mark_environment_ready(session.session_id);
}

bool SessionManager::environment_present(const Session& session) {
    // venv/bin/python usually links to an interpreter inside the image
    std::error_code ec;
    auto status = fs::symlink_status(session.local_path + "/" + VENV_DIR + "/bin/python", ec);
    return !ec && fs::exists(status);
}

size_t SessionManager::collect_idle(std::chrono::seconds max_idle) {
    if (max_idle.count() <= 0) return 0;

    auto cutoff = std::chrono::steady_clock::now() - max_idle;
    std::vector<std::string> candidates;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            if (session.last_used_at < cutoff) candidates.push_back(id);
        }
    }

    size_t collected = 0;
    for (const auto& id : candidates) {
        auto lease = slots_.try_acquire(id, std::chrono::milliseconds(0));
        if (!lease) continue;

        // Re-check under the slot: a task may have touched it meanwhile
        auto current = get(id);
        if (!current || current->last_used_at >= cutoff) continue;

        try {
            destroy(id);
            collected++;
            std::cout << "[SessionManager] Collected idle session " << id << std::endl;
        } catch (const StorageError& e) {
            std::cerr << "[SessionManager] Failed to collect " << id << ": " << e.what() << std::endl;
        }
    }
    return collected;
}

} // namespace pyexec
