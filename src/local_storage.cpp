#include "local_storage.h"
#include "errors.h"
#include "file_utils.h"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace pyexec {

LocalStorageBackend::LocalStorageBackend(const std::string& base_path)
    : base_path_(base_path) {}

std::string LocalStorageBackend::namespace_path(const std::string& workspace_ref) const {
    if (!FileUtils::is_safe_relative_path(workspace_ref) ||
        workspace_ref.find('/') != std::string::npos) {
        throw StorageError("invalid namespace: " + workspace_ref);
    }
    return base_path_ + "/" + workspace_ref;
}

void LocalStorageBackend::ensure_namespace(const std::string& workspace_ref) {
    std::error_code ec;
    fs::create_directories(namespace_path(workspace_ref), ec);
    if (ec) {
        throw StorageError("cannot create " + namespace_path(workspace_ref) + ": " + ec.message());
    }
}

void LocalStorageBackend::write_file(const std::string& workspace_ref,
                                     const std::string& relative_path,
                                     const std::string& bytes) {
    ensure_namespace(workspace_ref);
    // Sandboxed code owns the workspace and may plant symlinks in it
    FileUtils::write_file_beneath(namespace_path(workspace_ref), relative_path, bytes);
}

std::string LocalStorageBackend::read_file(const std::string& workspace_ref,
                                           const std::string& relative_path) {
    return FileUtils::read_file_beneath(namespace_path(workspace_ref), relative_path);
}

std::vector<std::string> LocalStorageBackend::list_files(const std::string& workspace_ref) {
    std::vector<std::string> files;
    fs::path root = namespace_path(workspace_ref);

    std::error_code ec;
    if (!fs::is_directory(root, ec)) return files;

    auto it = fs::recursive_directory_iterator(root, ec);
    if (ec) {
        throw StorageError("cannot list " + root.string() + ": " + ec.message());
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw StorageError("cannot list " + root.string() + ": " + ec.message());
        }
        if (it->is_symlink(ec)) {
            if (it->is_directory(ec)) it.disable_recursion_pending();
            continue;
        }
        if (it->is_regular_file(ec)) {
            files.push_back(fs::relative(it->path(), root).generic_string());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

void LocalStorageBackend::remove_tree(const std::string& workspace_ref) {
    std::error_code ec;
    fs::remove_all(namespace_path(workspace_ref), ec);
    if (ec) {
        throw StorageError("cannot remove " + namespace_path(workspace_ref) + ": " + ec.message());
    }
}

} // namespace pyexec
