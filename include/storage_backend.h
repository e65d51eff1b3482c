#pragma once

#include <string>
#include <vector>

namespace pyexec {

// Durable per-session file storage. Every operation is scoped to the
// namespace named by workspace_ref; relative paths that would escape it are
// rejected by callers before the call and again by the backend.
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    virtual void ensure_namespace(const std::string& workspace_ref) = 0;

    virtual void write_file(const std::string& workspace_ref,
                            const std::string& relative_path,
                            const std::string& bytes) = 0;

    // Throws FileNotFound when the file does not exist
    virtual std::string read_file(const std::string& workspace_ref,
                                  const std::string& relative_path) = 0;

    // Relative paths of every regular file in the namespace
    virtual std::vector<std::string> list_files(const std::string& workspace_ref) = 0;

    // Recursive removal of the whole namespace; absent namespace is not an error
    virtual void remove_tree(const std::string& workspace_ref) = 0;

    // True when workspaces live only on local disk (nothing to sync)
    virtual bool is_local() const = 0;

    virtual std::string name() const = 0;
};

} // namespace pyexec
