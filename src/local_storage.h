#pragma once

#include "storage_backend.h"

namespace pyexec {

// Namespaces are plain directories under base_path
class LocalStorageBackend : public StorageBackend {
public:
    explicit LocalStorageBackend(const std::string& base_path);

    void ensure_namespace(const std::string& workspace_ref) override;
    void write_file(const std::string& workspace_ref,
                    const std::string& relative_path,
                    const std::string& bytes) override;
    std::string read_file(const std::string& workspace_ref,
                          const std::string& relative_path) override;
    std::vector<std::string> list_files(const std::string& workspace_ref) override;
    void remove_tree(const std::string& workspace_ref) override;

    bool is_local() const override { return true; }
    std::string name() const override { return "local"; }

    std::string namespace_path(const std::string& workspace_ref) const;

private:
    std::string base_path_;
};

} // namespace pyexec
