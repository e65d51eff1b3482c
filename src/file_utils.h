#pragma once

#include <cstddef>
#include <map>
#include <string>

namespace pyexec {

class FileUtils {
public:
    // Hash utilities
    static std::string sha256_string(const std::string& data);
    static std::string hmac_sha256(const std::string& key, const std::string& data);  // raw bytes
    static std::string bytes_to_hex(const unsigned char* data, size_t len);
    static std::string to_hex(const std::string& bytes);

    // Cryptographically random bytes, hex encoded (2 chars per byte)
    static std::string random_hex(size_t num_bytes);

    // Relative path that stays inside its root: not empty, not absolute,
    // no "." / ".." components, no NUL, no backslashes
    static bool is_safe_relative_path(const std::string& path);

    // Whole-file helpers; throw StorageError on I/O failure
    static std::string read_file(const std::string& path);
    static void write_file(const std::string& path, const std::string& bytes);

    // Same, but confined to root: every component is opened with
    // O_NOFOLLOW, so a symlink anywhere below root is refused rather than
    // followed. read_file_beneath throws FileNotFound for missing entries
    // and refuses non-regular or hard-linked files.
    static std::string read_file_beneath(const std::string& root, const std::string& relative_path);
    static void write_file_beneath(const std::string& root, const std::string& relative_path,
                                   const std::string& bytes);

    // Get MIME type for file
    static std::string get_mime_type(const std::string& filename);

    // Format file size as human-readable string
    static std::string format_file_size(size_t bytes);

private:
    static const std::map<std::string, std::string> mime_type_map_;
};

} // namespace pyexec
