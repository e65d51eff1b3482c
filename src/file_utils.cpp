#include "file_utils.h"
#include "errors.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace pyexec {

const std::map<std::string, std::string> FileUtils::mime_type_map_ = {
    // Images
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif", "image/gif"},
    {".svg", "image/svg+xml"},

    // Data
    {".csv", "text/csv"},
    {".json", "application/json"},
    {".parquet", "application/octet-stream"},
    {".npy", "application/octet-stream"},
    {".pkl", "application/octet-stream"},

    // Text
    {".txt", "text/plain"},
    {".log", "text/plain"},
    {".md", "text/markdown"},
    {".py", "text/x-python"},
    {".html", "text/html"},

    // Documents
    {".pdf", "application/pdf"},
    {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},

    // Archives
    {".zip", "application/zip"},
    {".gz", "application/gzip"},
    {".tar", "application/x-tar"},
};

std::string FileUtils::bytes_to_hex(const unsigned char* data, size_t len) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string FileUtils::to_hex(const std::string& bytes) {
    return bytes_to_hex(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size());
}

std::string FileUtils::sha256_string(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return bytes_to_hex(hash, SHA256_DIGEST_LENGTH);
}

std::string FileUtils::hmac_sha256(const std::string& key, const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(),
              digest, &digest_len)) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
    return std::string(reinterpret_cast<const char*>(digest), digest_len);
}

std::string FileUtils::random_hex(size_t num_bytes) {
    std::vector<unsigned char> buf(num_bytes);
    if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return bytes_to_hex(buf.data(), buf.size());
}

bool FileUtils::is_safe_relative_path(const std::string& path) {
    if (path.empty() || path.front() == '/') return false;
    if (path.find('\0') != std::string::npos) return false;
    if (path.find('\\') != std::string::npos) return false;

    std::istringstream parts(path);
    std::string component;
    while (std::getline(parts, component, '/')) {
        if (component.empty() || component == "." || component == "..") {
            return false;
        }
    }
    return path.back() != '/';
}

std::string FileUtils::read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw StorageError("cannot open " + path);
    }
    return std::string((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
}

void FileUtils::write_file(const std::string& path, const std::string& bytes) {
    fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw StorageError("cannot create " + target.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw StorageError("cannot write " + path);
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) {
        throw StorageError("short write to " + path);
    }
}

namespace {

// Closes on scope exit
struct ScopedFd {
    int fd;
    explicit ScopedFd(int f) : fd(f) {}
    ~ScopedFd() { if (fd >= 0) ::close(fd); }
    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;
};

std::vector<std::string> split_components(const std::string& relative_path) {
    if (!FileUtils::is_safe_relative_path(relative_path)) {
        throw StorageError("path escapes workspace: " + relative_path);
    }
    std::vector<std::string> components;
    std::istringstream parts(relative_path);
    std::string component;
    while (std::getline(parts, component, '/')) {
        components.push_back(component);
    }
    return components;
}

std::string describe_open_failure(const std::string& what, int err) {
    if (err == ELOOP || err == ENOTDIR) {
        return "refusing symlink or non-directory in " + what;
    }
    return "cannot open " + what + ": " + std::strerror(err);
}

// Directory fd for the parent of the last component, walked without
// following symlinks. With create, missing directories are made.
int open_parent_beneath(const std::string& root, const std::vector<std::string>& components,
                        const std::string& relative_path, bool create) {
    int dir = ::open(root.c_str(), O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC);
    if (dir < 0) {
        int err = errno;
        if (err == ENOENT && !create) throw FileNotFound(relative_path);
        throw StorageError(describe_open_failure(root, err));
    }

    for (size_t i = 0; i + 1 < components.size(); i++) {
        ScopedFd current(dir);
        const char* name = components[i].c_str();
        if (create && ::mkdirat(current.fd, name, 0755) < 0 && errno != EEXIST) {
            throw StorageError("cannot create " + components[i] + ": " + std::strerror(errno));
        }
        dir = ::openat(current.fd, name, O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC);
        if (dir < 0) {
            int err = errno;
            if (err == ENOENT && !create) throw FileNotFound(relative_path);
            throw StorageError(describe_open_failure(relative_path, err));
        }
    }
    return dir;
}

} // anonymous namespace

std::string FileUtils::read_file_beneath(const std::string& root, const std::string& relative_path) {
    auto components = split_components(relative_path);
    ScopedFd parent(open_parent_beneath(root, components, relative_path, false));

    int fd = ::openat(parent.fd, components.back().c_str(), O_RDONLY | O_NOFOLLOW | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        int err = errno;
        if (err == ENOENT) throw FileNotFound(relative_path);
        throw StorageError(describe_open_failure(relative_path, err));
    }
    ScopedFd file(fd);

    struct stat st;
    if (::fstat(file.fd, &st) < 0) {
        throw StorageError("cannot stat " + relative_path + ": " + std::strerror(errno));
    }
    if (!S_ISREG(st.st_mode)) {
        throw FileNotFound(relative_path);
    }
    if (st.st_nlink > 1) {
        throw StorageError("refusing hard-linked file " + relative_path);
    }

    std::string bytes;
    bytes.reserve(static_cast<size_t>(st.st_size));
    char buffer[65536];
    while (true) {
        ssize_t n = ::read(file.fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw StorageError("cannot read " + relative_path + ": " + std::strerror(errno));
        }
        if (n == 0) break;
        bytes.append(buffer, static_cast<size_t>(n));
    }
    return bytes;
}

void FileUtils::write_file_beneath(const std::string& root, const std::string& relative_path,
                                   const std::string& bytes) {
    auto components = split_components(relative_path);
    ScopedFd parent(open_parent_beneath(root, components, relative_path, true));

    int fd = ::openat(parent.fd, components.back().c_str(),
                      O_WRONLY | O_CREAT | O_NOFOLLOW | O_NONBLOCK | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw StorageError(describe_open_failure(relative_path, errno));
    }
    ScopedFd file(fd);

    struct stat st;
    if (::fstat(file.fd, &st) < 0 || !S_ISREG(st.st_mode)) {
        throw StorageError("not a regular file: " + relative_path);
    }
    if (st.st_nlink > 1) {
        throw StorageError("refusing hard-linked file " + relative_path);
    }
    if (::ftruncate(file.fd, 0) < 0) {
        throw StorageError("cannot truncate " + relative_path + ": " + std::strerror(errno));
    }

    size_t written = 0;
    while (written < bytes.size()) {
        ssize_t n = ::write(file.fd, bytes.data() + written, bytes.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw StorageError("short write to " + relative_path + ": " + std::strerror(errno));
        }
        written += static_cast<size_t>(n);
    }
}

std::string FileUtils::get_mime_type(const std::string& filename) {
    std::string ext = fs::path(filename).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);

    auto it = mime_type_map_.find(ext);
    if (it != mime_type_map_.end()) {
        return it->second;
    }
    return "application/octet-stream";
}

std::string FileUtils::format_file_size(size_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    if (unit_index == 0) {
        oss << bytes << " " << units[0];
    } else {
        oss << std::fixed << std::setprecision(1) << size << " " << units[unit_index];
    }
    return oss.str();
}

} // namespace pyexec
