#pragma once

#include "config.h"
#include "storage_backend.h"

#include <map>

namespace pyexec {

// Request fields covered by an AWS Signature Version 4
struct SigV4Request {
    std::string method;
    std::string canonical_uri;      // URI-encoded path
    std::string canonical_query;    // sorted, URI-encoded, without '?'
    std::map<std::string, std::string> headers;  // lowercase names
    std::string payload_hash;       // hex SHA-256 of the body
};

// Objects live under "<workspace_ref>/<relative_path>" in one bucket.
// REST calls go through libcurl, signed with SigV4.
class S3StorageBackend : public StorageBackend {
public:
    explicit S3StorageBackend(const S3Settings& settings);
    ~S3StorageBackend() override;

    void ensure_namespace(const std::string& workspace_ref) override;
    void write_file(const std::string& workspace_ref,
                    const std::string& relative_path,
                    const std::string& bytes) override;
    std::string read_file(const std::string& workspace_ref,
                          const std::string& relative_path) override;
    std::vector<std::string> list_files(const std::string& workspace_ref) override;
    void remove_tree(const std::string& workspace_ref) override;

    bool is_local() const override { return false; }
    std::string name() const override { return "s3"; }

    // Signing helpers, exposed for tests
    static std::string uri_encode(const std::string& value, bool encode_slash);
    static std::string authorization_header(const SigV4Request& request,
                                            const S3Settings& settings,
                                            const std::string& amz_date);

    // Keys and continuation token from one ListObjectsV2 response page
    struct ListPage {
        std::vector<std::string> keys;
        std::string next_token;     // empty when the listing is complete
    };
    static ListPage parse_list_response(const std::string& xml);

private:
    struct Response {
        long status = 0;
        std::string body;
    };

    Response perform(const std::string& method,
                     const std::string& key,
                     const std::map<std::string, std::string>& query,
                     const std::string& body);

    std::vector<std::string> list_keys(const std::string& prefix);
    std::string key_prefix(const std::string& workspace_ref) const;
    std::string object_key(const std::string& workspace_ref,
                           const std::string& relative_path) const;

    S3Settings settings_;
    std::string base_url_;      // scheme://host[:port]
    std::string host_;          // Host header
    std::string path_prefix_;   // "/<bucket>" for path-style endpoints
};

} // namespace pyexec
