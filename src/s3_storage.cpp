#include "s3_storage.h"
#include "errors.h"
#include "file_utils.h"

#include <ctime>
#include <iostream>
#include <memory>
#include <sstream>

#include <curl/curl.h>

namespace pyexec {

namespace {

size_t append_body(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(data, size * nmemb);
    return size * nmemb;
}

std::string amz_timestamp() {
    std::time_t now = std::time(nullptr);
    std::tm utc;
    gmtime_r(&now, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%dT%H%M%SZ", &utc);
    return buf;
}

std::string xml_unescape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); i++) {
        if (text[i] != '&') {
            out += text[i];
            continue;
        }
        size_t semi = text.find(';', i);
        if (semi == std::string::npos) {
            out += text[i];
            continue;
        }
        std::string entity = text.substr(i + 1, semi - i - 1);
        if (entity == "amp") out += '&';
        else if (entity == "lt") out += '<';
        else if (entity == "gt") out += '>';
        else if (entity == "quot") out += '"';
        else if (entity == "apos") out += '\'';
        else {
            out += text.substr(i, semi - i + 1);
        }
        i = semi;
    }
    return out;
}

// Text of every <tag>...</tag> element, in document order
std::vector<std::string> xml_elements(const std::string& xml, const std::string& tag) {
    std::vector<std::string> values;
    const std::string open = "<" + tag + ">";
    const std::string close = "</" + tag + ">";
    size_t pos = 0;
    while ((pos = xml.find(open, pos)) != std::string::npos) {
        size_t start = pos + open.size();
        size_t end = xml.find(close, start);
        if (end == std::string::npos) break;
        values.push_back(xml_unescape(xml.substr(start, end - start)));
        pos = end + close.size();
    }
    return values;
}

} // anonymous namespace

S3StorageBackend::S3StorageBackend(const S3Settings& settings) : settings_(settings) {
    curl_global_init(CURL_GLOBAL_DEFAULT);

    if (settings_.endpoint.empty()) {
        host_ = settings_.bucket + ".s3." + settings_.region + ".amazonaws.com";
        base_url_ = "https://" + host_;
    } else {
        // Path-style addressing against a custom endpoint (MinIO, LocalStack, ...)
        base_url_ = settings_.endpoint;
        while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
        size_t scheme_end = base_url_.find("://");
        host_ = scheme_end == std::string::npos ? base_url_ : base_url_.substr(scheme_end + 3);
        path_prefix_ = "/" + uri_encode(settings_.bucket, true);
    }

    std::cout << "[S3] Using bucket " << settings_.bucket << " via " << base_url_ << std::endl;
}

S3StorageBackend::~S3StorageBackend() {
    curl_global_cleanup();
}

std::string S3StorageBackend::uri_encode(const std::string& value, bool encode_slash) {
    static const char* HEX = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : value) {
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                          (c >= '0' && c <= '9') ||
                          c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved || (c == '/' && !encode_slash)) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0F];
        }
    }
    return out;
}

std::string S3StorageBackend::authorization_header(const SigV4Request& request,
                                                   const S3Settings& settings,
                                                   const std::string& amz_date) {
    std::string canonical_headers;
    std::string signed_headers;
    for (const auto& [name, value] : request.headers) {
        canonical_headers += name + ":" + value + "\n";
        if (!signed_headers.empty()) signed_headers += ";";
        signed_headers += name;
    }

    std::string canonical_request =
        request.method + "\n" +
        request.canonical_uri + "\n" +
        request.canonical_query + "\n" +
        canonical_headers + "\n" +
        signed_headers + "\n" +
        request.payload_hash;

    std::string date = amz_date.substr(0, 8);
    std::string scope = date + "/" + settings.region + "/s3/aws4_request";

    std::string string_to_sign =
        "AWS4-HMAC-SHA256\n" + amz_date + "\n" + scope + "\n" +
        FileUtils::sha256_string(canonical_request);

    std::string key = FileUtils::hmac_sha256("AWS4" + settings.secret_access_key, date);
    key = FileUtils::hmac_sha256(key, settings.region);
    key = FileUtils::hmac_sha256(key, "s3");
    key = FileUtils::hmac_sha256(key, "aws4_request");

    std::string signature = FileUtils::to_hex(FileUtils::hmac_sha256(key, string_to_sign));

    return "AWS4-HMAC-SHA256 Credential=" + settings.access_key_id + "/" + scope +
           ",SignedHeaders=" + signed_headers +
           ",Signature=" + signature;
}

S3StorageBackend::ListPage S3StorageBackend::parse_list_response(const std::string& xml) {
    ListPage page;
    page.keys = xml_elements(xml, "Key");

    auto truncated = xml_elements(xml, "IsTruncated");
    if (!truncated.empty() && truncated.front() == "true") {
        auto token = xml_elements(xml, "NextContinuationToken");
        if (!token.empty()) page.next_token = token.front();
    }
    return page;
}

std::string S3StorageBackend::key_prefix(const std::string& workspace_ref) const {
    if (!FileUtils::is_safe_relative_path(workspace_ref) ||
        workspace_ref.find('/') != std::string::npos) {
        throw StorageError("invalid namespace: " + workspace_ref);
    }
    return workspace_ref + "/";
}

std::string S3StorageBackend::object_key(const std::string& workspace_ref,
                                         const std::string& relative_path) const {
    std::string prefix = key_prefix(workspace_ref);
    if (!FileUtils::is_safe_relative_path(relative_path)) {
        throw StorageError("path escapes workspace: " + relative_path);
    }
    return prefix + relative_path;
}

S3StorageBackend::Response S3StorageBackend::perform(
    const std::string& method,
    const std::string& key,
    const std::map<std::string, std::string>& query,
    const std::string& body
) {
    SigV4Request request;
    request.method = method;
    request.canonical_uri = path_prefix_ + "/" + uri_encode(key, false);

    std::ostringstream query_string;
    for (const auto& [name, value] : query) {
        if (query_string.tellp() > 0) query_string << "&";
        query_string << uri_encode(name, true) << "=" << uri_encode(value, true);
    }
    request.canonical_query = query_string.str();

    std::string amz_date = amz_timestamp();
    request.payload_hash = FileUtils::sha256_string(body);
    request.headers["host"] = host_;
    request.headers["x-amz-content-sha256"] = request.payload_hash;
    request.headers["x-amz-date"] = amz_date;

    std::string url = base_url_ + request.canonical_uri;
    if (!request.canonical_query.empty()) url += "?" + request.canonical_query;

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw StorageError("curl_easy_init failed");
    }

    struct curl_slist* raw_headers = nullptr;
    raw_headers = curl_slist_append(raw_headers,
        ("Authorization: " + authorization_header(request, settings_, amz_date)).c_str());
    raw_headers = curl_slist_append(raw_headers,
        ("x-amz-content-sha256: " + request.payload_hash).c_str());
    raw_headers = curl_slist_append(raw_headers, ("x-amz-date: " + amz_date).c_str());
    raw_headers = curl_slist_append(raw_headers, "Expect:");
    if (method == "PUT") {
        raw_headers = curl_slist_append(raw_headers, "Content-Type: application/octet-stream");
    }
    std::unique_ptr<struct curl_slist, decltype(&curl_slist_free_all)> headers(
        raw_headers, curl_slist_free_all);

    Response response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, 120L);

    if (method == "PUT") {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, "PUT");
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(body.size()));
    } else if (method != "GET") {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        throw StorageError(method + " " + key + ": " + curl_easy_strerror(rc));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

void S3StorageBackend::ensure_namespace(const std::string& workspace_ref) {
    // Prefixes exist implicitly once an object is written under them
    key_prefix(workspace_ref);
}

void S3StorageBackend::write_file(const std::string& workspace_ref,
                                  const std::string& relative_path,
                                  const std::string& bytes) {
    std::string key = object_key(workspace_ref, relative_path);
    Response response = perform("PUT", key, {}, bytes);
    if (response.status / 100 != 2) {
        throw StorageError("PUT " + key + " returned HTTP " + std::to_string(response.status));
    }
}

std::string S3StorageBackend::read_file(const std::string& workspace_ref,
                                        const std::string& relative_path) {
    std::string key = object_key(workspace_ref, relative_path);
    Response response = perform("GET", key, {}, "");
    if (response.status == 404) {
        throw FileNotFound(relative_path);
    }
    if (response.status / 100 != 2) {
        throw StorageError("GET " + key + " returned HTTP " + std::to_string(response.status));
    }
    return response.body;
}

std::vector<std::string> S3StorageBackend::list_keys(const std::string& prefix) {
    std::vector<std::string> keys;
    std::string token;
    do {
        std::map<std::string, std::string> query = {{"list-type", "2"}, {"prefix", prefix}};
        if (!token.empty()) query["continuation-token"] = token;

        // Bucket-level request: empty key
        Response response = perform("GET", "", query, "");
        if (response.status / 100 != 2) {
            throw StorageError("ListObjectsV2 " + prefix + " returned HTTP " +
                               std::to_string(response.status));
        }
        ListPage page = parse_list_response(response.body);
        keys.insert(keys.end(), page.keys.begin(), page.keys.end());
        token = page.next_token;
    } while (!token.empty());
    return keys;
}

std::vector<std::string> S3StorageBackend::list_files(const std::string& workspace_ref) {
    std::string prefix = key_prefix(workspace_ref);

    std::vector<std::string> files;
    for (const auto& key : list_keys(prefix)) {
        std::string relative = key.substr(prefix.size());
        // Keys that would not map back into the workspace are skipped
        if (FileUtils::is_safe_relative_path(relative)) {
            files.push_back(relative);
        }
    }
    return files;
}

void S3StorageBackend::remove_tree(const std::string& workspace_ref) {
    std::string prefix = key_prefix(workspace_ref);

    size_t removed = 0;
    for (const auto& key : list_keys(prefix)) {
        Response response = perform("DELETE", key, {}, "");
        if (response.status / 100 != 2 && response.status != 404) {
            throw StorageError("DELETE " + key + " returned HTTP " +
                               std::to_string(response.status));
        }
        removed++;
    }
    std::cout << "[S3] Removed " << removed << " objects under " << prefix << std::endl;
}

} // namespace pyexec
