#include "server_sync_adapter.hpp"
#include "logging.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

static constexpr long CONNECT_TIMEOUT_MS = 10000;
static constexpr long REQUEST_TIMEOUT_MS = 60000;

ServerSyncAdapter::ServerSyncAdapter(std::string base_url, std::string credentials)
    : base_url_(std::move(base_url)), credentials_(std::move(credentials))
{
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
    curl_ = curl_easy_init();
    if (!curl_) {
        audit_log_level(LogLevel::ERROR,
            "curl_easy_init failed",
            "server_sync",
            "failure");
    }
}

ServerSyncAdapter::~ServerSyncAdapter() {
    if (curl_) curl_easy_cleanup(curl_);
    if (!credentials_.empty()) sodium_memzero(&credentials_[0], credentials_.size());
}

ZkStatus ServerSyncAdapter::request(const std::string& path, const std::string* body, std::string& response) {
    if (!curl_) return ZkStatus::TRANSPORT_FAILURE;

    curl_easy_reset(curl_);
    response.clear();

    std::string url = base_url_ + path;
    std::string auth = "Authorization: Bearer " + credentials_;

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, auth.c_str());
    headers = curl_slist_append(headers, "Accept: application/json");
    if (body) headers = curl_slist_append(headers, "Content-Type: application/json");

    bool success = true;
    success &= !curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    success &= !curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
    success &= !curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 1L);
    success &= !curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, 2L);
    success &= !curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, CONNECT_TIMEOUT_MS);
    success &= !curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, REQUEST_TIMEOUT_MS);
    success &= !curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    // curl_easy_setopt is variadic: '+' turns the lambda into a plain function pointer
    success &= !curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION,
        +[](char* ptr, size_t size, size_t nmemb, void* udata) -> size_t {
            std::string* out = static_cast<std::string*>(udata);
            size_t len = size * nmemb;
            if (out->size() + len > MAX_STORE_SIZE) return 0;
            out->append(ptr, len);
            return len;
        });
    success &= !curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response);
    if (body) {
        success &= !curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        success &= !curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body->c_str());
        success &= !curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE_LARGE, (curl_off_t)body->size());
    }

    if (!success) {
        curl_slist_free_all(headers);
        sodium_memzero(&auth[0], auth.size());
        audit_log_level(LogLevel::ERROR,
            "Failed to set libcurl options",
            "server_sync",
            "failure");
        return ZkStatus::TRANSPORT_FAILURE;
    }

    CURLcode res = curl_easy_perform(curl_);
    curl_slist_free_all(headers);
    sodium_memzero(&auth[0], auth.size());

    if (res != CURLE_OK) {
        audit_log_level(LogLevel::WARN,
            std::string("Sync request failed: ") + curl_easy_strerror(res),
            "server_sync",
            "failure");
        return ZkStatus::TRANSPORT_FAILURE;
    }

    long status = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
    if (status == 409) return ZkStatus::KEY_EPOCH_MISMATCH;
    if (status < 200 || status >= 300) {
        audit_log_level(LogLevel::WARN,
            "Sync request rejected with HTTP " + std::to_string(status),
            "server_sync",
            "failure");
        return ZkStatus::TRANSPORT_FAILURE;
    }
    return ZkStatus::OK;
}

ZkStatus ServerSyncAdapter::test_connection() {
    std::string body = "{}";
    std::string response;
    return request("/api/sync/heartbeat", &body, response);
}

ZkStatus ServerSyncAdapter::pull_changes(uint64_t since, PullResponse& out) {
    std::string response;
    ZkStatus st = request("/api/sync/changes?since=" + std::to_string(since), nullptr, response);
    if (!ok(st)) return st;

    try {
        json::parse(response).get_to(out);
    }
    catch (const std::exception& e) {
        audit_log_level(LogLevel::ERROR,
            std::string("Malformed pull response: ") + e.what(),
            "server_sync",
            "failure");
        return ZkStatus::TRANSPORT_FAILURE;
    }
    return ZkStatus::OK;
}

ZkStatus ServerSyncAdapter::push_changes(const PushRequest& req, PushResult& out) {
    std::string body = json(req).dump();
    std::string response;
    ZkStatus st = request("/api/sync/push", &body, response);
    if (!ok(st)) return st;

    try {
        json::parse(response).get_to(out);
    }
    catch (const std::exception& e) {
        audit_log_level(LogLevel::ERROR,
            std::string("Malformed push response: ") + e.what(),
            "server_sync",
            "failure");
        return ZkStatus::TRANSPORT_FAILURE;
    }
    return ZkStatus::OK;
}
