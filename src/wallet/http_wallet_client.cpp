#include "wallet/http_wallet_client.hpp"
#include "common/errors.hpp"
#include "utils/crypto.hpp"
#include "utils/metrics.hpp"
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cctype>
#include <memory>
#include <stdexcept>

namespace settle {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlHeaders = std::unique_ptr<curl_slist, CurlSlistDeleter>;

// curl_global_init is not thread-safe; run it once for the process
struct CurlGlobal {
    CURLcode code;
    CurlGlobal() : code(curl_global_init(CURL_GLOBAL_ALL)) {}
    ~CurlGlobal() {
        if (code == CURLE_OK) curl_global_cleanup();
    }
};

void ensure_curl_global() {
    static CurlGlobal global;
    if (global.code != CURLE_OK) {
        throw std::runtime_error(fmt::format("curl_global_init failed: {}",
                                             curl_easy_strerror(global.code)));
    }
}

void append_header(CurlHeaders& headers, const std::string& line) {
    curl_slist* head = curl_slist_append(headers.get(), line.c_str());
    if (!head) {
        throw WalletUnavailableError("Failed to build wallet request headers");
    }
    headers.release();
    headers.reset(head);
}

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

bool is_unavailable(long status) {
    return status == 429 || status >= 500;
}

nlohmann::json parse_body(long http_status, const std::string& body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        throw WalletUnavailableError(fmt::format(
            "Unparseable wallet response (HTTP {}): {}", http_status, e.what()));
    }
    if (!j.is_object()) {
        throw WalletUnavailableError(fmt::format(
            "Wallet response is not an object (HTTP {})", http_status));
    }
    return j;
}

std::string url_escape(const std::string& s) {
    std::string out;
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out += fmt::format("%{:02X}", c);
        }
    }
    return out;
}

} // namespace

HttpWalletClient::HttpWalletClient(const WalletConfig& config)
    : config_(config)
{
    ensure_curl_global();
    if (config_.api_key.empty() || config_.api_secret.empty()) {
        spdlog::warn("HttpWalletClient: no API credentials, requests will be unsigned");
    }
    spdlog::info("HttpWalletClient initialized: {}", config_.base_url);
}

HttpWalletClient::~HttpWalletClient() = default;

HttpWalletClient::HttpResponse HttpWalletClient::perform(const std::string& method,
                                                         const std::string& path,
                                                         const std::string& body,
                                                         const std::string& idempotency_key) {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw WalletUnavailableError("Failed to initialize CURL");
    }

    HttpResponse response;
    std::string url = config_.base_url + path;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout_ms));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.timeout_ms));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    if (method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }

    CurlHeaders headers;
    append_header(headers, "Content-Type: application/json");
    append_header(headers, "Accept: application/json");
    if (!idempotency_key.empty()) {
        append_header(headers, "Idempotency-Key: " + idempotency_key);
    }

    if (!config_.api_key.empty() && !config_.api_secret.empty()) {
        std::string timestamp = std::to_string(now_ms());
        std::string signature = crypto::sign_wallet_request(
            config_.api_secret, timestamp, method, path, body);

        append_header(headers, "X-Api-Key: " + config_.api_key);
        append_header(headers, "X-Timestamp: " + timestamp);
        append_header(headers, "X-Signature: " + signature);
    }

    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

    ScopedLatency latency(SETTLE_HISTOGRAM("wallet_request"));
    CURLcode res = curl_easy_perform(curl.get());
    latency.stop();

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);

    if (res != CURLE_OK) {
        throw WalletUnavailableError(fmt::format(
            "Wallet {} {} failed: {}", method, path, curl_easy_strerror(res)));
    }

    return response;
}

HttpWalletClient::HttpResponse HttpWalletClient::http_get(const std::string& path) {
    return perform("GET", path, "", "");
}

HttpWalletClient::HttpResponse HttpWalletClient::http_post(const std::string& path,
                                                           const std::string& body,
                                                           const std::string& idempotency_key) {
    return perform("POST", path, body, idempotency_key);
}

Amount HttpWalletClient::balance(const std::string& account_id) {
    auto response = http_get("/balances/" + url_escape(account_id));
    return parse_balance_response(response.status, response.body);
}

DebitResult HttpWalletClient::debit(const std::string& account_id, Amount amount,
                                    const std::string& idempotency_key) {
    nlohmann::json body = {
        {"accountId", account_id},
        {"amount", amount.to_string()},
        {"idempotencyKey", idempotency_key}
    };
    auto response = http_post("/debit", body.dump(), idempotency_key);
    return parse_debit_response(response.status, response.body);
}

CreditResult HttpWalletClient::credit(const std::string& account_id, Amount amount,
                                      const std::string& idempotency_key) {
    nlohmann::json body = {
        {"accountId", account_id},
        {"amount", amount.to_string()},
        {"idempotencyKey", idempotency_key}
    };
    auto response = http_post("/credit", body.dump(), idempotency_key);
    return parse_credit_response(response.status, response.body);
}

Amount HttpWalletClient::parse_balance_response(long http_status, const std::string& body) {
    if (http_status == 404) {
        return Amount::zero();
    }
    if (http_status != 200) {
        throw WalletUnavailableError(fmt::format("Balance request returned HTTP {}", http_status));
    }

    auto j = parse_body(http_status, body);
    if (!j.contains("balance")) {
        throw WalletUnavailableError("Balance response missing 'balance'");
    }
    const auto& value = j.at("balance");
    if (value.is_string()) {
        return Amount::parse(value.get<std::string>());
    }
    if (value.is_number()) {
        return Amount::from_double(value.get<double>());
    }
    throw WalletUnavailableError("Balance response has non-numeric 'balance'");
}

DebitResult HttpWalletClient::parse_debit_response(long http_status, const std::string& body) {
    if (http_status == 402) {
        return DebitResult::INSUFFICIENT;
    }
    if (is_unavailable(http_status) || http_status < 200 || http_status >= 300) {
        throw WalletUnavailableError(fmt::format("Debit request returned HTTP {}", http_status));
    }

    auto j = parse_body(http_status, body);
    std::string result = j.value("result", "");
    if (result == "ok") return DebitResult::OK;
    if (result == "insufficient") return DebitResult::INSUFFICIENT;
    throw WalletUnavailableError("Unknown debit result: '" + result + "'");
}

CreditResult HttpWalletClient::parse_credit_response(long http_status, const std::string& body) {
    if (is_unavailable(http_status)) {
        throw WalletUnavailableError(fmt::format("Credit request returned HTTP {}", http_status));
    }
    if (http_status == 202) {
        return CreditResult::PENDING;
    }
    if (http_status >= 400) {
        return CreditResult::FAILED;
    }

    auto j = parse_body(http_status, body);
    std::string status = j.value("status", "");
    if (status == "ok") return CreditResult::OK;
    if (status == "pending") return CreditResult::PENDING;
    if (status == "failed") return CreditResult::FAILED;
    throw WalletUnavailableError("Unknown credit status: '" + status + "'");
}

} // namespace settle
