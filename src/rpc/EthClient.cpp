#include "rpc/EthClient.hpp"
#include "util/curlWrappers.hpp"
#include "log/Registry.hpp"

#include <charconv>
#include <memory>
#include <string_view>
#include <curl/curl.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace sw::rpc;
using namespace sw::util;
using json = nlohmann::json;

namespace {

struct CurlUrlDeleter {
    void operator()(CURLU* u) const { curl_url_cleanup(u); }
};

struct CurlStrDeleter {
    void operator()(char* s) const { curl_free(s); }
};

using CurlStr = std::unique_ptr<char, CurlStrDeleter>;

CurlStr urlPart(CURLU* u, const CURLUPart part) {
    char* out = nullptr;
    if (curl_url_get(u, part, &out, 0) != CURLUE_OK) return CurlStr(nullptr);
    return CurlStr(out);
}

}

EthClient::EthClient(const config::NodeConfig& cfg)
    : url_(cfg.url), timeout_(cfg.request_timeout) {
    if (url_.empty()) throw RpcError("node URL is empty");
    ensureCurlGlobalInit();

    const std::unique_ptr<CURLU, CurlUrlDeleter> u(curl_url());
    if (!u) throw RpcError("curl_url allocation failed");

    if (const auto rc = curl_url_set(u.get(), CURLUPART_URL, url_.c_str(), 0); rc != CURLUE_OK)
        throw RpcError(fmt::format("invalid node URL: {}", curl_url_strerror(rc)));

    const auto scheme = urlPart(u.get(), CURLUPART_SCHEME);
    const auto host = urlPart(u.get(), CURLUPART_HOST);

    const std::string_view schemeView = scheme ? scheme.get() : "";
    if (schemeView != "http" && schemeView != "https")
        throw RpcError(fmt::format("unsupported node URL scheme \"{}\" (expected http or https)", schemeView));
    if (!host || !*host.get()) throw RpcError("node URL has no host");

    host_ = host.get();
    log::Registry::rpc()->debug("[EthClient] Using node at {}://{}", schemeView, host_);
}

std::optional<SyncProgress> EthClient::querySyncProgress() {
    return decodeSyncing(call("eth_syncing"));
}

json EthClient::call(const std::string& method) {
    const auto id = nextId_.fetch_add(1, std::memory_order_relaxed);
    const auto payload = buildRequest(id, method).dump();

    const auto resp = httpPostJson(url_, payload, timeout_);
    if (!resp.transportOk()) {
        log::Registry::rpc()->warn("[EthClient] {} to {} failed: {}", method, host_, resp.describe());
        throw RpcError(fmt::format("{} failed: {}", method, resp.describe()));
    }

    return unwrapResponse(resp.http, resp.body);
}

json EthClient::buildRequest(const uint64_t id, const std::string& method) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
        {"params", json::array()}
    };
}

json EthClient::unwrapResponse(const long httpStatus, const std::string& body) {
    const auto doc = json::parse(body, nullptr, false);

    if (!doc.is_discarded() && doc.is_object()) {
        if (const auto it = doc.find("error"); it != doc.end() && !it->is_null()) {
            const auto code = it->is_object() ? it->value("code", 0) : 0;
            const auto message = it->is_object() ? it->value("message", std::string("unknown error")) : it->dump();
            throw RpcError(fmt::format("rpc error {}: {}", code, message));
        }
    }

    if (httpStatus / 100 != 2) throw RpcError(fmt::format("node returned HTTP {}", httpStatus));
    if (doc.is_discarded()) throw RpcError("malformed JSON-RPC response");
    if (!doc.is_object() || !doc.contains("result")) throw RpcError("JSON-RPC response has no result");

    return doc.at("result");
}

std::optional<SyncProgress> EthClient::decodeSyncing(const json& result) {
    // any boolean (or null) carries no progress object and means "not syncing"
    if (result.is_boolean() || result.is_null()) return std::nullopt;

    if (!result.is_object()) throw RpcError(fmt::format("unexpected eth_syncing result: {}", result.dump()));

    // absent figures decode as zero
    const auto quantity = [&result](const char* key) -> uint64_t {
        const auto it = result.find(key);
        return it == result.end() || it->is_null() ? 0 : parseQuantity(*it);
    };

    SyncProgress p;
    p.starting_block = quantity("startingBlock");
    p.current_block = quantity("currentBlock");
    p.highest_block = quantity("highestBlock");
    return p;
}

uint64_t EthClient::parseQuantity(const json& value) {
    if (value.is_number_unsigned()) return value.get<uint64_t>();
    if (value.is_number_integer() && value.get<int64_t>() >= 0) return static_cast<uint64_t>(value.get<int64_t>());

    if (!value.is_string()) throw RpcError(fmt::format("invalid quantity: {}", value.dump()));

    const auto& str = value.get_ref<const std::string&>();
    std::string_view digits = str;
    int base = 10;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits.remove_prefix(2);
        base = 16;
    }

    uint64_t out = 0;
    const auto* end = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(digits.data(), end, out, base);
    if (digits.empty() || ec != std::errc() || ptr != end)
        throw RpcError(fmt::format("invalid quantity \"{}\"", str));

    return out;
}
