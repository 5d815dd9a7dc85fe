#pragma once

#include "rpc/NodeClient.hpp"
#include "config/Config.hpp"
#include "util/duration.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace sw::rpc {

// Ethereum JSON-RPC client over HTTP(S). Construction validates the endpoint but does not connect.
class EthClient final : public NodeClient {
public:
    explicit EthClient(const config::NodeConfig& cfg);

    std::optional<SyncProgress> querySyncProgress() override;

    [[nodiscard]] const std::string& host() const { return host_; }

    static nlohmann::json buildRequest(uint64_t id, const std::string& method);

    // Returns the "result" member of a JSON-RPC response, or throws RpcError.
    static nlohmann::json unwrapResponse(long httpStatus, const std::string& body);

    // eth_syncing result: boolean or null -> nullopt, object -> progress (missing figures are 0).
    static std::optional<SyncProgress> decodeSyncing(const nlohmann::json& result);

    // Hex ("0x1a") or plain decimal quantity.
    static uint64_t parseQuantity(const nlohmann::json& value);

private:
    nlohmann::json call(const std::string& method);

    std::string url_;
    std::string host_;
    util::Duration timeout_;
    std::atomic<uint64_t> nextId_{1};
};

}
