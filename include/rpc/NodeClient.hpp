#pragma once

#include "rpc/SyncProgress.hpp"

#include <optional>
#include <stdexcept>

namespace sw::rpc {

class RpcError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class NodeClient {
public:
    virtual ~NodeClient() = default;

    // nullopt when the node considers itself fully synced. Throws RpcError on any failure.
    virtual std::optional<SyncProgress> querySyncProgress() = 0;
};

}
