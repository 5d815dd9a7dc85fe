#pragma once

#include <memory>

namespace sw::rpc { class NodeClient; }

namespace sw::monitor {

class SyncState;

class Sampler {
public:
    Sampler(std::shared_ptr<rpc::NodeClient> client, std::shared_ptr<SyncState> state);

    // One observation. A failed query is logged and leaves the shared state as it was.
    void sample();

private:
    std::shared_ptr<rpc::NodeClient> client_;
    std::shared_ptr<SyncState> state_;
};

}
