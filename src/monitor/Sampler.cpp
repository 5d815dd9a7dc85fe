#include "monitor/Sampler.hpp"
#include "monitor/SyncState.hpp"
#include "rpc/NodeClient.hpp"
#include "log/Registry.hpp"

#include <stdexcept>
#include <utility>

using namespace sw::monitor;

Sampler::Sampler(std::shared_ptr<rpc::NodeClient> client, std::shared_ptr<SyncState> state)
    : client_(std::move(client)), state_(std::move(state)) {
    if (!client_) throw std::invalid_argument("Sampler requires a node client");
    if (!state_) throw std::invalid_argument("Sampler requires a sync state");
}

void Sampler::sample() {
    std::optional<rpc::SyncProgress> progress;
    try {
        progress = client_->querySyncProgress();
    } catch (const std::exception& e) {
        log::Registry::monitor()->warn("[Sampler] error while checking sync status: {}", e.what());
        return;
    }

    if (!progress) {
        state_->recordSynced();
        log::Registry::monitor()->trace("[Sampler] node is synced");
        return;
    }

    state_->recordSyncing(*progress);
    log::Registry::monitor()->debug("[Sampler] node is syncing: current block {}, highest block {}",
                                    progress->current_block, progress->highest_block);
}
