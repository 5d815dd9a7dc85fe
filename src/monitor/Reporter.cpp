#include "monitor/Reporter.hpp"
#include "monitor/SyncState.hpp"
#include "monitor/messages.hpp"
#include "notify/Notifier.hpp"
#include "log/Registry.hpp"

#include <stdexcept>
#include <utility>

using namespace sw::monitor;

std::string sw::monitor::to_string(const AlertState s) {
    switch (s) {
        case AlertState::InSync: return "in-sync";
        case AlertState::OutOfSync: return "out-of-sync";
    }
    return "unknown";
}

Reporter::Reporter(std::shared_ptr<SyncState> state, std::shared_ptr<notify::Notifier> notifier,
                   const int64_t destination, const util::Duration reportInterval)
    : state_(std::move(state)), notifier_(std::move(notifier)),
      destination_(destination), reportInterval_(reportInterval) {
    if (!state_) throw std::invalid_argument("Reporter requires a sync state");
    if (!notifier_) throw std::invalid_argument("Reporter requires a notifier");
}

AlertState Reporter::nextState(const uint64_t syncedSamples) {
    return syncedSamples > 0 ? AlertState::InSync : AlertState::OutOfSync;
}

Decision Reporter::tick() {
    Decision d;
    d.synced_samples = state_->takeSyncedCount();
    d.previous = alertState_;
    d.current = nextState(d.synced_samples);

    if (!d.transitioned()) {
        log::Registry::monitor()->debug("[Reporter] {} synced samples this window, still {}",
                                        d.synced_samples, to_string(d.current));
        return d;
    }

    std::string text;
    if (d.current == AlertState::InSync) {
        log::Registry::monitor()->info("[Reporter] node is back in sync");
        text = backInSyncMessage();
    } else {
        const auto snapshot = state_->snapshot();
        log::Registry::monitor()->info("[Reporter] node is out of sync: current block {}, highest block {}",
                                       snapshot.currentBlockStr(), snapshot.highestBlockStr());
        text = outOfSyncMessage(reportInterval_, snapshot);
    }

    alertState_ = d.current;
    d.notified = true;
    d.delivered = deliver(text);
    return d;
}

bool Reporter::deliver(const std::string& text) const {
    try {
        notifier_->send(destination_, text);
        return true;
    } catch (const std::exception& e) {
        log::Registry::monitor()->error("[Reporter] error sending message: {}", e.what());
        return false;
    }
}
