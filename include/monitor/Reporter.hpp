#pragma once

#include "util/duration.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace sw::notify { class Notifier; }

namespace sw::monitor {

class SyncState;

enum class AlertState {
    InSync,
    OutOfSync
};

std::string to_string(AlertState s);

// Outcome of one reporting tick.
struct Decision {
    uint64_t synced_samples{};
    AlertState previous{AlertState::InSync};
    AlertState current{AlertState::InSync};
    bool notified{false};   // a message was attempted
    bool delivered{false};  // ...and the notifier accepted it

    [[nodiscard]] bool transitioned() const { return previous != current; }
};

/**
 * Debounces sync alerts over a reporting window.
 *
 * A single synced sample in the window is enough to recover; an outage needs a whole window
 * without one. The counter is consumed on every tick and a message goes out only when the
 * alert state flips. Delivery failures are logged; the new state stands regardless.
 */
class Reporter {
public:
    Reporter(std::shared_ptr<SyncState> state, std::shared_ptr<notify::Notifier> notifier,
             int64_t destination, util::Duration reportInterval);

    Decision tick();

    [[nodiscard]] AlertState alertState() const { return alertState_; }

    static AlertState nextState(uint64_t syncedSamples);

private:
    bool deliver(const std::string& text) const;

    std::shared_ptr<SyncState> state_;
    std::shared_ptr<notify::Notifier> notifier_;
    int64_t destination_;
    util::Duration reportInterval_;
    AlertState alertState_{AlertState::InSync};
};

}
