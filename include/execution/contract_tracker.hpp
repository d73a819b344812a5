#pragma once

#include <functional>
#include "common/types.hpp"
#include "config/config.hpp"
#include "utils/cancellation.hpp"
#include "venue/venue_connector.hpp"

namespace binbot {

/**
 * Resolves an open contract to its terminal outcome by polling the venue.
 * Poll failures (timeouts, dropped connection, venue error replies) are
 * retried with backoff; only settlement, cancellation or the tracking
 * deadline end the loop.
 */
class ContractTracker {
public:
    using ProgressCallback = std::function<void(const Contract&)>;

    ContractTracker(VenueConnector& connector, const TrackerConfig& config);

    // Blocks until settled. Throws StuckContractError past max_tracking_ms,
    // CancelledError when the token fires.
    Contract track(int64_t contract_id, CancellationToken& cancel);

    // Called with every open-status poll result
    void set_progress_callback(ProgressCallback cb) { on_progress_ = std::move(cb); }

    // Stats
    int64_t polls() const { return polls_; }
    int64_t poll_failures() const { return poll_failures_; }

private:
    VenueConnector& connector_;
    TrackerConfig config_;
    ProgressCallback on_progress_;

    int64_t polls_{0};
    int64_t poll_failures_{0};
};

} // namespace binbot
