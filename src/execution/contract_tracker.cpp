#include "execution/contract_tracker.hpp"
#include "common/errors.hpp"
#include "utils/metrics.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>

namespace binbot {

ContractTracker::ContractTracker(VenueConnector& connector, const TrackerConfig& config)
    : connector_(connector)
    , config_(config)
{
}

Contract ContractTracker::track(int64_t contract_id, CancellationToken& cancel) {
    auto started = now();
    auto deadline = started + std::chrono::milliseconds(config_.max_tracking_ms);
    auto interval = std::chrono::milliseconds(config_.poll_interval_ms);
    auto poll_timeout = std::chrono::milliseconds(config_.poll_timeout_ms);
    int consecutive_failures = 0;
    auto poll_failed = [&] {
        poll_failures_++;
        consecutive_failures++;
        METRIC_COUNTER(metric_names::POLL_FAILURES).increment();
    };

    spdlog::info("Tracking contract {}", contract_id);

    while (true) {
        if (cancel.is_cancelled()) {
            throw CancelledError(fmt::format("Tracking of contract {} cancelled", contract_id));
        }

        polls_++;
        try {
            Contract contract = connector_.get_contract(contract_id, poll_timeout);
            if (contract.contract_id == 0) contract.contract_id = contract_id;

            if (contract.is_settled()) {
                spdlog::info("Contract {} settled {} profit=${:.2f} after {}",
                             contract_id, contract_status_to_string(contract.status), contract.profit,
                             time_utils::format_duration_ms(time_utils::elapsed_ms(started)));
                return contract;
            }

            consecutive_failures = 0;
            if (on_progress_) on_progress_(contract);
        } catch (const TimeoutError& e) {
            poll_failed();
            spdlog::warn("Poll of contract {} timed out, retrying: {}", contract_id, e.what());
        } catch (const TransportError& e) {
            poll_failed();
            spdlog::warn("Poll of contract {} failed, retrying: {}", contract_id, e.what());
        } catch (const CancelledError&) {
            throw;
        } catch (const VenueError& e) {
            // The contract is paid for: a rate limit or a transient venue
            // error must not drop it from the session
            poll_failed();
            spdlog::warn("Poll of contract {} rejected ({}), retrying", contract_id, e.what());
        }

        if (now() >= deadline) {
            throw StuckContractError(contract_id, fmt::format(
                "Contract {} still open after {}ms", contract_id, config_.max_tracking_ms));
        }

        auto wait = interval;
        if (consecutive_failures > 0) {
            wait = std::chrono::milliseconds(time_utils::backoff_delay_ms(
                config_.poll_interval_ms, consecutive_failures,
                std::max(config_.poll_interval_ms, config_.max_poll_backoff_ms)));
        }
        if (cancel.wait_for(wait)) {
            throw CancelledError(fmt::format("Tracking of contract {} cancelled", contract_id));
        }
    }
}

} // namespace binbot
