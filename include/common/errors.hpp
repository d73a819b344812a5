#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

namespace binbot {

/**
 * Base class for all venue and trading failures.
 */
class VenueError : public std::runtime_error {
public:
    explicit VenueError(const std::string& what) : std::runtime_error(what) {}
};

// Socket-level failure. Triggers reconnection inside the connector.
class TransportError : public VenueError {
public:
    explicit TransportError(const std::string& what) : VenueError(what) {}
};

// Authorization rejected. Fatal for the session until re-authenticated.
class AuthError : public VenueError {
public:
    explicit AuthError(const std::string& what) : VenueError(what) {}
};

// No response within the request window. Never retried by the connector.
class TimeoutError : public VenueError {
public:
    explicit TimeoutError(const std::string& what) : VenueError(what) {}
};

// Venue declined the request (proposal, buy, subscription...).
class RejectedError : public VenueError {
public:
    RejectedError(const std::string& code, const std::string& message)
        : VenueError(code.empty() ? message : code + ": " + message)
        , code_(code)
    {}

    const std::string& code() const { return code_; }

private:
    std::string code_;
};

// Pending work abandoned by disconnect or shutdown.
class CancelledError : public VenueError {
public:
    explicit CancelledError(const std::string& what) : VenueError(what) {}
};

// Contract still open after the maximum tracking duration.
class StuckContractError : public VenueError {
public:
    StuckContractError(int64_t contract_id, const std::string& what)
        : VenueError(what)
        , contract_id_(contract_id)
    {}

    int64_t contract_id() const { return contract_id_; }

private:
    int64_t contract_id_;
};

// Session limit hit. Stops the loop, not a failure.
class LimitReachedError : public VenueError {
public:
    explicit LimitReachedError(const std::string& what) : VenueError(what) {}
};

} // namespace binbot
