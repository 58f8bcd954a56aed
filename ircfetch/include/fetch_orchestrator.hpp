#pragma once

#include <chrono>
#include <string>

#include "irc_client.hpp"
#include "session_state.hpp"
#include "types.h"

// Data of a poll event: seconds spent polling and the accepted file, or null
// while nothing was accepted.
json poll_event_data(std::chrono::seconds elapsed, const SessionState& state);

// Drives a single fetch: connect, wait out the grace period, ask the channel
// for the resource, poll until a matching file was accepted or the poll
// budget ran out, then quit. Every step reports on the session's event bus.
class FetchOrchestrator {
   public:
    FetchOrchestrator(SessionState& state, IrcClient& client, FetchTimings timings = FetchTimings{})
        : m_state(state), m_client(client), m_timings(timings) {}

    // Returns the final fetch status. Never throws.
    FetchStatus run(const std::string& request);

    // Safe to call from any thread; the running fetch stops at its next wait.
    void cancel() { m_state.cancel(); }

   private:
    bool connect();
    bool send_request(const std::string& request);
    // False if the run was cancelled while polling.
    bool poll_incoming_file_transfer();
    void quit_server();
    FetchStatus finish(FetchStatus status);
    void emit_fetch_status();

    SessionState& m_state;
    IrcClient& m_client;
    const FetchTimings m_timings;
};
