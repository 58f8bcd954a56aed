#pragma once

#include <string>

#include "irc_client.hpp"
#include "session_state.hpp"

// Decides on file offers for one fetch request. The first offer whose name
// matches the request is received, recorded in the session and copied into
// the transfer directory; everything else is left unanswered.
class FileTransferHandler {
   public:
    FileTransferHandler(SessionState& state, std::string request)
        : m_state(state), m_request(std::move(request)) {}

    // Runs on the protocol client's thread and returns once the offer was
    // accepted and copied, or rejected. Never throws.
    void handle(Notification::IncomingFileTransfer& offer);

    const std::string& request() const { return m_request; }

   private:
    void accept(Notification::IncomingFileTransfer& offer, const fs::path& temp_file, const json& offer_data);
    void copy_resource(const fs::path& temp_file, const std::string& safe_filename);

    SessionState& m_state;
    const std::string m_request;
};
