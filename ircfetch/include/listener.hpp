#pragma once

#include "irc_client.hpp"
#include "session_state.hpp"
#include "transfer_handler.hpp"

// Turns protocol notifications into bus events and hands file offers to the
// transfer handler.
class EventListener {
   public:
    EventListener(SessionState& state, FileTransferHandler& transfers) : m_state(state), m_transfers(transfers) {}

    void dispatch(IrcNotification& notification);

    void on_generic_message(const Notification::GenericMessage& message);
    void on_generic_channel(const Notification::ChannelMessage& message);
    void on_join(const Notification::Join& join);
    void on_incoming_file_transfer(Notification::IncomingFileTransfer& offer) { m_transfers.handle(offer); }

   private:
    SessionState& m_state;
    FileTransferHandler& m_transfers;
};
