#include "listener.hpp"

#include <variant>

#include "types.h"

namespace {
struct Dispatcher {
    EventListener& listener;

    void operator()(const Notification::GenericMessage& m) const { listener.on_generic_message(m); }
    void operator()(const Notification::ChannelMessage& m) const { listener.on_generic_channel(m); }
    void operator()(const Notification::Join& j) const { listener.on_join(j); }
    void operator()(Notification::IncomingFileTransfer& offer) const { listener.on_incoming_file_transfer(offer); }
};
}  // namespace

void EventListener::dispatch(IrcNotification& notification) { std::visit(Dispatcher{*this}, notification); }

void EventListener::on_generic_message(const Notification::GenericMessage& message) {
    if (message.user) {
        m_state.events().push(EventType::GenericMessage, *message.user + ": " + message.message);
    } else {
        m_state.events().push(EventType::GenericMessage, message.message);
    }
}

void EventListener::on_generic_channel(const Notification::ChannelMessage& message) {
    m_state.events().push(EventType::GenericChannel, {{"channel", message.channel}, {"message", message.message}});
}

void EventListener::on_join(const Notification::Join& join) {
    m_state.events().push(EventType::Join, {{"channel", join.channel}, {"user", join.user}});
}
