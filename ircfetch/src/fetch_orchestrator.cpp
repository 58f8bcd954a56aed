#include "fetch_orchestrator.hpp"

#include <chrono>
#include <memory>

#include "listener.hpp"
#include "transfer_handler.hpp"

FetchStatus FetchOrchestrator::run(const std::string& request) {
    EventBus& bus = m_state.events();
    emit_fetch_status();

    // The client may call back after run() returned, so the listener owns
    // what it refers to.
    auto transfers = std::make_shared<FileTransferHandler>(m_state, request);
    auto listener = std::make_shared<EventListener>(m_state, *transfers);
    m_client.set_listener(
        [transfers, listener](IrcNotification& notification) { listener->dispatch(notification); });

    const bool connected = connect();
    bus.push(EventType::BotStatus, m_client.is_connected());
    if (!connected) {
        return finish(FetchStatus::Failed);
    }

    if (!m_state.wait_for(m_timings.grace_period)) {
        bus.push(EventType::FetchCancelled, "grace-period");
        return finish(FetchStatus::Failed);
    }

    if (!send_request(request)) {
        return finish(FetchStatus::Failed);
    }
    m_state.advance_fetch_status(FetchStatus::Fetching);
    emit_fetch_status();

    if (!poll_incoming_file_transfer()) {
        bus.push(EventType::FetchCancelled, "polling");
        return finish(FetchStatus::Failed);
    }
    return finish(m_state.has_accepted_file() ? FetchStatus::Completed : FetchStatus::Failed);
}

bool FetchOrchestrator::connect() {
    EventBus& bus = m_state.events();
    try {
        std::shared_future<void> registered = m_client.start();
        if (registered.wait_for(m_timings.connect_timeout) != std::future_status::ready) {
            bus.push(EventType::ConnectionStatus, "unresolved");
            return false;
        }
        registered.get();
        bus.push(EventType::ConnectionStatus, "connected");
        return true;
    } catch (const std::exception& e) {
        bus.push(EventType::ConnectionError, e.what());
        return false;
    }
}

bool FetchOrchestrator::send_request(const std::string& request) {
    EventBus& bus = m_state.events();
    const std::string& channel = m_state.connection().channel;
    try {
        m_client.message(channel, request);
    } catch (const std::exception& e) {
        bus.push(EventType::MessageError, {{"message", request}, {"channel", channel}, {"error", e.what()}});
        return false;
    }
    bus.push(EventType::MessageOut, {{"message", request}, {"channel", channel}});
    return true;
}

json poll_event_data(std::chrono::seconds elapsed, const SessionState& state) {
    json status = nullptr;
    if (auto file = state.accepted_file()) {
        status = file->string();
    }
    return {{"elapsed", elapsed.count()}, {"status", status}};
}

bool FetchOrchestrator::poll_incoming_file_transfer() {
    EventBus& bus = m_state.events();
    for (int n = 0;; ++n) {
        if (m_state.has_accepted_file() || n >= m_timings.max_polls) {
            return true;
        }
        const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(m_timings.poll_interval * n);
        bus.push(EventType::Poll, poll_event_data(elapsed, m_state));
        if (!m_state.wait_for(m_timings.poll_interval, true)) {
            return false;
        }
    }
}

void FetchOrchestrator::quit_server() {
    EventBus& bus = m_state.events();
    try {
        m_client.quit("ircfetch done");
        bus.push(EventType::ServerQuit, "executed");
    } catch (const std::exception& e) {
        bus.push(EventType::CloseError, e.what());
    }
    bus.flush();
}

FetchStatus FetchOrchestrator::finish(FetchStatus status) {
    m_state.advance_fetch_status(status);
    emit_fetch_status();
    quit_server();
    return m_state.fetch_status();
}

void FetchOrchestrator::emit_fetch_status() {
    m_state.events().push(EventType::FetchStatus, to_string(m_state.fetch_status()));
}
