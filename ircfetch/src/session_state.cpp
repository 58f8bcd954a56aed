#include "session_state.hpp"

std::string to_string(FetchStatus status) {
    switch (status) {
        case FetchStatus::Initialising:
            return "initialising";
        case FetchStatus::Fetching:
            return "fetching";
        case FetchStatus::Completed:
            return "completed";
        case FetchStatus::Failed:
            return "failed";
    }
    return "unknown";
}

void SessionState::advance_fetch_status(FetchStatus status) {
    FetchStatus current = m_status.load();
    while (static_cast<int>(status) > static_cast<int>(current) &&
           !m_status.compare_exchange_weak(current, status)) {
    }
}

std::optional<fs::path> SessionState::accepted_file() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_accepted_file;
}

bool SessionState::record_accepted_file(const fs::path& file) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_accepted_file) return false;
        m_accepted_file = file;
    }
    m_wakeup.notify_all();
    return true;
}

void SessionState::cancel() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancelled = true;
    }
    m_wakeup.notify_all();
}

bool SessionState::cancelled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cancelled;
}

bool SessionState::wait_for(std::chrono::milliseconds duration, bool wake_on_accept) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_wakeup.wait_for(lock, duration,
                      [this, wake_on_accept] { return m_cancelled || (wake_on_accept && m_accepted_file); });
    return !m_cancelled;
}
