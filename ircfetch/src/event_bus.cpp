#include "event_bus.hpp"

#include <iostream>
#include <stdexcept>

std::string render(const Event& event) {
    std::string data;
    if (event.data.is_string()) {
        data = event.data.get<std::string>();
    } else if (event.data.is_null()) {
        data = "nil";
    } else {
        data = event.data.dump();
    }
    return "Type: " + event.type + ", Data: " + data;
}

EventBus::~EventBus() { close(); }

void EventBus::push(Event event) {
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (!m_closed && m_consumer.joinable() && m_consumer.get_id() != std::this_thread::get_id()) {
            m_space.wait(lock, [this] { return m_closed || m_queue.size() < m_capacity; });
        }
        if (m_closed) {
            std::cerr << "Event after close: " << render(event) << std::endl;
            return;
        }
        m_queue.push_back(std::move(event));
        ++m_pushed;
    }
    m_ready.notify_one();
}

void EventBus::subscribe(Handler handler) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_consumer.joinable()) {
        throw std::logic_error("EventBus already has a subscriber");
    }
    if (m_closed) {
        throw std::logic_error("EventBus is closed");
    }
    m_handler = std::move(handler);
    m_consumer = std::thread(&EventBus::consume, this);
}

void EventBus::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_consumer.joinable()) return;
    const uint64_t target = m_pushed;
    m_drained.wait(lock, [this, target] { return m_delivered >= target; });
}

void EventBus::close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }
    m_ready.notify_all();
    m_space.notify_all();
    if (m_consumer.joinable() && m_consumer.get_id() != std::this_thread::get_id()) {
        m_consumer.join();
    }
}

void EventBus::consume() {
    std::unique_lock<std::mutex> lock(m_mutex);
    while (true) {
        m_ready.wait(lock, [this] { return m_closed || !m_queue.empty(); });
        if (m_queue.empty()) break;  // closed and drained

        Event event = std::move(m_queue.front());
        m_queue.pop_front();
        m_space.notify_one();
        lock.unlock();
        try {
            m_handler(event);
        } catch (const std::exception& e) {
            std::cerr << "Event handler failed on '" << event.type << "': " << e.what() << std::endl;
        }
        lock.lock();
        ++m_delivered;
        m_drained.notify_all();
    }
}
