#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <string_view>
#include <thread>

using json = nlohmann::json;

struct Event {
    std::string type;
    json data;
};

// "Type: <type>, Data: <data>". Strings print raw, null prints nil.
std::string render(const Event& event);

// Multi-producer, single-consumer queue of events. The consumer runs on its
// own thread for the lifetime of the bus and sees events in one total order
// that respects each producer's push order.
//
// The queue holds at most capacity events. push() returns at once while there
// is room; on a full queue it waits for the consumer to take one. Events are
// never dropped. Pushes from the consumer thread, and pushes made before a
// subscriber exists, are never made to wait.
class EventBus {
   public:
    using Handler = std::function<void(const Event&)>;

    static constexpr std::size_t DEFAULT_CAPACITY = 1024;

    explicit EventBus(std::size_t capacity = DEFAULT_CAPACITY) : m_capacity(capacity == 0 ? 1 : capacity) {}
    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;
    ~EventBus();

    void push(Event event);
    void push(std::string_view type, json data) { push(Event{std::string(type), std::move(data)}); }

    // Starts the consumer thread. Only one subscriber is allowed.
    void subscribe(Handler handler);

    // Blocks until everything pushed before the call has been consumed.
    void flush();

    // Delivers whatever is still queued, then stops the consumer.
    void close();

   private:
    void consume();

    const std::size_t m_capacity;
    std::mutex m_mutex;
    std::condition_variable m_ready;
    std::condition_variable m_space;
    std::condition_variable m_drained;
    std::deque<Event> m_queue;
    uint64_t m_pushed = 0;
    uint64_t m_delivered = 0;
    bool m_closed = false;
    Handler m_handler;
    std::thread m_consumer;
};

class EventLogger {
   public:
    explicit EventLogger(std::ostream& out) : m_out(out) {}
    void operator()(const Event& event) { m_out << render(event) << std::endl; }

   private:
    std::ostream& m_out;
};
