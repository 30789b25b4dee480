#pragma once

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <stdexcept>

#include "event.h"

class ChannelClosed : public std::runtime_error {
public:
    ChannelClosed() : std::runtime_error("event channel closed: all producers stopped") {}
};

// Multi-producer, single-consumer FIFO. Events come out in the order their
// send() calls completed.
class EventChannel {
public:
    EventChannel() = default;
    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    void send(const Event& ev);

    // Blocks until an event is available. Throws ChannelClosed once every
    // registered producer is gone and nothing is pending.
    Event receive();

    void addProducer();
    void removeProducer();

    // Test hooks for draining and counting the queue without blocking.
    bool tryReceive(Event& out);
    size_t pending() const;

private:
    mutable std::mutex      mutex_;
    std::condition_variable ready_;
    std::deque<Event>       queue_;
    int                     producers_ = 0;
};

// Producer-side handle. Each live sender counts as one registered producer;
// the channel closes when the last one is destroyed.
class EventSender {
public:
    explicit EventSender(std::shared_ptr<EventChannel> channel);
    EventSender(const EventSender& other);
    EventSender(EventSender&& other) noexcept;
    ~EventSender();

    EventSender& operator=(const EventSender&) = delete;
    EventSender& operator=(EventSender&&) = delete;

    void send(const Event& ev) const { channel_->send(ev); }

private:
    std::shared_ptr<EventChannel> channel_;
};
