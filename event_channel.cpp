#include "event_channel.h"

using namespace std;

void EventChannel::send(const Event& ev) {
    {
        lock_guard<mutex> lock(mutex_);
        queue_.push_back(ev);
    }
    ready_.notify_one();
}

Event EventChannel::receive() {
    unique_lock<mutex> lock(mutex_);
    ready_.wait(lock, [this] { return !queue_.empty() || producers_ == 0; });
    if (queue_.empty()) throw ChannelClosed();

    Event ev = queue_.front();
    queue_.pop_front();
    return ev;
}

bool EventChannel::tryReceive(Event& out) {
    lock_guard<mutex> lock(mutex_);
    if (queue_.empty()) return false;
    out = queue_.front();
    queue_.pop_front();
    return true;
}

void EventChannel::addProducer() {
    lock_guard<mutex> lock(mutex_);
    producers_++;
}

void EventChannel::removeProducer() {
    {
        lock_guard<mutex> lock(mutex_);
        if (producers_ > 0) producers_--;
    }
    // wake the consumer so it can notice the channel closing
    ready_.notify_all();
}

size_t EventChannel::pending() const {
    lock_guard<mutex> lock(mutex_);
    return queue_.size();
}

EventSender::EventSender(shared_ptr<EventChannel> channel)
    : channel_(move(channel)) {
    channel_->addProducer();
}

EventSender::EventSender(const EventSender& other)
    : channel_(other.channel_) {
    if (channel_) channel_->addProducer();
}

EventSender::EventSender(EventSender&& other) noexcept
    : channel_(move(other.channel_)) {}

EventSender::~EventSender() {
    if (channel_) channel_->removeProducer();
}
