#include "session_pool.hpp"

SessionPool::SessionPool(ChannelFactory& factory) : factory(factory) {}

SessionPool::~SessionPool() {
    drain();
}

std::size_t SessionPool::probe(std::size_t ceiling) {
    std::deque<std::unique_ptr<CommandChannel>> opened;
    while (opened.size() < ceiling) {
        auto channel = factory.openChannel();
        if (!channel) {
            break;
        }
        opened.push_back(std::move(*channel));
    }

    std::lock_guard<std::mutex> lock(mutex);
    capacity_ = opened.size();
    idle = std::move(opened);
    return capacity_;
}

std::expected<std::unique_ptr<CommandChannel>, std::string> SessionPool::acquire() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!idle.empty()) {
            auto channel = std::move(idle.front());
            idle.pop_front();
            return channel;
        }
    }
    return factory.openChannel();
}

void SessionPool::release(std::unique_ptr<CommandChannel> channel) {
    if (!channel) {
        return;
    }
    std::unique_lock<std::mutex> lock(mutex);
    if (!channel->consumed() && idle.size() < capacity_) {
        idle.push_back(std::move(channel));
        return;
    }
    lock.unlock();
    channel.reset();
}

void SessionPool::drain() {
    std::deque<std::unique_ptr<CommandChannel>> closing;
    {
        std::lock_guard<std::mutex> lock(mutex);
        closing.swap(idle);
    }
    closing.clear();
}

std::size_t SessionPool::capacity() const {
    std::lock_guard<std::mutex> lock(mutex);
    return capacity_;
}

std::size_t SessionPool::available() const {
    std::lock_guard<std::mutex> lock(mutex);
    return idle.size();
}
