#ifndef GFAESTUS_CHANNEL_HPP_INCLUDED
#define GFAESTUS_CHANNEL_HPP_INCLUDED

/** \file
 * channel.hpp: a blocking FIFO for passing messages between threads.
 */

#include <deque>
#include <mutex>
#include <condition_variable>
#include <limits>
#include <cstddef>

namespace gfaestus {

using namespace std;

/**
 * A thread-safe FIFO channel that can be closed.
 *
 * With a capacity of 0 it is a rendezvous channel: send() doesn't return
 * until a receiver has taken the item. Otherwise send() blocks only while the
 * channel is full.
 *
 * After close(), sends fail. Receivers still get whatever was queued on a
 * buffered channel, but anything waiting on a rendezvous channel is dropped.
 */
template<typename T>
class Channel {
public:

    static const size_t UNBOUNDED = numeric_limits<size_t>::max();

    Channel(size_t capacity = UNBOUNDED) : capacity(capacity) {}

    Channel(const Channel& other) = delete;
    Channel& operator=(const Channel& other) = delete;

    /// Send an item. Returns false, and the item is lost, if the channel is
    /// closed before the item is accepted.
    bool send(T&& item);

    /// Receive an item, waiting for one if need be. Returns false once the
    /// channel is closed and has nothing left to give.
    bool recv(T& item);

    /// Receive an item if one is available right now.
    bool try_recv(T& item);

    /// Close the channel and wake everyone waiting on it.
    void close();

    bool is_closed() const;

    /// Number of items sent but not yet received.
    size_t size() const;

private:
    mutable mutex channel_mutex;
    condition_variable not_empty;
    condition_variable not_full;
    condition_variable taken;
    deque<T> items;
    size_t capacity;
    bool closed = false;
    /// Tickets for rendezvous: how many items have ever gone in and out.
    size_t sent_count = 0;
    size_t received_count = 0;
};

template<typename T>
const size_t Channel<T>::UNBOUNDED;

template<typename T>
bool Channel<T>::send(T&& item) {
    unique_lock<mutex> lock(channel_mutex);
    // A rendezvous channel still needs a slot to hand the item over in.
    size_t slots = capacity == 0 ? 1 : capacity;
    not_full.wait(lock, [&]() {
        return closed || items.size() < slots;
    });
    if (closed) {
        return false;
    }
    items.emplace_back(std::move(item));
    size_t ticket = ++sent_count;
    not_empty.notify_one();

    if (capacity == 0) {
        taken.wait(lock, [&]() {
            return closed || received_count >= ticket;
        });
        return received_count >= ticket;
    }
    return true;
}

template<typename T>
bool Channel<T>::recv(T& item) {
    unique_lock<mutex> lock(channel_mutex);
    not_empty.wait(lock, [&]() {
        return closed || !items.empty();
    });
    if (items.empty()) {
        // Closed and drained
        return false;
    }
    item = std::move(items.front());
    items.pop_front();
    received_count++;
    not_full.notify_one();
    taken.notify_all();
    return true;
}

template<typename T>
bool Channel<T>::try_recv(T& item) {
    lock_guard<mutex> lock(channel_mutex);
    if (items.empty()) {
        return false;
    }
    item = std::move(items.front());
    items.pop_front();
    received_count++;
    not_full.notify_one();
    taken.notify_all();
    return true;
}

template<typename T>
void Channel<T>::close() {
    {
        lock_guard<mutex> lock(channel_mutex);
        closed = true;
        if (capacity == 0) {
            // Nobody will take these now
            items.clear();
        }
    }
    not_empty.notify_all();
    not_full.notify_all();
    taken.notify_all();
}

template<typename T>
bool Channel<T>::is_closed() const {
    lock_guard<mutex> lock(channel_mutex);
    return closed;
}

template<typename T>
size_t Channel<T>::size() const {
    lock_guard<mutex> lock(channel_mutex);
    return items.size();
}

}

#endif
