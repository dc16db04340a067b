#ifndef GFAESTUS_ASYNC_RESULT_HPP_INCLUDED
#define GFAESTUS_ASYNC_RESULT_HPP_INCLUDED

/** \file
 * async_result.hpp: a handle for polling a computation running on a thread
 * pool without ever waiting on it.
 */

#include <future>
#include <exception>
#include <memory>
#include <mutex>
#include <atomic>
#include <type_traits>

#include "thread_pool.hpp"

namespace gfaestus {

using namespace std;

/**
 * Result of a task submitted to a ThreadPool. The value can be looked at any
 * number of times once it is ready, and taken out once.
 *
 * Dropping the handle doesn't stop the task; its result is just thrown away
 * when it finishes.
 */
template<typename T>
class AsyncResult {
public:
    /// Wrap a future whose task sets the ready flag when it is done.
    AsyncResult(future<T>&& pending, const shared_ptr<atomic<bool>>& ready);

    AsyncResult(AsyncResult&& other);
    AsyncResult& operator=(AsyncResult&& other) = delete;
    AsyncResult(const AsyncResult& other) = delete;
    AsyncResult& operator=(const AsyncResult& other) = delete;

    /// Has the task finished? Never waits, and once true stays true.
    bool is_ready() const;

    /// Get the result if the task has finished and it hasn't been taken.
    /// Otherwise gets null, without waiting. If the task threw, its exception
    /// comes out of here, every time.
    const T* get_result_if_ready();

    /// Take the result if the task has finished and it hasn't been taken
    /// before. Otherwise gets null, without waiting. If the task threw, its
    /// exception comes out of here, every time.
    unique_ptr<T> take_result_if_ready();

private:
    /// Get the value out of the future if we haven't yet, or rethrow what
    /// the task threw. Caller must hold the lock and know the task is done.
    void materialize();

    future<T> pending;
    shared_ptr<atomic<bool>> ready;
    mutex result_mutex;
    unique_ptr<T> result;
    /// What the task threw, if it did. The future only gives it up once.
    exception_ptr failure;
    bool taken = false;
};

/// Run a function on the pool, and get a handle to poll for its result.
template<typename F>
AsyncResult<invoke_result_t<F>> run_async(ThreadPool& pool, F&& function) {
    typedef invoke_result_t<F> result_t;

    auto ready = make_shared<atomic<bool>>(false);
    future<result_t> pending = pool.submit([function = std::forward<F>(function), ready]() mutable {
        // Flag that we're done on the way out, whether we return or throw
        struct ReadyFlag {
            shared_ptr<atomic<bool>> flag;
            ~ReadyFlag() {
                flag->store(true);
            }
        } ready_flag{ready};
        return function();
    });
    return AsyncResult<result_t>(std::move(pending), ready);
}

template<typename T>
AsyncResult<T>::AsyncResult(future<T>&& pending, const shared_ptr<atomic<bool>>& ready) :
    pending(std::move(pending)), ready(ready) {
    // Nothing to do
}

template<typename T>
AsyncResult<T>::AsyncResult(AsyncResult&& other) {
    lock_guard<mutex> lock(other.result_mutex);
    pending = std::move(other.pending);
    ready = std::move(other.ready);
    result = std::move(other.result);
    failure = other.failure;
    taken = other.taken;
}

template<typename T>
bool AsyncResult<T>::is_ready() const {
    return ready && ready->load();
}

template<typename T>
void AsyncResult<T>::materialize() {
    if (failure) {
        rethrow_exception(failure);
    }
    if (!result && !taken) {
        try {
            // The task is done, so this won't wait for more than the last store.
            result.reset(new T(pending.get()));
        } catch (...) {
            failure = current_exception();
            throw;
        }
    }
}

template<typename T>
const T* AsyncResult<T>::get_result_if_ready() {
    if (!is_ready()) {
        return nullptr;
    }
    lock_guard<mutex> lock(result_mutex);
    if (taken) {
        return nullptr;
    }
    materialize();
    return result.get();
}

template<typename T>
unique_ptr<T> AsyncResult<T>::take_result_if_ready() {
    if (!is_ready()) {
        return nullptr;
    }
    lock_guard<mutex> lock(result_mutex);
    if (taken) {
        return nullptr;
    }
    materialize();
    taken = true;
    return std::move(result);
}

}

#endif
