#ifndef GFAESTUS_THREAD_POOL_HPP_INCLUDED
#define GFAESTUS_THREAD_POOL_HPP_INCLUDED

/** \file
 * thread_pool.hpp: a fixed set of worker threads running queued tasks.
 */

#include <vector>
#include <thread>
#include <future>
#include <functional>
#include <memory>
#include <type_traits>
#include <stdexcept>

#include "channel.hpp"

namespace gfaestus {

using namespace std;

/**
 * Runs submitted tasks on a fixed number of threads, in the order they were
 * submitted. The queue of waiting tasks is unbounded. Destroying the pool
 * lets the queued tasks finish, then joins the threads.
 */
class ThreadPool {
public:
    /// Start the given number of threads. 0 is taken as 1.
    ThreadPool(size_t thread_count);
    ~ThreadPool();

    ThreadPool(const ThreadPool& other) = delete;
    ThreadPool& operator=(const ThreadPool& other) = delete;

    /// Queue up a task, and get a future for what it returns. Throws
    /// runtime_error if the pool is shutting down.
    template<typename F>
    future<invoke_result_t<F>> submit(F&& task);

    size_t thread_count() const;

private:
    void worker_loop();

    vector<thread> workers;
    Channel<function<void()>> tasks;
};

template<typename F>
future<invoke_result_t<F>> ThreadPool::submit(F&& task) {
    typedef invoke_result_t<F> result_t;

    // function needs something copyable, so share the packaged task.
    auto packaged = make_shared<packaged_task<result_t()>>(std::forward<F>(task));
    future<result_t> result = packaged->get_future();

    if (!tasks.send([packaged]() { (*packaged)(); })) {
        throw runtime_error("cannot submit to a thread pool that is shutting down");
    }

    return result;
}

}

#endif
