#include "thread_pool.hpp"

#include <iostream>

//#define debug

namespace gfaestus {

using namespace std;

ThreadPool::ThreadPool(size_t thread_count) {
    if (thread_count == 0) {
        thread_count = 1;
    }
    for (size_t i = 0; i < thread_count; i++) {
        workers.emplace_back([this]() {
            worker_loop();
        });
    }
}

ThreadPool::~ThreadPool() {
    tasks.close();
    for (auto& worker : workers) {
        worker.join();
    }
}

size_t ThreadPool::thread_count() const {
    return workers.size();
}

void ThreadPool::worker_loop() {
    function<void()> task;
    while (tasks.recv(task)) {
        // Exceptions are caught by the packaged task and go to its future.
        task();
#ifdef debug
        cerr << "Thread " << this_thread::get_id() << " finished a task" << endl;
#endif
    }
}

}
