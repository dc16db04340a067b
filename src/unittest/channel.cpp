/// \file unittest/channel.cpp
///
/// Unit tests for Channel, ThreadPool and AsyncResult.
///

#include <iostream>
#include <string>
#include <vector>
#include <set>
#include <future>
#include <thread>
#include <chrono>
#include <atomic>
#include <stdexcept>

#include "../channel.hpp"
#include "../thread_pool.hpp"
#include "../async_result.hpp"

#include <catch2/catch.hpp>

namespace gfaestus {
namespace unittest {
using namespace std;

TEST_CASE("Buffered channels pass items in order", "[channel]") {

    Channel<int> channel(3);
    REQUIRE(channel.send(1));
    REQUIRE(channel.send(2));
    REQUIRE(channel.size() == 2);

    int item = 0;
    REQUIRE(channel.recv(item));
    REQUIRE(item == 1);

    SECTION("Closing stops sends but lets the queue drain") {
        channel.close();
        REQUIRE(channel.is_closed());
        REQUIRE(!channel.send(3));
        REQUIRE(channel.recv(item));
        REQUIRE(item == 2);
        REQUIRE(!channel.recv(item));
        REQUIRE(!channel.try_recv(item));
    }

    SECTION("Receiving without waiting only works when something is there") {
        REQUIRE(channel.try_recv(item));
        REQUIRE(item == 2);
        REQUIRE(!channel.try_recv(item));
    }

    SECTION("A full channel makes senders wait for room") {
        REQUIRE(channel.send(3));
        REQUIRE(channel.send(4));
        atomic<bool> sent(false);
        thread sender([&]() {
            channel.send(5);
            sent.store(true);
        });
        this_thread::sleep_for(chrono::milliseconds(50));
        REQUIRE(!sent.load());
        REQUIRE(channel.recv(item));
        sender.join();
        REQUIRE(sent.load());
        REQUIRE(channel.size() == 3);
    }
}

TEST_CASE("Rendezvous channels hand items over directly", "[channel]") {

    Channel<string> channel(0);

    SECTION("Send waits until the item is received") {
        atomic<bool> sent(false);
        bool result = false;
        thread sender([&]() {
            result = channel.send("hello");
            sent.store(true);
        });
        this_thread::sleep_for(chrono::milliseconds(50));
        REQUIRE(!sent.load());

        string item;
        REQUIRE(channel.recv(item));
        REQUIRE(item == "hello");
        sender.join();
        REQUIRE(sent.load());
        REQUIRE(result);
    }

    SECTION("Closing fails a waiting send") {
        bool result = true;
        thread sender([&]() {
            result = channel.send("lost");
        });
        this_thread::sleep_for(chrono::milliseconds(50));
        channel.close();
        sender.join();
        REQUIRE(!result);
        string item;
        REQUIRE(!channel.recv(item));
    }

    SECTION("Closing wakes a waiting receiver") {
        bool result = true;
        thread receiver([&]() {
            string item;
            result = channel.recv(item);
        });
        this_thread::sleep_for(chrono::milliseconds(50));
        channel.close();
        receiver.join();
        REQUIRE(!result);
    }

    SECTION("Many senders each get their item through") {
        vector<thread> senders;
        for (size_t i = 0; i < 8; i++) {
            senders.emplace_back([&channel, i]() {
                channel.send(to_string(i));
            });
        }
        set<string> received;
        for (size_t i = 0; i < 8; i++) {
            string item;
            REQUIRE(channel.recv(item));
            received.insert(item);
        }
        for (auto& sender : senders) {
            sender.join();
        }
        REQUIRE(received.size() == 8);
    }
}

TEST_CASE("ThreadPool runs submitted tasks", "[threadpool]") {

    ThreadPool pool(4);
    REQUIRE(pool.thread_count() == 4);

    SECTION("Results come back through futures") {
        vector<future<size_t>> results;
        for (size_t i = 0; i < 100; i++) {
            results.push_back(pool.submit([i]() {
                return i * i;
            }));
        }
        for (size_t i = 0; i < 100; i++) {
            REQUIRE(results[i].get() == i * i);
        }
    }

    SECTION("Exceptions come back through futures") {
        auto result = pool.submit([]() -> int {
            throw runtime_error("task failed");
        });
        REQUIRE_THROWS_AS(result.get(), runtime_error);
    }

    SECTION("A pool of no threads gets one") {
        ThreadPool small(0);
        REQUIRE(small.thread_count() == 1);
        REQUIRE(small.submit([]() { return 7; }).get() == 7);
    }
}

TEST_CASE("ThreadPool finishes queued tasks before it goes away", "[threadpool]") {
    atomic<size_t> done(0);
    {
        ThreadPool pool(2);
        for (size_t i = 0; i < 20; i++) {
            pool.submit([&done]() {
                this_thread::sleep_for(chrono::milliseconds(1));
                done++;
            });
        }
    }
    REQUIRE(done.load() == 20);
}

TEST_CASE("AsyncResult can be polled without waiting", "[async]") {

    ThreadPool pool(2);

    SECTION("The result shows up once and can be taken once") {
        promise<void> go;
        shared_future<void> started = go.get_future().share();
        auto result = run_async(pool, [started]() {
            started.wait();
            return 42;
        });

        REQUIRE(!result.is_ready());
        REQUIRE(result.get_result_if_ready() == nullptr);
        REQUIRE(result.take_result_if_ready() == nullptr);

        go.set_value();
        while (!result.is_ready()) {
            this_thread::yield();
        }
        REQUIRE(result.is_ready());

        const int* peek = result.get_result_if_ready();
        REQUIRE(peek != nullptr);
        REQUIRE(*peek == 42);
        REQUIRE(*result.get_result_if_ready() == 42);

        unique_ptr<int> taken = result.take_result_if_ready();
        REQUIRE(taken);
        REQUIRE(*taken == 42);

        for (size_t i = 0; i < 3; i++) {
            REQUIRE(result.is_ready());
            REQUIRE(result.take_result_if_ready() == nullptr);
            REQUIRE(result.get_result_if_ready() == nullptr);
        }
    }

    SECTION("Results can be taken without looking first") {
        auto result = run_async(pool, []() {
            return string("done");
        });
        unique_ptr<string> taken;
        while (!taken) {
            taken = result.take_result_if_ready();
            this_thread::yield();
        }
        REQUIRE(*taken == "done");
        REQUIRE(result.take_result_if_ready() == nullptr);
    }

    SECTION("Handles can be moved") {
        auto result = run_async(pool, []() {
            return 5;
        });
        vector<AsyncResult<int>> results;
        results.push_back(std::move(result));
        while (!results[0].is_ready()) {
            this_thread::yield();
        }
        REQUIRE(*results[0].take_result_if_ready() == 5);
    }

    SECTION("Exceptions come out when the result is looked at") {
        auto result = run_async(pool, []() -> int {
            throw runtime_error("no result");
        });
        while (!result.is_ready()) {
            this_thread::yield();
        }
        REQUIRE_THROWS_WITH(result.get_result_if_ready(), "no result");
        REQUIRE_THROWS_WITH(result.get_result_if_ready(), "no result");
        REQUIRE_THROWS_AS(result.get_result_if_ready(), runtime_error);
        REQUIRE_THROWS_WITH(result.take_result_if_ready(), "no result");
        REQUIRE_THROWS_AS(result.take_result_if_ready(), runtime_error);
        REQUIRE(result.is_ready());
    }
}

}
}
