#include <catch2/catch_test_macros.hpp>

#include "pipeline/work_pool.hpp"
#include "platform/linux/eventfd_dispatcher.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

TEST_CASE("WorkPool", "[pipeline][pool]") {
    Logger log(LogLevel::Critical);

    SECTION("RunsEverySubmittedJob") {
        std::atomic<int> done{0};
        WorkPool pool(3, log);
        for (int i = 0; i < 100; ++i) {
            REQUIRE(pool.submit([&] { ++done; }));
        }
        pool.shutdown();
        REQUIRE(done == 100);
        REQUIRE(pool.pending() == 0);
    }

    SECTION("JobsRunOffTheCallerThread") {
        std::thread::id ran_on;
        WorkPool pool(1, log);
        pool.submit([&] { ran_on = std::this_thread::get_id(); });
        pool.shutdown();
        REQUIRE(ran_on != std::thread::id{});
        REQUIRE(ran_on != std::this_thread::get_id());
    }

    SECTION("ThrowingJobDoesNotKillWorker") {
        std::atomic<int> done{0};
        WorkPool pool(1, log);
        pool.submit([] { throw std::runtime_error("boom"); });
        pool.submit([&] { ++done; });
        pool.shutdown();
        REQUIRE(done == 1);
    }

    SECTION("SubmitAfterShutdownIsRejected") {
        WorkPool pool(1, log);
        pool.shutdown();
        REQUIRE_FALSE(pool.submit([] {}));
        pool.shutdown(); // idempotent
    }

    SECTION("LongJobDoesNotBlockOthers") {
        std::atomic<bool> release{false};
        std::atomic<int> quick{0};
        WorkPool pool(2, log);
        pool.submit([&] {
            while (!release) std::this_thread::sleep_for(1ms);
        });
        pool.submit([&] { ++quick; });

        for (int i = 0; i < 1000 && quick == 0; ++i) std::this_thread::sleep_for(1ms);
        REQUIRE(quick == 1);
        release = true;
        pool.shutdown();
    }
}

TEST_CASE("EventFdDispatcher", "[pipeline][dispatcher]") {
    EventFdDispatcher dispatcher;
    REQUIRE(dispatcher.init());
    REQUIRE(dispatcher.fd() >= 0);

    SECTION("InvokeOnOwnerThreadRunsInline") {
        bool ran = false;
        dispatcher.invoke([&] { ran = true; });
        REQUIRE(ran);
    }

    SECTION("InvokeFromWorkerRunsOnOwner") {
        std::thread::id ran_on;
        std::atomic<bool> finished{false};
        std::jthread worker([&] {
            dispatcher.invoke([&] { ran_on = std::this_thread::get_id(); });
            finished = true;
        });

        // Stand in for the epoll loop.
        while (!finished) {
            dispatcher.run_pending();
            std::this_thread::sleep_for(1ms);
        }
        worker.join();
        REQUIRE(ran_on == std::this_thread::get_id());
    }

    SECTION("InvokeRethrowsInCaller") {
        std::atomic<bool> caught{false};
        std::atomic<bool> finished{false};
        std::jthread worker([&] {
            try {
                dispatcher.invoke([] { throw std::runtime_error("clipboard gone"); });
            } catch (const std::runtime_error&) {
                caught = true;
            }
            finished = true;
        });
        while (!finished) {
            dispatcher.run_pending();
            std::this_thread::sleep_for(1ms);
        }
        REQUIRE(caught);
    }

    SECTION("PostQueuesUntilRun") {
        int count = 0;
        dispatcher.post([&] { ++count; });
        dispatcher.post([&] { ++count; });
        REQUIRE(count == 0);
        dispatcher.run_pending();
        REQUIRE(count == 2);
    }

    SECTION("CloseRunsQueuedAndGoesInline") {
        int count = 0;
        dispatcher.post([&] { ++count; });
        dispatcher.close();
        REQUIRE(count == 1);

        std::jthread worker([&] { dispatcher.invoke([&] { ++count; }); });
        worker.join();
        REQUIRE(count == 2);
    }
}
