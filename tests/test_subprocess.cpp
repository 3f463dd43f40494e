#include <catch2/catch_test_macros.hpp>

#include "platform/linux/subprocess.hpp"

#include <csignal>
#include <pthread.h>
#include <string>

TEST_CASE("run_process", "[platform][subprocess]") {
    SECTION("feeds stdin and captures stdout") {
        auto res = platform::run_process({"cat"}, "hello world", true);
        REQUIRE(res.has_value());
        CHECK(res->exit_code == 0);
        CHECK(res->output == "hello world");
        CHECK(res->input_consumed);
    }

    SECTION("child exiting without reading stdin does not kill the caller") {
        // Larger than a pipe buffer, so the write must hit a closed reader.
        std::string big(1 << 20, 'x');
        auto res = platform::run_process({"sh", "-c", "exit 1"}, big);
        REQUIRE(res.has_value());
        CHECK(res->exit_code == 1);
        CHECK_FALSE(res->input_consumed);
    }

    SECTION("leaves the caller's signal mask as it found it") {
        sigset_t before, after;
        pthread_sigmask(SIG_SETMASK, nullptr, &before);
        auto res = platform::run_process({"sh", "-c", "exit 0"}, std::string(1 << 20, 'x'));
        REQUIRE(res.has_value());
        pthread_sigmask(SIG_SETMASK, nullptr, &after);
        CHECK(sigismember(&before, SIGPIPE) == sigismember(&after, SIGPIPE));

        sigset_t pending;
        sigpending(&pending);
        CHECK_FALSE(sigismember(&pending, SIGPIPE));
    }

    SECTION("child does not inherit blocked signals") {
        sigset_t block, old;
        sigemptyset(&block);
        sigaddset(&block, SIGINT);
        pthread_sigmask(SIG_BLOCK, &block, &old);
        auto res = platform::run_process(
            {"sh", "-c", "grep SigBlk /proc/self/status"}, {}, true);
        pthread_sigmask(SIG_SETMASK, &old, nullptr);

        REQUIRE(res.has_value());
        CHECK(res->output.find("0000000000000000") != std::string::npos);
    }

    SECTION("missing binary is an error") {
        auto res = platform::run_process({"holdtalk-no-such-binary"});
        REQUIRE_FALSE(res.has_value());
        CHECK(res.error() == "holdtalk-no-such-binary not found");
    }

    SECTION("empty command is an error") {
        CHECK_FALSE(platform::run_process({}).has_value());
    }
}
