#include <catch2/catch_test_macros.hpp>
#include "hostmon/cancellation.hpp"
#include <signal.h>
#include <unistd.h>

using namespace std::chrono_literals;

TEST_CASE("CancellationToken wakes a waiting loop", "[cancel]") {
    SECTION("Wait times out when nobody cancels") {
        hostmon::CancellationToken token;
        REQUIRE_FALSE(token.wait_for(10ms));
        REQUIRE_FALSE(token.cancelled());
    }

    SECTION("Cancel from another thread interrupts the wait") {
        hostmon::CancellationToken token;
        std::thread canceller([&token] {
            std::this_thread::sleep_for(20ms);
            token.cancel();
        });

        auto start = std::chrono::steady_clock::now();
        REQUIRE(token.wait_for(10s));
        REQUIRE(std::chrono::steady_clock::now() - start < 5s);
        canceller.join();
        REQUIRE(token.cancelled());
    }

    SECTION("Already cancelled returns immediately") {
        hostmon::CancellationToken token;
        token.cancel();
        REQUIRE(token.wait_for(0ms));
    }
}

TEST_CASE("SignalWatcher turns SIGTERM into cancellation", "[cancel]") {
    hostmon::CancellationToken token;

    SECTION("Delivered signal cancels the token") {
        hostmon::SignalWatcher watcher(token);
        REQUIRE(::kill(::getpid(), SIGTERM) == 0);
        REQUIRE(token.wait_for(5s));
        REQUIRE(watcher.received() == SIGTERM);
    }

    SECTION("Teardown without a signal leaves the token alone") {
        {
            hostmon::SignalWatcher watcher(token);
            REQUIRE(watcher.received() == 0);
        }
        REQUIRE_FALSE(token.cancelled());
    }

    SECTION("A second signal pending at teardown is discarded") {
        {
            hostmon::SignalWatcher watcher(token);
            REQUIRE(::kill(::getpid(), SIGTERM) == 0);
            REQUIRE(token.wait_for(5s));

            // The watcher thread has finished; this one stays pending
            REQUIRE(::kill(::getpid(), SIGINT) == 0);
        }

        sigset_t pending;
        sigemptyset(&pending);
        REQUIRE(sigpending(&pending) == 0);
        REQUIRE_FALSE(sigismember(&pending, SIGINT));
        REQUIRE_FALSE(sigismember(&pending, SIGTERM));
    }
}
