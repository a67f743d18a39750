#include <catch2/catch_test_macros.hpp>

#include <toolmux/core/deadline.hpp>

#include <chrono>
#include <thread>

using namespace toolmux;
using namespace std::chrono_literals;

// ===========================================================================
// Deadline
// ===========================================================================

TEST_CASE("Deadline: fresh deadline is not expired", "[core][deadline]") {
    auto deadline = Deadline::AfterSeconds(10);
    CHECK_FALSE(deadline.Expired());
    CHECK_FALSE(deadline.IsCancelled());
    CHECK(deadline.Remaining() > 9s);
    CHECK(deadline.NextSlice() == Deadline::kPollSlice);
}

TEST_CASE("Deadline: expires after its budget", "[core][deadline]") {
    auto deadline = Deadline::After(20ms);
    std::this_thread::sleep_for(40ms);
    CHECK(deadline.Expired());
    CHECK(deadline.Remaining() == 0ms);
    CHECK(deadline.NextSlice() == 0ms);
}

TEST_CASE("Deadline: zero budget is already expired", "[core][deadline]") {
    CHECK(Deadline::After(0ms).Expired());
}

TEST_CASE("Deadline: cancel is shared between copies", "[core][deadline]") {
    auto original = Deadline::AfterSeconds(60);
    auto copy = original;
    copy.Cancel();
    CHECK(original.IsCancelled());
    CHECK(original.Expired());
    CHECK(original.Remaining() == 0ms);
}

TEST_CASE("Deadline: separate deadlines do not share cancel", "[core][deadline]") {
    auto a = Deadline::AfterSeconds(60);
    auto b = Deadline::AfterSeconds(60);
    a.Cancel();
    CHECK_FALSE(b.Expired());
}

TEST_CASE("Deadline: cancel from another thread is observed", "[core][deadline]") {
    auto deadline = Deadline::AfterSeconds(60);
    std::thread canceller([deadline] {
        std::this_thread::sleep_for(20ms);
        deadline.Cancel();
    });
    auto started = Deadline::Clock::now();
    while (!deadline.Expired() && Deadline::Clock::now() - started < 5s) {
        std::this_thread::sleep_for(deadline.NextSlice());
    }
    canceller.join();
    CHECK(deadline.IsCancelled());
}
