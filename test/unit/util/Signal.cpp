#include "util/Signal.hpp"

#include "coro_test.hpp"

#include <gtest/gtest.h>

namespace
{

TEST(Signal, WaitNotify)
{
    IOContext ioc;
    Signal signal(ioc);
    bool fired = false;

    // The wait happens first (this relies on boost::asio::co_spawn forming an in-order queue), so the notifyAll should
    // unblock the wait.
    testCoSpawn([&signal, &fired]() -> Awaitable<void> {
        co_await signal.wait();
        fired = true;
    }, ioc);
    testCoSpawn([&signal]() -> Awaitable<void> {
        EXPECT_TRUE(signal.hasWaiters());
        signal.notifyAll();
        co_return;
    }, ioc);

    ioc.poll();
    EXPECT_TRUE(fired);
    EXPECT_FALSE(signal.hasWaiters());
}

TEST(Signal, WaitOnly)
{
    IOContext ioc;
    Signal signal(ioc);
    bool fired = false;

    testCoSpawn([&signal, &fired]() -> Awaitable<void> {
        co_await signal.wait();
        fired = true;
    }, ioc);

    ioc.poll();
    EXPECT_FALSE(fired);

    // Let the waiter go, so nothing's left suspended on the timer.
    signal.notifyAll();
    ioc.poll();
    EXPECT_TRUE(fired);
}

TEST(Signal, NotifyWait)
{
    IOContext ioc;
    Signal signal(ioc);
    bool fired = false;

    // The notifyAll happens first, so the wait should be waiting for a new notifyAll.
    testCoSpawn([&signal]() -> Awaitable<void> {
        signal.notifyAll();
        co_return;
    }, ioc);
    testCoSpawn([&signal, &fired]() -> Awaitable<void> {
        co_await signal.wait();
        fired = true;
    }, ioc);

    ioc.poll();
    EXPECT_FALSE(fired);

    signal.notifyAll();
    ioc.poll();
    EXPECT_TRUE(fired);
}

TEST(Signal, ManyWaiters)
{
    IOContext ioc;
    Signal signal(ioc);
    int fired = 0;

    for (int i = 0; i < 3; i++) {
        testCoSpawn([&signal, &fired]() -> Awaitable<void> {
            co_await signal.wait();
            fired++;
        }, ioc);
    }
    ioc.poll();
    EXPECT_EQ(0, fired);

    signal.notifyAll();
    ioc.poll();
    EXPECT_EQ(3, fired);
}

} // namespace
