// =================================================================
// tests/EventLoopTest.cpp
// =================================================================
// Unit tests for EventLoop.

#include "Sieve/EventLoop.hpp"
#include <iostream>
#include <string>
#include <vector>
#include <cassert>

using namespace Sieve;
using std::chrono::milliseconds;

class EventLoopTest {
public:
    void testPostOrder() {
        std::cout << "Testing task order..." << std::endl;

        EventLoop loop(true);
        std::vector<std::string> order;
        loop.post([&order]() { order.push_back("a"); });
        loop.post([&order, &loop]() {
            order.push_back("b");
            loop.post([&order]() { order.push_back("d"); });
        });
        loop.post([&order]() { order.push_back("c"); });

        assert(loop.pendingCount() == 3);
        assert(loop.runPending() == 4);
        assert((order == std::vector<std::string>{"a", "b", "c", "d"}));
        assert(!loop.hasPending());

        std::cout << "✓ Task order test passed" << std::endl;
    }

    void testTimersOnManualClock() {
        std::cout << "Testing manual clock timers..." << std::endl;

        EventLoop loop(true);
        std::vector<int> fired;
        loop.schedule(milliseconds(300), [&fired]() { fired.push_back(300); });
        loop.schedule(milliseconds(100), [&fired]() { fired.push_back(100); });
        loop.schedule(milliseconds(100), [&fired]() { fired.push_back(101); });

        assert(loop.runPending() == 0);
        assert(loop.timeUntilNext() == milliseconds(100));

        assert(loop.advance(milliseconds(99)) == 0);
        assert(loop.advance(milliseconds(1)) == 2);
        assert((fired == std::vector<int>{100, 101}));

        assert(loop.runUntilIdle() == 1);
        assert(fired.back() == 300);
        assert(loop.now() == EventLoop::Clock::time_point{} + milliseconds(300));

        std::cout << "✓ Manual clock timer test passed" << std::endl;
    }

    void testCancel() {
        std::cout << "Testing cancel..." << std::endl;

        EventLoop loop(true);
        bool ran = false;
        EventLoop::TimerId id = loop.schedule(milliseconds(50), [&ran]() { ran = true; });

        assert(loop.cancel(id));
        assert(!loop.cancel(id));
        loop.runUntilIdle();
        assert(!ran);

        // A task may cancel a later one
        EventLoop::TimerId later = loop.schedule(milliseconds(20), [&ran]() { ran = true; });
        loop.schedule(milliseconds(10), [&loop, later]() { loop.cancel(later); });
        loop.runUntilIdle();
        assert(!ran);

        std::cout << "✓ Cancel test passed" << std::endl;
    }

    void testRealClock() {
        std::cout << "Testing real clock..." << std::endl;

        EventLoop loop;
        assert(!loop.isManualClock());

        int count = 0;
        loop.schedule(milliseconds(5), [&count]() { count++; });
        loop.post([&count]() { count++; });
        assert(loop.runUntilIdle() == 2);
        assert(count == 2);

        std::cout << "✓ Real clock test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running EventLoop unit tests..." << std::endl;

        testPostOrder();
        testTimersOnManualClock();
        testCancel();
        testRealClock();

        std::cout << "All EventLoop tests passed!" << std::endl;
    }
};

int main() {
    try {
        EventLoopTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All EventLoop component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
