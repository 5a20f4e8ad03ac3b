#include "meshstate/relay/EventLoop.hpp"

#include <cassert>
#include <cstdint>
#include <chrono>
#include <functional>
#include <thread>
#include <utility>
#include <vector>

#include <unistd.h>

int main() {
    using namespace std::chrono_literals;
    using meshstate::relay::EventLoop;

    // Posted tasks run in order, timers by deadline, cancelled timers never.
    {
        EventLoop loop;
        std::vector<int> order;
        loop.post([&]() { order.push_back(1); });
        loop.post([&]() { order.push_back(2); });
        loop.schedule_after(30ms, [&]() { order.push_back(5); });
        loop.schedule_after(10ms, [&]() { order.push_back(3); });
        const auto cancelled = loop.schedule_after(20ms, [&]() { order.push_back(99); });
        loop.schedule_after(20ms, [&]() { order.push_back(4); });
        loop.cancel(cancelled);
        loop.cancel(cancelled);
        loop.cancel(12345);
        loop.schedule_after(50ms, [&]() { loop.stop(); });

        const auto started = std::chrono::steady_clock::now();
        loop.run();
        const auto elapsed = std::chrono::steady_clock::now() - started;

        assert((order == std::vector<int>{1, 2, 3, 4, 5}));
        assert(elapsed >= 50ms);
        assert(!loop.running());
    }

    // Tasks posted from inside a task wait for the next turn; posting from
    // another thread wakes the loop.
    {
        EventLoop loop;
        std::vector<int> order;
        loop.post([&]() {
            order.push_back(1);
            loop.post([&]() { order.push_back(3); });
            order.push_back(2);
        });
        std::thread producer([&]() {
            std::this_thread::sleep_for(20ms);
            loop.post([&]() {
                order.push_back(4);
                loop.stop();
            });
        });
        loop.schedule_after(5s, [&]() { loop.stop(); });
        loop.run();
        producer.join();
        assert((order == std::vector<int>{1, 2, 3, 4}));
    }

    // A timer that reschedules itself keeps firing until stopped.
    {
        EventLoop loop;
        int ticks = 0;
        std::function<void()> tick = [&]() {
            if (++ticks == 3) {
                loop.stop();
                return;
            }
            loop.schedule_after(1ms, tick);
        };
        loop.schedule_after(1ms, tick);
        loop.run();
        assert(ticks == 3);
    }

    // Readiness on a watched fd reaches its callback with the fd and mask.
    {
        EventLoop loop;
        int ends[2]{-1, -1};
        assert(::pipe(ends) == 0);
        std::vector<std::pair<int, std::uint32_t>> seen;
        loop.add(ends[0], EventLoop::kEventReadable, [&](int fd, std::uint32_t events) {
            char byte = 0;
            assert(::read(fd, &byte, 1) == 1);
            seen.emplace_back(fd, events);
            loop.remove(fd);
            loop.stop();
        });
        loop.post([&]() {
            const char byte = 'x';
            assert(::write(ends[1], &byte, 1) == 1);
        });
        loop.schedule_after(5s, [&]() { loop.stop(); });
        loop.run();
        assert(seen.size() == 1);
        assert(seen[0].first == ends[0]);
        assert(seen[0].second & EventLoop::kEventReadable);
        ::close(ends[0]);
        ::close(ends[1]);
    }

    return 0;
}
