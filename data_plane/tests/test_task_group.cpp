#include "bolster/task_group.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

namespace {

std::atomic<int> live_buffers{0};

struct Buffer {
    Buffer() { ++live_buffers; }
    ~Buffer() { --live_buffers; }
};

} // namespace

int main() {
    using namespace std::chrono_literals;

    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    std::atomic<int> ran{0};
    {
        bolster::BoundedTaskGroup group(3);
        assert(group.limit() == 3);
        for (int i = 0; i < 20; ++i) {
            group.spawn([&] {
                int now = ++running;
                int seen = peak.load();
                while (now > seen && !peak.compare_exchange_weak(seen, now)) {
                }
                std::this_thread::sleep_for(5ms);
                --running;
                ++ran;
            });
            assert(group.in_flight() <= 3);
        }
        group.wait();
        assert(group.in_flight() == 0);
        assert(group.peak_in_flight() <= 3);
        assert(group.peak_in_flight() >= 1);
    }
    assert(ran == 20);
    assert(peak <= 3);

    // A slow task holds one slot; the others keep flowing through the rest.
    {
        bolster::BoundedTaskGroup group(2);
        std::atomic<bool> slow_done{false};
        std::atomic<int> fast_done{0};
        group.spawn([&] {
            std::this_thread::sleep_for(300ms);
            slow_done = true;
        });
        for (int i = 0; i < 10; ++i) {
            group.spawn([&] {
                std::this_thread::sleep_for(1ms);
                ++fast_done;
            });
        }
        // Every fast task was admitted, so at least nine have finished.
        assert(fast_done >= 9);
        assert(!slow_done);
        group.wait();
        assert(slow_done);
        assert(fast_done == 10);
    }

    // A finished task's captures are gone before its slot is handed out, so
    // buffers created after taking a slot never exceed the limit.
    {
        bolster::BoundedTaskGroup group(2);
        int peak_buffers = 0;
        for (int i = 0; i < 200; ++i) {
            group.wait_for_slot();
            auto buffer = std::make_shared<Buffer>();
            peak_buffers = std::max(peak_buffers, live_buffers.load());
            group.spawn([buffer] { std::this_thread::sleep_for(200us); });
        }
        group.wait();
        assert(peak_buffers <= 2);
        assert(live_buffers == 0);
    }

    std::atomic<int> counter{0};
    {
        bolster::BoundedTaskGroup group(1);
        group.spawn([&] { ++counter; });
        group.wait_for_slot();
        assert(counter == 1);
        group.spawn([&] { ++counter; });
        // The destructor waits for the last task.
    }
    assert(counter == 2);

    bool threw = false;
    try {
        bolster::BoundedTaskGroup group(0);
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);
    return 0;
}
