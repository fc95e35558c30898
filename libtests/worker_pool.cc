#include <pdfscrub/assert_test.h>

#include <pdfscrub/ScrubWorkerPool.hh>

#include <atomic>
#include <iostream>
#include <stdexcept>

static void
test_tasks()
{
    std::atomic<int> sum{0};
    std::vector<int> slots(100, 0);
    ScrubWorkerPool pool(4);
    for (int i = 0; i < 100; ++i) {
        pool.submit([&sum, &slots, i]() {
            sum += i;
            slots.at(static_cast<size_t>(i)) = i * 2;
        });
    }
    pool.join();
    assert(sum == 4950);
    for (int i = 0; i < 100; ++i) {
        assert(slots.at(static_cast<size_t>(i)) == i * 2);
    }
    try {
        pool.submit([]() {});
        assert(false);
    } catch (std::logic_error&) {
    }
}

static void
test_errors()
{
    std::atomic<int> ran{0};
    ScrubWorkerPool pool(1);
    pool.submit([&ran]() { ++ran; });
    pool.submit([]() { throw std::runtime_error("first failure"); });
    pool.submit([]() { throw std::logic_error("second failure"); });
    pool.submit([&ran]() { ++ran; });
    try {
        pool.join();
        assert(false);
    } catch (std::runtime_error& e) {
        assert(std::string(e.what()) == "first failure");
    }
    // A failing task doesn't stop the others.
    assert(ran == 2);

    // Zero threads still runs tasks.
    bool done = false;
    ScrubWorkerPool small(0);
    small.submit([&done]() { done = true; });
    small.join();
    assert(done);

    // Destroying an unjoined pool waits for its work.
    std::atomic<int> count{0};
    {
        ScrubWorkerPool unjoined(2);
        for (int i = 0; i < 10; ++i) {
            unjoined.submit([&count]() { ++count; });
        }
    }
    assert(count == 10);
}

int
main()
{
    test_tasks();
    test_errors();
    std::cout << "worker pool tests done" << std::endl;
    return 0;
}
