#include <pdfscrub/ScrubWorkerPool.hh>

#include <stdexcept>

ScrubWorkerPool::ScrubWorkerPool(size_t n)
{
    if (n == 0) {
        n = 1;
    }
    threads.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        threads.emplace_back([this]() { run(); });
    }
}

ScrubWorkerPool::~ScrubWorkerPool()
{
    // Errors are only reported by join(). A pool destroyed without join(), for example while
    // another exception propagates, still waits for its threads.
    stop();
}

void
ScrubWorkerPool::submit(std::function<void()> task)
{
    {
        std::lock_guard<std::mutex> guard(lock);
        if (closing) {
            throw std::logic_error("ScrubWorkerPool: submit called after join");
        }
        tasks.emplace_back(std::move(task));
    }
    ready.notify_one();
}

void
ScrubWorkerPool::join()
{
    stop();
    std::exception_ptr error;
    {
        std::lock_guard<std::mutex> guard(lock);
        std::swap(error, first_error);
    }
    if (error) {
        std::rethrow_exception(error);
    }
}

void
ScrubWorkerPool::stop()
{
    {
        std::lock_guard<std::mutex> guard(lock);
        closing = true;
    }
    ready.notify_all();
    for (auto& t: threads) {
        if (t.joinable()) {
            t.join();
        }
    }
}

void
ScrubWorkerPool::run()
{
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> guard(lock);
            ready.wait(guard, [this]() { return closing || !tasks.empty(); });
            if (tasks.empty()) {
                // closing and nothing left to do
                return;
            }
            task = std::move(tasks.front());
            tasks.pop_front();
        }
        try {
            task();
        } catch (...) {
            std::lock_guard<std::mutex> guard(lock);
            if (!first_error) {
                first_error = std::current_exception();
            }
        }
    }
}
