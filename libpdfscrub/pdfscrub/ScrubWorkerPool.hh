#ifndef SCRUBWORKERPOOL_HH
#define SCRUBWORKERPOOL_HH

#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// A fixed number of threads running queued tasks. join() waits for every task submitted so far and
// stops the threads; the pool can't be used after that. If a task throws, the exception of the
// first failing task is rethrown by join() after all threads have stopped.
class ScrubWorkerPool
{
  public:
    explicit ScrubWorkerPool(size_t threads);
    ~ScrubWorkerPool();

    void submit(std::function<void()> task);
    void join();

  private:
    ScrubWorkerPool(ScrubWorkerPool const&) = delete;
    ScrubWorkerPool& operator=(ScrubWorkerPool const&) = delete;

    void run();
    void stop();

    std::mutex lock;
    std::condition_variable ready;
    std::deque<std::function<void()>> tasks;
    std::vector<std::thread> threads;
    std::exception_ptr first_error;
    bool closing{false};
};

#endif // SCRUBWORKERPOOL_HH
