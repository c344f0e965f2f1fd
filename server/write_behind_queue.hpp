// write_behind_queue.hpp
#pragma once
#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

// A single worker thread that runs persistence jobs in submission order.
// Jobs never run on the caller's thread; the destructor drains the queue.
class WriteBehindQueue {
public:
    WriteBehindQueue();
    ~WriteBehindQueue();
    WriteBehindQueue(const WriteBehindQueue&) = delete;
    WriteBehindQueue& operator=(const WriteBehindQueue&) = delete;

    // Fire-and-forget write. An exception from `job` is logged under `label`
    // and reported as false through the returned future; it is never retried.
    std::shared_future<bool> enqueue(std::string label, std::function<void()> job);

    // Runs `fn` on the worker and hands back its result or exception.
    template <typename Fn>
    auto submit(Fn fn) -> std::future<decltype(fn())> {
        using Result = decltype(fn());
        auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
        std::future<Result> result = task->get_future();
        boost::asio::post(pool_, [task]() { (*task)(); });
        return result;
    }

    // Blocks until every job queued before the call has finished.
    void flush();

    std::size_t pending() const { return pending_.load(); }

private:
    boost::asio::thread_pool pool_;
    std::atomic<std::size_t> pending_;
};
