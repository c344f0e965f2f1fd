// write_behind_queue.cpp
#include "write_behind_queue.hpp"
#include "logger.hpp"

WriteBehindQueue::WriteBehindQueue()
    : pool_(1), pending_(0) {
}

WriteBehindQueue::~WriteBehindQueue() {
    pool_.join();
}

std::shared_future<bool> WriteBehindQueue::enqueue(std::string label, std::function<void()> job) {
    auto done = std::make_shared<std::promise<bool>>();
    std::shared_future<bool> result = done->get_future().share();
    ++pending_;

    boost::asio::post(pool_, [this, done, label = std::move(label), job = std::move(job)]() {
        bool ok = true;
        try {
            job();
        } catch (const std::exception& ex) {
            ok = false;
            Logger::instance().error("Background write failed", { {"job", label}, {"what", ex.what()} });
        }
        --pending_;
        done->set_value(ok);
    });
    return result;
}

void WriteBehindQueue::flush() {
    submit([]() {}).get();
}
