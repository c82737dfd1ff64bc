#include "thread.pool.hh"
#include "macros.hh"

#include <algorithm>

namespace {
thread_local const fileio::ThreadPool* current_pool = nullptr;
} // namespace

fileio::ThreadPool::JobQueue::JobQueue(ErrorCallback&& err)
  : error_handler{ std::move(err) }
{
}

std::optional<fileio::ThreadPool::Task>
fileio::ThreadPool::JobQueue::pop() noexcept
{
    if (jobs.empty()) {
        return std::nullopt;
    }

    auto job = std::move(jobs.front());
    jobs.pop();
    return job;
}

bool
fileio::ThreadPool::JobQueue::should_stop() const noexcept
{
    return !is_accepting_jobs && jobs.empty();
}

fileio::ThreadPool::ThreadPool(std::string_view name,
                               unsigned int n_threads,
                               ErrorCallback&& err)
  : name_{ name }
  , queue_{ std::make_shared<JobQueue>(std::move(err)) }
{
    const auto max_threads = std::max(std::thread::hardware_concurrency(), 1u);
    n_threads = std::clamp(n_threads, 1u, max_threads);

    for (unsigned int i = 0; i < n_threads; ++i) {
        threads_.emplace_back(process_tasks_, queue_, this);
    }

    LOG_DEBUG("Started dispatcher '", name_, "' with ", n_threads, " threads");
}

fileio::ThreadPool::~ThreadPool() noexcept
{
    {
        std::unique_lock lock(queue_->mutex);
        if (!queue_->jobs.empty()) {
            LOG_WARNING("Dispatcher '",
                        name_,
                        "' discarding ",
                        queue_->jobs.size(),
                        " queued jobs");
        }
        while (!queue_->jobs.empty()) {
            queue_->jobs.pop();
        }
    }

    await_stop();
}

bool
fileio::ThreadPool::push_job(Task&& job)
{
    std::unique_lock lock(queue_->mutex);
    if (!queue_->is_accepting_jobs) {
        return false;
    }

    queue_->jobs.push(std::move(job));
    queue_->cv.notify_one();

    return true;
}

void
fileio::ThreadPool::await_stop() noexcept
{
    {
        std::scoped_lock lock(queue_->mutex);
        queue_->is_accepting_jobs = false;

        queue_->cv.notify_all();
    }

    // spin down threads
    const auto caller = std::this_thread::get_id();
    for (auto& thread : threads_) {
        if (!thread.joinable()) {
            continue;
        }

        if (thread.get_id() == caller) {
            thread.detach();
        } else {
            thread.join();
        }
    }
}

const std::string&
fileio::ThreadPool::name() const noexcept
{
    return name_;
}

size_t
fileio::ThreadPool::n_threads() const noexcept
{
    return threads_.size();
}

const fileio::ThreadPool*
fileio::ThreadPool::current() noexcept
{
    return current_pool;
}

void
fileio::ThreadPool::process_tasks_(std::shared_ptr<JobQueue> queue,
                                   const ThreadPool* pool)
{
    current_pool = pool;

    while (true) {
        std::unique_lock lock(queue->mutex);
        queue->cv.wait(lock,
                       [&] { return queue->should_stop() || !queue->jobs.empty(); });

        if (queue->should_stop()) {
            break;
        }

        auto job = queue->pop();
        lock.unlock();

        // the job may release the last reference to the pool
        if (job.has_value()) {
            if (std::string err_msg; !job.value()(err_msg)) {
                queue->error_handler(err_msg);
            }
            job.reset();
        }
    }

    current_pool = nullptr;
}
