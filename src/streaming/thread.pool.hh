#pragma once

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace fileio {
class ThreadPool
{
  public:
    using Task = std::function<bool(std::string&)>;
    using ErrorCallback = std::function<void(const std::string&)>;

    // The error handler `err` is called when a job returns false. This
    // can happen when the job encounters an error, or otherwise fails. The
    // std::string& argument to the error handler is a diagnostic message from
    // the failing job.
    ThreadPool(std::string_view name, unsigned int n_threads, ErrorCallback&& err);
    ~ThreadPool() noexcept;

    /**
     * @brief Push a job onto the job queue.
     *
     * @param job The job to push onto the queue.
     * @return true if the job was successfully pushed onto the queue, false
     * otherwise.
     */
    [[nodiscard]] bool push_job(Task&& job);

    /**
     * @brief Block until all jobs on the queue have processed, then spin down
     * the threads.
     * @note After calling this function, the job queue no longer accepts jobs.
     * When called from one of the pool's own workers, that worker is detached
     * rather than joined; it finishes the remaining jobs and exits by itself.
     */
    void await_stop() noexcept;

    [[nodiscard]] const std::string& name() const noexcept;
    [[nodiscard]] size_t n_threads() const noexcept;

    /**
     * @brief The pool whose worker is running the calling thread.
     * @return A pointer to the pool, or nullptr if the calling thread is not
     * a pool worker.
     */
    [[nodiscard]] static const ThreadPool* current() noexcept;

  private:
    // Shared with the workers, so that a worker whose job destroys the pool
    // can still drain the queue and exit after the pool is gone.
    struct JobQueue
    {
        explicit JobQueue(ErrorCallback&& err);

        ErrorCallback error_handler;
        std::mutex mutex;
        std::condition_variable cv;
        std::queue<Task> jobs;
        bool is_accepting_jobs{ true };

        std::optional<Task> pop() noexcept;
        [[nodiscard]] bool should_stop() const noexcept;
    };

    const std::string name_;
    const std::shared_ptr<JobQueue> queue_;
    std::vector<std::thread> threads_;

    static void process_tasks_(std::shared_ptr<JobQueue> queue,
                               const ThreadPool* pool);
};
} // namespace fileio
