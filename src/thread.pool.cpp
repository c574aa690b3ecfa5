#include "thread.pool.hh"

#include "logger.hh"

#include <algorithm>
#include <exception>
#include <latch>

cf2zarr::ThreadPool::ThreadPool(unsigned int n_threads, ErrorCallback&& err)
  : error_handler_{ std::move(err) }
{
    const auto max_threads = std::max(std::thread::hardware_concurrency(), 1u);
    n_threads = std::clamp(n_threads, 1u, max_threads);

    for (auto i = 0u; i < n_threads; ++i) {
        threads_.emplace_back([this] { process_tasks_(); });
    }
}

cf2zarr::ThreadPool::~ThreadPool() noexcept
{
    {
        std::unique_lock lock(jobs_mutex_);
        while (!jobs_.empty()) {
            jobs_.pop();
        }
    }

    await_stop();
}

bool
cf2zarr::ThreadPool::push_job(Task&& job)
{
    std::unique_lock lock(jobs_mutex_);
    if (!is_accepting_jobs_) {
        return false;
    }

    jobs_.push(std::move(job));
    cv_.notify_one();

    return true;
}

void
cf2zarr::ThreadPool::run_batch(size_t n_jobs,
                               const std::function<void(size_t)>& job)
{
    if (n_jobs == 0) {
        return;
    }

    std::latch latch(static_cast<std::ptrdiff_t>(n_jobs));
    std::mutex error_mutex;
    std::exception_ptr first_error;

    for (size_t i = 0; i < n_jobs; ++i) {
        Task task = [&, i](std::string& err) -> bool {
            bool success = true;
            try {
                job(i);
            } catch (const std::exception& exc) {
                err = exc.what();
                success = false;

                std::scoped_lock lock(error_mutex);
                if (!first_error) {
                    first_error = std::current_exception();
                }
            }

            latch.count_down();
            return success;
        };

        if (!push_job(Task(task))) {
            LOG_WARNING("Thread pool is not accepting jobs. Running job ",
                        i,
                        " inline");

            if (std::string err; !task(err)) {
                error_handler_(err);
            }
        }
    }

    latch.wait();

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

void
cf2zarr::ThreadPool::await_stop() noexcept
{
    {
        std::scoped_lock lock(jobs_mutex_);
        is_accepting_jobs_ = false;

        cv_.notify_all();
    }

    // spin down threads
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

std::optional<cf2zarr::ThreadPool::Task>
cf2zarr::ThreadPool::pop_from_job_queue_() noexcept
{
    if (jobs_.empty()) {
        return std::nullopt;
    }

    auto job = std::move(jobs_.front());
    jobs_.pop();
    return job;
}

bool
cf2zarr::ThreadPool::should_stop_() const noexcept
{
    return !is_accepting_jobs_ && jobs_.empty();
}

void
cf2zarr::ThreadPool::process_tasks_()
{
    while (true) {
        std::unique_lock lock(jobs_mutex_);
        cv_.wait(lock, [&] { return should_stop_() || !jobs_.empty(); });

        if (should_stop_()) {
            break;
        }

        if (auto job = pop_from_job_queue_(); job.has_value()) {
            lock.unlock();
            if (std::string err_msg; !job.value()(err_msg)) {
                error_handler_(err_msg);
            }
        }
    }
}
