#ifndef VTCTL_UTILS_SERIAL_EXECUTOR_H
#define VTCTL_UTILS_SERIAL_EXECUTOR_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace vtctl {
namespace utils {

/**
 * @brief Single worker thread executing tasks strictly one at a time
 *
 * Features:
 * - FIFO execution of posted tasks on one dedicated thread
 * - Delayed tasks with cancellable handles (timers)
 * - Graceful shutdown: already posted immediate tasks still run,
 *   delayed tasks that have not fired are discarded
 *
 * Everything that runs on one executor is serialized, so state touched
 * only from its tasks needs no further locking.
 *
 * Example Usage:
 * @code
 * SerialExecutor executor("control");
 *
 * executor.post([]() { do_work(); });
 *
 * auto timer = executor.postDelayed(std::chrono::seconds(30), []() { tick(); });
 * executor.cancel(timer);
 *
 * executor.shutdown();
 * @endcode
 */
class SerialExecutor {
public:
    using Task = std::function<void()>;

    /** Handle of a delayed task; 0 is never a valid handle */
    using TaskId = uint64_t;

    /**
     * @brief Construct and start the worker thread
     * @param name Executor name used in log lines
     */
    explicit SerialExecutor(std::string name);

    /**
     * @brief Destructor - calls shutdown()
     */
    ~SerialExecutor();

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;
    SerialExecutor(SerialExecutor&&) = delete;
    SerialExecutor& operator=(SerialExecutor&&) = delete;

    /**
     * @brief Queue a task for execution
     * @param task Task to run
     * @return false if the executor is shut down (task dropped)
     */
    bool post(Task task);

    /**
     * @brief Queue a task to run once the delay has elapsed
     * @param delay Delay before the task becomes runnable
     * @param task Task to run
     * @return Handle for cancel(), or 0 if the executor is shut down
     */
    TaskId postDelayed(std::chrono::milliseconds delay, Task task);

    /**
     * @brief Cancel a delayed task that has not started yet
     * @param id Handle returned by postDelayed()
     * @return true if the task was removed before running
     */
    bool cancel(TaskId id);

    /**
     * @brief Stop accepting tasks, run the remaining immediate tasks, join the thread
     *
     * Safe to call more than once. Must not be called from the executor thread.
     */
    void shutdown();

    /**
     * @brief Check whether the caller is running on this executor's thread
     */
    bool isCurrentThread() const;

    /**
     * @brief Number of immediate plus delayed tasks waiting
     */
    size_t pendingCount() const;

    const std::string& name() const { return name_; }

private:
    using Clock = std::chrono::steady_clock;

    struct DelayedTask {
        Clock::time_point due;
        Task task;
    };

    void run();
    void execute(Task& task);

    std::string name_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> ready_;
    std::map<TaskId, DelayedTask> delayed_;
    TaskId next_id_;
    bool stopping_;

    std::atomic<bool> joined_;
    std::thread worker_;
};

} // namespace utils
} // namespace vtctl

#endif // VTCTL_UTILS_SERIAL_EXECUTOR_H
