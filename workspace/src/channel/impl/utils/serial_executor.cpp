#include "utils/serial_executor.h"
#include "utils/log.h"
#include <exception>
#include <utility>

namespace vtctl {
namespace utils {

SerialExecutor::SerialExecutor(std::string name)
    : name_(std::move(name))
    , next_id_(1)
    , stopping_(false)
    , joined_(false)
{
    worker_ = std::thread(&SerialExecutor::run, this);
}

SerialExecutor::~SerialExecutor() {
    shutdown();
}

bool SerialExecutor::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            LOGV_FMT("SerialExecutor[" << name_ << "]: post rejected, executor stopped");
            return false;
        }
        ready_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

SerialExecutor::TaskId SerialExecutor::postDelayed(std::chrono::milliseconds delay, Task task) {
    TaskId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return 0;
        }
        id = next_id_++;
        delayed_.emplace(id, DelayedTask{Clock::now() + delay, std::move(task)});
    }
    cv_.notify_one();
    return id;
}

bool SerialExecutor::cancel(TaskId id) {
    if (id == 0) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return delayed_.erase(id) > 0;
}

void SerialExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        delayed_.clear();
    }
    cv_.notify_all();

    if (joined_.exchange(true)) {
        return;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool SerialExecutor::isCurrentThread() const {
    return std::this_thread::get_id() == worker_.get_id();
}

size_t SerialExecutor::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_.size() + delayed_.size();
}

void SerialExecutor::run() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        // Move every delayed task that is due to the ready queue, oldest deadline first
        auto now = Clock::now();
        while (true) {
            auto due = delayed_.end();
            for (auto it = delayed_.begin(); it != delayed_.end(); ++it) {
                if (it->second.due <= now && (due == delayed_.end() || it->second.due < due->second.due)) {
                    due = it;
                }
            }
            if (due == delayed_.end()) {
                break;
            }
            ready_.push_back(std::move(due->second.task));
            delayed_.erase(due);
        }

        if (!ready_.empty()) {
            Task task = std::move(ready_.front());
            ready_.pop_front();

            lock.unlock();
            execute(task);
            lock.lock();
            continue;
        }

        if (stopping_) {
            break;
        }

        if (delayed_.empty()) {
            cv_.wait(lock);
        } else {
            auto next_due = delayed_.begin()->second.due;
            for (const auto& entry : delayed_) {
                if (entry.second.due < next_due) {
                    next_due = entry.second.due;
                }
            }
            cv_.wait_until(lock, next_due);
        }
    }

    LOGV_FMT("SerialExecutor[" << name_ << "]: worker exiting");
}

void SerialExecutor::execute(Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        LOGE_FMT("SerialExecutor[" << name_ << "]: task threw exception: " << e.what());
    }
}

} // namespace utils
} // namespace vtctl
