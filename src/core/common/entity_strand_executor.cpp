#include "ledger_core/core/entity_strand_executor.h"

#include <algorithm>
#include <chrono>

#include "ledger_core/core/structured_log.h"
#include "ledger_core/monitoring/metric_registry.h"

namespace ledger_core {

namespace {

std::shared_ptr<MonitoringCounter> RejectedTaskCounter() {
    static const auto counter = MetricRegistry::Instance().BuildCounter(
        "ledger_core_executor_rejected_total", "Tasks rejected by a stopped EntityStrandExecutor");
    return counter;
}

}  // namespace

EntityStrandExecutor::EntityStrandExecutor(std::size_t worker_threads)
    : worker_threads_(std::max<std::size_t>(1, worker_threads)) {}

EntityStrandExecutor::~EntityStrandExecutor() {
    Stop();
}

void EntityStrandExecutor::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_) {
        return;
    }
    stop_ = false;
    workers_.reserve(worker_threads_);
    for (std::size_t i = 0; i < worker_threads_; ++i) {
        workers_.emplace_back(&EntityStrandExecutor::WorkerLoop, this);
    }
    started_ = true;
}

void EntityStrandExecutor::Stop() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!started_) {
            return;
        }
        stop_ = true;
        workers.swap(workers_);
        started_ = false;
    }
    cv_.notify_all();
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

bool EntityStrandExecutor::Post(const std::string& key, Task task) {
    if (!task) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            RejectedTaskCounter()->Increment();
            EmitStructuredLog(nullptr, "entity_strand_executor", "warn", "task_rejected",
                              {{"strand", key}, {"reason", "executor stopped"}});
            return false;
        }
        auto& strand = strands_[key];
        strand.tasks.push_back(std::move(task));
        ++pending_;
        // A strand is either running or sitting in ready_ exactly once.
        if (!strand.running && strand.tasks.size() == 1) {
            ready_.push_back(key);
        }
    }
    cv_.notify_one();
    return true;
}

EntityStrandExecutor::Stats EntityStrandExecutor::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats stats;
    stats.pending_tasks = pending_;
    stats.active_strands = strands_.size();
    stats.processed_total = processed_total_.load();
    stats.worker_threads = worker_threads_;
    return stats;
}

bool EntityStrandExecutor::WaitUntilDrained(std::int64_t timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    return drained_cv_.wait_for(
        lock,
        std::chrono::milliseconds(std::max<std::int64_t>(0, timeout_ms)),
        [this]() { return pending_ == 0 && running_tasks_ == 0; });
}

void EntityStrandExecutor::WorkerLoop() {
    while (true) {
        Task task;
        std::string key;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stop_ || !ready_.empty(); });
            if (ready_.empty()) {
                // stop_ with nothing runnable; queued work on running strands is finished by
                // the worker that owns them.
                return;
            }
            key = std::move(ready_.front());
            ready_.pop_front();
            auto& strand = strands_[key];
            task = std::move(strand.tasks.front());
            strand.tasks.pop_front();
            strand.running = true;
            --pending_;
            ++running_tasks_;
        }

        task();
        processed_total_.fetch_add(1);

        bool notify_worker = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --running_tasks_;
            auto it = strands_.find(key);
            it->second.running = false;
            if (it->second.tasks.empty()) {
                strands_.erase(it);
            } else {
                ready_.push_back(key);
                notify_worker = true;
            }
            if (pending_ == 0 && running_tasks_ == 0) {
                drained_cv_.notify_all();
            }
        }
        if (notify_worker) {
            cv_.notify_one();
        }
    }
}

}  // namespace ledger_core
