#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ledger_core {

// Worker pool with one FIFO strand per entity key: tasks of a key run one at a time, in
// submission order; different keys run in parallel.
class EntityStrandExecutor {
public:
    using Task = std::function<void()>;

    struct Stats {
        std::size_t pending_tasks{0};
        std::size_t active_strands{0};
        std::size_t processed_total{0};
        std::size_t worker_threads{0};
    };

    explicit EntityStrandExecutor(std::size_t worker_threads = 1);
    ~EntityStrandExecutor();

    EntityStrandExecutor(const EntityStrandExecutor&) = delete;
    EntityStrandExecutor& operator=(const EntityStrandExecutor&) = delete;

    void Start();
    void Stop();
    bool Post(const std::string& key, Task task);

    // Tasks must not block on another Submit of the same executor.
    template <typename Fn>
    bool Submit(const std::string& key,
                Fn fn,
                std::future<std::invoke_result_t<Fn>>* result) {
        using Result = std::invoke_result_t<Fn>;
        auto packaged = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
        auto future = packaged->get_future();
        if (!Post(key, [packaged]() { (*packaged)(); })) {
            return false;
        }
        if (result != nullptr) {
            *result = std::move(future);
        }
        return true;
    }

    Stats Snapshot() const;
    // Waits until no task is queued or running.
    bool WaitUntilDrained(std::int64_t timeout_ms);

private:
    struct Strand {
        std::deque<Task> tasks;
        bool running{false};
    };

    void WorkerLoop();

    const std::size_t worker_threads_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable drained_cv_;
    std::unordered_map<std::string, Strand> strands_;
    std::deque<std::string> ready_;
    std::vector<std::thread> workers_;
    std::size_t pending_{0};
    std::size_t running_tasks_{0};
    std::atomic<std::size_t> processed_total_{0};
    bool started_{false};
    bool stop_{false};
};

}  // namespace ledger_core
