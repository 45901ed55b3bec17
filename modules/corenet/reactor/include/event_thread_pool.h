#ifndef EVENT_THREAD_POOL_H
#define EVENT_THREAD_POOL_H

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * Worker pool for callback dispatch.
 *
 * Tasks submitted with the same key always land on the same worker, so they run
 * one after another in submission order. Tasks with different keys may run in
 * parallel. Peer connections use their peer id as the key, which keeps every
 * peer's inbound frames ordered without serializing unrelated peers.
 */
class EventThreadPool {
public:
    using Task = std::function<void()>;

    // 0 workers means one per hardware thread
    explicit EventThreadPool(size_t num_workers = 0);
    ~EventThreadPool();

    EventThreadPool(const EventThreadPool&) = delete;
    EventThreadPool& operator=(const EventThreadPool&) = delete;

    // Returns false once the pool is shut down.
    bool submit(const std::string& key, Task task);

    // No ordering guarantee relative to other tasks.
    bool submit_any(Task task);

    /**
     * Stop accepting tasks. Already queued tasks still run. With blocking=true
     * the workers are joined before returning (a worker calling shutdown on
     * its own pool is detached instead).
     */
    void shutdown(bool blocking = true);

    size_t worker_count() const { return m_lanes.size(); }
    bool is_running() const { return m_running.load(); }

private:
    // One FIFO lane per worker thread.
    struct Lane {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<Task> tasks;
        std::thread thread;
    };

    bool push(Lane& lane, Task task);
    void drain(size_t index);
    size_t lane_for(const std::string& key) const;

    std::vector<std::unique_ptr<Lane>> m_lanes;
    std::atomic<bool> m_running{true};
    std::atomic<size_t> m_next_lane{0};
};

#endif // EVENT_THREAD_POOL_H
