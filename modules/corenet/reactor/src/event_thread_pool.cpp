#include "event_thread_pool.h"
#include "logger.h"

#include <algorithm>
#include <exception>

EventThreadPool::EventThreadPool(size_t num_workers) {
    if (num_workers == 0) {
        num_workers = std::max(1u, std::thread::hardware_concurrency());
    }
    m_lanes.reserve(num_workers);
    for (size_t i = 0; i < num_workers; ++i) {
        m_lanes.push_back(std::make_unique<Lane>());
    }
    // Lanes must all exist before any worker looks at them.
    for (size_t i = 0; i < num_workers; ++i) {
        m_lanes[i]->thread = std::thread(&EventThreadPool::drain, this, i);
    }
}

EventThreadPool::~EventThreadPool() {
    shutdown(true);
}

bool EventThreadPool::submit(const std::string& key, Task task) {
    return push(*m_lanes[lane_for(key)], std::move(task));
}

bool EventThreadPool::submit_any(Task task) {
    const size_t index = m_next_lane.fetch_add(1) % m_lanes.size();
    return push(*m_lanes[index], std::move(task));
}

bool EventThreadPool::push(Lane& lane, Task task) {
    std::unique_lock<std::mutex> lock(lane.mutex);
    if (!m_running.load()) {
        return false;
    }
    lane.tasks.push_back(std::move(task));
    lock.unlock();
    lane.cv.notify_one();
    return true;
}

void EventThreadPool::shutdown(bool blocking) {
    if (!m_running.exchange(false)) {
        return;
    }

    for (auto& lane : m_lanes) {
        // Flip is published under each lane lock so no push() slips in after it.
        { std::lock_guard<std::mutex> lock(lane->mutex); }
        lane->cv.notify_all();
    }

    const auto self = std::this_thread::get_id();
    for (auto& lane : m_lanes) {
        if (!lane->thread.joinable()) {
            continue;
        }
        if (blocking && lane->thread.get_id() != self) {
            lane->thread.join();
        } else {
            lane->thread.detach();
        }
    }
    LOG_DEBUG("EventThreadPool: Shut down " + std::to_string(m_lanes.size()) + " worker(s)");
}

void EventThreadPool::drain(size_t index) {
    Lane& lane = *m_lanes[index];
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(lane.mutex);
            lane.cv.wait(lock, [&] { return !lane.tasks.empty() || !m_running.load(); });
            if (lane.tasks.empty()) {
                return;
            }
            task = std::move(lane.tasks.front());
            lane.tasks.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("EventThreadPool: Task on worker " + std::to_string(index) + " threw: " + e.what());
        }
    }
}

size_t EventThreadPool::lane_for(const std::string& key) const {
    // Same key, same lane
    size_t h = 0;
    for (char c : key) {
        h = h * 31 + static_cast<unsigned char>(c);
    }
    return h % m_lanes.size();
}
