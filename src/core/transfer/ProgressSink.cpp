/**
 * ProgressSink.cpp
 */

#include "ProgressSink.hpp"
#include "../Logger.hpp"

#include <exception>

namespace takeout::core::transfer {

const char* progressPhaseToString(ProgressPhase phase) {
    switch (phase) {
        case ProgressPhase::Downloading: return "downloading";
        case ProgressPhase::Uploading:   return "uploading";
        case ProgressPhase::Complete:    return "complete";
        default:                         return "unknown";
    }
}

// -- CallbackProgressSink --

CallbackProgressSink::CallbackProgressSink(ProgressCallback callback)
    : m_callback(std::move(callback)) {}

void CallbackProgressSink::publish(const ProgressEvent& event) {
    if (m_callback) {
        m_callback(event);
    }
}

// -- AsyncProgressSink --

AsyncProgressSink::AsyncProgressSink(ProgressCallback callback, size_t capacity)
    : m_callback(std::move(callback))
    , m_capacity(capacity > 0 ? capacity : 1)
{
    m_worker = std::thread(&AsyncProgressSink::workerLoop, this);
}

AsyncProgressSink::~AsyncProgressSink() {
    stop();
}

void AsyncProgressSink::publish(const ProgressEvent& event) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping) {
            return;
        }
        if (m_queue.size() >= m_capacity) {
            m_queue.pop_front();
            ++m_dropped;
        }
        m_queue.push_back(event);
    }
    m_condition.notify_one();
}

void AsyncProgressSink::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
    }
    m_condition.notify_all();
    
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

size_t AsyncProgressSink::droppedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dropped;
}

void AsyncProgressSink::workerLoop() {
    while (true) {
        ProgressEvent event;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_condition.wait(lock, [this] { return m_stopping || !m_queue.empty(); });
            
            if (m_queue.empty()) {
                return; // Stopping and drained
            }
            event = std::move(m_queue.front());
            m_queue.pop_front();
        }
        
        // A failing observer must not take the pipeline down
        try {
            if (m_callback) {
                m_callback(event);
            }
        } catch (const std::exception& e) {
            TAKEOUT_LOG_WARN("Progress observer failed: {}", e.what());
        }
    }
}

} // namespace takeout::core::transfer
