#pragma once

/**
 * ProgressSink.hpp
 * 
 * Observational progress reporting. Publishing never blocks the pipeline
 * on a slow consumer.
 */

#include <string>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <functional>
#include <cstdint>

namespace takeout::core::transfer {

/**
 * Pipeline phase reported with each event
 */
enum class ProgressPhase {
    Downloading,
    Uploading,
    Complete
};

const char* progressPhaseToString(ProgressPhase phase);

/**
 * Progress snapshot
 */
struct ProgressEvent {
    ProgressPhase phase{ProgressPhase::Downloading};
    int64_t completedCount{0};
    int64_t totalCount{0};
    std::string currentItemName;
    int64_t bytesDone{0};
    int64_t bytesTotal{0};
};

using ProgressCallback = std::function<void(const ProgressEvent& event)>;

class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void publish(const ProgressEvent& event) = 0;
};

/**
 * Invokes the callback on the publishing thread
 */
class CallbackProgressSink : public ProgressSink {
public:
    explicit CallbackProgressSink(ProgressCallback callback);
    void publish(const ProgressEvent& event) override;

private:
    ProgressCallback m_callback;
};

/**
 * Discards every event
 */
class NullProgressSink : public ProgressSink {
public:
    void publish(const ProgressEvent&) override {}
};

/**
 * AsyncProgressSink - Bounded queue drained by a background thread
 * 
 * When the queue is full the oldest pending event is dropped.
 * The destructor delivers what is still queued, then joins.
 */
class AsyncProgressSink : public ProgressSink {
public:
    AsyncProgressSink(ProgressCallback callback, size_t capacity = 256);
    ~AsyncProgressSink() override;
    
    AsyncProgressSink(const AsyncProgressSink&) = delete;
    AsyncProgressSink& operator=(const AsyncProgressSink&) = delete;
    
    void publish(const ProgressEvent& event) override;
    
    /**
     * Stop accepting events, drain the queue and join the worker
     */
    void stop();
    
    size_t droppedCount() const;

private:
    void workerLoop();
    
    ProgressCallback m_callback;
    size_t m_capacity;
    
    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::deque<ProgressEvent> m_queue;
    size_t m_dropped{0};
    bool m_stopping{false};
    std::thread m_worker;
};

} // namespace takeout::core::transfer
