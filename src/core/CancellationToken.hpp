#pragma once

/**
 * CancellationToken.hpp
 * 
 * Cooperative cancellation flag shared between the caller and the workers.
 * Workers poll it between chunks and between archive entries.
 */

#include <atomic>
#include <memory>

namespace takeout::core {

class CancellationToken {
public:
    CancellationToken() : m_state(std::make_shared<std::atomic<bool>>(false)) {}
    
    /**
     * Request cancellation. Lock-free, usable from a signal handler
     * as long as the token outlives the handler installation.
     */
    void cancel() const { m_state->store(true, std::memory_order_relaxed); }
    
    bool isCancelled() const { return m_state->load(std::memory_order_relaxed); }
    
    /**
     * Clear the flag so the same token can drive another run
     */
    void reset() const { m_state->store(false, std::memory_order_relaxed); }

private:
    std::shared_ptr<std::atomic<bool>> m_state;
};

} // namespace takeout::core
