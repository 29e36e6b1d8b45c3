#pragma once

#include <atomic>
#include <memory>
#include <mutex>

class LayoutEngine;

/**
 * @brief Forwards memory pressure signals to a LayoutEngine.
 *
 * notify() may be called from any thread. The cache is only dropped on the FLTK main thread, from the
 * Fl::awake callback or an explicit handleOnMainThread() call. Repeated signals before the main thread runs
 * coalesce into one invalidation.
 */
class MemoryPressureRelay {
  public:
    explicit MemoryPressureRelay(LayoutEngine &engine);
    ~MemoryPressureRelay();

    MemoryPressureRelay(const MemoryPressureRelay &) = delete;
    MemoryPressureRelay &operator=(const MemoryPressureRelay &) = delete;

    void notify();

    /// Apply a pending signal now. Main thread only.
    void handleOnMainThread();

    bool isPending() const { return m_channel->pending.load(); }

  private:
    struct Channel {
        std::mutex mutex;
        LayoutEngine *engine = nullptr;
        std::atomic<bool> pending{false};

        void drain();
    };

    std::shared_ptr<Channel> m_channel;
};
