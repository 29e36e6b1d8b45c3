#include "state/MemoryPressureRelay.h"

#include "layout/LayoutEngine.h"
#include "utils/Logger.h"

#include <FL/Fl.H>

MemoryPressureRelay::MemoryPressureRelay(LayoutEngine &engine) : m_channel(std::make_shared<Channel>()) {
    m_channel->engine = &engine;
}

MemoryPressureRelay::~MemoryPressureRelay() {
    // Callbacks already queued on the main loop keep the channel alive but find no engine
    std::scoped_lock lock(m_channel->mutex);
    m_channel->engine = nullptr;
}

void MemoryPressureRelay::notify() {
    if (m_channel->pending.exchange(true)) {
        return;
    }

    auto *token = new std::shared_ptr<Channel>(m_channel);
    int result = Fl::awake(
        [](void *p) {
            std::unique_ptr<std::shared_ptr<Channel>> channel(static_cast<std::shared_ptr<Channel> *>(p));
            (*channel)->drain();
        },
        token);

    if (result != 0) {
        delete token;
        m_channel->pending = false;
        Logger::log(Logger::Level::WARN, "MemoryPressureRelay", "Main loop queue is full; memory signal dropped");
    }
}

void MemoryPressureRelay::handleOnMainThread() { m_channel->drain(); }

void MemoryPressureRelay::Channel::drain() {
    std::scoped_lock lock(mutex);
    if (!pending.exchange(false)) {
        return;
    }
    if (engine) {
        Logger::log(Logger::Level::DEBUG, "MemoryPressureRelay", "Memory pressure: dropping cached layouts");
        engine->invalidateAll();
    }
}
