#include "layout/AttributeCache.h"

AttributeCache::AttributeCache(size_t capacity) : m_capacity(capacity) {}

const CachedLayout *AttributeCache::lookup(const std::string &id, Fingerprint fingerprint) {
    auto it = m_index.find(id);
    if (it == m_index.end()) {
        ++m_misses;
        return nullptr;
    }

    if (it->second->fingerprint != fingerprint) {
        m_entries.erase(it->second);
        m_index.erase(it);
        ++m_misses;
        return nullptr;
    }

    m_entries.splice(m_entries.begin(), m_entries, it->second);
    ++m_hits;
    return &m_entries.front().layout;
}

void AttributeCache::store(const std::string &id, Fingerprint fingerprint, CachedLayout layout) {
    if (m_capacity == 0) {
        return;
    }

    auto it = m_index.find(id);
    if (it != m_index.end()) {
        it->second->fingerprint = fingerprint;
        it->second->layout = std::move(layout);
        m_entries.splice(m_entries.begin(), m_entries, it->second);
        return;
    }

    m_entries.push_front(Slot{id, fingerprint, std::move(layout)});
    m_index[id] = m_entries.begin();
    evictOverflow();
}

void AttributeCache::invalidate(const std::string &id) {
    auto it = m_index.find(id);
    if (it == m_index.end()) {
        return;
    }
    m_entries.erase(it->second);
    m_index.erase(it);
}

void AttributeCache::invalidateAll() {
    m_entries.clear();
    m_index.clear();
}

void AttributeCache::setCapacity(size_t capacity) {
    m_capacity = capacity;
    evictOverflow();
}

void AttributeCache::resetCounters() {
    m_hits = 0;
    m_misses = 0;
}

void AttributeCache::evictOverflow() {
    while (m_entries.size() > m_capacity) {
        m_index.erase(m_entries.back().id);
        m_entries.pop_back();
    }
}
