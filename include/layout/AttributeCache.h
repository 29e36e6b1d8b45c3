#pragma once

#include <cstddef>
#include <list>
#include <string>
#include <unordered_map>

#include "layout/LayoutAttributes.h"
#include "models/Message.h"

struct CachedLayout {
    LayoutAttributes attributes;
    Size cellSize;
};

/**
 * @brief Bounded LRU map from entry id to the last layout computed for it.
 *
 * An entry only answers a lookup whose fingerprint matches the one it was stored with. Capacity 0 disables
 * caching.
 */
class AttributeCache {
  public:
    explicit AttributeCache(size_t capacity = 256);

    /**
     * @brief Find a layout stored for this id and fingerprint and mark it most recently used
     * @return The cached layout, valid until the cache is next modified; nullptr on a miss
     */
    const CachedLayout *lookup(const std::string &id, Fingerprint fingerprint);

    void store(const std::string &id, Fingerprint fingerprint, CachedLayout layout);

    void invalidate(const std::string &id);
    void invalidateAll();

    bool contains(const std::string &id) const { return m_index.count(id) != 0; }
    size_t size() const { return m_entries.size(); }
    size_t capacity() const { return m_capacity; }

    /// Shrinking evicts least recently used entries
    void setCapacity(size_t capacity);

    size_t hits() const { return m_hits; }
    size_t misses() const { return m_misses; }
    void resetCounters();

  private:
    struct Slot {
        std::string id;
        Fingerprint fingerprint;
        CachedLayout layout;
    };

    void evictOverflow();

    size_t m_capacity;
    std::list<Slot> m_entries; ///< Most recently used first
    std::unordered_map<std::string, std::list<Slot>::iterator> m_index;
    size_t m_hits = 0;
    size_t m_misses = 0;
};
