#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "layout/AttributeCache.h"
#include "layout/CalculatorTable.h"
#include "layout/LayoutContext.h"
#include "layout/ScrollGeometry.h"
#include "models/Entry.h"

/**
 * @brief Owns the ordered entries of a thread and answers per-index geometry for the view.
 *
 * Geometry is computed on demand by the calculator registered for each entry's kind and cached per entry id.
 * A cached layout is reused only while the entry's content fingerprint and position are unchanged; width,
 * configuration and collaborator changes drop the whole cache.
 *
 * Not thread-safe: every call must come from the thread running the update passes.
 */
class LayoutEngine {
  public:
    explicit LayoutEngine(const SizingConfiguration &configuration = {});

    LayoutEngine(const LayoutEngine &) = delete;
    LayoutEngine &operator=(const LayoutEngine &) = delete;

    // Collaborators are not owned and must outlive the engine (or be unbound first)
    void setMessageSource(const MessageSource *source);
    void setLayoutPolicy(const LayoutPolicy *policy);
    void setTextMeasurer(TextMeasurer *measurer);

    const MessageSource &messageSource() const { return m_context.source(); }
    const LayoutContext &context() const { return m_context; }

    const SizingConfiguration &configuration() const { return m_context.configuration(); }
    void setConfiguration(const SizingConfiguration &configuration);

    int availableWidth() const { return m_context.itemWidth(); }
    void setAvailableWidth(int width);

    /// Replace the calculator for a message kind; required before custom messages can be laid out
    void registerCalculator(MessageKindTag tag, std::shared_ptr<SizeCalculator> calculator);

    /**
     * @brief Install a new ordering
     * @param sectionCount Number of sections including empty ones; -1 derives it from the entries
     */
    void setEntries(std::vector<Entry> entries, int sectionCount = -1);
    const std::vector<Entry> &entries() const { return m_entries; }
    int itemCount() const { return static_cast<int>(m_entries.size()); }
    int sectionCount() const { return m_sectionCount; }
    std::optional<size_t> indexOf(const std::string &id) const;

    /// @throws PreconditionFailure when index is out of range or a collaborator is missing
    LayoutAttributes attributesAt(size_t index);
    Size sizeAt(size_t index);

    int offsetAt(size_t index);
    int contentHeight();
    ScrollGeometry::ViewportRange visibleRange(int scrollOffset, int viewportHeight, int renderPadding = 200);

    /// Zero for the typing indicator's section
    Size headerSize(int section) const;
    Size footerSize(int section) const;

    bool isSectionReservedForTypingIndicator(int section) const;

    void invalidate(const std::string &id);
    void invalidateAll();

    const AttributeCache &cache() const { return m_cache; }

  private:
    CachedLayout layoutAt(size_t index);
    void ensureGeometry();
    void markDirty() { m_geometryDirty = true; }

    LayoutContext m_context;
    CalculatorTable m_calculators;
    AttributeCache m_cache;

    std::vector<Entry> m_entries;
    std::unordered_map<std::string, size_t> m_indexById;
    int m_sectionCount = 0;

    ScrollGeometry::HeightCache m_geometry;
    bool m_geometryDirty = true;
};
