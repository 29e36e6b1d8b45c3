#include "layout/LayoutEngine.h"

#include "utils/Errors.h"
#include "utils/Logger.h"

#include <algorithm>
#include <functional>

namespace {
Fingerprint layoutKey(const Entry &entry, const IndexPath &position, bool positional) {
    Fingerprint key = entry.contentFingerprint();
    if (positional) {
        key = combineFingerprint(key, std::hash<int>{}(position.section));
        key = combineFingerprint(key, std::hash<int>{}(position.item));
    }
    return key;
}
} // namespace

LayoutEngine::LayoutEngine(const SizingConfiguration &configuration)
    : m_calculators(m_context), m_cache(configuration.cacheCapacity) {
    m_context.setConfiguration(configuration);
}

void LayoutEngine::setMessageSource(const MessageSource *source) {
    m_context.setSource(source);
    invalidateAll();
}

void LayoutEngine::setLayoutPolicy(const LayoutPolicy *policy) {
    m_context.setPolicy(policy);
    invalidateAll();
}

void LayoutEngine::setTextMeasurer(TextMeasurer *measurer) {
    m_context.setMeasurer(measurer);
    invalidateAll();
}

void LayoutEngine::setConfiguration(const SizingConfiguration &configuration) {
    m_context.setConfiguration(configuration);
    m_cache.setCapacity(configuration.cacheCapacity);
    invalidateAll();
}

void LayoutEngine::setAvailableWidth(int width) {
    if (width <= 0) {
        Logger::log(Logger::Level::WARN, "LayoutEngine",
                    "Available width " + std::to_string(width) + " leaves no room; cells collapse to zero width");
    }

    const int previous = m_context.itemWidth();
    m_context.setItemWidth(width);
    if (m_context.itemWidth() != previous) {
        invalidateAll();
    }
}

void LayoutEngine::registerCalculator(MessageKindTag tag, std::shared_ptr<SizeCalculator> calculator) {
    m_calculators.registerCalculator(tag, std::move(calculator));
    invalidateAll();
}

void LayoutEngine::setEntries(std::vector<Entry> entries, int sectionCount) {
    m_entries = std::move(entries);

    m_indexById.clear();
    int derivedSections = 0;
    for (size_t i = 0; i < m_entries.size(); ++i) {
        m_indexById[m_entries[i].id()] = i;
        derivedSections = std::max(derivedSections, m_entries[i].position().section + 1);
    }
    m_sectionCount = std::max(sectionCount, derivedSections);

    markDirty();
}

std::optional<size_t> LayoutEngine::indexOf(const std::string &id) const {
    auto it = m_indexById.find(id);
    if (it == m_indexById.end()) {
        return std::nullopt;
    }
    return it->second;
}

CachedLayout LayoutEngine::layoutAt(size_t index) {
    if (index >= m_entries.size()) {
        failPrecondition(PreconditionFailure::Reason::IndexOutOfRange,
                         "index " + std::to_string(index) + " of " + std::to_string(m_entries.size()) + " entries");
    }

    const Entry &entry = m_entries[index];
    const IndexPath &position = entry.position();
    const bool positional = m_context.hasPolicy() && m_context.policy().layoutDependsOnPosition();
    const Fingerprint key = layoutKey(entry, position, positional);

    if (const CachedLayout *cached = m_cache.lookup(entry.id(), key)) {
        CachedLayout layout = *cached;
        layout.attributes.indexPath = position;
        return layout;
    }

    const SizeCalculator &calculator = m_calculators.calculatorFor(entry);
    CachedLayout layout{calculator.computeAttributes(entry, position), calculator.computeCellSize(entry, position)};
    m_cache.store(entry.id(), key, layout);
    return layout;
}

LayoutAttributes LayoutEngine::attributesAt(size_t index) { return layoutAt(index).attributes; }

Size LayoutEngine::sizeAt(size_t index) { return layoutAt(index).cellSize; }

Size LayoutEngine::headerSize(int section) const {
    if (isSectionReservedForTypingIndicator(section)) {
        return {};
    }
    return m_context.policy().headerSize(section).clamped();
}

Size LayoutEngine::footerSize(int section) const {
    if (isSectionReservedForTypingIndicator(section)) {
        return {};
    }
    return m_context.policy().footerSize(section).clamped();
}

bool LayoutEngine::isSectionReservedForTypingIndicator(int section) const {
    return std::any_of(m_entries.begin(), m_entries.end(), [section](const Entry &entry) {
        return entry.isTypingIndicator() && entry.position().section == section;
    });
}

void LayoutEngine::ensureGeometry() {
    if (!m_geometryDirty) {
        return;
    }

    m_geometry.clear();
    m_geometry.resize(m_entries.size());

    int pending = 0;
    size_t index = 0;
    for (int section = 0; section < m_sectionCount; ++section) {
        pending += headerSize(section).height;

        while (index < m_entries.size() && m_entries[index].position().section == section) {
            m_geometry.setSpacingBefore(index, pending);
            m_geometry.setHeight(index, sizeAt(index).height);
            pending = 0;
            ++index;
        }

        pending += footerSize(section).height;
    }

    // Entries out of section order still get placed, after everything else
    for (; index < m_entries.size(); ++index) {
        m_geometry.setSpacingBefore(index, pending);
        m_geometry.setHeight(index, sizeAt(index).height);
        pending = 0;
    }
    m_geometry.setTrailingSpacing(pending);

    m_geometryDirty = false;
}

int LayoutEngine::offsetAt(size_t index) {
    ensureGeometry();
    return m_geometry.getOffsetAt(index);
}

int LayoutEngine::contentHeight() {
    ensureGeometry();
    return m_geometry.getTotalHeight();
}

ScrollGeometry::ViewportRange LayoutEngine::visibleRange(int scrollOffset, int viewportHeight, int renderPadding) {
    ensureGeometry();
    return m_geometry.calculateRange(scrollOffset, viewportHeight, renderPadding);
}

void LayoutEngine::invalidate(const std::string &id) {
    m_cache.invalidate(id);
    markDirty();
}

void LayoutEngine::invalidateAll() {
    Logger::log(Logger::Level::DEBUG, "LayoutEngine",
                "Invalidating " + std::to_string(m_cache.size()) + " cached layouts");
    m_cache.invalidateAll();
    markDirty();
}
