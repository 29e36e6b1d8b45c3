#include "layout/ScrollGeometry.h"

#include <algorithm>

namespace ScrollGeometry {

void HeightCache::clear() {
    m_heights.clear();
    m_spacing.clear();
    m_offsets.clear();
    m_trailing = 0;
    m_offsetsDirty = false;
}

void HeightCache::resize(size_t newSize) {
    m_heights.resize(newSize, 0);
    m_spacing.resize(newSize, 0);
    m_offsetsDirty = true;
}

void HeightCache::setHeight(size_t index, int height) {
    if (index >= m_heights.size()) {
        resize(index + 1);
    }

    height = std::max(0, height);
    if (m_heights[index] != height) {
        m_heights[index] = height;
        m_offsetsDirty = true;
    }
}

int HeightCache::getHeight(size_t index) const {
    if (index >= m_heights.size()) {
        return 0;
    }
    return m_heights[index];
}

void HeightCache::setSpacingBefore(size_t index, int spacing) {
    if (index >= m_spacing.size()) {
        resize(index + 1);
    }

    spacing = std::max(0, spacing);
    if (m_spacing[index] != spacing) {
        m_spacing[index] = spacing;
        m_offsetsDirty = true;
    }
}

void HeightCache::setTrailingSpacing(int spacing) { m_trailing = std::max(0, spacing); }

int HeightCache::getOffsetAt(size_t index) const {
    if (index >= m_heights.size()) {
        return 0;
    }

    if (m_offsetsDirty) {
        rebuildOffsets();
    }

    return m_offsets[index];
}

int HeightCache::getTotalHeight() const {
    if (m_heights.empty()) {
        return m_trailing;
    }

    if (m_offsetsDirty) {
        rebuildOffsets();
    }

    return m_offsets.back() + m_heights.back() + m_trailing;
}

void HeightCache::rebuildOffsets() const {
    m_offsets.resize(m_heights.size());

    int cumulativeOffset = 0;
    for (size_t i = 0; i < m_heights.size(); ++i) {
        cumulativeOffset += m_spacing[i];
        m_offsets[i] = cumulativeOffset;
        cumulativeOffset += m_heights[i];
    }

    m_offsetsDirty = false;
}

int HeightCache::firstEndingAfter(int y) const {
    // Bottoms are non-decreasing, so the first item reaching below y is found by bisection
    int lo = 0;
    int hi = static_cast<int>(m_heights.size());
    while (lo < hi) {
        int mid = lo + (hi - lo) / 2;
        if (m_offsets[mid] + m_heights[mid] > y) {
            hi = mid;
        } else {
            lo = mid + 1;
        }
    }
    return lo;
}

int HeightCache::lastStartingBefore(int y) const {
    auto it = std::lower_bound(m_offsets.begin(), m_offsets.end(), y);
    return static_cast<int>(it - m_offsets.begin()) - 1;
}

ViewportRange HeightCache::calculateRange(int scrollOffset, int viewportHeight, int renderPadding) const {
    ViewportRange range;
    if (m_heights.empty() || viewportHeight <= 0) {
        return range;
    }

    if (m_offsetsDirty) {
        rebuildOffsets();
    }

    const int viewportTop = std::max(0, scrollOffset);
    const int viewportBottom = scrollOffset + viewportHeight;
    const int renderTop = std::max(0, viewportTop - renderPadding);
    const int renderBottom = viewportBottom + renderPadding;
    const int numItems = static_cast<int>(m_heights.size());

    range.firstVisible = std::min(firstEndingAfter(viewportTop), numItems - 1);
    range.lastVisible = std::max(lastStartingBefore(viewportBottom), 0);
    range.renderFirst = std::min(firstEndingAfter(renderTop), numItems - 1);
    range.renderLast = std::max(lastStartingBefore(renderBottom), 0);

    if (range.lastVisible < range.firstVisible) {
        // Viewport falls entirely in spacing or past the content
        range.lastVisible = range.firstVisible - 1;
    }

    return range;
}

} // namespace ScrollGeometry
