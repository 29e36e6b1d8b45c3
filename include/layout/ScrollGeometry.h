#ifndef THREADLINE_SCROLL_GEOMETRY_H
#define THREADLINE_SCROLL_GEOMETRY_H

#include <cstddef>
#include <vector>

namespace ScrollGeometry {

/**
 * @brief Items intersecting the viewport, and the wider range worth rendering ahead of scrolling.
 * An empty range has last < first.
 */
struct ViewportRange {
    int firstVisible = 0;
    int lastVisible = -1;
    int renderFirst = 0;
    int renderLast = -1;

    bool empty() const { return lastVisible < firstVisible; }
};

/**
 * @brief Vertical placement of a list of items. Each item may be preceded by spacing (section headers and
 * footers fold into it); trailing spacing follows the last item. Offsets are rebuilt lazily.
 */
class HeightCache {
  public:
    void clear();
    void resize(size_t newSize);
    size_t size() const { return m_heights.size(); }

    void setHeight(size_t index, int height);
    int getHeight(size_t index) const;

    void setSpacingBefore(size_t index, int spacing);
    void setTrailingSpacing(int spacing);

    /// Top of the item; 0 past the end
    int getOffsetAt(size_t index) const;
    int getTotalHeight() const;

    ViewportRange calculateRange(int scrollOffset, int viewportHeight, int renderPadding = 200) const;

  private:
    void rebuildOffsets() const;
    int firstEndingAfter(int y) const;
    int lastStartingBefore(int y) const;

    std::vector<int> m_heights;
    std::vector<int> m_spacing;
    int m_trailing = 0;
    mutable std::vector<int> m_offsets;
    mutable bool m_offsetsDirty = false;
};

} // namespace ScrollGeometry

#endif
