#pragma once

#include <algorithm>

/**
 * @brief Integer size in pixels. All computed sizes are rounded up to whole pixels.
 */
struct Size {
    int width = 0;
    int height = 0;

    bool isZero() const { return width == 0 && height == 0; }

    /// Negative components clamped to zero
    Size clamped() const { return {std::max(0, width), std::max(0, height)}; }

    bool operator==(const Size &other) const { return width == other.width && height == other.height; }
    bool operator!=(const Size &other) const { return !(*this == other); }
};

struct EdgeInsets {
    int top = 0;
    int left = 0;
    int bottom = 0;
    int right = 0;

    int horizontal() const { return left + right; }
    int vertical() const { return top + bottom; }

    bool operator==(const EdgeInsets &other) const {
        return top == other.top && left == other.left && bottom == other.bottom && right == other.right;
    }
    bool operator!=(const EdgeInsets &other) const { return !(*this == other); }
};

struct HorizontalEdgeInsets {
    int left = 0;
    int right = 0;

    int horizontal() const { return left + right; }

    bool operator==(const HorizontalEdgeInsets &other) const { return left == other.left && right == other.right; }
    bool operator!=(const HorizontalEdgeInsets &other) const { return !(*this == other); }
};

/**
 * @brief Position of an entry in the thread: section, then item within the section
 */
struct IndexPath {
    int section = 0;
    int item = 0;

    bool operator==(const IndexPath &other) const { return section == other.section && item == other.item; }
    bool operator!=(const IndexPath &other) const { return !(*this == other); }
    bool operator<(const IndexPath &other) const {
        return section != other.section ? section < other.section : item < other.item;
    }
};
