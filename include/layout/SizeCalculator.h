#pragma once

#include "layout/Geometry.h"
#include "layout/LayoutAttributes.h"
#include "models/Entry.h"

/**
 * @brief Turns one entry at one position into cell geometry. Implementations are pure: the same entry,
 * position and configuration always give the same result.
 */
class SizeCalculator {
  public:
    virtual ~SizeCalculator() = default;

    virtual LayoutAttributes computeAttributes(const Entry &entry, const IndexPath &position) const = 0;

    /// Width is always the item width
    virtual Size computeCellSize(const Entry &entry, const IndexPath &position) const = 0;
};
