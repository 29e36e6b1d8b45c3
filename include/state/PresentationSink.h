#pragma once

#include "state/Reconciler.h"

/**
 * @brief The view side of an update pass. Geometry for the new entries is already available from the engine
 * when either call is made.
 */
class PresentationSink {
  public:
    virtual ~PresentationSink() = default;

    /// Entries were inserted, removed or moved: rebuild from plan.entries, animating if asked
    virtual void applyStructural(const UpdatePlan &plan, bool animated) = 0;

    /// Redraw plan.refreshed in place; nothing moves
    virtual void applyRefresh(const UpdatePlan &plan, bool animated) = 0;
};
