#pragma once

#include <functional>
#include <vector>

#include "layout/LayoutEngine.h"
#include "state/PresentationSink.h"
#include "state/Reconciler.h"

/**
 * @brief Drives update passes: snapshot the message source, reconcile against the previous snapshot,
 * install the result into the engine and hand the plan to the view.
 */
class ThreadController {
  public:
    using Completion = std::function<void()>;

    explicit ThreadController(LayoutEngine &engine, PresentationSink *sink = nullptr);

    ThreadController(const ThreadController &) = delete;
    ThreadController &operator=(const ThreadController &) = delete;

    void setPresentationSink(PresentationSink *sink) { m_sink = sink; }

    /**
     * @brief Run one update pass. The completion runs once the plan has been applied (or immediately
     * for a no-op pass) and after the pass has ended, so it may start the next one.
     * @return false if a pass is already being applied; nothing changes in that case
     * @throws PreconditionFailure if the engine has no message source
     */
    bool update(bool animated, const Completion &completion = {});

    /// Show or hide the typing indicator and run an update pass for it
    bool setTypingIndicatorHidden(bool hidden, bool animated = false, const Completion &completion = {});
    bool isTypingIndicatorHidden() const { return m_typingIndicatorHidden; }

    bool isSectionReservedForTypingIndicator(int section) const;

    /// Entries as of the last applied pass
    const std::vector<Entry> &snapshot() const { return m_previous; }

    /// One section per source section, then the typing indicator's own section when it is shown
    std::vector<Entry> buildEntries(int &sectionCount) const;

  private:
    void apply(bool animated);

    LayoutEngine &m_engine;
    PresentationSink *m_sink;
    std::vector<Entry> m_previous;
    bool m_typingIndicatorHidden = true;
    bool m_updating = false;
};
