#include "state/ThreadController.h"

#include "utils/Logger.h"

namespace {
class UpdateGuard {
  public:
    explicit UpdateGuard(bool &flag) : m_flag(flag) { m_flag = true; }
    ~UpdateGuard() { m_flag = false; }

    UpdateGuard(const UpdateGuard &) = delete;
    UpdateGuard &operator=(const UpdateGuard &) = delete;

  private:
    bool &m_flag;
};
} // namespace

ThreadController::ThreadController(LayoutEngine &engine, PresentationSink *sink) : m_engine(engine), m_sink(sink) {}

std::vector<Entry> ThreadController::buildEntries(int &sectionCount) const {
    const MessageSource &source = m_engine.messageSource();

    std::vector<Entry> entries;
    const int sections = source.sectionCount();
    for (int section = 0; section < sections; ++section) {
        const int items = source.itemCount(section);
        for (int item = 0; item < items; ++item) {
            IndexPath position{section, item};
            entries.push_back(Entry::fromMessage(source.message(position), position));
        }
    }

    sectionCount = sections;
    if (!m_typingIndicatorHidden) {
        entries.push_back(Entry::typingIndicator(IndexPath{sections, 0}));
        sectionCount = sections + 1;
    }

    return entries;
}

bool ThreadController::update(bool animated, const Completion &completion) {
    if (m_updating) {
        Logger::log(Logger::Level::WARN, "ThreadController", "Update requested while a pass is being applied; ignored");
        return false;
    }
    apply(animated);

    if (completion) {
        completion();
    }
    return true;
}

void ThreadController::apply(bool animated) {
    UpdateGuard guard(m_updating);

    int sectionCount = 0;
    std::vector<Entry> entries = buildEntries(sectionCount);
    UpdatePlan plan = Reconciler::reconcile(m_previous, entries);

    Logger::log(Logger::Level::DEBUG, "ThreadController",
                std::string(Reconciler::toString(plan.kind)) + ": " + std::to_string(plan.inserted.size()) +
                    " inserted, " + std::to_string(plan.removed.size()) + " removed, " +
                    std::to_string(plan.moved.size()) + " moved, " + std::to_string(plan.refreshed.size()) +
                    " refreshed");

    if (plan.kind != UpdateKind::NoOp) {
        for (const auto &refresh : plan.refreshed) {
            m_engine.invalidate(refresh.id);
        }
        m_engine.setEntries(plan.entries, sectionCount);
        m_previous = std::move(entries);

        if (m_sink) {
            if (plan.isStructural()) {
                m_sink->applyStructural(plan, animated);
            } else {
                m_sink->applyRefresh(plan, animated);
            }
        }
    } else if (sectionCount != m_engine.sectionCount()) {
        // Empty sections came or went; only header and footer spacing changes
        m_engine.setEntries(plan.entries, sectionCount);
    }
}

bool ThreadController::setTypingIndicatorHidden(bool hidden, bool animated, const Completion &completion) {
    if (m_updating) {
        Logger::log(Logger::Level::WARN, "ThreadController",
                    "Typing indicator toggled while a pass is being applied; ignored");
        return false;
    }
    m_typingIndicatorHidden = hidden;
    return update(animated, completion);
}

bool ThreadController::isSectionReservedForTypingIndicator(int section) const {
    return m_engine.isSectionReservedForTypingIndicator(section);
}
