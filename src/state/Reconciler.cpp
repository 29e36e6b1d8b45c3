#include "state/Reconciler.h"

#include <unordered_map>

namespace Reconciler {

namespace {
std::unordered_map<std::string, size_t> indexById(const std::vector<Entry> &entries) {
    std::unordered_map<std::string, size_t> index;
    index.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        index.emplace(entries[i].id(), i);
    }
    return index;
}
} // namespace

UpdatePlan reconcile(const std::vector<Entry> &previous, const std::vector<Entry> &next) {
    UpdatePlan plan;
    plan.entries = next;

    const auto previousIndex = indexById(previous);
    const auto nextIndex = indexById(next);

    for (const auto &entry : next) {
        if (previousIndex.count(entry.id()) == 0) {
            plan.inserted.push_back(entry.id());
        }
    }
    for (const auto &entry : previous) {
        if (nextIndex.count(entry.id()) == 0) {
            plan.removed.push_back(entry.id());
        }
    }

    // Walk the surviving entries in both orders; a mismatch in rank or index path is a move
    std::vector<const Entry *> survivorsBefore;
    for (const auto &entry : previous) {
        if (nextIndex.count(entry.id()) != 0) {
            survivorsBefore.push_back(&entry);
        }
    }

    size_t rank = 0;
    for (size_t i = 0; i < next.size(); ++i) {
        const Entry &entry = next[i];
        auto it = previousIndex.find(entry.id());
        if (it == previousIndex.end()) {
            continue;
        }

        const Entry &before = previous[it->second];
        const bool sameRank = rank < survivorsBefore.size() && survivorsBefore[rank]->id() == entry.id();
        ++rank;

        if (!sameRank || before.position() != entry.position()) {
            plan.moved.push_back(entry.id());
        }

        if (!entry.isTypingIndicator() && before.contentFingerprint() != entry.contentFingerprint()) {
            plan.refreshed.push_back(EntryRefresh{entry.id(), i});
        }
    }

    if (!plan.inserted.empty() || !plan.removed.empty() || !plan.moved.empty()) {
        plan.kind = UpdateKind::Structural;
    } else if (!plan.refreshed.empty()) {
        plan.kind = UpdateKind::SelectiveRefresh;
    } else {
        plan.kind = UpdateKind::NoOp;
    }

    return plan;
}

const char *toString(UpdateKind kind) {
    switch (kind) {
    case UpdateKind::NoOp:
        return "no-op";
    case UpdateKind::SelectiveRefresh:
        return "selective-refresh";
    case UpdateKind::Structural:
        return "structural";
    }
    return "unknown";
}

} // namespace Reconciler
