#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "models/Entry.h"

enum class UpdateKind {
    NoOp,             ///< Nothing to do
    SelectiveRefresh, ///< Same entries in the same places; some contents changed
    Structural        ///< Entries were added, removed or moved
};

struct EntryRefresh {
    std::string id;
    size_t index = 0; ///< Position in the new ordering

    bool operator==(const EntryRefresh &other) const { return id == other.id && index == other.index; }
};

/**
 * @brief The outcome of comparing two snapshots of a thread
 */
struct UpdatePlan {
    UpdateKind kind = UpdateKind::NoOp;
    std::vector<Entry> entries;        ///< The full new ordering
    std::vector<std::string> inserted; ///< Ids only in the new snapshot, in new order
    std::vector<std::string> removed;  ///< Ids only in the old snapshot, in old order
    std::vector<std::string> moved;    ///< Ids in both whose order or position changed
    std::vector<EntryRefresh> refreshed; ///< Entries in both whose content changed

    bool isStructural() const { return kind == UpdateKind::Structural; }
};

namespace Reconciler {

/**
 * @brief Classify the change from previous to next. Pure; neither input is modified.
 *
 * Any difference in the set of ids, in their order, or in an entry's index path is structural. Otherwise
 * entries whose content fingerprint changed are refreshed in place; with none, the pass is a no-op. The typing
 * indicator takes part through its fixed id, so showing or hiding it is structural.
 */
UpdatePlan reconcile(const std::vector<Entry> &previous, const std::vector<Entry> &next);

const char *toString(UpdateKind kind);

} // namespace Reconciler
