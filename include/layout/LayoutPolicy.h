#pragma once

#include <optional>

#include "layout/Geometry.h"
#include "layout/LayoutAttributes.h"
#include "models/Message.h"

/**
 * @brief Per-message sizing decisions made by the host.
 *
 * Caption label heights must always be answered. Every other facet returns std::nullopt to fall back to the
 * SizingConfiguration default for the sender's side.
 */
class LayoutPolicy {
  public:
    virtual ~LayoutPolicy() = default;

    virtual int cellTopLabelHeight(const Message &message, const IndexPath &position) const = 0;
    virtual int cellBottomLabelHeight(const Message &message, const IndexPath &position) const = 0;
    virtual int messageTopLabelHeight(const Message &message, const IndexPath &position) const = 0;
    virtual int messageBottomLabelHeight(const Message &message, const IndexPath &position) const = 0;

    virtual std::optional<Size> avatarSize(const Message &, const IndexPath &) const { return std::nullopt; }
    virtual std::optional<AvatarPosition> avatarPosition(const Message &, const IndexPath &) const {
        return std::nullopt;
    }

    virtual std::optional<LabelAlignment> cellTopLabelAlignment(const Message &, const IndexPath &) const {
        return std::nullopt;
    }
    virtual std::optional<LabelAlignment> cellBottomLabelAlignment(const Message &, const IndexPath &) const {
        return std::nullopt;
    }
    virtual std::optional<LabelAlignment> messageTopLabelAlignment(const Message &, const IndexPath &) const {
        return std::nullopt;
    }
    virtual std::optional<LabelAlignment> messageBottomLabelAlignment(const Message &, const IndexPath &) const {
        return std::nullopt;
    }

    virtual std::optional<Size> accessoryViewSize(const Message &, const IndexPath &) const { return std::nullopt; }
    virtual std::optional<AccessoryPosition> accessoryViewPosition(const Message &, const IndexPath &) const {
        return std::nullopt;
    }

    /**
     * @brief Height of an inline attachment laid out at maxWidth. std::nullopt means no attachment
     * (or its content is not loaded yet; invalidate the message once it is).
     */
    virtual std::optional<int> attachmentHeight(const Message &, const IndexPath &, int maxWidth) const {
        (void)maxWidth;
        return std::nullopt;
    }

    virtual std::optional<int> typingIndicatorHeight(const IndexPath &) const { return std::nullopt; }

    /**
     * @brief True if any answer above depends on the IndexPath rather than the message alone. Cached layouts
     * are then reused only at the position they were computed for; otherwise a message that moves (older
     * history prepended, say) keeps its layout.
     */
    virtual bool layoutDependsOnPosition() const { return false; }

    virtual Size headerSize(int section) const {
        (void)section;
        return {};
    }
    virtual Size footerSize(int section) const {
        (void)section;
        return {};
    }
};
