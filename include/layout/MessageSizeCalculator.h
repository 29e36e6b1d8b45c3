#pragma once

#include <memory>

#include "layout/LayoutContext.h"
#include "layout/SizeCalculator.h"

class MessageSizeCalculator;

/**
 * @brief Sizes the message container for one family of message kinds
 */
class ContainerSizer {
  public:
    virtual ~ContainerSizer() = default;

    /// Container size before attachments are added
    virtual Size containerSize(const Message &message, const IndexPath &position,
                               const MessageSizeCalculator &calculator) const = 0;

    /// Fill in the kind-specific attributes (label font and insets)
    virtual void decorate(LayoutAttributes &attributes, const Message &message, const IndexPath &position,
                          const MessageSizeCalculator &calculator) const {
        (void)attributes;
        (void)message;
        (void)position;
        (void)calculator;
    }
};

/**
 * @brief Shared cell composition: avatar, four caption labels, container, accessory and attachment.
 * The container itself is sized by the ContainerSizer.
 */
class MessageSizeCalculator : public SizeCalculator {
  public:
    MessageSizeCalculator(const LayoutContext &context, std::unique_ptr<ContainerSizer> sizer);

    LayoutAttributes computeAttributes(const Entry &entry, const IndexPath &position) const override;
    Size computeCellSize(const Entry &entry, const IndexPath &position) const override;

    const LayoutContext &context() const { return m_context; }

    int cellContentHeight(const Message &message, const IndexPath &position) const;

    Size avatarSize(const Message &message, const IndexPath &position) const;

    /// Never Natural: resolved to trailing for the current user and leading otherwise
    AvatarPosition avatarPosition(const Message &message, const IndexPath &position) const;

    Size cellTopLabelSize(const Message &message, const IndexPath &position) const;
    Size cellBottomLabelSize(const Message &message, const IndexPath &position) const;
    Size messageTopLabelSize(const Message &message, const IndexPath &position) const;
    Size messageBottomLabelSize(const Message &message, const IndexPath &position) const;

    LabelAlignment cellTopLabelAlignment(const Message &message, const IndexPath &position) const;
    LabelAlignment cellBottomLabelAlignment(const Message &message, const IndexPath &position) const;
    LabelAlignment messageTopLabelAlignment(const Message &message, const IndexPath &position) const;
    LabelAlignment messageBottomLabelAlignment(const Message &message, const IndexPath &position) const;

    Size messageTimeLabelSize(const Message &message, const IndexPath &position) const;

    EdgeInsets messageContainerPadding(const Message &message) const;

    /**
     * @brief Item width minus avatar, container padding, accessory, accessory padding and the avatar edge
     * padding; clamped to zero
     */
    int messageContainerMaxWidth(const Message &message, const IndexPath &position) const;

    Size messageContainerSize(const Message &message, const IndexPath &position) const;

    /// Container size grown to the max width and by the attachment height when an attachment is present
    Size messageContainerSizeWithAttachments(const Message &message, const IndexPath &position) const;

    Size accessoryViewSize(const Message &message, const IndexPath &position) const;
    HorizontalEdgeInsets accessoryViewPadding(const Message &message) const;
    AccessoryPosition accessoryViewPosition(const Message &message, const IndexPath &position) const;

    EdgeInsets attachmentPadding(const Message &message) const;

    /// Zero unless the policy reports an attachment height
    Size attachmentViewSize(const Message &message, const IndexPath &position) const;

  private:
    const Message &messageOf(const Entry &entry) const;
    Size labelSize(int height) const;

    const LayoutContext &m_context;
    std::unique_ptr<ContainerSizer> m_sizer;
};
