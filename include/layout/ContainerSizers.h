#pragma once

#include "layout/MessageSizeCalculator.h"

/**
 * @brief Text, attributed text and emoji: the label measured at the container max width plus the label insets.
 * An attachment-only message keeps just the top inset.
 */
class TextContainerSizer : public ContainerSizer {
  public:
    Size containerSize(const Message &message, const IndexPath &position,
                       const MessageSizeCalculator &calculator) const override;
    void decorate(LayoutAttributes &attributes, const Message &message, const IndexPath &position,
                  const MessageSizeCalculator &calculator) const override;

    /// The label text of a text-like or link-preview message
    static StyledText labelText(const Message &message, const SizingConfiguration &config);
};

/**
 * @brief Photo and video: the item scaled down to the max width, keeping its aspect ratio
 */
class MediaContainerSizer : public ContainerSizer {
  public:
    Size containerSize(const Message &message, const IndexPath &position,
                       const MessageSizeCalculator &calculator) const override;
};

/**
 * @brief Location snapshot: its own size, width capped at the max width
 */
class LocationContainerSizer : public ContainerSizer {
  public:
    Size containerSize(const Message &message, const IndexPath &position,
                       const MessageSizeCalculator &calculator) const override;
};

/**
 * @brief Audio player: its own size, width capped at the max width
 */
class AudioContainerSizer : public ContainerSizer {
  public:
    Size containerSize(const Message &message, const IndexPath &position,
                       const MessageSizeCalculator &calculator) const override;
};

class ContactContainerSizer : public ContainerSizer {
  public:
    static constexpr int kMinimumHeight = 65;

    Size containerSize(const Message &message, const IndexPath &position,
                       const MessageSizeCalculator &calculator) const override;
    void decorate(LayoutAttributes &attributes, const Message &message, const IndexPath &position,
                  const MessageSizeCalculator &calculator) const override;
};

/**
 * @brief Text container followed by a preview block: a square image beside the title, teaser and domain lines.
 * Always spans the max width.
 */
class LinkPreviewContainerSizer : public ContainerSizer {
  public:
    static constexpr int kImageViewSize = 60;
    static constexpr int kImageViewMargin = 8;

    Size containerSize(const Message &message, const IndexPath &position,
                       const MessageSizeCalculator &calculator) const override;
    void decorate(LayoutAttributes &attributes, const Message &message, const IndexPath &position,
                  const MessageSizeCalculator &calculator) const override;

  private:
    TextContainerSizer m_text;
};
