#pragma once

#include "layout/LayoutContext.h"
#include "layout/SizeCalculator.h"

/**
 * @brief Centred caption across the whole cell. No avatar, captions or accessory.
 */
class SystemMessageSizeCalculator : public SizeCalculator {
  public:
    explicit SystemMessageSizeCalculator(const LayoutContext &context);

    LayoutAttributes computeAttributes(const Entry &entry, const IndexPath &position) const override;
    Size computeCellSize(const Entry &entry, const IndexPath &position) const override;

    /// Caption measured at the item width less the padding; width is always the item width
    Size messageContainerSize(const Message &message) const;

  private:
    const SystemKind &systemKindOf(const Entry &entry) const;

    const LayoutContext &m_context;
};

/**
 * @brief The transient "typing" bubble: full item width, height from the policy or the configuration
 */
class TypingIndicatorSizeCalculator : public SizeCalculator {
  public:
    explicit TypingIndicatorSizeCalculator(const LayoutContext &context);

    LayoutAttributes computeAttributes(const Entry &entry, const IndexPath &position) const override;
    Size computeCellSize(const Entry &entry, const IndexPath &position) const override;

  private:
    const LayoutContext &m_context;
};
