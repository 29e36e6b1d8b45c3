#pragma once

#include <map>
#include <memory>

#include "layout/LayoutContext.h"
#include "layout/SizeCalculator.h"

/**
 * @brief Picks the size calculator for an entry by its message kind.
 *
 * Every built-in kind has a calculator from construction; custom messages have none until the host
 * registers one.
 */
class CalculatorTable {
  public:
    explicit CalculatorTable(const LayoutContext &context);

    /// Replace the calculator for a kind; nullptr removes it
    void registerCalculator(MessageKindTag tag, std::shared_ptr<SizeCalculator> calculator);
    void setTypingIndicatorCalculator(std::shared_ptr<SizeCalculator> calculator);

    bool hasCalculator(MessageKindTag tag) const { return m_calculators.count(tag) != 0; }

    /**
     * @throws PreconditionFailure (UnsupportedMessageKind) when nothing handles the entry
     */
    const SizeCalculator &calculatorFor(const Entry &entry) const;

  private:
    std::map<MessageKindTag, std::shared_ptr<SizeCalculator>> m_calculators;
    std::shared_ptr<SizeCalculator> m_typingIndicator;
};
