#pragma once

#include "layout/LayoutPolicy.h"
#include "layout/MessageSource.h"
#include "layout/SizingConfiguration.h"
#include "layout/TextMeasurer.h"

/**
 * @brief What a size calculator reads during a pass: the host collaborators (not owned), the
 * configuration and the item width.
 */
class LayoutContext {
  public:
    /// @throws PreconditionFailure if no source is bound
    const MessageSource &source() const;
    /// @throws PreconditionFailure if no policy is bound
    const LayoutPolicy &policy() const;
    /// @throws PreconditionFailure if no measurer is bound
    TextMeasurer &measurer() const;

    bool hasSource() const { return m_source != nullptr; }
    bool hasPolicy() const { return m_policy != nullptr; }
    bool hasMeasurer() const { return m_measurer != nullptr; }

    void setSource(const MessageSource *source) { m_source = source; }
    void setPolicy(const LayoutPolicy *policy) { m_policy = policy; }
    void setMeasurer(TextMeasurer *measurer) { m_measurer = measurer; }

    const SizingConfiguration &configuration() const { return m_configuration; }
    void setConfiguration(const SizingConfiguration &configuration) { m_configuration = configuration; }

    /// Available content width, never negative
    int itemWidth() const { return m_itemWidth; }
    void setItemWidth(int width);

    bool isMine(const Message &message) const { return source().isMine(message); }
    const SenderStyle &styleFor(const Message &message) const { return m_configuration.styleFor(isMine(message)); }

  private:
    const MessageSource *m_source = nullptr;
    const LayoutPolicy *m_policy = nullptr;
    TextMeasurer *m_measurer = nullptr;
    SizingConfiguration m_configuration;
    int m_itemWidth = 0;
};
