#include "layout/LayoutContext.h"

#include "utils/Errors.h"

#include <algorithm>

const MessageSource &LayoutContext::source() const {
    if (!m_source) {
        failPrecondition(PreconditionFailure::Reason::MissingMessageSource, "bind a MessageSource before layout");
    }
    return *m_source;
}

const LayoutPolicy &LayoutContext::policy() const {
    if (!m_policy) {
        failPrecondition(PreconditionFailure::Reason::MissingLayoutPolicy, "bind a LayoutPolicy before layout");
    }
    return *m_policy;
}

TextMeasurer &LayoutContext::measurer() const {
    if (!m_measurer) {
        failPrecondition(PreconditionFailure::Reason::MissingTextMeasurer, "bind a TextMeasurer before layout");
    }
    return *m_measurer;
}

void LayoutContext::setItemWidth(int width) { m_itemWidth = std::max(0, width); }
