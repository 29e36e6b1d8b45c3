#pragma once

#include <optional>

#include "layout/Geometry.h"
#include "models/Message.h"
#include "models/StyledText.h"

/**
 * @brief Supplies the messages of a thread. Must not change while an update pass is running.
 */
class MessageSource {
  public:
    virtual ~MessageSource() = default;

    virtual int sectionCount() const = 0;
    virtual int itemCount(int section) const = 0;
    virtual Message message(const IndexPath &position) const = 0;

    /// True for messages sent by the current user
    virtual bool isMine(const Message &message) const = 0;

    /// Text of the timestamp shown beside the message; none by default
    virtual std::optional<StyledText> timestampLabelText(const Message &message, const IndexPath &position) const {
        (void)message;
        (void)position;
        return std::nullopt;
    }
};
