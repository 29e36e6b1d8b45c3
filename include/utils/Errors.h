#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Raised when the engine is asked to work without a required collaborator,
 * or for a message kind no calculator handles. Computed geometry would be meaningless,
 * so callers are expected to fix their wiring rather than recover.
 */
class PreconditionFailure : public std::logic_error {
  public:
    enum class Reason {
        MissingMessageSource,
        MissingLayoutPolicy,
        MissingTextMeasurer,
        UnsupportedMessageKind,
        IndexOutOfRange
    };

    PreconditionFailure(Reason reason, const std::string &detail);

    Reason reason() const { return m_reason; }

    static const char *describe(Reason reason);

  private:
    Reason m_reason;
};

/**
 * @brief Log the failure and throw PreconditionFailure
 */
[[noreturn]] void failPrecondition(PreconditionFailure::Reason reason, const std::string &detail);
