#include "utils/Errors.h"

#include "utils/Logger.h"

PreconditionFailure::PreconditionFailure(Reason reason, const std::string &detail)
    : std::logic_error(std::string(describe(reason)) + (detail.empty() ? "" : ": " + detail)), m_reason(reason) {}

const char *PreconditionFailure::describe(Reason reason) {
    switch (reason) {
    case Reason::MissingMessageSource:
        return "no message source bound";
    case Reason::MissingLayoutPolicy:
        return "no layout policy bound";
    case Reason::MissingTextMeasurer:
        return "no text measurer bound";
    case Reason::UnsupportedMessageKind:
        return "unsupported message kind";
    case Reason::IndexOutOfRange:
        return "index out of range";
    }
    return "precondition failed";
}

void failPrecondition(PreconditionFailure::Reason reason, const std::string &detail) {
    PreconditionFailure failure(reason, detail);
    Logger::log(Logger::Level::ERROR, "Precondition", failure.what());
    throw failure;
}
