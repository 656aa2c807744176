#include "whenami/core/EngineError.hpp"

namespace whenami {
namespace core {

QString errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::None:
        return QStringLiteral("None");
    case ErrorCode::InvalidDateFormat:
        return QStringLiteral("InvalidDateFormat");
    case ErrorCode::InvalidRange:
        return QStringLiteral("InvalidRange");
    case ErrorCode::MalformedEvent:
        return QStringLiteral("MalformedEvent");
    case ErrorCode::InvalidTimezone:
        return QStringLiteral("InvalidTimezone");
    case ErrorCode::ConfigError:
        return QStringLiteral("ConfigError");
    case ErrorCode::SourceError:
        return QStringLiteral("SourceError");
    }
    return QStringLiteral("Unknown");
}

void setError(EngineError *error, ErrorCode code, const QString &message)
{
    if (!error) {
        return;
    }
    error->code = code;
    error->message = message;
}

} // namespace core
} // namespace whenami
