#pragma once

#include <QString>

namespace whenami {
namespace core {

enum class ErrorCode
{
    None,
    InvalidDateFormat,
    InvalidRange,
    MalformedEvent,
    InvalidTimezone,
    ConfigError,
    SourceError,
};

struct EngineError
{
    ErrorCode code = ErrorCode::None;
    QString message;

    bool isError() const { return code != ErrorCode::None; }
};

QString errorCodeName(ErrorCode code);

// Fills *error when the caller asked for it.
void setError(EngineError *error, ErrorCode code, const QString &message);

} // namespace core
} // namespace whenami
