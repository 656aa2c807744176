#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcCore)
Q_DECLARE_LOGGING_CATEGORY(lcData)
Q_DECLARE_LOGGING_CATEGORY(lcConfig)

namespace whenami {
namespace core {

// Switches the whenami.* categories between warnings-only and full debug output.
void enableDebugLogging(bool enabled);

} // namespace core
} // namespace whenami
