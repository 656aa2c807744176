#include "whenami/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcCore, "whenami.core", QtWarningMsg)
Q_LOGGING_CATEGORY(lcData, "whenami.data", QtWarningMsg)
Q_LOGGING_CATEGORY(lcConfig, "whenami.config", QtWarningMsg)

namespace whenami {
namespace core {

void enableDebugLogging(bool enabled)
{
    if (enabled) {
        QLoggingCategory::setFilterRules(QStringLiteral("whenami.*.debug=true\nwhenami.*.info=true"));
    } else {
        QLoggingCategory::setFilterRules(QStringLiteral("whenami.*.debug=false\nwhenami.*.info=false"));
    }
}

} // namespace core
} // namespace whenami
