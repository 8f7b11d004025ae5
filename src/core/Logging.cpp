#include "taskvault/core/Logging.hpp"

#include <QString>

namespace taskvault {
namespace core {

Q_LOGGING_CATEGORY(lcApp, "taskvault.app")
Q_LOGGING_CATEGORY(lcStorage, "taskvault.storage")
Q_LOGGING_CATEGORY(lcCrypto, "taskvault.crypto")
Q_LOGGING_CATEGORY(lcData, "taskvault.data")
Q_LOGGING_CATEGORY(lcWorker, "taskvault.worker")

void setupLogging(bool verbose)
{
    qSetMessagePattern(QStringLiteral(
        "%{time yyyy-MM-dd hh:mm:ss.zzz} %{if-debug}D%{endif}%{if-info}I%{endif}"
        "%{if-warning}W%{endif}%{if-critical}C%{endif}%{if-fatal}F%{endif} %{category}: %{message}"));
    if (verbose) {
        QLoggingCategory::setFilterRules(QStringLiteral("taskvault.*.debug=true"));
    } else {
        QLoggingCategory::setFilterRules(QStringLiteral("taskvault.*.debug=false"));
    }
}

} // namespace core
} // namespace taskvault
