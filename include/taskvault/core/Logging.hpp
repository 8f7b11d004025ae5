#pragma once

#include <QLoggingCategory>

namespace taskvault {
namespace core {

Q_DECLARE_LOGGING_CATEGORY(lcApp)
Q_DECLARE_LOGGING_CATEGORY(lcStorage)
Q_DECLARE_LOGGING_CATEGORY(lcCrypto)
Q_DECLARE_LOGGING_CATEGORY(lcData)
Q_DECLARE_LOGGING_CATEGORY(lcWorker)

void setupLogging(bool verbose);

} // namespace core
} // namespace taskvault
