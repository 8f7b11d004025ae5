#pragma once

#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

#include <optional>

namespace taskvault {
namespace core {

// Process configuration from the command line and TASKVAULT_* environment
// variables. User preferences live in the encrypted settings document.
struct AppConfig
{
    QString command = QStringLiteral("run");
    QStringList arguments;
    QString dataDir;
    QString installDir;
    int kdfIterations = 600000;
    std::optional<QString> password;
    bool verbose = false;
    bool helpRequested = false;
    bool versionRequested = false;
    QString helpText;

    static QStringList commands();

    // Throws ValidationError for unknown commands or invalid values.
    static AppConfig parse(const QStringList &arguments,
                           const QProcessEnvironment &environment = QProcessEnvironment::systemEnvironment());
};

} // namespace core
} // namespace taskvault
