#include "taskvault/core/AppConfig.hpp"

#include "taskvault/core/Errors.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QFileInfo>

namespace taskvault {
namespace core {

namespace {
constexpr auto ENV_DATA_DIR = "TASKVAULT_DATA_DIR";
constexpr auto ENV_PASSWORD = "TASKVAULT_PASSWORD";
constexpr auto ENV_KDF_ITERATIONS = "TASKVAULT_KDF_ITERATIONS";

int parseIterations(const QString &value, const QString &field)
{
    bool ok = false;
    const int iterations = value.toInt(&ok);
    if (!ok || iterations < 1) {
        throw ValidationError(field, QStringLiteral("must be a positive integer"));
    }
    return iterations;
}
} // namespace

QStringList AppConfig::commands()
{
    return {
        QStringLiteral("run"),
        QStringLiteral("init"),
        QStringLiteral("passwd"),
        QStringLiteral("backup-list"),
        QStringLiteral("backup-create"),
        QStringLiteral("backup-restore"),
        QStringLiteral("tasks"),
    };
}

AppConfig AppConfig::parse(const QStringList &arguments, const QProcessEnvironment &environment)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Encrypted local task storage daemon"));
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();
    const QCommandLineOption dataDirOption(QStringList{QStringLiteral("d"), QStringLiteral("data-dir")},
                                           QStringLiteral("Use <dir> as the storage root."),
                                           QStringLiteral("dir"));
    const QCommandLineOption iterationsOption(QStringLiteral("kdf-iterations"),
                                              QStringLiteral("PBKDF2 work factor for new keys."),
                                              QStringLiteral("n"));
    const QCommandLineOption verboseOption(QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
                                           QStringLiteral("Enable debug logging."));
    parser.addOption(dataDirOption);
    parser.addOption(iterationsOption);
    parser.addOption(verboseOption);
    parser.addPositionalArgument(QStringLiteral("command"), commands().join(QStringLiteral(", ")),
                                 QStringLiteral("[command]"));
    parser.addPositionalArgument(QStringLiteral("args"), QStringLiteral("Command arguments."),
                                 QStringLiteral("[args...]"));

    if (!parser.parse(arguments)) {
        throw ValidationError(QStringLiteral("arguments"), parser.errorText());
    }

    AppConfig config;
    config.helpRequested = parser.isSet(helpOption);
    config.versionRequested = parser.isSet(versionOption);
    config.helpText = parser.helpText();
    config.verbose = parser.isSet(verboseOption);

    if (!arguments.isEmpty()) {
        config.installDir = QFileInfo(arguments.first()).absolutePath();
    }

    config.dataDir = environment.value(QLatin1String(ENV_DATA_DIR));
    if (parser.isSet(dataDirOption)) {
        config.dataDir = parser.value(dataDirOption);
    }

    if (environment.contains(QLatin1String(ENV_KDF_ITERATIONS))) {
        config.kdfIterations = parseIterations(environment.value(QLatin1String(ENV_KDF_ITERATIONS)),
                                               QLatin1String(ENV_KDF_ITERATIONS));
    }
    if (parser.isSet(iterationsOption)) {
        config.kdfIterations = parseIterations(parser.value(iterationsOption), QStringLiteral("kdf-iterations"));
    }

    if (environment.contains(QLatin1String(ENV_PASSWORD))) {
        config.password = environment.value(QLatin1String(ENV_PASSWORD));
    }

    QStringList positional = parser.positionalArguments();
    if (!positional.isEmpty()) {
        config.command = positional.takeFirst();
    }
    if (!commands().contains(config.command)) {
        throw ValidationError(QStringLiteral("command"), QStringLiteral("unknown command '%1'").arg(config.command));
    }
    config.arguments = positional;
    return config;
}

} // namespace core
} // namespace taskvault
