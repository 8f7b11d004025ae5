#include <QCoreApplication>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSocketNotifier>
#include <QString>
#include <QTextStream>

#include "version.h"

#include "taskvault/core/AppConfig.hpp"
#include "taskvault/core/AppContext.hpp"
#include "taskvault/core/Errors.hpp"
#include "taskvault/core/Logging.hpp"
#include "taskvault/data/Task.hpp"
#include "taskvault/data/TaskRepository.hpp"

#include <algorithm>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <sys/socket.h>
#include <termios.h>
#include <unistd.h>

using namespace taskvault;

namespace {

int g_signalFds[2] = {-1, -1};

void handleTerminationSignal(int)
{
    const char byte = 1;
    const ssize_t written = ::write(g_signalFds[0], &byte, sizeof(byte));
    static_cast<void>(written);
}

// Turns SIGINT/SIGTERM into a QCoreApplication::quit() on the event loop.
bool installSignalHandlers(QCoreApplication &app)
{
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, g_signalFds) != 0) {
        return false;
    }
    auto *notifier = new QSocketNotifier(g_signalFds[1], QSocketNotifier::Read, &app);
    QObject::connect(notifier, &QSocketNotifier::activated, &app, [notifier, &app] {
        notifier->setEnabled(false);
        char byte = 0;
        const ssize_t received = ::read(g_signalFds[1], &byte, sizeof(byte));
        static_cast<void>(received);
        qCInfo(core::lcApp) << "termination requested";
        app.quit();
    });

    struct sigaction action {};
    action.sa_handler = handleTerminationSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    return ::sigaction(SIGINT, &action, nullptr) == 0 && ::sigaction(SIGTERM, &action, nullptr) == 0;
}

QString promptPassword(const QString &prompt)
{
    std::cerr << prompt.toStdString() << std::flush;

    termios original {};
    const bool terminal = ::isatty(STDIN_FILENO) && ::tcgetattr(STDIN_FILENO, &original) == 0;
    if (terminal) {
        termios silent = original;
        silent.c_lflag &= static_cast<tcflag_t>(~ECHO);
        ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent);
    }
    std::string line;
    std::getline(std::cin, line);
    if (terminal) {
        ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &original);
        std::cerr << std::endl;
    }
    const QString password = QString::fromStdString(line);
    std::fill(line.begin(), line.end(), '\0');
    return password;
}

QString currentPassword(const core::AppConfig &config, const QString &prompt)
{
    if (config.password) {
        return *config.password;
    }
    return promptPassword(prompt);
}

QString newPassword(const QString &prompt)
{
    const QString first = promptPassword(prompt);
    const QString second = promptPassword(QStringLiteral("Repeat password: "));
    if (first != second) {
        throw core::ValidationError(QStringLiteral("password"), QStringLiteral("passwords do not match"));
    }
    return first;
}

int runDaemon(QCoreApplication &app, core::AppContext &context)
{
    context.login(currentPassword(context.config(), QStringLiteral("Password: ")));
    if (!installSignalHandlers(app)) {
        qCWarning(core::lcApp) << "could not install signal handlers";
    }
    context.startBackgroundWork();
    qCInfo(core::lcApp) << "running; send SIGINT or SIGTERM to stop";
    const int code = app.exec();
    context.shutdown();
    return code;
}

int runCommand(QCoreApplication &app, core::AppContext &context)
{
    const core::AppConfig &config = context.config();
    QTextStream out(stdout);

    if (config.command == QLatin1String("run")) {
        return runDaemon(app, context);
    }
    if (config.command == QLatin1String("init")) {
        if (context.isInitialized()) {
            throw core::ValidationError(QStringLiteral("envelope"), QStringLiteral("storage is already initialized"));
        }
        const QString password =
            config.password ? *config.password : newPassword(QStringLiteral("New password: "));
        context.initialize(password);
        context.flush();
        out << "initialized " << context.storageLocation().activeRoot << '\n';
        return 0;
    }
    if (config.command == QLatin1String("passwd")) {
        const QString oldPassword = currentPassword(config, QStringLiteral("Current password: "));
        context.login(oldPassword);
        context.changePassword(oldPassword, newPassword(QStringLiteral("New password: ")));
        out << "password changed\n";
        return 0;
    }

    context.login(currentPassword(config, QStringLiteral("Password: ")));

    if (config.command == QLatin1String("backup-list")) {
        for (const storage::BackupInfo &info : context.listBackups()) {
            out << info.name << '\t' << storage::backupTypeToString(info.type) << '\t'
                << info.createdAt.toString(Qt::ISODate) << '\t' << info.appVersion << '\n';
        }
        return 0;
    }
    if (config.command == QLatin1String("backup-create")) {
        storage::BackupType type = storage::BackupType::Manual;
        if (!config.arguments.isEmpty()) {
            const auto parsed = storage::backupTypeFromString(config.arguments.first());
            if (!parsed) {
                throw core::ValidationError(QStringLiteral("type"),
                                            QStringLiteral("unknown backup type '%1'").arg(config.arguments.first()));
            }
            type = *parsed;
        }
        out << context.createBackup(type).name << '\n';
        return 0;
    }
    if (config.command == QLatin1String("backup-restore")) {
        if (config.arguments.isEmpty()) {
            throw core::ValidationError(QStringLiteral("name"), QStringLiteral("backup name is required"));
        }
        context.restoreBackup(config.arguments.first());
        out << "restored " << config.arguments.first() << '\n';
        return 0;
    }
    if (config.command == QLatin1String("tasks")) {
        QJsonArray tasks;
        for (const data::TaskItem &task : context.tasks().fetchTasks()) {
            tasks.append(data::taskToJson(task));
        }
        out << QJsonDocument(tasks).toJson(QJsonDocument::Indented);
        return 0;
    }
    return 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("TaskVault"));
    QCoreApplication::setApplicationName(QStringLiteral("taskvault"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kTaskVaultVersion));

    QCoreApplication app(argc, argv);

    core::AppConfig config;
    try {
        config = core::AppConfig::parse(app.arguments());
    } catch (const core::Error &e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }
    if (config.helpRequested) {
        std::cout << config.helpText.toStdString();
        return 0;
    }
    if (config.versionRequested) {
        std::cout << "taskvault " << kTaskVaultVersion << std::endl;
        return 0;
    }
    core::setupLogging(config.verbose);

    std::unique_ptr<core::AppContext> context;
    try {
        context = std::make_unique<core::AppContext>(config);
    } catch (const core::StorageUnavailable &e) {
        qCCritical(core::lcApp) << "no usable storage location";
        for (const core::AttemptedPath &attempt : e.attempts()) {
            qCCritical(core::lcApp) << " " << attempt.path << core::probeFailureName(attempt.reason) << attempt.detail;
        }
        return 3;
    } catch (const core::Error &e) {
        qCCritical(core::lcApp) << "startup failed:" << e.message();
        return 3;
    }

    try {
        return runCommand(app, *context);
    } catch (const core::AuthenticationFailed &) {
        qCCritical(core::lcApp) << "wrong password";
        return 4;
    } catch (const core::Error &e) {
        qCCritical(core::lcApp) << core::errorCodeName(e.code()) << e.message();
        return 1;
    }
}
