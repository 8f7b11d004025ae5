#include "taskvault/storage/PathResolver.hpp"

#include "taskvault/core/Logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>
#include <QUuid>

#include <cerrno>
#include <cstring>

namespace taskvault {
namespace storage {

namespace {
constexpr int kMaxPathLength = 4096;
constexpr int kMaxNameLength = 255;
constexpr auto kProbePrefix = ".taskvault-probe-";

QString errnoText(int error)
{
    return QString::fromLocal8Bit(std::strerror(error));
}

bool isTransient(core::ProbeFailure reason)
{
    return reason == core::ProbeFailure::Other || reason == core::ProbeFailure::DiskFull;
}

ProbeResult failureFromErrno(int error, const QString &what)
{
    return ProbeResult::failure(FileStorageProbe::classifyErrno(error),
                                QStringLiteral("%1: %2").arg(what, errnoText(error)));
}

// Removes the probe file however the probe ends.
class ProbeFileGuard
{
public:
    explicit ProbeFileGuard(QString path)
        : m_path(std::move(path))
    {
    }

    ~ProbeFileGuard()
    {
        if (QFile::exists(m_path) && !QFile::remove(m_path)) {
            qCWarning(core::lcStorage) << "could not remove probe file" << m_path;
        }
    }

    ProbeFileGuard(const ProbeFileGuard &) = delete;
    ProbeFileGuard &operator=(const ProbeFileGuard &) = delete;

private:
    QString m_path;
};

} // namespace

ProbeResult ProbeResult::success()
{
    ProbeResult result;
    result.ok = true;
    return result;
}

ProbeResult ProbeResult::failure(core::ProbeFailure reason, QString detail)
{
    ProbeResult result;
    result.ok = false;
    result.reason = reason;
    result.detail = std::move(detail);
    return result;
}

core::ProbeFailure FileStorageProbe::classifyErrno(int error)
{
    switch (error) {
    case EACCES:
    case EPERM:
        return core::ProbeFailure::PermissionDenied;
    case EROFS:
        return core::ProbeFailure::ReadOnlyFilesystem;
    case ENAMETOOLONG:
        return core::ProbeFailure::PathTooLong;
    case ENOSPC:
    case EDQUOT:
        return core::ProbeFailure::DiskFull;
    default:
        return core::ProbeFailure::Other;
    }
}

ProbeResult FileStorageProbe::probe(const QString &directory) const
{
    if (directory.isEmpty()) {
        return ProbeResult::failure(core::ProbeFailure::Other, QStringLiteral("empty path"));
    }

    const QString absolute = QDir::cleanPath(QFileInfo(directory).absoluteFilePath());
    if (absolute.toLocal8Bit().size() >= kMaxPathLength) {
        return ProbeResult::failure(core::ProbeFailure::PathTooLong, QStringLiteral("path exceeds %1 bytes").arg(kMaxPathLength));
    }
    const QStringList segments = absolute.split(QLatin1Char('/'), Qt::SkipEmptyParts);
    for (const QString &segment : segments) {
        if (segment.toLocal8Bit().size() > kMaxNameLength) {
            return ProbeResult::failure(core::ProbeFailure::PathTooLong,
                                        QStringLiteral("path component exceeds %1 bytes").arg(kMaxNameLength));
        }
    }

    QFileInfo info(absolute);
    if (info.exists() && !info.isDir()) {
        return ProbeResult::failure(core::ProbeFailure::Other, QStringLiteral("exists but is not a directory"));
    }
    if (!info.exists()) {
        errno = 0;
        if (!QDir().mkpath(absolute)) {
            const int error = errno;
            return failureFromErrno(error, QStringLiteral("create directory"));
        }
    }

    const QString probePath = QDir(absolute).filePath(
        QString::fromLatin1(kProbePrefix) + QUuid::createUuid().toString(QUuid::WithoutBraces));
    ProbeFileGuard guard(probePath);
    const QByteArray payload = QUuid::createUuid().toRfc4122();

    {
        QFile file(probePath);
        errno = 0;
        if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            const int error = errno;
            if (error == 0 && file.error() == QFileDevice::PermissionsError) {
                return ProbeResult::failure(core::ProbeFailure::PermissionDenied, file.errorString());
            }
            return failureFromErrno(error, QStringLiteral("open probe"));
        }
        errno = 0;
        if (file.write(payload) != payload.size() || !file.flush()) {
            const int error = errno;
            return failureFromErrno(error, QStringLiteral("write probe"));
        }
        file.close();
    }

    {
        QFile file(probePath);
        if (!file.open(QIODevice::ReadOnly)) {
            const int error = errno;
            return failureFromErrno(error, QStringLiteral("read probe"));
        }
        if (file.readAll() != payload) {
            return ProbeResult::failure(core::ProbeFailure::Other, QStringLiteral("probe read-back mismatch"));
        }
    }

    if (!QFile::remove(probePath)) {
        return ProbeResult::failure(core::ProbeFailure::PermissionDenied, QStringLiteral("probe file could not be deleted"));
    }
    return ProbeResult::success();
}

PathResolver::PathResolver(QStringList candidates,
                           std::shared_ptr<const StorageProbe> probe,
                           core::RetryPolicy retryPolicy)
    : m_candidates(std::move(candidates))
    , m_probe(probe ? std::move(probe) : std::make_shared<FileStorageProbe>())
    , m_retryPolicy(retryPolicy)
{
}

QStringList PathResolver::defaultCandidates(const QString &installDir, const QString &overrideDir)
{
    QStringList candidates;
    auto add = [&candidates](const QString &path) {
        if (path.isEmpty()) {
            return;
        }
        const QString cleaned = QDir::cleanPath(path);
        if (!candidates.contains(cleaned)) {
            candidates << cleaned;
        }
    };

    add(overrideDir);
    if (!installDir.isEmpty()) {
        add(QDir(installDir).filePath(QStringLiteral("data")));
    }
    add(QDir::home().filePath(QStringLiteral(".taskvault")));
    add(QStandardPaths::writableLocation(QStandardPaths::AppDataLocation));
    add(QDir(QDir::tempPath()).filePath(QStringLiteral("taskvault-data")));
    return candidates;
}

StorageLocation PathResolver::resolve() const
{
    StorageLocation location;
    location.candidates = m_candidates;

    for (const QString &candidate : m_candidates) {
        const ProbeResult result = probeWithRetry(candidate);
        if (result.ok) {
            location.activeRoot = QDir::cleanPath(QFileInfo(candidate).absoluteFilePath());
            qCInfo(core::lcStorage) << "storage root resolved to" << location.activeRoot;
            return location;
        }
        qCWarning(core::lcStorage) << "storage candidate rejected:" << candidate
                                   << core::probeFailureName(result.reason) << result.detail;
        location.failures.push_back({candidate, result.reason, result.detail});
    }

    throw core::StorageUnavailable(location.failures);
}

const QStringList &PathResolver::candidates() const
{
    return m_candidates;
}

ProbeResult PathResolver::probeWithRetry(const QString &candidate) const
{
    ProbeResult result;
    core::retryWithBackoff(m_retryPolicy, [&]() {
        result = m_probe->probe(candidate);
        return result.ok || !isTransient(result.reason);
    });
    return result;
}

} // namespace storage
} // namespace taskvault
