#include "taskvault/storage/AtomicFile.hpp"

#include "taskvault/core/Errors.hpp"
#include "taskvault/core/Logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace taskvault {
namespace storage {

void writeFileAtomically(const QString &path, const QByteArray &data, const core::RetryPolicy &retryPolicy)
{
    const QFileInfo info(path);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        throw core::StorageError(dir.path(), QStringLiteral("cannot create directory"));
    }

    QString lastError;
    const bool written = core::retryWithBackoff(retryPolicy, [&]() {
        QSaveFile file(path);
        if (!file.open(QIODevice::WriteOnly)) {
            lastError = file.errorString();
            return false;
        }
        if (file.write(data) != data.size() || !file.flush()) {
            lastError = file.errorString();
            file.cancelWriting();
            return false;
        }
        if (::fsync(file.handle()) != 0) {
            lastError = QString::fromLocal8Bit(std::strerror(errno));
            file.cancelWriting();
            return false;
        }
        if (!file.commit()) {
            lastError = file.errorString();
            return false;
        }
        return true;
    });

    if (!written) {
        qCWarning(core::lcStorage) << "atomic write failed for" << path << lastError;
        throw core::StorageError(path, lastError);
    }
    syncDirectory(dir.path());
}

void renameOver(const QString &from, const QString &to)
{
    const QByteArray source = QFile::encodeName(from);
    const QByteArray target = QFile::encodeName(to);
    if (std::rename(source.constData(), target.constData()) != 0) {
        throw core::StorageError(to, QStringLiteral("rename from %1 failed: %2")
                                         .arg(from, QString::fromLocal8Bit(std::strerror(errno))));
    }
    syncDirectory(QFileInfo(to).absolutePath());
}

QByteArray readWholeFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        throw core::StorageError(path, file.errorString());
    }
    return file.readAll();
}

void syncDirectory(const QString &directory)
{
    const QByteArray encoded = QFile::encodeName(directory);
    const int fd = ::open(encoded.constData(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        qCDebug(core::lcStorage) << "cannot open directory for sync" << directory;
        return;
    }
    if (::fsync(fd) != 0) {
        qCDebug(core::lcStorage) << "directory sync failed" << directory;
    }
    ::close(fd);
}

} // namespace storage
} // namespace taskvault
