#include "taskvault/storage/BackupManager.hpp"

#include "taskvault/core/Errors.hpp"
#include "taskvault/core/Logging.hpp"
#include "taskvault/storage/AtomicFile.hpp"
#include "taskvault/storage/EncryptedStore.hpp"
#include "taskvault/storage/KeyManager.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QUuid>

#include <algorithm>

namespace taskvault {
namespace storage {

namespace {
constexpr auto BACKUPS_DIR = "backups";
constexpr auto MANIFEST_FILE = "manifest.json";
constexpr auto STAGING_PREFIX = ".staging-";
constexpr auto NAME_TIMESTAMP_FORMAT = "yyyyMMdd-HHmmss-zzz";
constexpr auto RESTORE_SUFFIX = ".restore";
constexpr auto RESTORE_MARKER_FILE = "restore.commit";

bool isValidBackupName(const QString &name)
{
    return !name.isEmpty() && !name.startsWith(QLatin1Char('.')) && !name.contains(QLatin1Char('/'))
        && !name.contains(QLatin1Char('\\'));
}

QString documentNameOf(const QString &fileName)
{
    return fileName.left(fileName.size() - EncryptedStore::documentFileName(QString()).size());
}
} // namespace

QString backupTypeToString(BackupType type)
{
    switch (type) {
    case BackupType::Automatic:
        return QStringLiteral("automatic");
    case BackupType::PreUpdate:
        return QStringLiteral("pre-update");
    case BackupType::PreRestore:
        return QStringLiteral("pre-restore");
    case BackupType::Manual:
    default:
        return QStringLiteral("manual");
    }
}

std::optional<BackupType> backupTypeFromString(const QString &value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("manual")) {
        return BackupType::Manual;
    }
    if (normalized == QLatin1String("automatic")) {
        return BackupType::Automatic;
    }
    if (normalized == QLatin1String("pre-update")) {
        return BackupType::PreUpdate;
    }
    if (normalized == QLatin1String("pre-restore")) {
        return BackupType::PreRestore;
    }
    return std::nullopt;
}

BackupManager::BackupManager(std::shared_ptr<EncryptedStore> store, QString appVersion)
    : m_store(std::move(store))
    , m_appVersion(std::move(appVersion))
    , m_clock([] { return QDateTime::currentDateTime(); })
{
}

QString BackupManager::backupsRoot() const
{
    return QDir(m_store->rootPath()).filePath(QLatin1String(BACKUPS_DIR));
}

void BackupManager::setClock(std::function<QDateTime()> clock)
{
    m_clock = std::move(clock);
}

BackupInfo BackupManager::create(BackupType type)
{
    const auto access = m_store->acquireExclusive(QStringLiteral("backup"));

    QDir root(m_store->rootPath());
    QDir backups(backupsRoot());
    if (!backups.exists() && !backups.mkpath(QStringLiteral("."))) {
        throw core::StorageError(backups.path(), QStringLiteral("cannot create backups directory"));
    }

    const QDateTime timestamp = m_clock();
    const QString staging =
        backups.filePath(QLatin1String(STAGING_PREFIX) + QUuid::createUuid().toString(QUuid::WithoutBraces));
    if (!QDir().mkpath(staging)) {
        throw core::StorageError(staging, QStringLiteral("cannot create staging directory"));
    }

    BackupInfo info;
    info.name = uniqueName(timestamp, type);
    info.path = backups.filePath(info.name);
    info.createdAt = timestamp;
    info.type = type;
    info.formatVersion = kFormatVersion;
    info.appVersion = m_appVersion;

    try {
        QStringList files;
        for (const QString &name : m_store->documentNames()) {
            files << EncryptedStore::documentFileName(name);
        }
        if (root.exists(KeyManager::envelopeFileName())) {
            files << KeyManager::envelopeFileName();
        }
        for (const QString &file : files) {
            writeFileAtomically(QDir(staging).filePath(file), readWholeFile(root.filePath(file)));
        }
        info.files = files;

        QJsonObject manifest;
        manifest.insert(QStringLiteral("format_version"), info.formatVersion);
        manifest.insert(QStringLiteral("type"), backupTypeToString(type));
        manifest.insert(QStringLiteral("created_at"), timestamp.toString(Qt::ISODateWithMs));
        manifest.insert(QStringLiteral("app_version"), info.appVersion);
        manifest.insert(QStringLiteral("files"), QJsonArray::fromStringList(files));
        writeFileAtomically(QDir(staging).filePath(QLatin1String(MANIFEST_FILE)),
                            QJsonDocument(manifest).toJson(QJsonDocument::Indented));

        renameOver(staging, info.path);
    } catch (const std::exception &e) {
        qCWarning(core::lcStorage) << "backup failed, removing staging directory:" << e.what();
        QDir(staging).removeRecursively();
        throw;
    }

    qCInfo(core::lcStorage) << "created backup" << info.name << "with" << info.files.size() << "files";
    return info;
}

std::vector<BackupInfo> BackupManager::list() const
{
    std::vector<BackupInfo> result;
    const QDir backups(backupsRoot());
    if (!backups.exists()) {
        return result;
    }
    const QStringList entries = backups.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    for (const QString &entry : entries) {
        if (!isValidBackupName(entry)) {
            continue;
        }
        std::optional<BackupInfo> info = readManifest(backups.filePath(entry));
        if (!info) {
            qCDebug(core::lcStorage) << "ignoring backup folder without manifest" << entry;
            continue;
        }
        result.push_back(std::move(*info));
    }
    std::sort(result.begin(), result.end(), [](const BackupInfo &lhs, const BackupInfo &rhs) {
        if (lhs.createdAt == rhs.createdAt) {
            return lhs.name > rhs.name;
        }
        return lhs.createdAt > rhs.createdAt;
    });
    return result;
}

std::optional<BackupInfo> BackupManager::find(const QString &name) const
{
    if (!isValidBackupName(name)) {
        return std::nullopt;
    }
    const QString directory = QDir(backupsRoot()).filePath(name);
    if (!QFileInfo(directory).isDir()) {
        return std::nullopt;
    }
    return readManifest(directory);
}

void BackupManager::restore(const QString &name)
{
    const std::optional<BackupInfo> info = find(name);
    if (!info) {
        throw core::NotFound(QStringLiteral("backup"), name);
    }
    if (info->formatVersion != kFormatVersion) {
        throw core::VersionMismatch(info->formatVersion, kFormatVersion);
    }

    const auto access = m_store->acquireExclusive(QStringLiteral("restore"));

    struct StagedDocument
    {
        QString name;
        QByteArray raw;
    };
    std::vector<StagedDocument> staged;
    const QDir snapshot(info->path);
    for (const QString &file : info->files) {
        if (!EncryptedStore::isDocumentFileName(file)) {
            continue;
        }
        const QString documentName = documentNameOf(file);
        QByteArray raw = readWholeFile(snapshot.filePath(file));
        if (!EncryptedStore::decode(access->key(), documentName, raw)) {
            qCWarning(core::lcStorage) << "backup" << name << "document" << documentName
                                       << "does not decrypt under the current key";
            throw core::DecryptionFailed(documentName);
        }
        staged.push_back({documentName, std::move(raw)});
    }

    QStringList documents;
    try {
        for (const StagedDocument &document : staged) {
            writeFileAtomically(restoreStagingPath(document.name), document.raw);
            documents << document.name;
        }
        if (m_restoreObserver) {
            m_restoreObserver(RestorePhase::Staged);
        }
        // Commit point: once the marker is durable the restore is rolled
        // forward, before it the staged documents are discarded.
        QJsonObject marker;
        marker.insert(QStringLiteral("backup"), name);
        marker.insert(QStringLiteral("documents"), QJsonArray::fromStringList(documents));
        writeFileAtomically(restoreMarkerPath(), QJsonDocument(marker).toJson(QJsonDocument::Indented));
    } catch (const std::exception &e) {
        qCWarning(core::lcStorage) << "restore of" << name << "aborted before commit:" << e.what();
        discardRestoreStaging();
        throw;
    }

    if (m_restoreObserver) {
        m_restoreObserver(RestorePhase::Committed);
    }
    rollForwardRestore(documents);
    qCInfo(core::lcStorage) << "restored backup" << name << "(" << documents.size() << "documents)";
}

void BackupManager::recover()
{
    const auto access = m_store->acquireExclusive(QStringLiteral("recover restore"));
    const QString markerPath = restoreMarkerPath();
    if (QFile::exists(markerPath)) {
        QByteArray contents;
        try {
            contents = readWholeFile(markerPath);
        } catch (const core::Error &e) {
            qCWarning(core::lcStorage) << "cannot read restore marker:" << e.message();
        }
        QJsonParseError error;
        const QJsonDocument marker = QJsonDocument::fromJson(contents, &error);
        const QJsonValue documents = marker.object().value(QStringLiteral("documents"));
        if (error.error == QJsonParseError::NoError && marker.isObject() && documents.isArray()) {
            QStringList names;
            for (const QJsonValue &value : documents.toArray()) {
                names << value.toString();
            }
            qCInfo(core::lcStorage) << "completing interrupted restore of"
                                    << marker.object().value(QStringLiteral("backup")).toString();
            rollForwardRestore(names);
            return;
        }
        qCWarning(core::lcStorage) << "discarding unreadable restore marker";
        QFile::remove(markerPath);
    }
    discardRestoreStaging();
}

void BackupManager::setRestoreObserver(std::function<void(RestorePhase)> observer)
{
    m_restoreObserver = std::move(observer);
}

int BackupManager::prune(int keepAutomatic)
{
    int kept = 0;
    int removed = 0;
    for (const BackupInfo &info : list()) {
        if (info.type != BackupType::Automatic) {
            continue;
        }
        if (kept < keepAutomatic) {
            ++kept;
            continue;
        }
        if (QDir(info.path).removeRecursively()) {
            qCInfo(core::lcStorage) << "pruned backup" << info.name;
            ++removed;
        } else {
            qCWarning(core::lcStorage) << "could not prune backup" << info.name;
        }
    }
    return removed;
}

int BackupManager::sweepStaging()
{
    const QDir backups(backupsRoot());
    if (!backups.exists()) {
        return 0;
    }
    int removed = 0;
    const QStringList entries = backups.entryList(QStringList{QLatin1String(STAGING_PREFIX) + QLatin1Char('*')},
                                                  QDir::Dirs | QDir::Hidden | QDir::NoDotAndDotDot);
    for (const QString &entry : entries) {
        if (QDir(backups.filePath(entry)).removeRecursively()) {
            qCInfo(core::lcStorage) << "removed interrupted backup staging" << entry;
            ++removed;
        }
    }
    return removed;
}

std::optional<BackupInfo> BackupManager::readManifest(const QString &directory) const
{
    QFile file(QDir(directory).filePath(QLatin1String(MANIFEST_FILE)));
    if (!file.open(QIODevice::ReadOnly)) {
        return std::nullopt;
    }
    QJsonParseError error;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError || !document.isObject()) {
        return std::nullopt;
    }
    const QJsonObject manifest = document.object();

    BackupInfo info;
    info.name = QFileInfo(directory).fileName();
    info.path = directory;
    info.formatVersion = manifest.value(QStringLiteral("format_version")).toInt(0);
    info.type = backupTypeFromString(manifest.value(QStringLiteral("type")).toString()).value_or(BackupType::Manual);
    info.createdAt = QDateTime::fromString(manifest.value(QStringLiteral("created_at")).toString(), Qt::ISODateWithMs);
    info.appVersion = manifest.value(QStringLiteral("app_version")).toString();
    for (const QJsonValue &value : manifest.value(QStringLiteral("files")).toArray()) {
        const QString fileName = value.toString();
        if (isValidBackupName(fileName)) {
            info.files << fileName;
        }
    }
    return info;
}

QString BackupManager::uniqueName(const QDateTime &timestamp, BackupType type) const
{
    const QString base = timestamp.toString(QLatin1String(NAME_TIMESTAMP_FORMAT)) + QLatin1Char('-')
        + backupTypeToString(type);
    const QDir backups(backupsRoot());
    QString name = base;
    for (int suffix = 2; backups.exists(name); ++suffix) {
        name = base + QLatin1Char('-') + QString::number(suffix);
    }
    return name;
}

QString BackupManager::restoreStagingPath(const QString &documentName) const
{
    return QDir(m_store->rootPath()).filePath(documentName + QLatin1String(RESTORE_SUFFIX));
}

QString BackupManager::restoreMarkerPath() const
{
    return QDir(m_store->rootPath()).filePath(QLatin1String(RESTORE_MARKER_FILE));
}

void BackupManager::discardRestoreStaging() const
{
    QDir root(m_store->rootPath());
    const QStringList staged = root.entryList({QStringLiteral("*") + QLatin1String(RESTORE_SUFFIX),
                                               QStringLiteral("*") + QLatin1String(RESTORE_SUFFIX) + QStringLiteral(".*")},
                                              QDir::Files | QDir::Hidden);
    for (const QString &file : staged) {
        if (!root.remove(file)) {
            qCWarning(core::lcStorage) << "could not remove staged restore file" << file;
        }
    }
}

void BackupManager::rollForwardRestore(const QStringList &documents) const
{
    for (const QString &name : documents) {
        const QString staged = restoreStagingPath(name);
        // Already moved by an earlier, interrupted roll forward.
        if (QFile::exists(staged)) {
            renameOver(staged, m_store->documentPath(name));
        }
    }
    for (const QString &live : m_store->documentNames()) {
        if (!documents.contains(live) && !QFile::remove(m_store->documentPath(live))) {
            throw core::StorageError(m_store->documentPath(live), QStringLiteral("cannot remove document"));
        }
    }
    if (!QFile::remove(restoreMarkerPath())) {
        throw core::StorageError(restoreMarkerPath(), QStringLiteral("cannot remove restore marker"));
    }
    syncDirectory(m_store->rootPath());
}

} // namespace storage
} // namespace taskvault
