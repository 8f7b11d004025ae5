#pragma once

#include <QDateTime>
#include <QString>
#include <QStringList>

#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace taskvault {
namespace storage {

class EncryptedStore;

enum class BackupType
{
    Manual,
    Automatic,
    PreUpdate,
    PreRestore,
};

QString backupTypeToString(BackupType type);
std::optional<BackupType> backupTypeFromString(const QString &value);

enum class RestorePhase
{
    Staged,
    Committed,
};

struct BackupInfo
{
    QString name;
    QString path;
    QDateTime createdAt;
    BackupType type = BackupType::Manual;
    int formatVersion = 0;
    QString appVersion;
    QStringList files;
};

// Snapshots of the storage root under <root>/backups. Snapshot contents stay
// encrypted exactly as they are on disk.
class BackupManager
{
public:
    static constexpr int kFormatVersion = 1;
    static constexpr int kAutomaticRetention = 10;

    BackupManager(std::shared_ptr<EncryptedStore> store, QString appVersion);

    QString backupsRoot() const;

    void setClock(std::function<QDateTime()> clock);

    // Requires exclusive store access; throws core::StorageBusy if a write
    // does not finish within the store's lock timeout.
    BackupInfo create(BackupType type);

    // Newest first. Staging directories and folders without a readable
    // manifest are skipped.
    std::vector<BackupInfo> list() const;
    std::optional<BackupInfo> find(const QString &name) const;

    // Replaces the live documents with the snapshot. Every check happens
    // before the first live file is touched. Documents are staged next to the
    // live ones and only swapped in after the commit marker is durable, so a
    // failure leaves either the old set or, after recover(), the new one.
    void restore(const QString &name);

    // Completes or discards a restore interrupted by a crash.
    void recover();

    // Called at each restore phase; used to interrupt a restore.
    void setRestoreObserver(std::function<void(RestorePhase)> observer);

    // Deletes automatic snapshots beyond the newest keepAutomatic. Returns
    // the number removed.
    int prune(int keepAutomatic = kAutomaticRetention);

    // Removes staging directories left behind by an interrupted create().
    int sweepStaging();

private:
    std::optional<BackupInfo> readManifest(const QString &directory) const;
    QString uniqueName(const QDateTime &timestamp, BackupType type) const;
    QString restoreStagingPath(const QString &documentName) const;
    QString restoreMarkerPath() const;
    void discardRestoreStaging() const;
    void rollForwardRestore(const QStringList &documents) const;

    std::shared_ptr<EncryptedStore> m_store;
    QString m_appVersion;
    std::function<QDateTime()> m_clock;
    std::function<void(RestorePhase)> m_restoreObserver;
};

} // namespace storage
} // namespace taskvault
