#pragma once

#include "taskvault/core/Retry.hpp"
#include "taskvault/storage/SecureBytes.hpp"

#include <QHash>
#include <QJsonDocument>
#include <QMutex>
#include <QReadWriteLock>
#include <QString>
#include <QStringList>

#include <memory>
#include <optional>

namespace taskvault {
namespace storage {

// Named JSON documents, each sealed with AES-256-GCM under the session key
// and written with temp-write + fsync + rename. Documents are independent:
// a corrupted one raises core::DecryptionFailed and never blocks the others.
class EncryptedStore
{
public:
    static constexpr int kDefaultLockTimeoutMs = 5000;

    explicit EncryptedStore(QString rootPath, core::RetryPolicy retryPolicy = core::RetryPolicy());
    ~EncryptedStore();

    EncryptedStore(const EncryptedStore &) = delete;
    EncryptedStore &operator=(const EncryptedStore &) = delete;

    const QString &rootPath() const;
    QString documentPath(const QString &name) const;
    static QString documentFileName(const QString &name);
    static bool isDocumentFileName(const QString &fileName);

    void setKey(SecureBytes key);
    bool hasKey() const;
    void clearKey();

    void setLockTimeout(int milliseconds);
    int lockTimeout() const;

    void save(const QString &name, const QJsonDocument &document);
    QJsonDocument load(const QString &name) const;
    std::optional<QJsonDocument> tryLoad(const QString &name) const;
    bool exists(const QString &name) const;
    bool remove(const QString &name);
    QStringList documentNames() const;

    // Removes temp files left behind by an interrupted write.
    int sweepTemporaryFiles();

    static QByteArray encode(const SecureBytes &key, const QString &name, const QJsonDocument &document);
    static std::optional<QJsonDocument> decode(const SecureBytes &key, const QString &name, const QByteArray &raw);

    // Root-level lock held for the lifetime of the object. While it is held no
    // document write can start; writes already in flight finish first or the
    // acquisition times out.
    class ExclusiveAccess
    {
    public:
        ~ExclusiveAccess();

        ExclusiveAccess(const ExclusiveAccess &) = delete;
        ExclusiveAccess &operator=(const ExclusiveAccess &) = delete;

        EncryptedStore &store() const { return m_store; }
        const SecureBytes &key() const;
        void replaceKey(SecureBytes key);
        QJsonDocument load(const QString &name) const;
        void save(const QString &name, const QJsonDocument &document);

    private:
        friend class EncryptedStore;
        explicit ExclusiveAccess(EncryptedStore &store);

        EncryptedStore &m_store;
    };

    // Throws core::StorageBusy when the lock cannot be taken within the
    // configured timeout.
    std::unique_ptr<ExclusiveAccess> acquireExclusive(const QString &operation);

private:
    class SharedAccess;

    std::shared_ptr<QRecursiveMutex> documentMutex(const QString &name);
    void writeDocument(const QString &name, const QJsonDocument &document);
    QJsonDocument readDocument(const QString &name) const;

    QString m_rootPath;
    core::RetryPolicy m_retryPolicy;
    SecureBytes m_key;
    int m_lockTimeoutMs = kDefaultLockTimeoutMs;

    mutable QReadWriteLock m_rootLock{QReadWriteLock::Recursive};
    QMutex m_lockTableMutex;
    QHash<QString, std::shared_ptr<QRecursiveMutex>> m_documentLocks;
};

} // namespace storage
} // namespace taskvault
