#pragma once

#include <QJsonDocument>
#include <QMutex>
#include <QString>

#include <functional>
#include <memory>

namespace taskvault {
namespace storage {
class EncryptedStore;
}

namespace data {

enum class PersistMode
{
    Immediate,
    Deferred,
};

// In-memory authoritative state for one EncryptedStore document. Reads are
// served from memory; mutations either write through or mark the state dirty
// for a later flush().
class DocumentRepository
{
public:
    DocumentRepository(std::shared_ptr<storage::EncryptedStore> store, QString documentName, PersistMode mode);
    virtual ~DocumentRepository();

    DocumentRepository(const DocumentRepository &) = delete;
    DocumentRepository &operator=(const DocumentRepository &) = delete;

    const QString &documentName() const;

    PersistMode persistMode() const;
    void setPersistMode(PersistMode mode);

    bool isDirty() const;
    // False after the document failed to decrypt. Mutations are refused and
    // flush() never overwrites the file until a successful reload().
    bool isAvailable() const;

    // Writes the current state if anything changed since the last flush.
    // Returns true if a write happened. Throws on I/O failure and stays dirty.
    bool flush();

    // Replaces the in-memory state with the stored document. A missing
    // document resets to defaults and leaves the state dirty.
    void reload();

    // Runs action with flushes blocked, then reloads. Used when something
    // else replaces the file underneath the repository.
    void reloadAfter(const std::function<void()> &action);

protected:
    // Guards the subclass state.
    QMutex &stateMutex() const { return m_mutex; }

    // Call with stateMutex() held.
    void markDirtyLocked();
    void ensureAvailableLocked() const;

    // Call without stateMutex() held. Write failures are logged and leave
    // the state dirty; the next flush() retries them.
    void persistIfImmediate();

    virtual QJsonDocument serializeLocked() const = 0;
    virtual void deserializeLocked(const QJsonDocument &document) = 0;
    virtual void resetLocked() = 0;

private:
    std::shared_ptr<storage::EncryptedStore> m_store;
    QString m_documentName;
    PersistMode m_mode;

    mutable QMutex m_mutex;
    QMutex m_flushMutex;
    quint64 m_revision = 0;
    quint64 m_flushedRevision = 0;
    bool m_available = true;
};

} // namespace data
} // namespace taskvault
