#include "taskvault/data/DocumentRepository.hpp"

#include "taskvault/core/Errors.hpp"
#include "taskvault/core/Logging.hpp"
#include "taskvault/storage/EncryptedStore.hpp"

#include <QMutexLocker>

#include <algorithm>
#include <optional>

namespace taskvault {
namespace data {

DocumentRepository::DocumentRepository(std::shared_ptr<storage::EncryptedStore> store,
                                       QString documentName,
                                       PersistMode mode)
    : m_store(std::move(store))
    , m_documentName(std::move(documentName))
    , m_mode(mode)
{
}

DocumentRepository::~DocumentRepository() = default;

const QString &DocumentRepository::documentName() const
{
    return m_documentName;
}

PersistMode DocumentRepository::persistMode() const
{
    QMutexLocker locker(&m_mutex);
    return m_mode;
}

void DocumentRepository::setPersistMode(PersistMode mode)
{
    QMutexLocker locker(&m_mutex);
    m_mode = mode;
}

bool DocumentRepository::isDirty() const
{
    QMutexLocker locker(&m_mutex);
    return m_revision != m_flushedRevision;
}

bool DocumentRepository::isAvailable() const
{
    QMutexLocker locker(&m_mutex);
    return m_available;
}

bool DocumentRepository::flush()
{
    QMutexLocker flushLocker(&m_flushMutex);
    QJsonDocument snapshot;
    quint64 revision = 0;
    {
        QMutexLocker locker(&m_mutex);
        if (!m_available || m_revision == m_flushedRevision) {
            return false;
        }
        snapshot = serializeLocked();
        revision = m_revision;
    }

    m_store->save(m_documentName, snapshot);

    QMutexLocker locker(&m_mutex);
    m_flushedRevision = std::max(m_flushedRevision, revision);
    qCDebug(core::lcData) << "flushed" << m_documentName << "revision" << revision;
    return true;
}

void DocumentRepository::reload()
{
    reloadAfter(std::function<void()>());
}

void DocumentRepository::reloadAfter(const std::function<void()> &action)
{
    QMutexLocker flushLocker(&m_flushMutex);
    if (action) {
        action();
    }

    std::optional<QJsonDocument> document;
    try {
        document = m_store->tryLoad(m_documentName);
    } catch (const core::DecryptionFailed &) {
        QMutexLocker locker(&m_mutex);
        m_available = false;
        resetLocked();
        m_flushedRevision = m_revision;
        qCWarning(core::lcData) << m_documentName << "is unreadable; refusing changes until it is restored";
        throw;
    }

    QMutexLocker locker(&m_mutex);
    m_available = true;
    if (document) {
        deserializeLocked(*document);
        m_flushedRevision = ++m_revision;
    } else {
        qCInfo(core::lcData) << m_documentName << "not found, starting with defaults";
        resetLocked();
        ++m_revision;
    }
}

void DocumentRepository::markDirtyLocked()
{
    ++m_revision;
}

void DocumentRepository::ensureAvailableLocked() const
{
    if (!m_available) {
        throw core::DecryptionFailed(m_documentName);
    }
}

void DocumentRepository::persistIfImmediate()
{
    if (persistMode() != PersistMode::Immediate) {
        return;
    }
    // The mutation already happened in memory; a failed write leaves it dirty
    // for the next flush instead of failing the call.
    try {
        flush();
    } catch (const core::Error &e) {
        qCWarning(core::lcData) << "write-through of" << m_documentName << "failed, keeping changes for the next flush:"
                                << e.message();
    }
}

} // namespace data
} // namespace taskvault
