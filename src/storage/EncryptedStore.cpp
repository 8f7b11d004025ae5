#include "taskvault/storage/EncryptedStore.hpp"

#include "taskvault/core/Errors.hpp"
#include "taskvault/core/Logging.hpp"
#include "taskvault/storage/AtomicFile.hpp"
#include "taskvault/storage/Cipher.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonParseError>
#include <QMutexLocker>

namespace taskvault {
namespace storage {

namespace {
constexpr auto kDocumentSuffix = ".vault";
const QByteArray kMagic = QByteArrayLiteral("TVD1");

void checkName(const QString &name)
{
    if (name.isEmpty() || name.contains(QLatin1Char('/')) || name.contains(QLatin1Char('\\'))
        || name.startsWith(QLatin1Char('.'))) {
        throw core::ValidationError(QStringLiteral("document"), QStringLiteral("invalid name '%1'").arg(name));
    }
}
} // namespace

// Shared side of the root lock, taken by every ordinary document read/write.
class EncryptedStore::SharedAccess
{
public:
    SharedAccess(const EncryptedStore &store, const QString &operation)
        : m_lock(store.m_rootLock)
    {
        if (!m_lock.tryLockForRead(store.m_lockTimeoutMs)) {
            throw core::StorageBusy(operation);
        }
    }

    ~SharedAccess() { m_lock.unlock(); }

    SharedAccess(const SharedAccess &) = delete;
    SharedAccess &operator=(const SharedAccess &) = delete;

private:
    QReadWriteLock &m_lock;
};

EncryptedStore::EncryptedStore(QString rootPath, core::RetryPolicy retryPolicy)
    : m_rootPath(QDir::cleanPath(std::move(rootPath)))
    , m_retryPolicy(retryPolicy)
{
    QDir dir(m_rootPath);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        throw core::StorageError(m_rootPath, QStringLiteral("cannot create storage root"));
    }
}

EncryptedStore::~EncryptedStore() = default;

const QString &EncryptedStore::rootPath() const
{
    return m_rootPath;
}

QString EncryptedStore::documentFileName(const QString &name)
{
    return name + QLatin1String(kDocumentSuffix);
}

bool EncryptedStore::isDocumentFileName(const QString &fileName)
{
    return fileName.endsWith(QLatin1String(kDocumentSuffix)) && !fileName.startsWith(QLatin1Char('.'));
}

QString EncryptedStore::documentPath(const QString &name) const
{
    return QDir(m_rootPath).filePath(documentFileName(name));
}

void EncryptedStore::setKey(SecureBytes key)
{
    QWriteLocker locker(&m_rootLock);
    m_key = std::move(key);
}

bool EncryptedStore::hasKey() const
{
    QReadLocker locker(&m_rootLock);
    return !m_key.isEmpty();
}

void EncryptedStore::clearKey()
{
    QWriteLocker locker(&m_rootLock);
    m_key.clear();
}

void EncryptedStore::setLockTimeout(int milliseconds)
{
    m_lockTimeoutMs = milliseconds;
}

int EncryptedStore::lockTimeout() const
{
    return m_lockTimeoutMs;
}

void EncryptedStore::save(const QString &name, const QJsonDocument &document)
{
    checkName(name);
    SharedAccess access(*this, QStringLiteral("save %1").arg(name));
    writeDocument(name, document);
}

QJsonDocument EncryptedStore::load(const QString &name) const
{
    checkName(name);
    SharedAccess access(*this, QStringLiteral("load %1").arg(name));
    return readDocument(name);
}

std::optional<QJsonDocument> EncryptedStore::tryLoad(const QString &name) const
{
    checkName(name);
    SharedAccess access(*this, QStringLiteral("load %1").arg(name));
    if (!QFile::exists(documentPath(name))) {
        return std::nullopt;
    }
    return readDocument(name);
}

bool EncryptedStore::exists(const QString &name) const
{
    checkName(name);
    return QFile::exists(documentPath(name));
}

bool EncryptedStore::remove(const QString &name)
{
    checkName(name);
    SharedAccess access(*this, QStringLiteral("remove %1").arg(name));
    const auto mutex = documentMutex(name);
    QMutexLocker locker(mutex.get());
    return QFile::remove(documentPath(name));
}

QStringList EncryptedStore::documentNames() const
{
    QStringList names;
    const QStringList files = QDir(m_rootPath).entryList(QDir::Files, QDir::Name);
    for (const QString &file : files) {
        if (isDocumentFileName(file)) {
            names << file.left(file.size() - static_cast<int>(qstrlen(kDocumentSuffix)));
        }
    }
    return names;
}

int EncryptedStore::sweepTemporaryFiles()
{
    QWriteLocker locker(&m_rootLock);
    int removed = 0;
    const QStringList files = QDir(m_rootPath).entryList(QDir::Files | QDir::Hidden, QDir::Name);
    const QString marker = QLatin1String(kDocumentSuffix) + QLatin1Char('.');
    for (const QString &file : files) {
        if (file.contains(marker) && QFile::remove(QDir(m_rootPath).filePath(file))) {
            qCInfo(core::lcStorage) << "removed stale temporary file" << file;
            ++removed;
        }
    }
    return removed;
}

QByteArray EncryptedStore::encode(const SecureBytes &key, const QString &name, const QJsonDocument &document)
{
    QByteArray plaintext = document.toJson(QJsonDocument::Compact);
    QByteArray encoded = kMagic + cipher::seal(key, plaintext, name.toUtf8());
    plaintext.fill('\0');
    return encoded;
}

std::optional<QJsonDocument> EncryptedStore::decode(const SecureBytes &key, const QString &name, const QByteArray &raw)
{
    if (!raw.startsWith(kMagic)) {
        return std::nullopt;
    }
    const std::optional<QByteArray> plaintext = cipher::open(key, raw.mid(kMagic.size()), name.toUtf8());
    if (!plaintext) {
        return std::nullopt;
    }
    QJsonParseError error;
    QJsonDocument document = QJsonDocument::fromJson(*plaintext, &error);
    if (error.error != QJsonParseError::NoError) {
        return std::nullopt;
    }
    return document;
}

std::unique_ptr<EncryptedStore::ExclusiveAccess> EncryptedStore::acquireExclusive(const QString &operation)
{
    if (!m_rootLock.tryLockForWrite(m_lockTimeoutMs)) {
        qCWarning(core::lcStorage) << operation << "could not acquire exclusive storage access";
        throw core::StorageBusy(operation);
    }
    return std::unique_ptr<ExclusiveAccess>(new ExclusiveAccess(*this));
}

std::shared_ptr<QRecursiveMutex> EncryptedStore::documentMutex(const QString &name)
{
    QMutexLocker locker(&m_lockTableMutex);
    auto it = m_documentLocks.find(name);
    if (it == m_documentLocks.end()) {
        it = m_documentLocks.insert(name, std::make_shared<QRecursiveMutex>());
    }
    return it.value();
}

void EncryptedStore::writeDocument(const QString &name, const QJsonDocument &document)
{
    if (m_key.isEmpty()) {
        throw core::StorageError(documentPath(name), QStringLiteral("store is locked"));
    }
    const auto mutex = documentMutex(name);
    QMutexLocker locker(mutex.get());
    const QByteArray encoded = encode(m_key, name, document);
    writeFileAtomically(documentPath(name), encoded, m_retryPolicy);
    qCDebug(core::lcStorage) << "saved document" << name << encoded.size() << "bytes";
}

QJsonDocument EncryptedStore::readDocument(const QString &name) const
{
    if (m_key.isEmpty()) {
        throw core::StorageError(documentPath(name), QStringLiteral("store is locked"));
    }
    const QString path = documentPath(name);
    if (!QFile::exists(path)) {
        throw core::NotFound(QStringLiteral("document"), name);
    }
    const std::optional<QJsonDocument> document = decode(m_key, name, readWholeFile(path));
    if (!document) {
        qCWarning(core::lcStorage) << "document" << name << "failed authentication; leaving file in place";
        throw core::DecryptionFailed(name);
    }
    return *document;
}

EncryptedStore::ExclusiveAccess::ExclusiveAccess(EncryptedStore &store)
    : m_store(store)
{
}

EncryptedStore::ExclusiveAccess::~ExclusiveAccess()
{
    m_store.m_rootLock.unlock();
}

const SecureBytes &EncryptedStore::ExclusiveAccess::key() const
{
    return m_store.m_key;
}

void EncryptedStore::ExclusiveAccess::replaceKey(SecureBytes key)
{
    m_store.m_key = std::move(key);
}

QJsonDocument EncryptedStore::ExclusiveAccess::load(const QString &name) const
{
    checkName(name);
    return m_store.readDocument(name);
}

void EncryptedStore::ExclusiveAccess::save(const QString &name, const QJsonDocument &document)
{
    checkName(name);
    m_store.writeDocument(name, document);
}

} // namespace storage
} // namespace taskvault
