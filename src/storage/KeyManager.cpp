#include "taskvault/storage/KeyManager.hpp"

#include "taskvault/core/Errors.hpp"
#include "taskvault/core/Logging.hpp"
#include "taskvault/storage/AtomicFile.hpp"
#include "taskvault/storage/Cipher.hpp"
#include "taskvault/storage/EncryptedStore.hpp"

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>

namespace taskvault {
namespace storage {

namespace {
constexpr auto kEnvelopeFile = "envelope.json";
constexpr auto kPendingEnvelopeFile = "envelope.next";
constexpr auto kStagingSuffix = ".rekey";
constexpr auto kKdfName = "pbkdf2-hmac-sha256";
const QByteArray kCanary = QByteArrayLiteral("taskvault-envelope-canary-v1");
const QByteArray kCanaryContext = QByteArrayLiteral("envelope");

void checkPassword(const QString &field, const QString &password)
{
    if (password.isEmpty()) {
        throw core::ValidationError(field, QStringLiteral("password must not be empty"));
    }
}
} // namespace

QJsonObject Envelope::toJson() const
{
    QJsonObject object;
    object.insert(QStringLiteral("format"), format);
    object.insert(QStringLiteral("kdf"), QString::fromLatin1(kKdfName));
    object.insert(QStringLiteral("iterations"), iterations);
    object.insert(QStringLiteral("salt"), QString::fromLatin1(salt.toBase64()));
    object.insert(QStringLiteral("verifier"), QString::fromLatin1(verifier.toBase64()));
    return object;
}

std::optional<Envelope> Envelope::fromJson(const QJsonObject &object)
{
    Envelope envelope;
    envelope.format = object.value(QStringLiteral("format")).toInt(-1);
    envelope.iterations = object.value(QStringLiteral("iterations")).toInt(0);
    envelope.salt = QByteArray::fromBase64(object.value(QStringLiteral("salt")).toString().toLatin1());
    envelope.verifier = QByteArray::fromBase64(object.value(QStringLiteral("verifier")).toString().toLatin1());
    if (envelope.format != kFormat
        || object.value(QStringLiteral("kdf")).toString() != QLatin1String(kKdfName)
        || envelope.iterations < 1 || envelope.iterations > KeyManager::kMaxIterations
        || envelope.salt.size() != cipher::kSaltLength || envelope.verifier.isEmpty()) {
        return std::nullopt;
    }
    return envelope;
}

KeyManager::KeyManager(EncryptedStore &store, int iterations)
    : m_store(store)
    , m_iterations(iterations)
{
    if (m_iterations < 1 || m_iterations > kMaxIterations) {
        throw core::ValidationError(QStringLiteral("iterations"), QStringLiteral("work factor out of range"));
    }
}

QString KeyManager::envelopeFileName()
{
    return QLatin1String(kEnvelopeFile);
}

bool KeyManager::hasEnvelope() const
{
    return QFile::exists(envelopePath());
}

QString KeyManager::envelopePath() const
{
    return QDir(m_store.rootPath()).filePath(envelopeFileName());
}

int KeyManager::iterations() const
{
    return m_iterations;
}

SecureBytes KeyManager::initialize(const QString &password)
{
    checkPassword(QStringLiteral("password"), password);
    if (hasEnvelope()) {
        throw core::ValidationError(QStringLiteral("envelope"), QStringLiteral("storage is already initialized"));
    }

    const QByteArray salt = cipher::randomBytes(cipher::kSaltLength);
    SecureBytes key = cipher::deriveKey(password, salt, m_iterations);
    const Envelope envelope = makeEnvelope(key, salt, m_iterations);
    writeFileAtomically(envelopePath(), QJsonDocument(envelope.toJson()).toJson(QJsonDocument::Indented));
    qCInfo(core::lcCrypto) << "created encryption envelope with" << m_iterations << "iterations";
    return key;
}

SecureBytes KeyManager::login(const QString &password) const
{
    if (!hasEnvelope()) {
        throw core::NotFound(QStringLiteral("envelope"), envelopePath());
    }
    const Envelope envelope = readEnvelope(envelopePath());
    return deriveAndVerify(password, envelope);
}

void KeyManager::changePassword(const QString &oldPassword, const QString &newPassword)
{
    checkPassword(QStringLiteral("new_password"), newPassword);
    const auto access = m_store.acquireExclusive(QStringLiteral("change password"));

    SecureBytes oldKey = login(oldPassword);
    const QByteArray salt = cipher::randomBytes(cipher::kSaltLength);
    SecureBytes newKey = cipher::deriveKey(newPassword, salt, m_iterations);
    const Envelope envelope = makeEnvelope(newKey, salt, m_iterations);

    const QStringList names = m_store.documentNames();
    try {
        for (const QString &name : names) {
            const std::optional<QJsonDocument> document =
                EncryptedStore::decode(oldKey, name, readWholeFile(m_store.documentPath(name)));
            if (!document) {
                throw core::DecryptionFailed(name);
            }
            writeFileAtomically(stagingPath(name), EncryptedStore::encode(newKey, name, *document));
        }
        if (m_observer) {
            m_observer(RekeyPhase::Staged);
        }
        // Commit point: once the pending envelope is durable the change is
        // rolled forward, before it the staged files are discarded.
        writeFileAtomically(pendingEnvelopePath(), QJsonDocument(envelope.toJson()).toJson(QJsonDocument::Indented));
    } catch (const std::exception &e) {
        qCWarning(core::lcCrypto) << "password change aborted before commit:" << e.what();
        discardStaged();
        throw;
    }

    if (m_observer) {
        m_observer(RekeyPhase::Committed);
    }
    rollForward();
    access->replaceKey(std::move(newKey));
    qCInfo(core::lcCrypto) << "password changed;" << names.size() << "documents re-encrypted";
}

void KeyManager::recover()
{
    const auto access = m_store.acquireExclusive(QStringLiteral("recover password change"));
    const QString pending = pendingEnvelopePath();
    if (QFile::exists(pending)) {
        bool valid = false;
        try {
            readEnvelope(pending);
            valid = true;
        } catch (const core::Error &e) {
            qCWarning(core::lcCrypto) << "discarding unreadable pending envelope:" << e.what();
        }
        if (valid) {
            qCInfo(core::lcCrypto) << "completing interrupted password change";
            rollForward();
            return;
        }
        QFile::remove(pending);
    }
    discardStaged();
}

void KeyManager::setRekeyObserver(std::function<void(RekeyPhase)> observer)
{
    m_observer = std::move(observer);
}

Envelope KeyManager::makeEnvelope(const SecureBytes &key, const QByteArray &salt, int iterations) const
{
    Envelope envelope;
    envelope.iterations = iterations;
    envelope.salt = salt;
    envelope.verifier = cipher::seal(key, kCanary, kCanaryContext);
    return envelope;
}

Envelope KeyManager::readEnvelope(const QString &path) const
{
    QJsonParseError error;
    const QJsonDocument document = QJsonDocument::fromJson(readWholeFile(path), &error);
    if (error.error != QJsonParseError::NoError || !document.isObject()) {
        throw core::StorageError(path, QStringLiteral("envelope is not valid JSON"));
    }
    const std::optional<Envelope> envelope = Envelope::fromJson(document.object());
    if (!envelope) {
        throw core::StorageError(path, QStringLiteral("envelope is malformed"));
    }
    return *envelope;
}

SecureBytes KeyManager::deriveAndVerify(const QString &password, const Envelope &envelope) const
{
    SecureBytes key = cipher::deriveKey(password, envelope.salt, envelope.iterations);
    const std::optional<QByteArray> canary = cipher::open(key, envelope.verifier, kCanaryContext);
    // Both failure modes look the same to the caller.
    const bool matches = canary.has_value() && cipher::constantTimeEquals(*canary, kCanary);
    if (!matches) {
        qCInfo(core::lcCrypto) << "password verification failed";
        throw core::AuthenticationFailed();
    }
    return key;
}

QString KeyManager::stagingPath(const QString &documentName) const
{
    return QDir(m_store.rootPath()).filePath(documentName + QLatin1String(kStagingSuffix));
}

QString KeyManager::pendingEnvelopePath() const
{
    return QDir(m_store.rootPath()).filePath(QLatin1String(kPendingEnvelopeFile));
}

void KeyManager::discardStaged() const
{
    QDir root(m_store.rootPath());
    const QStringList staged = root.entryList({QStringLiteral("*") + QLatin1String(kStagingSuffix)}, QDir::Files);
    for (const QString &file : staged) {
        if (!root.remove(file)) {
            qCWarning(core::lcCrypto) << "could not remove staged file" << file;
        }
    }
}

void KeyManager::rollForward() const
{
    QDir root(m_store.rootPath());
    const QStringList staged = root.entryList({QStringLiteral("*") + QLatin1String(kStagingSuffix)}, QDir::Files);
    for (const QString &file : staged) {
        const QString name = file.left(file.size() - static_cast<int>(qstrlen(kStagingSuffix)));
        renameOver(root.filePath(file), m_store.documentPath(name));
    }
    renameOver(pendingEnvelopePath(), envelopePath());
}

} // namespace storage
} // namespace taskvault
