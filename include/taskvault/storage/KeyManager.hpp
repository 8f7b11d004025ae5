#pragma once

#include "taskvault/storage/SecureBytes.hpp"

#include <QByteArray>
#include <QJsonObject>
#include <QString>

#include <functional>
#include <optional>

namespace taskvault {
namespace storage {

class EncryptedStore;

// Salt, work factor and verifier. The only file in the storage root that is
// partly readable without the password.
struct Envelope
{
    static constexpr int kFormat = 1;

    int format = kFormat;
    int iterations = 0;
    QByteArray salt;
    QByteArray verifier;

    QJsonObject toJson() const;
    static std::optional<Envelope> fromJson(const QJsonObject &object);
};

enum class RekeyPhase
{
    Staged,
    Committed,
};

class KeyManager
{
public:
    // PBKDF2-HMAC-SHA256 work factor for new envelopes.
    static constexpr int kDefaultIterations = 600000;
    static constexpr int kMaxIterations = 10000000;

    explicit KeyManager(EncryptedStore &store, int iterations = kDefaultIterations);

    static QString envelopeFileName();

    bool hasEnvelope() const;
    QString envelopePath() const;
    int iterations() const;

    // First run: creates the envelope and returns the session key.
    SecureBytes initialize(const QString &password);

    // Throws core::AuthenticationFailed for a wrong password.
    SecureBytes login(const QString &password) const;

    // Re-encrypts every document under a key derived from newPassword and
    // installs that key in the store. Until the new envelope is durable the
    // old password keeps working.
    void changePassword(const QString &oldPassword, const QString &newPassword);

    // Completes or discards a password change interrupted by a crash. Call
    // before login().
    void recover();

    // Called at each rekey phase; used to interrupt a password change.
    void setRekeyObserver(std::function<void(RekeyPhase)> observer);

private:
    Envelope makeEnvelope(const SecureBytes &key, const QByteArray &salt, int iterations) const;
    Envelope readEnvelope(const QString &path) const;
    SecureBytes deriveAndVerify(const QString &password, const Envelope &envelope) const;
    QString stagingPath(const QString &documentName) const;
    QString pendingEnvelopePath() const;
    void discardStaged() const;
    void rollForward() const;

    EncryptedStore &m_store;
    int m_iterations;
    std::function<void(RekeyPhase)> m_observer;
};

} // namespace storage
} // namespace taskvault
