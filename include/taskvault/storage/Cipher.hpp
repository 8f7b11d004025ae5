#pragma once

#include "taskvault/core/Errors.hpp"
#include "taskvault/storage/SecureBytes.hpp"

#include <QByteArray>
#include <QString>

#include <optional>
#include <string>

namespace taskvault {
namespace storage {

// Raised when OpenSSL itself fails (allocation, RNG, cipher setup). Failed
// authentication is not an error here; open() reports it as nullopt.
class CipherError : public core::Error
{
public:
    explicit CipherError(const std::string &message);
};

namespace cipher {

constexpr int kKeyLength = 32;
constexpr int kSaltLength = 16;
constexpr int kNonceLength = 12;
constexpr int kTagLength = 16;

QByteArray randomBytes(int count);

// PBKDF2-HMAC-SHA256, kKeyLength bytes of output.
SecureBytes deriveKey(const QString &password, const QByteArray &salt, int iterations);

// AES-256-GCM. Output layout: nonce | ciphertext | tag.
QByteArray seal(const SecureBytes &key, const QByteArray &plaintext, const QByteArray &associatedData);
std::optional<QByteArray> open(const SecureBytes &key, const QByteArray &sealed, const QByteArray &associatedData);

bool constantTimeEquals(const QByteArray &lhs, const QByteArray &rhs);

} // namespace cipher
} // namespace storage
} // namespace taskvault
