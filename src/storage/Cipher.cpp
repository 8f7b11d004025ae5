#include "taskvault/storage/Cipher.hpp"

#include "taskvault/core/Logging.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <climits>
#include <memory>

namespace taskvault {
namespace storage {

CipherError::CipherError(const std::string &message)
    : core::Error(core::ErrorCode::CipherFailure, QString::fromStdString(message))
{
}

namespace cipher {

namespace {

struct CipherContextDeleter
{
    void operator()(EVP_CIPHER_CTX *ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherContextPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherContextDeleter>;

[[noreturn]] void throwOpenSslError(const char *operation)
{
    std::string message(operation);
    unsigned long code = ERR_get_error();
    while (code != 0) {
        char buffer[256];
        ERR_error_string_n(code, buffer, sizeof(buffer));
        message += ": ";
        message += buffer;
        code = ERR_get_error();
    }
    throw CipherError(message);
}

void checkKey(const SecureBytes &key)
{
    if (key.size() != kKeyLength) {
        throw CipherError("AES-256-GCM key must be exactly 32 bytes");
    }
}

const unsigned char *asBytes(const QByteArray &data)
{
    return reinterpret_cast<const unsigned char *>(data.constData());
}

} // namespace

QByteArray randomBytes(int count)
{
    QByteArray bytes(count, Qt::Uninitialized);
    if (count > 0 && RAND_bytes(reinterpret_cast<unsigned char *>(bytes.data()), count) != 1) {
        throwOpenSslError("RAND_bytes");
    }
    return bytes;
}

SecureBytes deriveKey(const QString &password, const QByteArray &salt, int iterations)
{
    if (iterations < 1) {
        throw CipherError("PBKDF2 work factor must be positive");
    }
    QByteArray passwordBytes = password.toUtf8();
    QByteArray derived(kKeyLength, Qt::Uninitialized);
    const int res = PKCS5_PBKDF2_HMAC(passwordBytes.constData(),
                                      passwordBytes.size(),
                                      asBytes(salt),
                                      salt.size(),
                                      iterations,
                                      EVP_sha256(),
                                      kKeyLength,
                                      reinterpret_cast<unsigned char *>(derived.data()));
    if (!passwordBytes.isEmpty()) {
        OPENSSL_cleanse(passwordBytes.data(), static_cast<size_t>(passwordBytes.size()));
    }
    if (res != 1) {
        OPENSSL_cleanse(derived.data(), static_cast<size_t>(derived.size()));
        throwOpenSslError("PKCS5_PBKDF2_HMAC");
    }
    return SecureBytes(std::move(derived));
}

QByteArray seal(const SecureBytes &key, const QByteArray &plaintext, const QByteArray &associatedData)
{
    checkKey(key);
    if (plaintext.size() > INT_MAX - kNonceLength - kTagLength) {
        throw CipherError("plaintext too large");
    }

    const QByteArray nonce = randomBytes(kNonceLength);
    QByteArray ciphertext(plaintext.size(), Qt::Uninitialized);
    QByteArray tag(kTagLength, Qt::Uninitialized);

    CipherContextPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throwOpenSslError("EVP_CIPHER_CTX_new");
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kNonceLength, nullptr) != 1
        || EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, asBytes(key.bytes()), asBytes(nonce)) != 1) {
        throwOpenSslError("EVP_EncryptInit_ex");
    }

    int outlen = 0;
    if (!associatedData.isEmpty()
        && EVP_EncryptUpdate(ctx.get(), nullptr, &outlen, asBytes(associatedData), associatedData.size()) != 1) {
        throwOpenSslError("EVP_EncryptUpdate(aad)");
    }

    int total = 0;
    if (!plaintext.isEmpty()) {
        if (EVP_EncryptUpdate(ctx.get(),
                              reinterpret_cast<unsigned char *>(ciphertext.data()),
                              &outlen,
                              asBytes(plaintext),
                              plaintext.size()) != 1) {
            throwOpenSslError("EVP_EncryptUpdate");
        }
        total = outlen;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char *>(ciphertext.data()) + total, &outlen) != 1) {
        throwOpenSslError("EVP_EncryptFinal_ex");
    }
    total += outlen;
    ciphertext.resize(total);

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, kTagLength, tag.data()) != 1) {
        throwOpenSslError("EVP_CTRL_GCM_GET_TAG");
    }

    QByteArray result;
    result.reserve(nonce.size() + ciphertext.size() + tag.size());
    result.append(nonce);
    result.append(ciphertext);
    result.append(tag);
    return result;
}

std::optional<QByteArray> open(const SecureBytes &key, const QByteArray &sealed, const QByteArray &associatedData)
{
    checkKey(key);
    if (sealed.size() < kNonceLength + kTagLength) {
        return std::nullopt;
    }

    const int cipherLength = sealed.size() - kNonceLength - kTagLength;
    const QByteArray nonce = sealed.left(kNonceLength);
    const QByteArray ciphertext = sealed.mid(kNonceLength, cipherLength);
    QByteArray tag = sealed.right(kTagLength);
    QByteArray plaintext(cipherLength, Qt::Uninitialized);

    CipherContextPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throwOpenSslError("EVP_CIPHER_CTX_new");
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1
        || EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, kNonceLength, nullptr) != 1
        || EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, asBytes(key.bytes()), asBytes(nonce)) != 1) {
        throwOpenSslError("EVP_DecryptInit_ex");
    }

    int outlen = 0;
    if (!associatedData.isEmpty()
        && EVP_DecryptUpdate(ctx.get(), nullptr, &outlen, asBytes(associatedData), associatedData.size()) != 1) {
        ERR_clear_error();
        return std::nullopt;
    }

    int total = 0;
    if (cipherLength > 0) {
        if (EVP_DecryptUpdate(ctx.get(),
                              reinterpret_cast<unsigned char *>(plaintext.data()),
                              &outlen,
                              asBytes(ciphertext),
                              cipherLength) != 1) {
            ERR_clear_error();
            return std::nullopt;
        }
        total = outlen;
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, kTagLength, tag.data()) != 1) {
        throwOpenSslError("EVP_CTRL_GCM_SET_TAG");
    }
    if (EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char *>(plaintext.data()) + total, &outlen) != 1) {
        // Tag mismatch: wrong key or tampered data. Never hand back partial plaintext.
        OPENSSL_cleanse(plaintext.data(), static_cast<size_t>(plaintext.size()));
        ERR_clear_error();
        qCDebug(core::lcCrypto) << "GCM tag verification failed";
        return std::nullopt;
    }
    total += outlen;
    plaintext.resize(total);
    return plaintext;
}

bool constantTimeEquals(const QByteArray &lhs, const QByteArray &rhs)
{
    if (lhs.size() != rhs.size()) {
        return false;
    }
    return CRYPTO_memcmp(lhs.constData(), rhs.constData(), static_cast<size_t>(lhs.size())) == 0;
}

} // namespace cipher
} // namespace storage
} // namespace taskvault
