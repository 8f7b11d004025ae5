#include <QtTest/QtTest>

#include "taskvault/core/Errors.hpp"
#include "taskvault/storage/Cipher.hpp"

using namespace taskvault::storage;

class CipherTest : public QObject
{
    Q_OBJECT

private slots:
    void sealAndOpen();
    void wrongKeyFailsAuthentication();
    void associatedDataIsBound();
    void tamperedCiphertextIsRejected();
    void derivationIsDeterministic();
    void setupFailuresAreCoreErrors();
};

void CipherTest::sealAndOpen()
{
    const SecureBytes key = cipher::deriveKey(QStringLiteral("secret"), cipher::randomBytes(cipher::kSaltLength), 1000);
    QCOMPARE(key.size(), cipher::kKeyLength);

    const QByteArray plaintext = QByteArrayLiteral("{\"tasks\":[]}");
    const QByteArray sealed = cipher::seal(key, plaintext, QByteArrayLiteral("tasks"));
    QCOMPARE(sealed.size(), cipher::kNonceLength + plaintext.size() + cipher::kTagLength);
    QVERIFY(!sealed.contains(plaintext));

    const auto opened = cipher::open(key, sealed, QByteArrayLiteral("tasks"));
    QVERIFY(opened.has_value());
    QCOMPARE(*opened, plaintext);
}

void CipherTest::wrongKeyFailsAuthentication()
{
    const QByteArray salt = cipher::randomBytes(cipher::kSaltLength);
    const SecureBytes right = cipher::deriveKey(QStringLiteral("right"), salt, 1000);
    const SecureBytes wrong = cipher::deriveKey(QStringLiteral("wrong"), salt, 1000);

    const QByteArray sealed = cipher::seal(right, QByteArrayLiteral("payload"), QByteArray());
    QVERIFY(!cipher::open(wrong, sealed, QByteArray()).has_value());
}

void CipherTest::associatedDataIsBound()
{
    const SecureBytes key = cipher::deriveKey(QStringLiteral("pw"), cipher::randomBytes(cipher::kSaltLength), 1000);
    const QByteArray sealed = cipher::seal(key, QByteArrayLiteral("payload"), QByteArrayLiteral("tasks"));
    QVERIFY(!cipher::open(key, sealed, QByteArrayLiteral("settings")).has_value());
}

void CipherTest::tamperedCiphertextIsRejected()
{
    const SecureBytes key = cipher::deriveKey(QStringLiteral("pw"), cipher::randomBytes(cipher::kSaltLength), 1000);
    QByteArray sealed = cipher::seal(key, QByteArrayLiteral("payload"), QByteArray());
    sealed[cipher::kNonceLength] = static_cast<char>(sealed.at(cipher::kNonceLength) ^ 0x01);
    QVERIFY(!cipher::open(key, sealed, QByteArray()).has_value());

    QVERIFY(!cipher::open(key, QByteArrayLiteral("short"), QByteArray()).has_value());
}

void CipherTest::derivationIsDeterministic()
{
    const QByteArray salt = cipher::randomBytes(cipher::kSaltLength);
    const SecureBytes first = cipher::deriveKey(QStringLiteral("pw"), salt, 1000);
    const SecureBytes second = cipher::deriveKey(QStringLiteral("pw"), salt, 1000);
    QVERIFY(cipher::constantTimeEquals(first.bytes(), second.bytes()));

    const SecureBytes otherSalt = cipher::deriveKey(QStringLiteral("pw"), cipher::randomBytes(cipher::kSaltLength), 1000);
    QVERIFY(!cipher::constantTimeEquals(first.bytes(), otherSalt.bytes()));
}

void CipherTest::setupFailuresAreCoreErrors()
{
    QVERIFY_EXCEPTION_THROWN(cipher::deriveKey(QStringLiteral("pw"), cipher::randomBytes(cipher::kSaltLength), 0),
                             taskvault::core::Error);

    const SecureBytes shortKey(QByteArrayLiteral("too short"));
    try {
        cipher::seal(shortKey, QByteArrayLiteral("payload"), QByteArray());
        QFAIL("seal accepted a short key");
    } catch (const taskvault::core::Error &e) {
        QCOMPARE(e.code(), taskvault::core::ErrorCode::CipherFailure);
    }
}

QTEST_GUILESS_MAIN(CipherTest)
#include "CipherTest.moc"
