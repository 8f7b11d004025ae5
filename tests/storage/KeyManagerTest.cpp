#include <QtTest/QtTest>

#include "taskvault/core/Errors.hpp"
#include "taskvault/storage/EncryptedStore.hpp"
#include "taskvault/storage/KeyManager.hpp"

#include <QJsonObject>
#include <QTemporaryDir>

#include <stdexcept>

using namespace taskvault;
using storage::EncryptedStore;
using storage::KeyManager;
using storage::RekeyPhase;

namespace {

constexpr int kTestIterations = 1000;

QJsonDocument documentWith(const QString &value)
{
    QJsonObject object;
    object.insert(QStringLiteral("value"), value);
    return QJsonDocument(object);
}

QStringList filesMatching(const QString &root, const QString &pattern)
{
    return QDir(root).entryList(QStringList{pattern}, QDir::Files);
}

} // namespace

class KeyManagerTest : public QObject
{
    Q_OBJECT

private slots:
    void initializeAndLogin();
    void initializeRejectsEmptyPasswordAndSecondRun();
    void loginWithoutEnvelope();
    void envelopeContainsNoSecrets();
    void rejectsOutOfRangeWorkFactor();
    void changePasswordReencryptsDocuments();
    void changePasswordRequiresOldPassword();
    void interruptedBeforeCommitKeepsOldPassword();
    void leftoverStagedFilesAreDiscarded();
    void committedChangeIsRolledForward();
};

void KeyManagerTest::initializeAndLogin()
{
    QTemporaryDir dir;
    EncryptedStore store(dir.path());
    KeyManager keys(store, kTestIterations);

    QVERIFY(!keys.hasEnvelope());
    const storage::SecureBytes key = keys.initialize(QStringLiteral("correct horse"));
    QVERIFY(keys.hasEnvelope());
    QCOMPARE(key.size(), 32);

    const storage::SecureBytes again = keys.login(QStringLiteral("correct horse"));
    QCOMPARE(again.bytes(), key.bytes());

    QVERIFY_EXCEPTION_THROWN(keys.login(QStringLiteral("battery staple")), core::AuthenticationFailed);
}

void KeyManagerTest::initializeRejectsEmptyPasswordAndSecondRun()
{
    QTemporaryDir dir;
    EncryptedStore store(dir.path());
    KeyManager keys(store, kTestIterations);

    QVERIFY_EXCEPTION_THROWN(keys.initialize(QString()), core::ValidationError);
    QVERIFY(!keys.hasEnvelope());

    keys.initialize(QStringLiteral("pw"));
    QVERIFY_EXCEPTION_THROWN(keys.initialize(QStringLiteral("other")), core::ValidationError);
    keys.login(QStringLiteral("pw"));
}

void KeyManagerTest::loginWithoutEnvelope()
{
    QTemporaryDir dir;
    EncryptedStore store(dir.path());
    KeyManager keys(store, kTestIterations);
    QVERIFY_EXCEPTION_THROWN(keys.login(QStringLiteral("pw")), core::NotFound);
}

void KeyManagerTest::envelopeContainsNoSecrets()
{
    QTemporaryDir dir;
    EncryptedStore store(dir.path());
    KeyManager keys(store, kTestIterations);
    const QString password = QStringLiteral("hunter2-unique-password");
    const storage::SecureBytes key = keys.initialize(password);

    QFile file(keys.envelopePath());
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray contents = file.readAll();
    QVERIFY(!contents.contains(password.toUtf8()));
    QVERIFY(!contents.contains(key.bytes()));
    QVERIFY(!contents.contains(key.bytes().toBase64()));
    QVERIFY(!contents.contains(key.bytes().toHex()));

    const QJsonObject envelope = QJsonDocument::fromJson(contents).object();
    QCOMPARE(envelope.value(QStringLiteral("kdf")).toString(), QStringLiteral("pbkdf2-hmac-sha256"));
    QCOMPARE(envelope.value(QStringLiteral("iterations")).toInt(), kTestIterations);
    QCOMPARE(QByteArray::fromBase64(envelope.value(QStringLiteral("salt")).toString().toLatin1()).size(), 16);
    QVERIFY(!envelope.value(QStringLiteral("verifier")).toString().isEmpty());
}

void KeyManagerTest::rejectsOutOfRangeWorkFactor()
{
    QTemporaryDir dir;
    EncryptedStore store(dir.path());
    QVERIFY_EXCEPTION_THROWN(KeyManager(store, 0), core::ValidationError);
    QVERIFY_EXCEPTION_THROWN(KeyManager(store, KeyManager::kMaxIterations + 1), core::ValidationError);
}

void KeyManagerTest::changePasswordReencryptsDocuments()
{
    QTemporaryDir dir;
    EncryptedStore store(dir.path());
    KeyManager keys(store, kTestIterations);
    store.setKey(keys.initialize(QStringLiteral("old")));
    store.save(QStringLiteral("tasks"), documentWith(QStringLiteral("a")));
    store.save(QStringLiteral("settings"), documentWith(QStringLiteral("b")));

    keys.changePassword(QStringLiteral("old"), QStringLiteral("new"));

    QVERIFY_EXCEPTION_THROWN(keys.login(QStringLiteral("old")), core::AuthenticationFailed);
    QCOMPARE(store.load(QStringLiteral("tasks")), documentWith(QStringLiteral("a")));

    EncryptedStore reopened(dir.path());
    reopened.setKey(KeyManager(reopened, kTestIterations).login(QStringLiteral("new")));
    QCOMPARE(reopened.load(QStringLiteral("tasks")), documentWith(QStringLiteral("a")));
    QCOMPARE(reopened.load(QStringLiteral("settings")), documentWith(QStringLiteral("b")));
    QVERIFY(filesMatching(dir.path(), QStringLiteral("*.rekey")).isEmpty());
    QVERIFY(!QFile::exists(dir.filePath(QStringLiteral("envelope.next"))));
}

void KeyManagerTest::changePasswordRequiresOldPassword()
{
    QTemporaryDir dir;
    EncryptedStore store(dir.path());
    KeyManager keys(store, kTestIterations);
    store.setKey(keys.initialize(QStringLiteral("old")));

    QVERIFY_EXCEPTION_THROWN(keys.changePassword(QStringLiteral("wrong"), QStringLiteral("new")),
                             core::AuthenticationFailed);
    QVERIFY_EXCEPTION_THROWN(keys.changePassword(QStringLiteral("old"), QString()), core::ValidationError);
    keys.login(QStringLiteral("old"));
}

void KeyManagerTest::interruptedBeforeCommitKeepsOldPassword()
{
    QTemporaryDir dir;
    EncryptedStore store(dir.path());
    KeyManager keys(store, kTestIterations);
    store.setKey(keys.initialize(QStringLiteral("old")));
    store.save(QStringLiteral("tasks"), documentWith(QStringLiteral("intact")));

    keys.setRekeyObserver([](RekeyPhase phase) {
        if (phase == RekeyPhase::Staged) {
            throw std::runtime_error("simulated crash");
        }
    });
    QVERIFY_EXCEPTION_THROWN(keys.changePassword(QStringLiteral("old"), QStringLiteral("new")), std::runtime_error);

    keys.login(QStringLiteral("old"));
    QVERIFY_EXCEPTION_THROWN(keys.login(QStringLiteral("new")), core::AuthenticationFailed);
    QCOMPARE(store.load(QStringLiteral("tasks")), documentWith(QStringLiteral("intact")));
    QVERIFY(filesMatching(dir.path(), QStringLiteral("*.rekey")).isEmpty());
}

void KeyManagerTest::leftoverStagedFilesAreDiscarded()
{
    QTemporaryDir dir;
    EncryptedStore store(dir.path());
    KeyManager keys(store, kTestIterations);
    store.setKey(keys.initialize(QStringLiteral("old")));
    store.save(QStringLiteral("tasks"), documentWith(QStringLiteral("intact")));

    QFile leftover(dir.filePath(QStringLiteral("tasks.rekey")));
    QVERIFY(leftover.open(QIODevice::WriteOnly));
    leftover.write("staged by a crashed password change");
    leftover.close();

    keys.recover();

    QVERIFY(!QFile::exists(dir.filePath(QStringLiteral("tasks.rekey"))));
    keys.login(QStringLiteral("old"));
    QCOMPARE(store.load(QStringLiteral("tasks")), documentWith(QStringLiteral("intact")));
}

void KeyManagerTest::committedChangeIsRolledForward()
{
    QTemporaryDir dir;
    {
        EncryptedStore store(dir.path());
        KeyManager keys(store, kTestIterations);
        store.setKey(keys.initialize(QStringLiteral("old")));
        store.save(QStringLiteral("tasks"), documentWith(QStringLiteral("kept")));

        keys.setRekeyObserver([](RekeyPhase phase) {
            if (phase == RekeyPhase::Committed) {
                throw std::runtime_error("simulated crash after commit");
            }
        });
        QVERIFY_EXCEPTION_THROWN(keys.changePassword(QStringLiteral("old"), QStringLiteral("new")),
                                 std::runtime_error);
        QVERIFY(QFile::exists(dir.filePath(QStringLiteral("envelope.next"))));
    }

    EncryptedStore store(dir.path());
    KeyManager keys(store, kTestIterations);
    keys.recover();

    QVERIFY(!QFile::exists(dir.filePath(QStringLiteral("envelope.next"))));
    QVERIFY_EXCEPTION_THROWN(keys.login(QStringLiteral("old")), core::AuthenticationFailed);
    store.setKey(keys.login(QStringLiteral("new")));
    QCOMPARE(store.load(QStringLiteral("tasks")), documentWith(QStringLiteral("kept")));
}

QTEST_GUILESS_MAIN(KeyManagerTest)
#include "KeyManagerTest.moc"
