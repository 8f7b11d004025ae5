#include <QtTest/QtTest>

#include "taskvault/core/Errors.hpp"
#include "taskvault/storage/AtomicFile.hpp"
#include "taskvault/storage/BackupManager.hpp"
#include "taskvault/storage/Cipher.hpp"
#include "taskvault/storage/EncryptedStore.hpp"

#include <QJsonArray>
#include <QJsonObject>
#include <QTemporaryDir>

#include <stdexcept>
#include <thread>

using namespace taskvault;
using storage::BackupInfo;
using storage::BackupManager;
using storage::BackupType;
using storage::EncryptedStore;

namespace {

storage::SecureBytes keyFor(const QString &password)
{
    return storage::cipher::deriveKey(password, QByteArray(storage::cipher::kSaltLength, 'b'), 1000);
}

QJsonDocument documentWith(const QString &value)
{
    QJsonObject object;
    object.insert(QStringLiteral("value"), value);
    return QJsonDocument(object);
}

class SteppingClock
{
public:
    explicit SteppingClock(QDateTime start)
        : m_now(std::move(start))
    {
    }

    QDateTime operator()()
    {
        const QDateTime current = m_now;
        m_now = m_now.addSecs(60);
        return current;
    }

private:
    QDateTime m_now;
};

} // namespace

class BackupManagerTest : public QObject
{
    Q_OBJECT

private slots:
    void createWritesManifestAndCopies();
    void listIsNewestFirstAndIgnoresIncomplete();
    void restoreReplacesLiveDocuments();
    void restoreUnknownBackupIsNotFound();
    void restoreRejectsIncompatibleFormat();
    void restoreRejectsSnapshotUnderAnotherKey();
    void failedRestoreLeavesLiveDataIntact();
    void interruptedRestoreIsCompletedOnRecover();
    void restoreInterruptedBeforeCommitIsDiscarded();
    void pruneKeepsNewestAutomaticOnly();
    void createRefusedWhileStoreIsBusy();
};

void BackupManagerTest::createWritesManifestAndCopies()
{
    QTemporaryDir dir;
    auto store = std::make_shared<EncryptedStore>(dir.path());
    store->setKey(keyFor(QStringLiteral("pw")));
    store->save(QStringLiteral("tasks"), documentWith(QStringLiteral("t1")));
    QFile envelope(dir.filePath(QStringLiteral("envelope.json")));
    QVERIFY(envelope.open(QIODevice::WriteOnly));
    envelope.write("{}");
    envelope.close();

    BackupManager backups(store, QStringLiteral("1.2.3"));
    backups.setClock([] { return QDateTime(QDate(2024, 3, 1), QTime(8, 30, 15, 250)); });
    const BackupInfo info = backups.create(BackupType::Manual);

    QCOMPARE(info.name, QStringLiteral("20240301-083015-250-manual"));
    QVERIFY(QFileInfo(info.path).isDir());
    QVERIFY(info.files.contains(QStringLiteral("tasks.vault")));
    QVERIFY(info.files.contains(QStringLiteral("envelope.json")));

    QFile manifestFile(QDir(info.path).filePath(QStringLiteral("manifest.json")));
    QVERIFY(manifestFile.open(QIODevice::ReadOnly));
    const QJsonObject manifest = QJsonDocument::fromJson(manifestFile.readAll()).object();
    QCOMPARE(manifest.value(QStringLiteral("format_version")).toInt(), BackupManager::kFormatVersion);
    QCOMPARE(manifest.value(QStringLiteral("type")).toString(), QStringLiteral("manual"));
    QCOMPARE(manifest.value(QStringLiteral("app_version")).toString(), QStringLiteral("1.2.3"));
    QCOMPARE(manifest.value(QStringLiteral("files")).toArray().size(), 2);

    QFile live(store->documentPath(QStringLiteral("tasks")));
    QFile copy(QDir(info.path).filePath(QStringLiteral("tasks.vault")));
    QVERIFY(live.open(QIODevice::ReadOnly));
    QVERIFY(copy.open(QIODevice::ReadOnly));
    QCOMPARE(copy.readAll(), live.readAll());
}

void BackupManagerTest::listIsNewestFirstAndIgnoresIncomplete()
{
    QTemporaryDir dir;
    auto store = std::make_shared<EncryptedStore>(dir.path());
    store->setKey(keyFor(QStringLiteral("pw")));
    store->save(QStringLiteral("tasks"), documentWith(QStringLiteral("t1")));

    BackupManager backups(store, QStringLiteral("1.0.0"));
    backups.setClock(SteppingClock(QDateTime(QDate(2024, 1, 1), QTime(12, 0))));
    const BackupInfo first = backups.create(BackupType::Manual);
    const BackupInfo second = backups.create(BackupType::Automatic);
    const BackupInfo third = backups.create(BackupType::PreUpdate);

    QVERIFY(QDir().mkpath(QDir(backups.backupsRoot()).filePath(QStringLiteral(".staging-crashed"))));
    QVERIFY(QDir().mkpath(QDir(backups.backupsRoot()).filePath(QStringLiteral("no-manifest"))));

    const std::vector<BackupInfo> listed = backups.list();
    QCOMPARE(listed.size(), static_cast<size_t>(3));
    QCOMPARE(listed.at(0).name, third.name);
    QCOMPARE(listed.at(1).name, second.name);
    QCOMPARE(listed.at(2).name, first.name);
    QCOMPARE(listed.at(0).type, BackupType::PreUpdate);

    QCOMPARE(backups.sweepStaging(), 1);
}

void BackupManagerTest::restoreReplacesLiveDocuments()
{
    QTemporaryDir dir;
    auto store = std::make_shared<EncryptedStore>(dir.path());
    store->setKey(keyFor(QStringLiteral("pw")));
    store->save(QStringLiteral("tasks"), documentWith(QStringLiteral("captured")));

    BackupManager backups(store, QStringLiteral("1.0.0"));
    const BackupInfo info = backups.create(BackupType::Manual);

    store->save(QStringLiteral("tasks"), documentWith(QStringLiteral("later")));
    store->save(QStringLiteral("extra"), documentWith(QStringLiteral("not in snapshot")));

    backups.restore(info.name);

    QCOMPARE(store->load(QStringLiteral("tasks")), documentWith(QStringLiteral("captured")));
    QVERIFY(!store->exists(QStringLiteral("extra")));
}

void BackupManagerTest::restoreUnknownBackupIsNotFound()
{
    QTemporaryDir dir;
    auto store = std::make_shared<EncryptedStore>(dir.path());
    store->setKey(keyFor(QStringLiteral("pw")));
    BackupManager backups(store, QStringLiteral("1.0.0"));

    QVERIFY_EXCEPTION_THROWN(backups.restore(QStringLiteral("20990101-000000-000-manual")), core::NotFound);
    QVERIFY_EXCEPTION_THROWN(backups.restore(QStringLiteral("../../etc")), core::NotFound);
}

void BackupManagerTest::restoreRejectsIncompatibleFormat()
{
    QTemporaryDir dir;
    auto store = std::make_shared<EncryptedStore>(dir.path());
    store->setKey(keyFor(QStringLiteral("pw")));
    store->save(QStringLiteral("tasks"), documentWith(QStringLiteral("v1")));

    BackupManager backups(store, QStringLiteral("1.0.0"));
    const BackupInfo info = backups.create(BackupType::Manual);

    QFile manifestFile(QDir(info.path).filePath(QStringLiteral("manifest.json")));
    QVERIFY(manifestFile.open(QIODevice::ReadOnly));
    QJsonObject manifest = QJsonDocument::fromJson(manifestFile.readAll()).object();
    manifestFile.close();
    manifest.insert(QStringLiteral("format_version"), 99);
    QVERIFY(manifestFile.open(QIODevice::WriteOnly | QIODevice::Truncate));
    manifestFile.write(QJsonDocument(manifest).toJson());
    manifestFile.close();

    store->save(QStringLiteral("tasks"), documentWith(QStringLiteral("live")));
    try {
        backups.restore(info.name);
        QFAIL("expected VersionMismatch");
    } catch (const core::VersionMismatch &e) {
        QCOMPARE(e.found(), 99);
        QCOMPARE(e.expected(), BackupManager::kFormatVersion);
    }
    QCOMPARE(store->load(QStringLiteral("tasks")), documentWith(QStringLiteral("live")));
}

void BackupManagerTest::restoreRejectsSnapshotUnderAnotherKey()
{
    QTemporaryDir dir;
    auto store = std::make_shared<EncryptedStore>(dir.path());
    store->setKey(keyFor(QStringLiteral("old")));
    store->save(QStringLiteral("tasks"), documentWith(QStringLiteral("old key")));

    BackupManager backups(store, QStringLiteral("1.0.0"));
    const BackupInfo info = backups.create(BackupType::Manual);

    store->setKey(keyFor(QStringLiteral("new")));
    store->save(QStringLiteral("tasks"), documentWith(QStringLiteral("new key")));

    QVERIFY_EXCEPTION_THROWN(backups.restore(info.name), core::DecryptionFailed);
    QCOMPARE(store->load(QStringLiteral("tasks")), documentWith(QStringLiteral("new key")));
}

void BackupManagerTest::failedRestoreLeavesLiveDataIntact()
{
    QTemporaryDir dir;
    auto store = std::make_shared<EncryptedStore>(dir.path());
    store->setKey(keyFor(QStringLiteral("pw")));
    store->save(QStringLiteral("settings"), documentWith(QStringLiteral("s captured")));
    store->save(QStringLiteral("tasks"), documentWith(QStringLiteral("t captured")));

    BackupManager backups(store, QStringLiteral("1.0.0"));
    const BackupInfo info = backups.create(BackupType::Manual);

    store->save(QStringLiteral("settings"), documentWith(QStringLiteral("s live")));
    store->save(QStringLiteral("tasks"), documentWith(QStringLiteral("t live")));
    const QByteArray settingsBefore = storage::readWholeFile(store->documentPath(QStringLiteral("settings")));
    const QByteArray tasksBefore = storage::readWholeFile(store->documentPath(QStringLiteral("tasks")));

    // A directory in the way makes staging of the second document fail.
    QVERIFY(QDir(dir.path()).mkdir(QStringLiteral("tasks.restore")));

    QVERIFY_EXCEPTION_THROWN(backups.restore(info.name), core::StorageError);

    QCOMPARE(storage::readWholeFile(store->documentPath(QStringLiteral("settings"))), settingsBefore);
    QCOMPARE(storage::readWholeFile(store->documentPath(QStringLiteral("tasks"))), tasksBefore);
    QVERIFY(!QFile::exists(dir.filePath(QStringLiteral("settings.restore"))));
    QVERIFY(!QFile::exists(dir.filePath(QStringLiteral("restore.commit"))));

    QVERIFY(QDir(dir.path()).rmdir(QStringLiteral("tasks.restore")));
    backups.restore(info.name);
    QCOMPARE(store->load(QStringLiteral("settings")), documentWith(QStringLiteral("s captured")));
    QCOMPARE(store->load(QStringLiteral("tasks")), documentWith(QStringLiteral("t captured")));
}

void BackupManagerTest::interruptedRestoreIsCompletedOnRecover()
{
    QTemporaryDir dir;
    auto store = std::make_shared<EncryptedStore>(dir.path());
    store->setKey(keyFor(QStringLiteral("pw")));
    store->save(QStringLiteral("settings"), documentWith(QStringLiteral("s captured")));
    store->save(QStringLiteral("tasks"), documentWith(QStringLiteral("t captured")));

    BackupManager backups(store, QStringLiteral("1.0.0"));
    const BackupInfo info = backups.create(BackupType::Manual);

    store->save(QStringLiteral("tasks"), documentWith(QStringLiteral("t live")));
    store->save(QStringLiteral("extra"), documentWith(QStringLiteral("not in snapshot")));

    backups.setRestoreObserver([](storage::RestorePhase phase) {
        if (phase == storage::RestorePhase::Committed) {
            throw std::runtime_error("crash after commit");
        }
    });
    QVERIFY_EXCEPTION_THROWN(backups.restore(info.name), std::runtime_error);
    QCOMPARE(store->load(QStringLiteral("tasks")), documentWith(QStringLiteral("t live")));
    QVERIFY(QFile::exists(dir.filePath(QStringLiteral("restore.commit"))));

    BackupManager restarted(store, QStringLiteral("1.0.0"));
    restarted.recover();

    QCOMPARE(store->load(QStringLiteral("settings")), documentWith(QStringLiteral("s captured")));
    QCOMPARE(store->load(QStringLiteral("tasks")), documentWith(QStringLiteral("t captured")));
    QVERIFY(!store->exists(QStringLiteral("extra")));
    QVERIFY(!QFile::exists(dir.filePath(QStringLiteral("restore.commit"))));
    QVERIFY(!QFile::exists(dir.filePath(QStringLiteral("tasks.restore"))));
}

void BackupManagerTest::restoreInterruptedBeforeCommitIsDiscarded()
{
    QTemporaryDir dir;
    auto store = std::make_shared<EncryptedStore>(dir.path());
    store->setKey(keyFor(QStringLiteral("pw")));
    store->save(QStringLiteral("tasks"), documentWith(QStringLiteral("captured")));

    BackupManager backups(store, QStringLiteral("1.0.0"));
    const BackupInfo info = backups.create(BackupType::Manual);
    store->save(QStringLiteral("tasks"), documentWith(QStringLiteral("live")));

    backups.setRestoreObserver([](storage::RestorePhase phase) {
        if (phase == storage::RestorePhase::Staged) {
            throw std::runtime_error("crash before commit");
        }
    });
    QVERIFY_EXCEPTION_THROWN(backups.restore(info.name), std::runtime_error);
    QVERIFY(!QFile::exists(dir.filePath(QStringLiteral("tasks.restore"))));

    // A staged file left by a crash without a marker is discarded.
    storage::writeFileAtomically(dir.filePath(QStringLiteral("tasks.restore")),
                                 storage::readWholeFile(QDir(info.path).filePath(QStringLiteral("tasks.vault"))));
    BackupManager restarted(store, QStringLiteral("1.0.0"));
    restarted.recover();

    QCOMPARE(store->load(QStringLiteral("tasks")), documentWith(QStringLiteral("live")));
    QVERIFY(!QFile::exists(dir.filePath(QStringLiteral("tasks.restore"))));
}

void BackupManagerTest::pruneKeepsNewestAutomaticOnly()
{
    QTemporaryDir dir;
    auto store = std::make_shared<EncryptedStore>(dir.path());
    store->setKey(keyFor(QStringLiteral("pw")));
    store->save(QStringLiteral("tasks"), documentWith(QStringLiteral("t")));

    BackupManager backups(store, QStringLiteral("1.0.0"));
    backups.setClock(SteppingClock(QDateTime(QDate(2024, 1, 1), QTime(0, 0))));
    const BackupInfo manual = backups.create(BackupType::Manual);
    std::vector<BackupInfo> automatic;
    for (int i = 0; i < 4; ++i) {
        automatic.push_back(backups.create(BackupType::Automatic));
    }

    QCOMPARE(backups.prune(2), 2);

    QStringList remaining;
    for (const BackupInfo &info : backups.list()) {
        remaining << info.name;
    }
    QCOMPARE(remaining, (QStringList{automatic.at(3).name, automatic.at(2).name, manual.name}));
}

void BackupManagerTest::createRefusedWhileStoreIsBusy()
{
    QTemporaryDir dir;
    auto store = std::make_shared<EncryptedStore>(dir.path());
    store->setKey(keyFor(QStringLiteral("pw")));
    store->setLockTimeout(20);
    BackupManager backups(store, QStringLiteral("1.0.0"));

    const auto access = store->acquireExclusive(QStringLiteral("held"));
    bool busy = false;
    std::thread backupThread([&] {
        try {
            backups.create(BackupType::Manual);
        } catch (const core::StorageBusy &) {
            busy = true;
        }
    });
    backupThread.join();

    QVERIFY(busy);
    QVERIFY(backups.list().empty());
}

QTEST_GUILESS_MAIN(BackupManagerTest)
#include "BackupManagerTest.moc"
