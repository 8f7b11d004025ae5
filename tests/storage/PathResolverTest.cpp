#include <QtTest/QtTest>

#include "taskvault/core/Errors.hpp"
#include "taskvault/storage/PathResolver.hpp"

#include <QHash>
#include <QTemporaryDir>

#include <unistd.h>

using namespace taskvault;
using core::ProbeFailure;
using storage::PathResolver;
using storage::ProbeResult;

namespace {

class ScriptedProbe : public storage::StorageProbe
{
public:
    // Each path answers with its queued results in order; the last one repeats.
    void script(const QString &path, QList<ProbeResult> results) { m_results.insert(path, results); }

    ProbeResult probe(const QString &directory) const override
    {
        ++m_calls[directory];
        QList<ProbeResult> &queue = m_results[directory];
        if (queue.isEmpty()) {
            return ProbeResult::success();
        }
        return queue.size() > 1 ? queue.takeFirst() : queue.first();
    }

    int calls(const QString &path) const { return m_calls.value(path); }

private:
    mutable QHash<QString, QList<ProbeResult>> m_results;
    mutable QHash<QString, int> m_calls;
};

core::RetryPolicy fastRetries()
{
    core::RetryPolicy policy;
    policy.maxAttempts = 3;
    policy.initialDelayMs = 0;
    policy.maxDelayMs = 0;
    return policy;
}

QStringList probeLeftovers(const QString &directory)
{
    return QDir(directory).entryList(QStringList{QStringLiteral(".taskvault-probe-*")}, QDir::Files | QDir::Hidden);
}

} // namespace

class PathResolverTest : public QObject
{
    Q_OBJECT

private slots:
    void selectsFirstWritableCandidate();
    void reportsEveryAttemptWhenNothingIsWritable();
    void retriesOnlyTransientFailures();
    void realProbeSkipsReadOnlyDirectory();
    void realProbeCleansUp();
    void rejectsOverlongPathComponent();
    void defaultCandidatesPutOverrideFirst();
};

void PathResolverTest::selectsFirstWritableCandidate()
{
    auto probe = std::make_shared<ScriptedProbe>();
    probe->script(QStringLiteral("/readonly"),
                  {ProbeResult::failure(ProbeFailure::PermissionDenied, QStringLiteral("open probe"))});

    const PathResolver resolver({QStringLiteral("/readonly"), QStringLiteral("/creatable"), QStringLiteral("/home")},
                                probe, fastRetries());
    const storage::StorageLocation location = resolver.resolve();

    QCOMPARE(location.activeRoot, QStringLiteral("/creatable"));
    QCOMPARE(location.failures.size(), static_cast<size_t>(1));
    QCOMPARE(location.failures.front().path, QStringLiteral("/readonly"));
    QCOMPARE(location.failures.front().reason, ProbeFailure::PermissionDenied);
    QCOMPARE(core::probeFailureName(location.failures.front().reason), QStringLiteral("permission denied"));
    QCOMPARE(probe->calls(QStringLiteral("/home")), 0);
}

void PathResolverTest::reportsEveryAttemptWhenNothingIsWritable()
{
    auto probe = std::make_shared<ScriptedProbe>();
    probe->script(QStringLiteral("/a"), {ProbeResult::failure(ProbeFailure::ReadOnlyFilesystem, QString())});
    probe->script(QStringLiteral("/b"), {ProbeResult::failure(ProbeFailure::PathTooLong, QString())});
    probe->script(QStringLiteral("/c"), {ProbeResult::failure(ProbeFailure::DiskFull, QStringLiteral("quota"))});

    const PathResolver resolver({QStringLiteral("/a"), QStringLiteral("/b"), QStringLiteral("/c")}, probe,
                                fastRetries());
    try {
        resolver.resolve();
        QFAIL("expected StorageUnavailable");
    } catch (const core::StorageUnavailable &e) {
        QCOMPARE(e.attempts().size(), static_cast<size_t>(3));
        QCOMPARE(e.attempts().at(0).reason, ProbeFailure::ReadOnlyFilesystem);
        QCOMPARE(e.attempts().at(1).reason, ProbeFailure::PathTooLong);
        QCOMPARE(e.attempts().at(2).reason, ProbeFailure::DiskFull);
        const QString message = e.message();
        QVERIFY(message.contains(QStringLiteral("/a: read-only filesystem")));
        QVERIFY(message.contains(QStringLiteral("/b: path too long")));
        QVERIFY(message.contains(QStringLiteral("/c: disk full")));
    }
}

void PathResolverTest::retriesOnlyTransientFailures()
{
    auto probe = std::make_shared<ScriptedProbe>();
    probe->script(QStringLiteral("/denied"), {ProbeResult::failure(ProbeFailure::PermissionDenied, QString())});
    probe->script(QStringLiteral("/flaky"),
                  {ProbeResult::failure(ProbeFailure::Other, QStringLiteral("EIO")), ProbeResult::success()});

    const PathResolver resolver({QStringLiteral("/denied"), QStringLiteral("/flaky")}, probe, fastRetries());
    QCOMPARE(resolver.resolve().activeRoot, QStringLiteral("/flaky"));
    QCOMPARE(probe->calls(QStringLiteral("/denied")), 1);
    QCOMPARE(probe->calls(QStringLiteral("/flaky")), 2);
}

void PathResolverTest::realProbeSkipsReadOnlyDirectory()
{
    if (::geteuid() == 0) {
        QSKIP("permission checks do not apply to root");
    }
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString locked = dir.filePath(QStringLiteral("locked"));
    QVERIFY(QDir().mkpath(locked));
    QVERIFY(QFile::setPermissions(locked, QFileDevice::ReadOwner | QFileDevice::ExeOwner));
    const QString fresh = dir.filePath(QStringLiteral("fresh/nested"));

    const PathResolver resolver({locked, fresh}, nullptr, fastRetries());
    const storage::StorageLocation location = resolver.resolve();

    QFile::setPermissions(locked, QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner);

    QCOMPARE(location.activeRoot, fresh);
    QVERIFY(QFileInfo(fresh).isDir());
    QCOMPARE(location.failures.size(), static_cast<size_t>(1));
    QCOMPARE(location.failures.front().reason, ProbeFailure::PermissionDenied);
    QVERIFY(probeLeftovers(fresh).isEmpty());
}

void PathResolverTest::realProbeCleansUp()
{
    QTemporaryDir dir;
    storage::FileStorageProbe probe;
    const ProbeResult result = probe.probe(dir.path());
    QVERIFY(result.ok);
    QVERIFY(probeLeftovers(dir.path()).isEmpty());
}

void PathResolverTest::rejectsOverlongPathComponent()
{
    QTemporaryDir dir;
    storage::FileStorageProbe probe;
    const ProbeResult result = probe.probe(dir.filePath(QString(300, QLatin1Char('x'))));
    QVERIFY(!result.ok);
    QCOMPARE(result.reason, ProbeFailure::PathTooLong);
}

void PathResolverTest::defaultCandidatesPutOverrideFirst()
{
    const QStringList candidates = PathResolver::defaultCandidates(QStringLiteral("/opt/taskvault"),
                                                                   QStringLiteral("/srv/override"));
    QVERIFY(candidates.size() >= 4);
    QCOMPARE(candidates.at(0), QStringLiteral("/srv/override"));
    QCOMPARE(candidates.at(1), QStringLiteral("/opt/taskvault/data"));
    QCOMPARE(candidates.at(2), QDir::home().filePath(QStringLiteral(".taskvault")));
    QCOMPARE(candidates.last(), QDir(QDir::tempPath()).filePath(QStringLiteral("taskvault-data")));
}

QTEST_GUILESS_MAIN(PathResolverTest)
#include "PathResolverTest.moc"
