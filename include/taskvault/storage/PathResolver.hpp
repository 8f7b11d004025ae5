#pragma once

#include "taskvault/core/Errors.hpp"
#include "taskvault/core/Retry.hpp"

#include <QString>
#include <QStringList>

#include <memory>
#include <vector>

namespace taskvault {
namespace storage {

struct ProbeResult
{
    bool ok = false;
    core::ProbeFailure reason = core::ProbeFailure::Other;
    QString detail;

    static ProbeResult success();
    static ProbeResult failure(core::ProbeFailure reason, QString detail);
};

// Checks that a directory can really be written: existence alone says
// nothing about permissions, quotas or read-only mounts.
class StorageProbe
{
public:
    virtual ~StorageProbe() = default;
    virtual ProbeResult probe(const QString &directory) const = 0;
};

// Creates the directory if needed, then writes, reads back and deletes a
// probe file. The probe file is removed on every exit path.
class FileStorageProbe : public StorageProbe
{
public:
    ProbeResult probe(const QString &directory) const override;

    static core::ProbeFailure classifyErrno(int error);
};

struct StorageLocation
{
    QStringList candidates;
    QString activeRoot;
    std::vector<core::AttemptedPath> failures;
};

class PathResolver
{
public:
    explicit PathResolver(QStringList candidates,
                          std::shared_ptr<const StorageProbe> probe = nullptr,
                          core::RetryPolicy retryPolicy = core::RetryPolicy());

    // Install-relative dir, home dir, platform app-data dir, temp fallback.
    // A non-empty overrideDir is tried before all of them.
    static QStringList defaultCandidates(const QString &installDir, const QString &overrideDir = QString());

    // Throws core::StorageUnavailable carrying every attempt when no
    // candidate passes the probe.
    StorageLocation resolve() const;

    const QStringList &candidates() const;

private:
    ProbeResult probeWithRetry(const QString &candidate) const;

    QStringList m_candidates;
    std::shared_ptr<const StorageProbe> m_probe;
    core::RetryPolicy m_retryPolicy;
};

} // namespace storage
} // namespace taskvault
