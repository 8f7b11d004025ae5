#include "taskvault/core/Errors.hpp"

namespace taskvault {
namespace core {

QString errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::StorageUnavailable:
        return QStringLiteral("StorageUnavailable");
    case ErrorCode::StorageError:
        return QStringLiteral("StorageError");
    case ErrorCode::StorageBusy:
        return QStringLiteral("StorageBusy");
    case ErrorCode::CipherFailure:
        return QStringLiteral("CipherFailure");
    case ErrorCode::AuthenticationFailed:
        return QStringLiteral("AuthenticationFailed");
    case ErrorCode::DecryptionFailed:
        return QStringLiteral("DecryptionFailed");
    case ErrorCode::LimitExceeded:
        return QStringLiteral("LimitExceeded");
    case ErrorCode::SlotConflict:
        return QStringLiteral("SlotConflict");
    case ErrorCode::ValidationError:
        return QStringLiteral("ValidationError");
    case ErrorCode::VersionMismatch:
        return QStringLiteral("VersionMismatch");
    case ErrorCode::NotFound:
    default:
        return QStringLiteral("NotFound");
    }
}

QString probeFailureName(ProbeFailure failure)
{
    switch (failure) {
    case ProbeFailure::PermissionDenied:
        return QStringLiteral("permission denied");
    case ProbeFailure::ReadOnlyFilesystem:
        return QStringLiteral("read-only filesystem");
    case ProbeFailure::PathTooLong:
        return QStringLiteral("path too long");
    case ProbeFailure::DiskFull:
        return QStringLiteral("disk full");
    case ProbeFailure::Other:
    default:
        return QStringLiteral("other");
    }
}

Error::Error(ErrorCode code, const QString &message)
    : std::runtime_error(message.toStdString())
    , m_code(code)
{
}

QString Error::message() const
{
    return QString::fromStdString(what());
}

namespace {

QString describeAttempts(const std::vector<AttemptedPath> &attempts)
{
    QStringList lines;
    for (const AttemptedPath &attempt : attempts) {
        QString line = QStringLiteral("%1: %2").arg(attempt.path, probeFailureName(attempt.reason));
        if (!attempt.detail.isEmpty()) {
            line += QStringLiteral(" (%1)").arg(attempt.detail);
        }
        lines << line;
    }
    if (lines.isEmpty()) {
        return QStringLiteral("no writable storage location found: no candidates");
    }
    return QStringLiteral("no writable storage location found: ") + lines.join(QStringLiteral("; "));
}

} // namespace

StorageUnavailable::StorageUnavailable(std::vector<AttemptedPath> attempts)
    : Error(ErrorCode::StorageUnavailable, describeAttempts(attempts))
    , m_attempts(std::move(attempts))
{
}

StorageError::StorageError(const QString &path, const QString &detail)
    : Error(ErrorCode::StorageError, QStringLiteral("%1: %2").arg(path, detail))
    , m_path(path)
{
}

StorageBusy::StorageBusy(const QString &operation)
    : Error(ErrorCode::StorageBusy,
            QStringLiteral("%1 refused: storage is busy with another write").arg(operation))
{
}

AuthenticationFailed::AuthenticationFailed()
    : Error(ErrorCode::AuthenticationFailed, QStringLiteral("authentication failed"))
{
}

DecryptionFailed::DecryptionFailed(const QString &document)
    : Error(ErrorCode::DecryptionFailed,
            QStringLiteral("document '%1' could not be decrypted or authenticated").arg(document))
    , m_document(document)
{
}

LimitExceeded::LimitExceeded(const QString &taskId, int limit)
    : Error(ErrorCode::LimitExceeded,
            QStringLiteral("task %1 already has %2 strikes today").arg(taskId).arg(limit))
    , m_taskId(taskId)
    , m_limit(limit)
{
}

SlotConflict::SlotConflict(const QString &occupyingId, const QString &occupyingTitle)
    : Error(ErrorCode::SlotConflict,
            QStringLiteral("slot is occupied by task '%1' (%2)").arg(occupyingTitle, occupyingId))
    , m_occupyingId(occupyingId)
    , m_occupyingTitle(occupyingTitle)
{
}

ValidationError::ValidationError(const QString &field, const QString &reason)
    : Error(ErrorCode::ValidationError, QStringLiteral("%1: %2").arg(field, reason))
    , m_field(field)
{
}

VersionMismatch::VersionMismatch(int found, int expected)
    : Error(ErrorCode::VersionMismatch,
            QStringLiteral("backup format version %1 is not supported (expected %2)").arg(found).arg(expected))
    , m_found(found)
    , m_expected(expected)
{
}

NotFound::NotFound(const QString &kind, const QString &id)
    : Error(ErrorCode::NotFound, QStringLiteral("%1 '%2' not found").arg(kind, id))
{
}

} // namespace core
} // namespace taskvault
