#pragma once

#include <QString>
#include <QStringList>

#include <stdexcept>
#include <vector>

namespace taskvault {
namespace core {

enum class ErrorCode
{
    StorageUnavailable,
    StorageError,
    StorageBusy,
    CipherFailure,
    AuthenticationFailed,
    DecryptionFailed,
    LimitExceeded,
    SlotConflict,
    ValidationError,
    VersionMismatch,
    NotFound,
};

QString errorCodeName(ErrorCode code);

class Error : public std::runtime_error
{
public:
    Error(ErrorCode code, const QString &message);

    ErrorCode code() const { return m_code; }
    QString message() const;

private:
    ErrorCode m_code;
};

enum class ProbeFailure
{
    PermissionDenied,
    ReadOnlyFilesystem,
    PathTooLong,
    DiskFull,
    Other,
};

QString probeFailureName(ProbeFailure failure);

struct AttemptedPath
{
    QString path;
    ProbeFailure reason = ProbeFailure::Other;
    QString detail;
};

class StorageUnavailable : public Error
{
public:
    explicit StorageUnavailable(std::vector<AttemptedPath> attempts);

    const std::vector<AttemptedPath> &attempts() const { return m_attempts; }

private:
    std::vector<AttemptedPath> m_attempts;
};

class StorageError : public Error
{
public:
    StorageError(const QString &path, const QString &detail);

    const QString &path() const { return m_path; }

private:
    QString m_path;
};

class StorageBusy : public Error
{
public:
    explicit StorageBusy(const QString &operation);
};

class AuthenticationFailed : public Error
{
public:
    AuthenticationFailed();
};

class DecryptionFailed : public Error
{
public:
    explicit DecryptionFailed(const QString &document);

    const QString &document() const { return m_document; }

private:
    QString m_document;
};

class LimitExceeded : public Error
{
public:
    LimitExceeded(const QString &taskId, int limit);

    const QString &taskId() const { return m_taskId; }
    int limit() const { return m_limit; }

private:
    QString m_taskId;
    int m_limit;
};

class SlotConflict : public Error
{
public:
    SlotConflict(const QString &occupyingId, const QString &occupyingTitle);

    const QString &occupyingId() const { return m_occupyingId; }
    const QString &occupyingTitle() const { return m_occupyingTitle; }

private:
    QString m_occupyingId;
    QString m_occupyingTitle;
};

class ValidationError : public Error
{
public:
    ValidationError(const QString &field, const QString &reason);

    const QString &field() const { return m_field; }

private:
    QString m_field;
};

class VersionMismatch : public Error
{
public:
    VersionMismatch(int found, int expected);

    int found() const { return m_found; }
    int expected() const { return m_expected; }

private:
    int m_found;
    int m_expected;
};

class NotFound : public Error
{
public:
    NotFound(const QString &kind, const QString &id);
};

} // namespace core
} // namespace taskvault
