#pragma once

#include "taskvault/core/Retry.hpp"

#include <QByteArray>
#include <QString>

namespace taskvault {
namespace storage {

// Writes to a temporary file beside path, syncs it to disk and renames it over
// path. Either the old or the new content is visible, never a mix. Throws
// core::StorageError once the retry policy is exhausted.
void writeFileAtomically(const QString &path, const QByteArray &data,
                         const core::RetryPolicy &retryPolicy = core::RetryPolicy());

// Atomic rename plus directory sync. Throws core::StorageError.
void renameOver(const QString &from, const QString &to);

QByteArray readWholeFile(const QString &path);

void syncDirectory(const QString &directory);

} // namespace storage
} // namespace taskvault
