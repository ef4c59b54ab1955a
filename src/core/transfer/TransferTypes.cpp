#include "TransferTypes.hpp"

namespace rbridge {

QString TransferError::message() const
{
    switch (kind) {
    case Kind::NoDestinationConfigured:
        return QStringLiteral("No inbox folder configured");
    case Kind::DestinationUnreachable:
        return QStringLiteral("Inbox folder not accessible: %1").arg(file);
    case Kind::CopyFailed:
        return QStringLiteral("Failed to copy %1: %2").arg(file, reason);
    case Kind::VerificationFailed:
        return QStringLiteral("File verification failed for %1").arg(file);
    case Kind::DeletionFailed:
        return QStringLiteral("Copied and verified %1 but could not delete the original; "
                              "the file now exists on both the device and the inbox").arg(file);
    case Kind::TransferAlreadyInProgress:
        return QStringLiteral("Another transfer is already in progress");
    case Kind::Cancelled:
        return QStringLiteral("Transfer was cancelled");
    }
    return {};
}

TransferOutcome TransferOutcome::make(int totalCount, int transferredCount, const QStringList& errors)
{
    TransferOutcome outcome;
    outcome.totalCount = totalCount;
    outcome.transferredCount = transferredCount;
    outcome.errors = errors;
    outcome.success = errors.isEmpty() && transferredCount > 0;

    if (totalCount == 0 && errors.isEmpty())
        outcome.summary = QStringLiteral("No files to transfer");
    else if (outcome.success)
        outcome.summary = QStringLiteral("Successfully transferred %1 of %2 files")
                              .arg(transferredCount).arg(totalCount);
    else if (transferredCount > 0)
        outcome.summary = QStringLiteral("Transferred %1 of %2 files with %3 errors")
                              .arg(transferredCount).arg(totalCount).arg(errors.size());
    else
        outcome.summary = QStringLiteral("Transfer failed - no files were transferred");
    return outcome;
}

QString ScanError::message() const
{
    switch (kind) {
    case Kind::DeviceNotAccessible:
        return QStringLiteral("Device at %1 is not accessible").arg(path);
    case Kind::PermissionDenied:
        return QStringLiteral("Permission denied accessing %1").arg(path);
    case Kind::InsufficientDiskSpace:
        return QStringLiteral("Insufficient disk space. Required: %1MB, Available: %2MB")
            .arg(required / (1024 * 1024)).arg(available / (1024 * 1024));
    case Kind::ScanInterrupted:
        return QStringLiteral("File scan was interrupted");
    }
    return {};
}

} // namespace rbridge
