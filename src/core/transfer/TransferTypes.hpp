#pragma once

#include <QMetaType>
#include <QString>
#include <QStringList>

namespace rbridge {

/// Why a transfer cycle or a single file in it did not complete.
struct TransferError {
    enum class Kind {
        NoDestinationConfigured,
        DestinationUnreachable,
        CopyFailed,
        VerificationFailed,
        DeletionFailed,
        TransferAlreadyInProgress,
        Cancelled
    };

    Kind kind = Kind::CopyFailed;
    QString file;    // file name, or destination path for DestinationUnreachable
    QString reason;  // CopyFailed only

    static TransferError noDestination() { return {Kind::NoDestinationConfigured, {}, {}}; }
    static TransferError destinationUnreachable(const QString& path) { return {Kind::DestinationUnreachable, path, {}}; }
    static TransferError copyFailed(const QString& file, const QString& reason) { return {Kind::CopyFailed, file, reason}; }
    static TransferError verificationFailed(const QString& file) { return {Kind::VerificationFailed, file, {}}; }
    static TransferError deletionFailed(const QString& file) { return {Kind::DeletionFailed, file, {}}; }
    static TransferError alreadyInProgress() { return {Kind::TransferAlreadyInProgress, {}, {}}; }
    static TransferError cancelled() { return {Kind::Cancelled, {}, {}}; }

    QString message() const;
};

/// Aggregate result of one transfer cycle.
/// success holds iff errors is empty and at least one file moved.
struct TransferOutcome {
    bool success = false;
    int transferredCount = 0;
    int totalCount = 0;
    QStringList errors;
    QString summary;

    static TransferOutcome make(int totalCount, int transferredCount, const QStringList& errors);
};

/// Why discovery aborted before any file was touched.
struct ScanError {
    enum class Kind {
        DeviceNotAccessible,
        PermissionDenied,
        InsufficientDiskSpace,
        ScanInterrupted
    };

    Kind kind = Kind::DeviceNotAccessible;
    QString path;
    qint64 required = 0;
    qint64 available = 0;

    static ScanError deviceNotAccessible(const QString& path) { return {Kind::DeviceNotAccessible, path, 0, 0}; }
    static ScanError permissionDenied(const QString& path) { return {Kind::PermissionDenied, path, 0, 0}; }
    static ScanError insufficientDiskSpace(qint64 required, qint64 available) { return {Kind::InsufficientDiskSpace, {}, required, available}; }
    static ScanError interrupted() { return {Kind::ScanInterrupted, {}, 0, 0}; }

    QString message() const;
};

} // namespace rbridge

Q_DECLARE_METATYPE(rbridge::TransferError)
Q_DECLARE_METATYPE(rbridge::TransferOutcome)
Q_DECLARE_METATYPE(rbridge::ScanError)
