#pragma once

#include <QByteArray>
#include <QString>

namespace rbridge {

/// Byte-level copy and content verification primitives used by the
/// transfer engine. All calls block for the duration of the I/O.
class FileIntegrity {
public:
    static constexpr qint64 CHUNK_SIZE = 1024 * 1024;

    enum class VerifyResult {
        Match,
        SizeMismatch,
        DigestMismatch,
        ReadError
    };

    /// Path inside dir for fileName that does not exist yet: fileName itself,
    /// else "<base>_<n>.<ext>" with the smallest free n >= 1.
    static QString uniqueDestinationPath(const QString& dir, const QString& fileName);

    /// Copy source to destination, which must not exist. The destination is
    /// flushed to stable storage before returning. On failure nothing is left
    /// at destination and error (if given) describes the cause.
    static bool copyFile(const QString& source, const QString& destination, QString* error = nullptr);

    /// SHA-256 of the file contents, empty on read failure.
    static QByteArray sha256(const QString& path, QString* error = nullptr);

    /// Compare sizes first, then SHA-256 digests.
    static VerifyResult verifyCopy(const QString& original, const QString& copy, QString* error = nullptr);

    /// Best-effort removal; true if the path no longer exists.
    static bool removeIfExists(const QString& path);
};

} // namespace rbridge
