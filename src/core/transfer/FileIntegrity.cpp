#include "FileIntegrity.hpp"

#include <QCryptographicHash>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <boost/log/trivial.hpp>
#include <unistd.h>

namespace rbridge {

QString FileIntegrity::uniqueDestinationPath(const QString& dir, const QString& fileName)
{
    QDir target(dir);
    QString candidate = target.filePath(fileName);
    if (!QFileInfo::exists(candidate))
        return candidate;

    QFileInfo info(fileName);
    const QString base = info.completeBaseName();
    const QString suffix = info.suffix();

    for (int n = 1;; ++n) {
        QString name = suffix.isEmpty() ? QStringLiteral("%1_%2").arg(base).arg(n)
                                        : QStringLiteral("%1_%2.%3").arg(base).arg(n).arg(suffix);
        candidate = target.filePath(name);
        if (!QFileInfo::exists(candidate))
            return candidate;
    }
}

static bool fail(QString* error, const QString& message)
{
    if (error)
        *error = message;
    return false;
}

bool FileIntegrity::copyFile(const QString& source, const QString& destination, QString* error)
{
    QFile in(source);
    if (!in.open(QIODevice::ReadOnly))
        return fail(error, in.errorString());

    QFile out(destination);
    // NewOnly: never overwrite something that appeared since the name was picked
    if (!out.open(QIODevice::WriteOnly | QIODevice::NewOnly))
        return fail(error, out.errorString());

    QByteArray buffer;
    while (!in.atEnd()) {
        buffer = in.read(CHUNK_SIZE);
        if (buffer.isEmpty() && in.error() != QFileDevice::NoError) {
            QString reason = in.errorString();
            out.close();
            out.remove();
            return fail(error, reason);
        }
        if (out.write(buffer) != buffer.size()) {
            QString reason = out.errorString();
            out.close();
            out.remove();
            return fail(error, reason);
        }
    }

    if (!out.flush() || ::fsync(out.handle()) != 0) {
        QString reason = out.errorString();
        out.close();
        out.remove();
        return fail(error, reason.isEmpty() ? QStringLiteral("flush to disk failed") : reason);
    }
    out.close();
    return true;
}

QByteArray FileIntegrity::sha256(const QString& path, QString* error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        fail(error, file.errorString());
        return {};
    }

    QCryptographicHash hash(QCryptographicHash::Sha256);
    if (!hash.addData(&file)) {
        fail(error, file.errorString());
        return {};
    }
    return hash.result();
}

FileIntegrity::VerifyResult FileIntegrity::verifyCopy(const QString& original, const QString& copy, QString* error)
{
    QFileInfo originalInfo(original);
    QFileInfo copyInfo(copy);
    if (!originalInfo.exists() || !copyInfo.exists()) {
        fail(error, QStringLiteral("file missing during verification"));
        return VerifyResult::ReadError;
    }
    if (originalInfo.size() != copyInfo.size())
        return VerifyResult::SizeMismatch;

    QByteArray originalDigest = sha256(original, error);
    if (originalDigest.isEmpty())
        return VerifyResult::ReadError;
    QByteArray copyDigest = sha256(copy, error);
    if (copyDigest.isEmpty())
        return VerifyResult::ReadError;

    BOOST_LOG_TRIVIAL(trace) << "[FileIntegrity] " << originalInfo.fileName().toStdString()
                             << " sha256=" << originalDigest.toHex().toStdString();

    return originalDigest == copyDigest ? VerifyResult::Match : VerifyResult::DigestMismatch;
}

bool FileIntegrity::removeIfExists(const QString& path)
{
    if (!QFileInfo::exists(path))
        return true;
    if (QFile::remove(path))
        return true;
    BOOST_LOG_TRIVIAL(warning) << "[FileIntegrity] Could not remove " << path.toStdString();
    return false;
}

} // namespace rbridge
