#pragma once

#include <QDateTime>
#include <QMetaType>
#include <QString>
#include <QStringList>
#include <QVector>

namespace rbridge {

/// One discovered candidate file. Immutable once produced by FileScanner.
struct AudioFile {
    enum class Kind {
        Compressed,    // mp3
        Uncompressed   // wav, lpcm
    };

    QString path;      // absolute source path
    QString name;      // file name without directories
    qint64 size = 0;
    QDateTime lastModified;
    Kind kind = Kind::Compressed;

    bool isCompressed() const { return kind == Kind::Compressed; }

    /// Lower-case extensions FileScanner accepts.
    static const QStringList& supportedExtensions()
    {
        static const QStringList exts{"mp3", "wav", "lpcm"};
        return exts;
    }

    static bool isSupportedExtension(const QString& suffix)
    {
        return supportedExtensions().contains(suffix.toLower());
    }

    /// Caller must have checked isSupportedExtension().
    static Kind kindForExtension(const QString& suffix)
    {
        return suffix.compare("mp3", Qt::CaseInsensitive) == 0 ? Kind::Compressed
                                                               : Kind::Uncompressed;
    }
};

using AudioFileList = QVector<AudioFile>;

} // namespace rbridge

Q_DECLARE_METATYPE(rbridge::AudioFile)
