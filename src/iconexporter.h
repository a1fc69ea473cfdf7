#ifndef ICONEXPORTER_H
#define ICONEXPORTER_H

#include <QImage>
#include <QList>
#include <QMap>
#include <QString>
#include <QStringList>

#include "miciconrenderer.h"

/**
 * @brief Renders the microphone icon at every supported size and writes the
 * icon files an application bundle expects.
 *
 * Written artifacts:
 *   - 32x32.png  tray icon
 *   - icon.png   256 pixel primary icon
 *   - icon.ico   container with 16, 32, 48, 64, 128 and 256 pixel bitmaps
 *
 * The first failure stops the export; error() and errorString() tell which
 * artifact failed and why.
 */
class IconExporter
{
public:
    enum ExportError {
        NoError,
        InvalidGeometry,
        FilesystemError,
        EncodingError,
        VerificationError
    };

    static const char *TrayIconFileName;
    static const char *PrimaryIconFileName;
    static const char *ContainerIconFileName;
    static constexpr int TrayIconSize = 32;
    static constexpr int PrimaryIconSize = 256;

    explicit IconExporter(double paddingRatio = MicIconRenderer::DefaultPaddingRatio);

    static QList<int> iconSizes();

    bool exportTo(const QString &outputDirectory);

    // Re-reads the artifacts in outputDirectory and checks their dimensions
    bool verifyOutput(const QString &outputDirectory);

    QStringList writtenFiles() const { return m_writtenFiles; }
    ExportError error() const { return m_error; }
    QString errorString() const { return m_errorString; }

private:
    bool renderAll(QMap<int, QImage> &images);
    bool writePng(const QImage &image, const QString &path);
    bool writeContainer(const QImage &source, const QString &path);
    bool writeFile(const QByteArray &data, const QString &path);
    bool fail(ExportError error, const QString &message);

    MicIconRenderer m_renderer;
    QStringList m_writtenFiles;
    ExportError m_error;
    QString m_errorString;
};

#endif // ICONEXPORTER_H
