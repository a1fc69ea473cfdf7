#include "iconexporter.h"
#include "icocontainer.h"

#include <QBuffer>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QImageReader>
#include <QImageWriter>
#include <QSaveFile>

const char *IconExporter::TrayIconFileName = "32x32.png";
const char *IconExporter::PrimaryIconFileName = "icon.png";
const char *IconExporter::ContainerIconFileName = "icon.ico";

IconExporter::IconExporter(double paddingRatio)
    : m_renderer(paddingRatio)
    , m_error(NoError)
{
}

QList<int> IconExporter::iconSizes()
{
    return {16, 32, 48, 64, 128, 256};
}

/**
 * @brief Renders all icon sizes and writes the three icon artifacts.
 *
 * The output directory and its parents are created when missing. Files that
 * already exist are replaced.
 *
 * @param outputDirectory Destination directory.
 * @return true if every artifact was written.
 */
bool IconExporter::exportTo(const QString &outputDirectory)
{
    m_writtenFiles.clear();
    m_error = NoError;
    m_errorString.clear();

    // Reject bad geometry before touching the filesystem
    QString message;
    for (int size : iconSizes()) {
        if (!MicIconRenderer::validate(size, m_renderer.paddingRatio(), &message)) {
            return fail(InvalidGeometry, message);
        }
    }

    const QDir dir(outputDirectory);
    if (!QDir().mkpath(outputDirectory)) {
        return fail(FilesystemError, QString("Cannot create output directory %1")
                                         .arg(QDir::toNativeSeparators(dir.absolutePath())));
    }

    QMap<int, QImage> images;
    if (!renderAll(images)) {
        return false;
    }

    if (!writePng(images.value(TrayIconSize), dir.filePath(TrayIconFileName))) {
        return false;
    }
    if (!writePng(images.value(PrimaryIconSize), dir.filePath(PrimaryIconFileName))) {
        return false;
    }
    if (!writeContainer(images.value(PrimaryIconSize), dir.filePath(ContainerIconFileName))) {
        return false;
    }

    qInfo() << "Icon export complete:" << m_writtenFiles.size() << "files in"
            << QDir::toNativeSeparators(dir.absolutePath());
    return true;
}

bool IconExporter::renderAll(QMap<int, QImage> &images)
{
    for (int size : iconSizes()) {
        const QImage image = m_renderer.render(size);
        if (image.isNull()) {
            return fail(InvalidGeometry, m_renderer.errorString());
        }
        images.insert(size, image);
    }
    return true;
}

bool IconExporter::writePng(const QImage &image, const QString &path)
{
    QByteArray data;
    QBuffer buffer(&data);
    buffer.open(QIODevice::WriteOnly);

    QImageWriter writer(&buffer, "PNG");
    if (!writer.write(image)) {
        return fail(EncodingError, QString("Cannot encode %1: %2")
                                       .arg(QDir::toNativeSeparators(path), writer.errorString()));
    }

    if (!writeFile(data, path)) {
        return false;
    }
    qInfo().noquote() << "Saved" << QFileInfo(path).fileName();
    return true;
}

bool IconExporter::writeContainer(const QImage &source, const QString &path)
{
    QList<QImage> entries;
    for (int size : iconSizes()) {
        if (size == source.width()) {
            entries.append(source);
        } else {
            entries.append(source.scaled(size, size, Qt::IgnoreAspectRatio, Qt::SmoothTransformation));
        }
    }

    QString message;
    const QByteArray data = IcoContainer::encode(entries, &message);
    if (data.isEmpty()) {
        return fail(EncodingError, QString("Cannot encode %1: %2")
                                       .arg(QDir::toNativeSeparators(path), message));
    }

    if (!writeFile(data, path)) {
        return false;
    }

    QStringList sizes;
    for (int size : iconSizes()) {
        sizes << QString::number(size);
    }
    qInfo().noquote() << "Saved" << QFileInfo(path).fileName() << "with sizes:" << sizes.join(", ");
    return true;
}

bool IconExporter::writeFile(const QByteArray &data, const QString &path)
{
    // QSaveFile leaves no partial file behind when the write fails
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return fail(FilesystemError, QString("Cannot open %1 for writing: %2")
                                         .arg(QDir::toNativeSeparators(path), file.errorString()));
    }
    if (file.write(data) != data.size()) {
        const QString reason = file.errorString();
        file.cancelWriting();
        return fail(FilesystemError, QString("Cannot write %1: %2")
                                         .arg(QDir::toNativeSeparators(path), reason));
    }
    if (!file.commit()) {
        return fail(FilesystemError, QString("Cannot save %1: %2")
                                         .arg(QDir::toNativeSeparators(path), file.errorString()));
    }

    m_writtenFiles.append(path);
    return true;
}

bool IconExporter::verifyOutput(const QString &outputDirectory)
{
    m_error = NoError;
    m_errorString.clear();

    const QDir dir(outputDirectory);
    const struct {
        const char *fileName;
        int size;
    } pngFiles[] = {
        {TrayIconFileName, TrayIconSize},
        {PrimaryIconFileName, PrimaryIconSize},
    };

    for (const auto &png : pngFiles) {
        const QString path = dir.filePath(png.fileName);
        QImageReader reader(path, "PNG");
        const QImage image = reader.read();
        if (image.isNull()) {
            return fail(VerificationError, QString("Cannot read %1: %2")
                                               .arg(QDir::toNativeSeparators(path), reader.errorString()));
        }
        if (image.size() != QSize(png.size, png.size) || !image.hasAlphaChannel()) {
            return fail(VerificationError, QString("%1 is %2x%3, expected a %4x%4 image with alpha")
                                               .arg(QDir::toNativeSeparators(path))
                                               .arg(image.width())
                                               .arg(image.height())
                                               .arg(png.size));
        }
        qDebug() << "Verified" << png.fileName;
    }

    QString message;
    const QList<QImage> entries = IcoContainer::read(dir.filePath(ContainerIconFileName), &message);
    if (entries.isEmpty()) {
        return fail(VerificationError, message);
    }

    QList<int> found;
    for (const QImage &entry : entries) {
        found.append(entry.width());
    }
    if (found != iconSizes()) {
        QStringList sizes;
        for (int size : found) {
            sizes << QString::number(size);
        }
        return fail(VerificationError, QString("%1 holds sizes %2")
                                           .arg(QString::fromLatin1(ContainerIconFileName), sizes.join(", ")));
    }
    qDebug() << "Verified" << ContainerIconFileName << "with" << entries.size() << "sizes";
    return true;
}

bool IconExporter::fail(ExportError error, const QString &message)
{
    m_error = error;
    m_errorString = message;
    qWarning().noquote() << message;
    return false;
}
