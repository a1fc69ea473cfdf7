#ifndef ICOCONTAINER_H
#define ICOCONTAINER_H

#include <QByteArray>
#include <QList>
#include <QImage>
#include <QString>

/**
 * @brief Reads and writes multi-resolution Windows icon (.ico) files.
 *
 * Qt's ICO image plugin stores a single image per file, so the container is
 * assembled here: an ICONDIR header, one ICONDIRENTRY per image and the
 * PNG-compressed bitmaps, all little-endian. Entries are stored smallest
 * first. Only square images up to 256 pixels are accepted.
 */
class IcoContainer
{
public:
    static constexpr int MaxIconSize = 256;

    static QByteArray encode(const QList<QImage> &images, QString *errorMessage = nullptr);
    static QList<QImage> decode(const QByteArray &data, QString *errorMessage = nullptr);

    // Returns an empty list and sets errorMessage if the file is missing or malformed
    static QList<QImage> read(const QString &path, QString *errorMessage = nullptr);
};

#endif // ICOCONTAINER_H
