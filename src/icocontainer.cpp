#include "icocontainer.h"

#include <QBuffer>
#include <QDataStream>
#include <QFile>
#include <algorithm>

namespace {

const quint16 IconResourceType = 1;
const int DirectoryHeaderSize = 6;
const int DirectoryEntrySize = 16;
const char PngSignature[] = "\x89PNG\r\n\x1a\n";

void setMessage(QString *errorMessage, const QString &message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}

// Width and height bytes store 256 as 0
quint8 dimensionByte(int value)
{
    return value >= 256 ? 0 : static_cast<quint8>(value);
}

int dimensionFromByte(quint8 value)
{
    return value == 0 ? 256 : value;
}

}

/**
 * @brief Encodes the images into an ICO container.
 *
 * @param images Square images, at most one per size.
 * @param errorMessage Receives a description of the failure, if any.
 * @return The container bytes, or an empty array on failure.
 */
QByteArray IcoContainer::encode(const QList<QImage> &images, QString *errorMessage)
{
    if (images.isEmpty()) {
        setMessage(errorMessage, "No images to store in the icon container");
        return QByteArray();
    }

    QList<QImage> sorted = images;
    std::sort(sorted.begin(), sorted.end(), [](const QImage &a, const QImage &b) {
        return a.width() < b.width();
    });

    QList<QByteArray> payloads;
    for (int i = 0; i < sorted.size(); ++i) {
        const QImage &image = sorted.at(i);
        if (image.isNull() || image.width() != image.height()) {
            setMessage(errorMessage, QString("Icon image %1 is not a square bitmap").arg(i));
            return QByteArray();
        }
        if (image.width() > MaxIconSize) {
            setMessage(errorMessage, QString("Icon image of %1 pixels exceeds the %2 pixel limit")
                                         .arg(image.width())
                                         .arg(MaxIconSize));
            return QByteArray();
        }
        if (i > 0 && sorted.at(i - 1).width() == image.width()) {
            setMessage(errorMessage, QString("Duplicate %1 pixel icon image").arg(image.width()));
            return QByteArray();
        }

        QByteArray png;
        QBuffer buffer(&png);
        buffer.open(QIODevice::WriteOnly);
        if (!image.convertToFormat(QImage::Format_ARGB32).save(&buffer, "PNG")) {
            setMessage(errorMessage, QString("Failed to encode %1 pixel icon image as PNG").arg(image.width()));
            return QByteArray();
        }
        payloads.append(png);
    }

    QByteArray data;
    QDataStream stream(&data, QIODevice::WriteOnly);
    stream.setByteOrder(QDataStream::LittleEndian);

    // ICONDIR
    stream << quint16(0) << IconResourceType << quint16(sorted.size());

    quint32 offset = DirectoryHeaderSize + DirectoryEntrySize * sorted.size();
    for (int i = 0; i < sorted.size(); ++i) {
        const int size = sorted.at(i).width();
        // ICONDIRENTRY: dimensions, palette size, reserved, planes, bit depth, length, offset
        stream << dimensionByte(size) << dimensionByte(size) << quint8(0) << quint8(0)
               << quint16(1) << quint16(32)
               << quint32(payloads.at(i).size()) << offset;
        offset += payloads.at(i).size();
    }

    for (const QByteArray &png : payloads) {
        stream.writeRawData(png.constData(), png.size());
    }

    setMessage(errorMessage, QString());
    return data;
}

QList<QImage> IcoContainer::decode(const QByteArray &data, QString *errorMessage)
{
    QList<QImage> images;

    if (data.size() < DirectoryHeaderSize) {
        setMessage(errorMessage, "Icon data is too short for a header");
        return images;
    }

    QDataStream stream(data);
    stream.setByteOrder(QDataStream::LittleEndian);

    quint16 reserved = 0;
    quint16 type = 0;
    quint16 count = 0;
    stream >> reserved >> type >> count;
    if (reserved != 0 || type != IconResourceType) {
        setMessage(errorMessage, "Data is not an icon container");
        return images;
    }
    if (count == 0) {
        setMessage(errorMessage, "Icon container holds no images");
        return images;
    }
    if (data.size() < DirectoryHeaderSize + DirectoryEntrySize * count) {
        setMessage(errorMessage, QString("Icon directory of %1 entries is truncated").arg(count));
        return images;
    }

    const QByteArray pngSignature(PngSignature, sizeof(PngSignature) - 1);

    for (int i = 0; i < count; ++i) {
        quint8 width = 0;
        quint8 height = 0;
        quint8 colorCount = 0;
        quint8 entryReserved = 0;
        quint16 planes = 0;
        quint16 bitCount = 0;
        quint32 length = 0;
        quint32 offset = 0;
        stream >> width >> height >> colorCount >> entryReserved >> planes >> bitCount >> length >> offset;

        if (offset > static_cast<quint32>(data.size()) || length > static_cast<quint32>(data.size()) - offset) {
            setMessage(errorMessage, QString("Icon entry %1 points outside the data").arg(i));
            return QList<QImage>();
        }

        const QByteArray payload = data.mid(static_cast<int>(offset), static_cast<int>(length));
        if (!payload.startsWith(pngSignature)) {
            setMessage(errorMessage, QString("Icon entry %1 is not PNG-compressed").arg(i));
            return QList<QImage>();
        }

        QImage image = QImage::fromData(payload, "PNG");
        if (image.isNull()) {
            setMessage(errorMessage, QString("Icon entry %1 holds a corrupt PNG").arg(i));
            return QList<QImage>();
        }
        if (image.width() != dimensionFromByte(width) || image.height() != dimensionFromByte(height)) {
            setMessage(errorMessage, QString("Icon entry %1 is %2x%3 but the directory says %4x%5")
                                         .arg(i)
                                         .arg(image.width())
                                         .arg(image.height())
                                         .arg(dimensionFromByte(width))
                                         .arg(dimensionFromByte(height)));
            return QList<QImage>();
        }
        images.append(image.convertToFormat(QImage::Format_ARGB32));
    }

    setMessage(errorMessage, QString());
    return images;
}

QList<QImage> IcoContainer::read(const QString &path, QString *errorMessage)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        setMessage(errorMessage, QString("Cannot open %1: %2").arg(path, file.errorString()));
        return QList<QImage>();
    }

    QString message;
    const QList<QImage> images = decode(file.readAll(), &message);
    if (images.isEmpty()) {
        setMessage(errorMessage, QString("%1: %2").arg(path, message));
    } else {
        setMessage(errorMessage, QString());
    }
    return images;
}
