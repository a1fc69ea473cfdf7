#include <QtTest>
#include <QDataStream>
#include <QFile>
#include <QTemporaryDir>
#include "icocontainer.h"
#include "miciconrenderer.h"

class TestIcoContainer : public QObject
{
    Q_OBJECT

private:
    static QList<QImage> renderSizes(const QList<int> &sizes);

private slots:
    void writesDirectoryHeader();
    void storesLargestSizeAsZero();
    void ordersEntriesBySize();
    void decodesEncodedBitmaps();
    void readsFromFile();

    void rejectsUnsuitableImages_data();
    void rejectsUnsuitableImages();
    void rejectsMalformedData_data();
    void rejectsMalformedData();
    void reportsMissingFile();
};

QList<QImage> TestIcoContainer::renderSizes(const QList<int> &sizes)
{
    MicIconRenderer renderer;
    QList<QImage> images;
    for (int size : sizes) {
        images.append(renderer.render(size));
    }
    return images;
}

void TestIcoContainer::writesDirectoryHeader()
{
    const QByteArray data = IcoContainer::encode(renderSizes({16, 32, 48, 64, 128, 256}));
    QVERIFY(data.size() > 6 + 6 * 16);

    QDataStream stream(data);
    stream.setByteOrder(QDataStream::LittleEndian);
    quint16 reserved, type, count;
    stream >> reserved >> type >> count;
    QCOMPARE(reserved, quint16(0));
    QCOMPARE(type, quint16(1));
    QCOMPARE(count, quint16(6));

    // First entry: 16x16, 32 bits per pixel, data right after the directory
    quint8 width, height, colors, entryReserved;
    quint16 planes, bitCount;
    quint32 length, offset;
    stream >> width >> height >> colors >> entryReserved >> planes >> bitCount >> length >> offset;
    QCOMPARE(width, quint8(16));
    QCOMPARE(height, quint8(16));
    QCOMPARE(planes, quint16(1));
    QCOMPARE(bitCount, quint16(32));
    QCOMPARE(offset, quint32(6 + 6 * 16));
    QVERIFY(data.mid(offset, 8).startsWith("\x89PNG"));
}

void TestIcoContainer::storesLargestSizeAsZero()
{
    const QByteArray data = IcoContainer::encode(renderSizes({256}));
    QCOMPARE(quint8(data.at(6)), quint8(0));
    QCOMPARE(quint8(data.at(7)), quint8(0));
}

void TestIcoContainer::ordersEntriesBySize()
{
    const QByteArray data = IcoContainer::encode(renderSizes({128, 16, 48}));
    QCOMPARE(quint8(data.at(6)), quint8(16));
    QCOMPARE(quint8(data.at(6 + 16)), quint8(48));
    QCOMPARE(quint8(data.at(6 + 32)), quint8(128));
}

void TestIcoContainer::decodesEncodedBitmaps()
{
    const QList<QImage> images = renderSizes({16, 32, 48, 64, 128, 256});

    QString message;
    const QList<QImage> decoded = IcoContainer::decode(IcoContainer::encode(images), &message);
    QVERIFY2(message.isEmpty(), qPrintable(message));
    QCOMPARE(decoded.size(), 6);
    QCOMPARE(decoded.first().size(), QSize(16, 16));
    QCOMPARE(decoded.last().size(), QSize(256, 256));
    QCOMPARE(decoded.last(), images.last());
}

void TestIcoContainer::readsFromFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    const QString path = dir.filePath("icon.ico");
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(IcoContainer::encode(renderSizes({32, 64})));
    file.close();

    QString message;
    const QList<QImage> images = IcoContainer::read(path, &message);
    QVERIFY2(message.isEmpty(), qPrintable(message));
    QCOMPARE(images.size(), 2);
    QCOMPARE(images.at(1).width(), 64);
}

void TestIcoContainer::rejectsUnsuitableImages_data()
{
    QTest::addColumn<QList<QImage>>("images");

    QImage wide(64, 32, QImage::Format_ARGB32);
    wide.fill(Qt::transparent);
    QImage huge(512, 512, QImage::Format_ARGB32);
    huge.fill(Qt::transparent);

    QTest::newRow("empty list") << QList<QImage>();
    QTest::newRow("null image") << (QList<QImage>() << QImage());
    QTest::newRow("not square") << (QList<QImage>() << wide);
    QTest::newRow("larger than 256") << (QList<QImage>() << huge);
    QTest::newRow("duplicate size") << renderSizes({32, 32});
}

void TestIcoContainer::rejectsUnsuitableImages()
{
    QFETCH(QList<QImage>, images);

    QString message;
    QVERIFY(IcoContainer::encode(images, &message).isEmpty());
    QVERIFY(!message.isEmpty());
}

void TestIcoContainer::rejectsMalformedData_data()
{
    QTest::addColumn<QByteArray>("data");

    const QByteArray valid = IcoContainer::encode(renderSizes({16, 32}));

    QByteArray cursor = valid;
    cursor[2] = 2;  // resource type 2 is a cursor

    QByteArray outOfBounds = valid;
    outOfBounds[6 + 12] = char(0xff);  // offset of the first entry
    outOfBounds[6 + 13] = char(0xff);

    QTest::newRow("empty") << QByteArray();
    QTest::newRow("garbage") << QByteArray("not an icon at all");
    QTest::newRow("cursor") << cursor;
    QTest::newRow("no entries") << QByteArray("\0\0\1\0\0\0", 6);
    QTest::newRow("truncated directory") << valid.left(20);
    QTest::newRow("truncated bitmap") << valid.left(valid.size() - 10);
    QTest::newRow("offset out of bounds") << outOfBounds;
}

void TestIcoContainer::rejectsMalformedData()
{
    QFETCH(QByteArray, data);

    QString message;
    QVERIFY(IcoContainer::decode(data, &message).isEmpty());
    QVERIFY(!message.isEmpty());
}

void TestIcoContainer::reportsMissingFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());

    QString message;
    QVERIFY(IcoContainer::read(dir.filePath("missing.ico"), &message).isEmpty());
    QVERIFY(message.contains("missing.ico"));
}

QTEST_GUILESS_MAIN(TestIcoContainer)
#include "test_icocontainer.moc"
