#include "miciconrenderer.h"
#include "icongeometry.h"

#include <QDebug>
#include <QPainter>
#include <QPen>
#include <QRectF>
#include <cmath>

const double MicIconRenderer::DefaultPaddingRatio = 0.15;

MicIconRenderer::MicIconRenderer(double paddingRatio)
    : m_paddingRatio(paddingRatio)
    , m_error(NoError)
{
}

void MicIconRenderer::setPaddingRatio(double paddingRatio)
{
    m_paddingRatio = paddingRatio;
}

QColor MicIconRenderer::accentColor()
{
    return QColor(168, 85, 247, 255);   // #a855f7
}

QColor MicIconRenderer::tintColor()
{
    return QColor(196, 140, 255, 255);  // #c48cff
}

bool MicIconRenderer::validate(int size, double paddingRatio, QString *errorMessage)
{
    QString message;
    if (size <= 0) {
        message = QString("Icon size must be positive, got %1").arg(size);
    } else if (!std::isfinite(paddingRatio) || paddingRatio < 0.0 || paddingRatio >= 0.5) {
        message = QString("Padding ratio must be in [0, 0.5), got %1").arg(paddingRatio);
    } else {
        const int padding = static_cast<int>(size * paddingRatio);
        if (size - 2 * padding <= 0) {
            message = QString("Padding ratio %1 leaves no drawable area in a %2 pixel icon")
                          .arg(paddingRatio)
                          .arg(size);
        }
    }

    if (message.isEmpty()) {
        return true;
    }
    if (errorMessage) {
        *errorMessage = message;
    }
    return false;
}

/**
 * @brief Renders the icon into a new size x size ARGB32 image.
 *
 * The drawing order matters: the capsule goes first, then the arc, stem and
 * base, each painted over whatever lies underneath.
 *
 * @param size Side length in pixels.
 * @return The rendered image, or a null image if the geometry is invalid.
 */
QImage MicIconRenderer::render(int size)
{
    QString message;
    if (!validate(size, m_paddingRatio, &message)) {
        m_error = InvalidGeometry;
        m_errorString = message;
        qWarning() << "Cannot render icon:" << message;
        return QImage();
    }
    m_error = NoError;
    m_errorString.clear();

    const IconGeometry geometry = IconGeometry::compute(size, m_paddingRatio);
    qDebug() << "Rendering" << size << "px icon, padding" << geometry.padding
             << "line width" << geometry.lineWidth;

    QImage image(size, size, QImage::Format_ARGB32);
    if (image.isNull()) {
        m_error = InvalidGeometry;
        m_errorString = QString("Cannot allocate %1 pixel canvas").arg(size);
        qWarning() << "Cannot render icon:" << m_errorString;
        return QImage();
    }
    image.fill(Qt::transparent);

    QPainter painter(&image);
    painter.setRenderHint(QPainter::Antialiasing, false);

    drawCapsule(painter, geometry);
    drawArc(painter, geometry);
    drawStem(painter, geometry);
    drawBase(painter, geometry);

    painter.end();
    return image;
}

void MicIconRenderer::drawCapsule(QPainter &painter, const IconGeometry &geometry) const
{
    const QRect &body = geometry.capsuleRect;
    const int diameter = geometry.micWidth;

    painter.setPen(Qt::NoPen);
    painter.setBrush(accentColor());

    // Top cap, mid-section, bottom cap
    painter.drawEllipse(QRect(body.left(), body.top(), diameter, diameter));
    painter.fillRect(QRect(body.left(), body.top() + geometry.micRadius,
                           diameter, geometry.micHeight - geometry.micRadius),
                     accentColor());
    painter.drawEllipse(QRect(body.left(), geometry.capsuleBottom - geometry.micRadius,
                              diameter, diameter));
}

void MicIconRenderer::drawArc(QPainter &painter, const IconGeometry &geometry) const
{
    painter.setPen(QPen(tintColor(), geometry.lineWidth, Qt::SolidLine, Qt::FlatCap, Qt::MiterJoin));
    painter.setBrush(Qt::NoBrush);

    // Keep the stroke inside the arc's bounding box
    const qreal inset = geometry.lineWidth / 2.0;
    const QRectF box = QRectF(geometry.arcBox).adjusted(inset, inset, -inset, -inset);
    if (box.width() <= 0 || box.height() <= 0) {
        return;
    }

    // Lower half: from 9 o'clock through 6 o'clock to 3 o'clock
    painter.drawArc(box, 180 * 16, 180 * 16);
}

void MicIconRenderer::drawStem(QPainter &painter, const IconGeometry &geometry) const
{
    painter.setPen(QPen(tintColor(), geometry.lineWidth, Qt::SolidLine, Qt::FlatCap));
    painter.drawLine(geometry.stemTop, geometry.stemBottom);
}

void MicIconRenderer::drawBase(QPainter &painter, const IconGeometry &geometry) const
{
    painter.setPen(QPen(tintColor(), geometry.lineWidth, Qt::SolidLine, Qt::FlatCap));
    painter.drawLine(geometry.baseLeft, geometry.baseRight);
}
