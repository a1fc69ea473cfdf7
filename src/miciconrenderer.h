#ifndef MICICONRENDERER_H
#define MICICONRENDERER_H

#include <QColor>
#include <QImage>
#include <QString>

struct IconGeometry;
class QPainter;

/**
 * @brief Draws the microphone tray icon at a given pixel size.
 *
 * The glyph is a filled capsule (the microphone body) in the accent color,
 * framed by a U-shaped arc, a vertical stem and a horizontal base in the tint
 * color, on a fully transparent background. Rendering is aliased so every
 * glyph pixel carries one of the two colors exactly.
 *
 * Failures are reported the way QImageWriter does: render() returns a null
 * image and error()/errorString() describe what went wrong.
 */
class MicIconRenderer
{
public:
    enum RenderError {
        NoError,
        InvalidGeometry
    };

    static const double DefaultPaddingRatio;

    explicit MicIconRenderer(double paddingRatio = DefaultPaddingRatio);

    void setPaddingRatio(double paddingRatio);
    double paddingRatio() const { return m_paddingRatio; }

    QImage render(int size);

    RenderError error() const { return m_error; }
    QString errorString() const { return m_errorString; }

    // Returns false and fills errorMessage when the parameters leave no drawable area
    static bool validate(int size, double paddingRatio, QString *errorMessage = nullptr);

    static QColor accentColor();
    static QColor tintColor();

private:
    void drawCapsule(QPainter &painter, const IconGeometry &geometry) const;
    void drawArc(QPainter &painter, const IconGeometry &geometry) const;
    void drawStem(QPainter &painter, const IconGeometry &geometry) const;
    void drawBase(QPainter &painter, const IconGeometry &geometry) const;

    double m_paddingRatio;
    RenderError m_error;
    QString m_errorString;
};

#endif // MICICONRENDERER_H
