#ifndef ICONGEOMETRY_H
#define ICONGEOMETRY_H

#include <QPoint>
#include <QRect>

/**
 * @brief Layout of the microphone glyph for one icon size.
 *
 * Every measurement is an integer derived by truncation from the icon size
 * and the padding ratio, so the glyph keeps the same proportions at every
 * resolution (up to one pixel of rounding).
 */
struct IconGeometry {
    int size;
    int padding;
    int drawableWidth;
    int drawableHeight;
    int centerX;
    int lineWidth;

    // Capsule (microphone body). capsuleRect spans exactly micWidth columns.
    int micWidth;
    int micHeight;
    int micRadius;
    QRect capsuleRect;
    int capsuleBottom;

    // Ellipse whose lower half forms the U-shaped arc
    QRect arcBox;
    int arcBottom;

    // Stem and base lines
    QPoint stemTop;
    QPoint stemBottom;
    QPoint baseLeft;
    QPoint baseRight;

    IconGeometry();

    static IconGeometry compute(int size, double paddingRatio);
};

#endif // ICONGEOMETRY_H
