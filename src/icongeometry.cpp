#include "icongeometry.h"

#include <QtGlobal>

namespace {

// Truncates toward zero like an integer cast of the scaled value
int scaled(int value, double factor)
{
    return static_cast<int>(value * factor);
}

}

IconGeometry::IconGeometry()
    : size(0)
    , padding(0)
    , drawableWidth(0)
    , drawableHeight(0)
    , centerX(0)
    , lineWidth(1)
    , micWidth(0)
    , micHeight(0)
    , micRadius(0)
    , capsuleBottom(0)
    , arcBottom(0)
{
}

IconGeometry IconGeometry::compute(int size, double paddingRatio)
{
    IconGeometry g;
    g.size = size;
    g.padding = scaled(size, paddingRatio);
    g.drawableWidth = size - 2 * g.padding;
    g.drawableHeight = size - 2 * g.padding;
    g.centerX = size / 2;
    g.lineWidth = qMax(1, scaled(size, 0.06));

    const int w = g.drawableWidth;
    const int h = g.drawableHeight;

    g.micWidth = scaled(w, 0.30);
    g.micHeight = scaled(h, 0.45);
    g.micRadius = g.micWidth / 2;
    g.capsuleRect = QRect(g.centerX - g.micWidth / 2, g.padding, g.micWidth, g.micHeight);
    g.capsuleBottom = g.padding + g.micHeight;

    // The arc reaches past the capsule on both sides and dips below it
    const int arcMargin = scaled(w, 0.05);
    const int arcSpread = scaled(w, 0.12);
    const int arcLeft = g.capsuleRect.left() - arcSpread - arcMargin;
    // Measured from the capsule's exclusive right edge, one past capsuleRect.right()
    const int capsuleRightEdge = g.capsuleRect.left() + g.micWidth;
    const int arcRight = capsuleRightEdge + arcSpread + arcMargin;
    const int arcTop = g.padding + scaled(g.micHeight, 0.25);
    g.arcBottom = g.capsuleBottom + scaled(h, 0.12);
    const int arcHeight = g.arcBottom - arcTop;
    g.arcBox = QRect(arcLeft, arcTop, arcRight - arcLeft, 2 * arcHeight);

    g.stemTop = QPoint(g.centerX, g.arcBottom);
    g.stemBottom = QPoint(g.centerX, g.arcBottom + scaled(h, 0.15));

    const int baseWidth = scaled(w, 0.25);
    g.baseLeft = QPoint(g.centerX - baseWidth / 2, g.stemBottom.y());
    g.baseRight = QPoint(g.centerX + baseWidth / 2, g.stemBottom.y());

    return g;
}
