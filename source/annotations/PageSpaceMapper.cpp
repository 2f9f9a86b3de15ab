// ============================================================================
// PageSpaceMapper - Implementation
// ============================================================================

#include "PageSpaceMapper.h"

#include <QDebug>
#include <QtMath>

int PageSpaceMapper::normalizeRotation(int degrees)
{
    int normalized = ((degrees % 360) + 360) % 360;
    if (normalized % 90 != 0) {
        const int snapped = (qRound(normalized / 90.0) * 90) % 360;
        qWarning() << "PageSpaceMapper: Rotation" << degrees
                   << "is not a quarter turn, using" << snapped;
        normalized = snapped;
    }
    return normalized;
}

QTransform PageSpaceMapper::pageTransform(const QRectF& boundary, int rotation, qreal zoom)
{
    const qreal w = boundary.width();
    const qreal h = boundary.height();

    // Flip y and move the boundary's top-left corner to the origin
    const QTransform flip(1, 0, 0, -1, -boundary.left(), boundary.bottom());

    // Clockwise rotation of the w x h page, keeping it in the positive quadrant
    QTransform rotate;
    switch (normalizeRotation(rotation)) {
    case 90:
        rotate = QTransform(0, 1, -1, 0, h, 0);
        break;
    case 180:
        rotate = QTransform(-1, 0, 0, -1, w, h);
        break;
    case 270:
        rotate = QTransform(0, -1, 1, 0, 0, w);
        break;
    default:
        break;
    }

    // QTransform multiplies row vectors: A * B applies A first
    return flip * rotate * QTransform::fromScale(zoom, zoom);
}

QTransform PageSpaceMapper::inversePageTransform(const QRectF& boundary, int rotation, qreal zoom)
{
    bool invertible = false;
    const QTransform inverse = pageTransform(boundary, rotation, zoom).inverted(&invertible);
    if (!invertible) {
        qWarning() << "PageSpaceMapper: Page transform is singular, zoom =" << zoom;
    }
    return inverse;
}

QRectF PageSpaceMapper::toViewSpace(const QRectF& pageRect, const QRectF& boundary,
                                    int rotation, qreal zoom, const QPointF& viewportOffset)
{
    return pageTransform(boundary, rotation, zoom)
        .mapRect(pageRect.normalized())
        .translated(viewportOffset);
}

QRectF PageSpaceMapper::toPageSpace(const QRectF& viewRect, const QPointF& viewportOffset,
                                    const QTransform& inverseTransform)
{
    return inverseTransform.mapRect(viewRect.translated(-viewportOffset)).normalized();
}

QRectF PageSpaceMapper::toPageSpace(const QRectF& viewRect, const QRectF& boundary,
                                    int rotation, qreal zoom, const QPointF& viewportOffset)
{
    return toPageSpace(viewRect, viewportOffset, inversePageTransform(boundary, rotation, zoom));
}

QSizeF PageSpaceMapper::viewSize(const QRectF& boundary, int rotation, qreal zoom)
{
    const int r = normalizeRotation(rotation);
    if (r == 90 || r == 270) {
        return QSizeF(boundary.height() * zoom, boundary.width() * zoom);
    }
    return QSizeF(boundary.width() * zoom, boundary.height() * zoom);
}
