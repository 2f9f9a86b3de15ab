#pragma once

// ============================================================================
// PageSpaceMapper - Page space <-> view space transforms
// ============================================================================
// Part of the MarkupView annotation architecture
//
// Page space is PDF user space: origin at the bottom-left of the page
// boundary, y up, 72 units per inch. View space is the pixel space of the
// document view: origin top-left, y down, scaled by zoom and rotated
// clockwise by the view rotation.
//
// The boundary rectangle is given in page space as (x0, y0, width, height)
// with y0 the lower edge, i.e. the /MediaBox or /CropBox of the page.
// ============================================================================

#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <QTransform>

class PageSpaceMapper {
public:
    /**
     * @brief Normalize a rotation to 0, 90, 180 or 270.
     *
     * Negative angles and multiples of 360 wrap around. Angles that are not
     * a multiple of 90 are snapped to the nearest quarter turn (logged).
     */
    static int normalizeRotation(int degrees);

    /**
     * @brief Transform from page space to page-local view pixels.
     * @param boundary Page boundary in page space.
     * @param rotation Clockwise view rotation in degrees.
     * @param zoom View scale (1.0 = one pixel per PDF unit).
     */
    static QTransform pageTransform(const QRectF& boundary, int rotation, qreal zoom);

    /**
     * @brief Inverse of pageTransform().
     */
    static QTransform inversePageTransform(const QRectF& boundary, int rotation, qreal zoom);

    /**
     * @brief Map a page-space rectangle into the document view.
     * @param viewportOffset Top-left corner of the page inside the document view.
     * @return Bounding rectangle in view space.
     */
    static QRectF toViewSpace(const QRectF& pageRect, const QRectF& boundary,
                              int rotation, qreal zoom, const QPointF& viewportOffset);

    /**
     * @brief Map a view-space rectangle back into page space.
     * @param inverseTransform inversePageTransform() of the current view.
     * @return Normalized bounding rectangle in page space.
     */
    static QRectF toPageSpace(const QRectF& viewRect, const QPointF& viewportOffset,
                              const QTransform& inverseTransform);

    static QRectF toPageSpace(const QRectF& viewRect, const QRectF& boundary,
                              int rotation, qreal zoom, const QPointF& viewportOffset);

    /**
     * @brief Size of the rotated, zoomed page in view pixels.
     */
    static QSizeF viewSize(const QRectF& boundary, int rotation, qreal zoom);
};
