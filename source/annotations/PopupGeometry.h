#pragma once

// ============================================================================
// PopupGeometry - On-screen placement of a popup annotation
// ============================================================================
// Part of the MarkupView annotation architecture
//
// The popup annotation stores its rectangle in page space. The widget that
// shows it lives in view space. PopupGeometry converts between the two with
// the current PageViewState and applies the placement rules of a popup
// window:
// - a visible popup is never smaller than DEFAULT_WIDTH x DEFAULT_HEIGHT
// - while the user drags or resizes it, it stays inside the document view
// ============================================================================

#include "MarkupAnnotation.h"
#include "ViewGeometryProvider.h"

#include <QRect>
#include <QTransform>

class PopupGeometry {
public:
    static constexpr int DEFAULT_WIDTH = 215;
    static constexpr int DEFAULT_HEIGHT = 150;

    /**
     * @brief Construct geometry helpers for one page.
     * @param provider View geometry source (not owned, may be nullptr in which
     *                 case every conversion returns an empty rectangle).
     */
    PopupGeometry(const ViewGeometryProvider* provider, int pageIndex);

    void setPageIndex(int pageIndex) { m_pageIndex = pageIndex; }
    int pageIndex() const { return m_pageIndex; }

    PageViewState viewState() const;
    QTransform pageTransform() const;
    QTransform inverseTransform() const;

    /**
     * @brief View-space bounds for an annotation's page-space rectangle.
     *
     * This is what the widget passes to setGeometry() after zoom, rotation
     * or page layout changes.
     */
    QRect refreshDirtyBounds(const MarkupAnnotation& annotation) const;

    /**
     * @brief Page-space rectangle for view-space widget bounds.
     */
    QRectF refreshAnnotationRect(const QRect& bounds) const;

    /**
     * @brief Write refreshAnnotationRect(bounds) into the annotation.
     * @return True if the stored rectangle changed.
     */
    bool syncAnnotationRect(MarkupAnnotation& annotation, const QRect& bounds) const;

    /**
     * @brief Grow bounds to the default size if either side is too small.
     *
     * The top-left corner is kept.
     */
    static QRect ensureMinimumSize(const QRect& bounds);

    /**
     * @brief Apply the drag and resize constraints.
     * @param current Bounds before the change.
     * @param requested Bounds the user asked for.
     * @param mousePressed True while a drag or resize is in progress.
     * @return Bounds to apply.
     *
     * Outside a drag the request is returned unchanged. During a drag a move
     * is clamped into the document view (a simultaneous resize at the left
     * or top edge gives up the overhang), and a resize shrinks the popup
     * instead of letting it leave the view.
     */
    QRect constrainBounds(const QRect& current, const QRect& requested, bool mousePressed) const;

    /**
     * @brief Bounds of a new default-size popup at a page-local view point.
     * @param pagePoint Point relative to the page's top-left corner in view pixels.
     */
    QRect boundsRelativeToParent(const QPoint& pagePoint) const;

    /**
     * @brief Font size scaled by the current zoom.
     */
    qreal scaledFontSize(qreal pointSize) const;

private:
    const ViewGeometryProvider* m_provider = nullptr;
    int m_pageIndex = 0;
};
