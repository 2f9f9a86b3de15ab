#pragma once

// ============================================================================
// ViewGeometryProvider - Current view geometry of a page
// ============================================================================
// Part of the MarkupView annotation architecture
//
// Implemented by the widget that shows the pages (PageWidget) and by test
// fixtures. Popup geometry is always computed from the state returned here,
// never cached, so zoom and rotation changes take effect on the next refresh.
// ============================================================================

#include <QPointF>
#include <QRectF>
#include <QSize>

/**
 * @brief Snapshot of how one page is currently shown.
 */
struct PageViewState {
    QRectF pageBoundary;        ///< Page boundary in page space (x0, y0, w, h)
    int rotation = 0;           ///< Clockwise view rotation in degrees
    qreal zoom = 1.0;           ///< View scale
    QPointF pageOrigin;         ///< Top-left of the page inside the document view
    QSize documentViewSize;     ///< Size of the widget that hosts the popups

    bool isValid() const { return !pageBoundary.isEmpty() && zoom > 0; }
};

/**
 * @brief Source of PageViewState for the popup components.
 */
class ViewGeometryProvider {
public:
    virtual ~ViewGeometryProvider() = default;

    /**
     * @brief Current view state of a page.
     * @param pageIndex 0-based page index.
     * @return The state; isValid() is false for unknown pages.
     */
    virtual PageViewState pageViewState(int pageIndex) const = 0;
};
