// ============================================================================
// PopupGeometry - Implementation
// ============================================================================

#include "PopupGeometry.h"
#include "PageSpaceMapper.h"

#include <QDebug>
#include <algorithm>

PopupGeometry::PopupGeometry(const ViewGeometryProvider* provider, int pageIndex)
    : m_provider(provider)
    , m_pageIndex(pageIndex)
{
}

PageViewState PopupGeometry::viewState() const
{
    if (!m_provider) {
        return PageViewState();
    }
    return m_provider->pageViewState(m_pageIndex);
}

QTransform PopupGeometry::pageTransform() const
{
    const PageViewState state = viewState();
    return PageSpaceMapper::pageTransform(state.pageBoundary, state.rotation, state.zoom);
}

QTransform PopupGeometry::inverseTransform() const
{
    const PageViewState state = viewState();
    return PageSpaceMapper::inversePageTransform(state.pageBoundary, state.rotation, state.zoom);
}

QRect PopupGeometry::refreshDirtyBounds(const MarkupAnnotation& annotation) const
{
    const PageViewState state = viewState();
    if (!state.isValid()) {
        qDebug() << "PopupGeometry: No view state for page" << m_pageIndex;
        return QRect();
    }
    return PageSpaceMapper::toViewSpace(annotation.rect, state.pageBoundary, state.rotation,
                                        state.zoom, state.pageOrigin).toRect();
}

QRectF PopupGeometry::refreshAnnotationRect(const QRect& bounds) const
{
    const PageViewState state = viewState();
    if (!state.isValid()) {
        qDebug() << "PopupGeometry: No view state for page" << m_pageIndex;
        return QRectF();
    }
    return PageSpaceMapper::toPageSpace(QRectF(bounds), state.pageOrigin,
                                        PageSpaceMapper::inversePageTransform(
                                            state.pageBoundary, state.rotation, state.zoom));
}

bool PopupGeometry::syncAnnotationRect(MarkupAnnotation& annotation, const QRect& bounds) const
{
    const QRectF rect = refreshAnnotationRect(bounds);
    if (rect.isNull() || rect == annotation.rect) {
        return false;
    }
    annotation.rect = rect;
    return true;
}

QRect PopupGeometry::ensureMinimumSize(const QRect& bounds)
{
    if (bounds.width() < DEFAULT_WIDTH || bounds.height() < DEFAULT_HEIGHT) {
        return QRect(bounds.x(), bounds.y(), DEFAULT_WIDTH, DEFAULT_HEIGHT);
    }
    return bounds;
}

QRect PopupGeometry::constrainBounds(const QRect& current, const QRect& requested,
                                     bool mousePressed) const
{
    if (!mousePressed) {
        return requested;
    }

    const QSize viewSize = viewState().documentViewSize;
    if (!viewSize.isValid()) {
        return requested;
    }

    int x = requested.x();
    int y = requested.y();
    int width = requested.width();
    int height = requested.height();

    // Move: keep the popup inside the view
    if (current.x() != x || current.y() != y) {
        if (x < 0) {
            if (current.width() != width) {
                width += x;
            }
            x = 0;
        } else if (x + width > viewSize.width()) {
            x = viewSize.width() - current.width();
        }
        if (y < 0) {
            if (current.height() != height) {
                height += y;
            }
            y = 0;
        } else if (y + height > viewSize.height()) {
            y = viewSize.height() - current.height();
        }
    }

    // Resize: shrink instead of growing out of the view
    if (current.width() != width || current.height() != height) {
        if (x + width > viewSize.width()) {
            width = viewSize.width() - x;
        } else if (y + height > viewSize.height()) {
            height = viewSize.height() - y;
        }
    }

    return QRect(x, y, std::max(width, 0), std::max(height, 0));
}

QRect PopupGeometry::boundsRelativeToParent(const QPoint& pagePoint) const
{
    const QPointF origin = viewState().pageOrigin;
    return QRect(pagePoint.x() + qRound(origin.x()), pagePoint.y() + qRound(origin.y()),
                 DEFAULT_WIDTH, DEFAULT_HEIGHT);
}

qreal PopupGeometry::scaledFontSize(qreal pointSize) const
{
    const PageViewState state = viewState();
    const qreal zoom = state.zoom > 0 ? state.zoom : 1.0;
    return std::max<qreal>(1.0, pointSize * zoom);
}
