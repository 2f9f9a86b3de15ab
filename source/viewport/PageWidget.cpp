// ============================================================================
// PageWidget - Implementation
// ============================================================================

#include "PageWidget.h"
#include "../annotations/AnnotationController.h"
#include "../annotations/PageSpaceMapper.h"
#include "../pdf/PdfProvider.h"
#include "../ui/PopupAnnotationWidget.h"
#include "../ui/ThemeColors.h"

#include <QDebug>
#include <QPainter>
#include <QResizeEvent>
#include <QtMath>

PageWidget::PageWidget(QWidget* parent)
    : QWidget(parent)
{
    setObjectName("PageWidget");
    setAttribute(Qt::WA_OpaquePaintEvent, true);
}

PageWidget::~PageWidget() = default;

// ============================================================================
// Document
// ============================================================================

void PageWidget::setAnnotationController(AnnotationController* controller,
                                         const AnnotationSettings& settings,
                                         const FileDropHandlerRegistry* dropHandlers)
{
    destroyPopupWidgets();

    if (m_controller) {
        disconnect(m_controller, nullptr, this, nullptr);
    }

    m_controller = controller;
    m_settings = settings;
    m_dropHandlers = dropHandlers;

    if (m_controller) {
        connect(m_controller, &AnnotationController::annotationEvent,
                this, &PageWidget::onAnnotationEvent);
    }
    createPopupWidgets();
}

void PageWidget::setPdfProvider(PdfProvider* provider)
{
    m_pdf = provider;
    invalidatePageCache();
}

void PageWidget::setPage(int pageIndex, const QRectF& boundary, int pageRotation)
{
    m_pageIndex = pageIndex;
    m_boundary = boundary;
    m_pageRotation = PageSpaceMapper::normalizeRotation(pageRotation);

    if (!boundary.isValid()) {
        qWarning() << "PageWidget: Page" << pageIndex << "has no usable boundary";
    }

    invalidatePageCache();
    updateLayoutSize();

    destroyPopupWidgets();
    createPopupWidgets();
}

// ============================================================================
// View
// ============================================================================

void PageWidget::setZoom(qreal zoom)
{
    if (zoom <= 0) {
        qDebug() << "PageWidget: Ignoring zoom" << zoom;
        return;
    }
    if (qFuzzyCompare(m_zoom, zoom)) {
        return;
    }
    m_zoom = zoom;
    invalidatePageCache();
    updateLayoutSize();
    refreshPopupBounds();
}

void PageWidget::setUserRotation(int degrees)
{
    const int rotation = PageSpaceMapper::normalizeRotation(degrees);
    if (m_userRotation == rotation) {
        return;
    }
    m_userRotation = rotation;
    invalidatePageCache();
    updateLayoutSize();
    refreshPopupBounds();
}

int PageWidget::effectiveRotation() const
{
    return PageSpaceMapper::normalizeRotation(m_pageRotation + m_userRotation);
}

PageViewState PageWidget::pageViewState(int pageIndex) const
{
    PageViewState state;
    if (pageIndex != m_pageIndex || m_pageIndex < 0) {
        return state;
    }
    state.pageBoundary = m_boundary;
    state.rotation = effectiveRotation();
    state.zoom = m_zoom;
    state.pageOrigin = QPointF(PAGE_MARGIN, PAGE_MARGIN);
    state.documentViewSize = size();
    return state;
}

QSize PageWidget::sizeHint() const
{
    if (!m_boundary.isValid()) {
        return QSize(400, 300);
    }
    const QSizeF page = PageSpaceMapper::viewSize(m_boundary, effectiveRotation(), m_zoom);
    return QSize(qCeil(page.width()) + 2 * PAGE_MARGIN,
                 qCeil(page.height()) + 2 * PAGE_MARGIN);
}

void PageWidget::updateLayoutSize()
{
    const QSize hint = sizeHint();
    setMinimumSize(hint);
    resize(hint.expandedTo(size()));
    updateGeometry();
}

// ============================================================================
// Popups
// ============================================================================

void PageWidget::setPopupsVisible(bool visible)
{
    for (PopupAnnotationWidget* popup : m_popups) {
        if (popup->isBuilt() && popup->isTopLevelPopup()) {
            popup->showPopup(visible);
        }
    }
}

PopupAnnotationWidget* PageWidget::popupWidget(const AnnotationRef& popupRef) const
{
    for (PopupAnnotationWidget* popup : m_popups) {
        if (popup->popupRef() == popupRef) {
            return popup;
        }
    }
    return nullptr;
}

void PageWidget::createPopupWidgets()
{
    if (!m_controller || m_pageIndex < 0) {
        return;
    }
    for (const MarkupAnnotation* annot : m_controller->store()->annotations(m_pageIndex)) {
        if (annot->subtype == MarkupAnnotation::Subtype::Popup) {
            createPopupWidget(annot->ref);
        }
    }
}

void PageWidget::destroyPopupWidgets()
{
    qDeleteAll(m_popups);
    m_popups.clear();
}

PopupAnnotationWidget* PageWidget::createPopupWidget(const AnnotationRef& popupRef)
{
    if (PopupAnnotationWidget* existing = popupWidget(popupRef)) {
        return existing;
    }

    auto* popup = new PopupAnnotationWidget(m_controller, popupRef, m_settings,
                                            this, m_dropHandlers, this);
    if (!popup->isBuilt()) {
        // Orphaned popup (no markup parent): nothing to show
        delete popup;
        return nullptr;
    }
    m_popups.append(popup);
    return popup;
}

void PageWidget::removePopupWidget(const AnnotationRef& popupRef)
{
    PopupAnnotationWidget* popup = popupWidget(popupRef);
    if (!popup) {
        return;
    }
    m_popups.removeOne(popup);
    popup->hide();
    // May be inside one of the popup's own handlers
    popup->deleteLater();
}

void PageWidget::refreshPopupBounds()
{
    for (PopupAnnotationWidget* popup : m_popups) {
        popup->refreshDirtyBounds();
    }
}

void PageWidget::onAnnotationEvent(const AnnotationEvent& event)
{
    if (event.pageIndex != m_pageIndex) {
        return;
    }

    switch (event.type) {
    case AnnotationEvent::Type::Added: {
        const MarkupAnnotation* annot = m_controller->store()->annotation(event.ref);
        if (annot && annot->subtype == MarkupAnnotation::Subtype::Popup) {
            createPopupWidget(event.ref);
        }
        break;
    }
    case AnnotationEvent::Type::Deleted:
        removePopupWidget(event.ref);
        break;
    case AnnotationEvent::Type::Updated:
    case AnnotationEvent::Type::SummaryUpdated:
        break;
    }
}

// ============================================================================
// Painting
// ============================================================================

void PageWidget::invalidatePageCache()
{
    m_cacheDirty = true;
    update();
}

void PageWidget::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    const bool dark = palette().color(QPalette::Window).lightness() < 128;
    painter.fillRect(rect(), ThemeColors::pageViewBackground(dark));

    if (!m_boundary.isValid()) {
        return;
    }

    const QSizeF pageSize = PageSpaceMapper::viewSize(m_boundary, effectiveRotation(), m_zoom);
    const QRectF pageRect(QPointF(PAGE_MARGIN, PAGE_MARGIN), pageSize);

    painter.fillRect(pageRect.translated(3, 3), ThemeColors::pageShadow());
    painter.fillRect(pageRect, Qt::white);

    if (m_cacheDirty && m_pdf && m_pdf->isValid() && m_pageIndex < m_pdf->pageCount()) {
        const qreal dpr = devicePixelRatioF();
        QPixmap rendered = m_pdf->renderPageToPixmap(m_pageIndex, 72.0 * m_zoom * dpr);
        if (rendered.isNull()) {
            qWarning() << "PageWidget: Failed to render page" << m_pageIndex;
        } else if (m_userRotation != 0) {
            rendered = rendered.transformed(QTransform().rotate(m_userRotation),
                                            Qt::SmoothTransformation);
        }
        rendered.setDevicePixelRatio(dpr);
        m_pageCache = rendered;
        m_cacheDirty = false;
    }

    if (!m_pageCache.isNull()) {
        painter.setRenderHint(QPainter::SmoothPixmapTransform, true);
        painter.drawPixmap(pageRect, m_pageCache, QRectF(m_pageCache.rect()));
    }
}

void PageWidget::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);
    // documentViewSize changed: popups may need clamping on the next drag
    refreshPopupBounds();
}
