#pragma once

// ============================================================================
// PageWidget - Shows one PDF page and hosts its popup windows
// ============================================================================
// Part of the MarkupView viewport
//
// PageWidget:
// - Renders the current page through PdfProvider, rotated by the view
//   rotation and scaled by the zoom
// - Creates one PopupAnnotationWidget per popup annotation on the page
// - Implements ViewGeometryProvider so popups can map between page space
//   and widget coordinates
// - Follows AnnotationController events: popups added to the page get a
//   widget, deleted popups lose theirs
//
// The page is drawn with a margin (PAGE_MARGIN) around it. Popups are
// children of this widget and may be dragged anywhere inside it.
// ============================================================================


#include "../annotations/AnnotationEvent.h"
#include "../annotations/ViewGeometryProvider.h"
#include "../core/AnnotationSettings.h"

#include <QPixmap>
#include <QVector>
#include <QWidget>

class AnnotationController;
class FileDropHandlerRegistry;
class PdfProvider;
class PopupAnnotationWidget;

class PageWidget : public QWidget, public ViewGeometryProvider {
    Q_OBJECT

public:
    static constexpr int PAGE_MARGIN = 20;      ///< Space around the page in pixels

    explicit PageWidget(QWidget* parent = nullptr);
    ~PageWidget() override;

    // ===== Document =====

    /**
     * @brief Attach the annotation side of the document.
     * @param controller Mutation entry point and event bus (not owned, may be nullptr).
     * @param settings User settings handed to every popup.
     * @param dropHandlers File drop handlers (not owned, may be nullptr).
     */
    void setAnnotationController(AnnotationController* controller,
                                 const AnnotationSettings& settings,
                                 const FileDropHandlerRegistry* dropHandlers = nullptr);

    /**
     * @brief Set the renderer for page images.
     * @param provider PDF renderer (not owned, may be nullptr for a blank page).
     */
    void setPdfProvider(PdfProvider* provider);

    /**
     * @brief Show a page.
     * @param pageIndex 0-based page index.
     * @param boundary Page boundary in page space (CropBox or MediaBox).
     * @param pageRotation The page's own /Rotate.
     *
     * Rebuilds the popup widgets for the new page.
     */
    void setPage(int pageIndex, const QRectF& boundary, int pageRotation = 0);

    int pageIndex() const { return m_pageIndex; }

    // ===== View =====

    void setZoom(qreal zoom);
    qreal zoom() const { return m_zoom; }

    /**
     * @brief Set the clockwise view rotation (snapped to quarter turns).
     */
    void setUserRotation(int degrees);
    int userRotation() const { return m_userRotation; }

    /**
     * @brief Page /Rotate plus view rotation, normalized.
     */
    int effectiveRotation() const;

    // ===== Popups =====

    /**
     * @brief Show or hide the popups of all top-level annotations on the page.
     *
     * Persists the /Open state of each popup.
     */
    void setPopupsVisible(bool visible);

    const QVector<PopupAnnotationWidget*>& popupWidgets() const { return m_popups; }
    PopupAnnotationWidget* popupWidget(const AnnotationRef& popupRef) const;

    // ===== ViewGeometryProvider =====
    PageViewState pageViewState(int pageIndex) const override;

    QSize sizeHint() const override;

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;

private slots:
    void onAnnotationEvent(const AnnotationEvent& event);

private:
    void createPopupWidgets();
    void destroyPopupWidgets();
    PopupAnnotationWidget* createPopupWidget(const AnnotationRef& popupRef);
    void removePopupWidget(const AnnotationRef& popupRef);
    void refreshPopupBounds();
    void invalidatePageCache();
    void updateLayoutSize();

    AnnotationController* m_controller = nullptr;
    AnnotationSettings m_settings;
    const FileDropHandlerRegistry* m_dropHandlers = nullptr;
    PdfProvider* m_pdf = nullptr;

    int m_pageIndex = -1;
    QRectF m_boundary;
    int m_pageRotation = 0;
    int m_userRotation = 0;
    qreal m_zoom = 1.0;

    QPixmap m_pageCache;        ///< Rendered page at the current zoom/rotation
    bool m_cacheDirty = true;

    QVector<PopupAnnotationWidget*> m_popups;
};
