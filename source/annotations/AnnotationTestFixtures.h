#pragma once

// ============================================================================
// AnnotationTestFixtures - Helpers shared by the annotation test suites
// ============================================================================

#include "AnnotationStore.h"
#include "ViewGeometryProvider.h"

#include <memory>

/**
 * @brief ViewGeometryProvider returning a fixed state for one page.
 */
class FixedViewGeometry : public ViewGeometryProvider {
public:
    FixedViewGeometry()
    {
        state.pageBoundary = QRectF(0, 0, 612, 792);
        state.rotation = 0;
        state.zoom = 1.0;
        state.pageOrigin = QPointF(20, 20);
        state.documentViewSize = QSize(1000, 1000);
    }

    PageViewState pageViewState(int pageIndex) const override
    {
        return pageIndex == page ? state : PageViewState();
    }

    PageViewState state;
    int page = 0;
};

namespace AnnotationTestFixtures {

/**
 * @brief Add a Text annotation straight to a store (no events).
 */
inline MarkupAnnotation* addComment(AnnotationStore& store, int pageIndex,
                                    const QString& title, const QString& contents,
                                    const AnnotationRef& inReplyTo = AnnotationRef())
{
    auto annot = std::make_unique<MarkupAnnotation>(MarkupAnnotation::Subtype::Text);
    annot->titleText = title;
    annot->contents = contents;
    annot->inReplyTo = inReplyTo;
    annot->rect = QRectF(100, 700, 20, 20);
    return store.addAnnotation(pageIndex, std::move(annot));
}

/**
 * @brief Add the popup window of a markup annotation and link both ways.
 */
inline MarkupAnnotation* addPopup(AnnotationStore& store, MarkupAnnotation* parent,
                                  bool open = false)
{
    auto popup = std::make_unique<MarkupAnnotation>(MarkupAnnotation::Subtype::Popup);
    popup->parentRef = parent->ref;
    popup->rect = QRectF(300, 500, 215, 150);
    popup->open = open;
    MarkupAnnotation* stored = store.addAnnotation(parent->pageIndex, std::move(popup));
    if (stored) {
        parent->popupRef = stored->ref;
    }
    return stored;
}

} // namespace AnnotationTestFixtures
