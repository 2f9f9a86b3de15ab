#pragma once

// ============================================================================
// AnnotationStore - Abstract access to the annotations of a document
// ============================================================================
// Part of the MarkupView annotation architecture
//
// This abstraction layer enables:
// - Reading all annotations of a page as a flat list (threads are derived
//   from it, never stored)
// - Adding, removing and committing annotation records
// - Testing the comment-thread logic without a PDF backend
//
// Implementations:
// - MemoryAnnotationStore: in-memory records (tests, scratch documents)
// - MuPdfAnnotationStore: records mirrored into a MuPDF pdf_document
//
// A store never publishes notifications. AnnotationController wraps a store
// and announces every mutation to the rest of the viewer.
// ============================================================================

#include "MarkupAnnotation.h"

#include <QVector>
#include <memory>

/**
 * @brief Abstract interface for the document's annotation model.
 */
class AnnotationStore {
public:
    virtual ~AnnotationStore() = default;

    /**
     * @brief Number of pages annotations can be placed on.
     */
    virtual int pageCount() const = 0;

    /**
     * @brief All annotations of a page in document order.
     * @param pageIndex 0-based page index.
     * @return Flat list (markup and popup annotations), empty if invalid page.
     *
     * Pointers stay valid until the annotation is removed from the store.
     */
    virtual QVector<MarkupAnnotation*> annotations(int pageIndex) const = 0;

    /**
     * @brief Look up an annotation by reference.
     * @return The annotation, or nullptr if the store has no such object.
     */
    virtual MarkupAnnotation* annotation(const AnnotationRef& ref) const = 0;

    /**
     * @brief Add an annotation to a page.
     * @param pageIndex 0-based page index.
     * @param annotation The annotation (ownership transferred).
     * @return Pointer to the stored annotation with its reference assigned,
     *         or nullptr if the page is invalid or the backend refused it.
     */
    virtual MarkupAnnotation* addAnnotation(int pageIndex,
                                            std::unique_ptr<MarkupAnnotation> annotation) = 0;

    /**
     * @brief Remove an annotation.
     * @return True if it existed and was removed.
     *
     * Only the given object is removed. Replies and popups are separate
     * objects; AnnotationController decides what else goes with it.
     */
    virtual bool removeAnnotation(const AnnotationRef& ref) = 0;

    /**
     * @brief Persist the current field values of an annotation.
     * @return True on success.
     */
    virtual bool commit(const MarkupAnnotation& annotation) = 0;

    // ===== Helpers =====

    /**
     * @brief Find the popup window whose parent is the given markup annotation.
     * @return The popup, or nullptr if the markup has none.
     */
    MarkupAnnotation* popupFor(const MarkupAnnotation& markup) const
    {
        if (!markup.popupRef.isNull()) {
            if (MarkupAnnotation* popup = annotation(markup.popupRef)) {
                return popup;
            }
        }
        for (MarkupAnnotation* candidate : annotations(markup.pageIndex)) {
            if (candidate->subtype == MarkupAnnotation::Subtype::Popup &&
                candidate->parentRef == markup.ref) {
                return candidate;
            }
        }
        return nullptr;
    }
};
