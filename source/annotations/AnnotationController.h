#pragma once

// ============================================================================
// AnnotationController - Mutation entry point and notification bus
// ============================================================================
// Part of the MarkupView annotation architecture
//
// Every component that changes an annotation goes through the controller:
// - addAnnotation():    store + Added
// - deleteAnnotation(): store (annotation and its popup) + Deleted
// - updateAnnotation(): commit + Updated
//
// Delivery is strictly FIFO. An event published while another one is being
// delivered is queued and delivered once the current receivers return, so a
// rebuild triggered by one event always completes before the next event is
// seen by anyone.
// ============================================================================

#include "AnnotationEvent.h"
#include "AnnotationStore.h"

#include <QObject>
#include <QQueue>
#include <memory>

class AnnotationController : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Construct a controller for a store.
     * @param store The annotation store (not owned, must outlive the controller).
     */
    explicit AnnotationController(AnnotationStore* store, QObject* parent = nullptr);
    ~AnnotationController() override = default;

    AnnotationStore* store() const { return m_store; }

    // ===== Mutations =====

    /**
     * @brief Register a new annotation on a page.
     * @return The stored annotation, or nullptr if the store refused it.
     *
     * Publishes Added on success.
     */
    MarkupAnnotation* addAnnotation(int pageIndex, std::unique_ptr<MarkupAnnotation> annotation);

    /**
     * @brief Delete an annotation together with its popup window.
     * @return True if the annotation existed.
     *
     * Publishes Deleted for the popup (if any) and then for the annotation.
     * Replies are not touched; CommentEditSession cascades over them.
     */
    bool deleteAnnotation(const AnnotationRef& ref);

    /**
     * @brief Persist an annotation and announce the change.
     * @return True if the store accepted the commit.
     *
     * Publishes Updated even when the commit fails, so views stay in sync
     * with the in-memory record.
     */
    bool updateAnnotation(MarkupAnnotation* annotation);

    /**
     * @brief Publish a notification.
     *
     * Delivered immediately when no delivery is in progress, queued otherwise.
     */
    void publish(const AnnotationEvent& event);

    /**
     * @brief True while annotationEvent() receivers are running.
     */
    bool isDispatching() const { return m_dispatching; }

signals:
    /**
     * @brief Emitted once per published event, in publication order.
     */
    void annotationEvent(const AnnotationEvent& event);

private:
    void drainQueue();

    AnnotationStore* m_store = nullptr;
    QQueue<AnnotationEvent> m_pending;
    bool m_dispatching = false;
};
