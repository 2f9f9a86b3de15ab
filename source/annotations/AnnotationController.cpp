// ============================================================================
// AnnotationController - Implementation
// ============================================================================

#include "AnnotationController.h"

#include <QDebug>

AnnotationController::AnnotationController(AnnotationStore* store, QObject* parent)
    : QObject(parent)
    , m_store(store)
{
}

MarkupAnnotation* AnnotationController::addAnnotation(int pageIndex,
                                                      std::unique_ptr<MarkupAnnotation> annotation)
{
    if (!m_store || !annotation) {
        return nullptr;
    }

    MarkupAnnotation* stored = m_store->addAnnotation(pageIndex, std::move(annotation));
    if (!stored) {
        qWarning() << "AnnotationController: Store refused new annotation on page" << pageIndex;
        return nullptr;
    }

    publish(AnnotationEvent::added(stored->pageIndex, stored->ref));
    return stored;
}

bool AnnotationController::deleteAnnotation(const AnnotationRef& ref)
{
    if (!m_store) {
        return false;
    }

    MarkupAnnotation* annot = m_store->annotation(ref);
    if (!annot) {
        qDebug() << "AnnotationController: Nothing to delete for" << ref.toString();
        return false;
    }

    // Copy what the events need before the records go away
    const int pageIndex = annot->pageIndex;
    const AnnotationRef irt = annot->inReplyTo;

    if (annot->isMarkup()) {
        if (MarkupAnnotation* popup = m_store->popupFor(*annot)) {
            const AnnotationRef popupRef = popup->ref;
            if (m_store->removeAnnotation(popupRef)) {
                publish(AnnotationEvent::deleted(pageIndex, popupRef, AnnotationRef()));
            }
        }
    }

    if (!m_store->removeAnnotation(ref)) {
        qWarning() << "AnnotationController: Store failed to remove" << ref.toString();
        return false;
    }

    publish(AnnotationEvent::deleted(pageIndex, ref, irt));
    return true;
}

bool AnnotationController::updateAnnotation(MarkupAnnotation* annotation)
{
    if (!m_store || !annotation) {
        return false;
    }

    const bool committed = m_store->commit(*annotation);
    if (!committed) {
        qWarning() << "AnnotationController: Commit failed for" << annotation->ref.toString();
    }

    publish(AnnotationEvent::updated(annotation->pageIndex, annotation->ref));
    return committed;
}

void AnnotationController::publish(const AnnotationEvent& event)
{
    m_pending.enqueue(event);
    if (m_dispatching) {
        return;
    }
    drainQueue();
}

void AnnotationController::drainQueue()
{
    m_dispatching = true;
    while (!m_pending.isEmpty()) {
        const AnnotationEvent event = m_pending.dequeue();
        emit annotationEvent(event);
    }
    m_dispatching = false;
}
