// ============================================================================
// ThreadColorPropagator - Implementation
// ============================================================================

#include "ThreadColorPropagator.h"
#include "AnnotationController.h"

#include <QDebug>

ThreadColorPropagator::ThreadColorPropagator(AnnotationController* controller)
    : m_controller(controller)
{
}

int ThreadColorPropagator::reconcile(const CommentThreadNode* tree, const AnnotationRef& triggerRef)
{
    if (!tree || !m_controller || !m_controller->store()) {
        return 0;
    }

    AnnotationStore* store = m_controller->store();
    const MarkupAnnotation* trigger = store->annotation(triggerRef);
    if (!trigger) {
        qDebug() << "ThreadColorPropagator: Trigger" << triggerRef.toString() << "no longer exists";
        return 0;
    }
    const QColor color = trigger->color;

    QVector<MarkupAnnotation*> changed;
    for (const AnnotationRef& ref : tree->refs()) {
        MarkupAnnotation* member = store->annotation(ref);
        if (!member || member->color == color) {
            continue;
        }
        member->color = color;
        member->touch();
        changed.append(member);
    }

    for (MarkupAnnotation* member : changed) {
        m_controller->updateAnnotation(member);
    }

    if (!changed.isEmpty()) {
        qDebug() << "ThreadColorPropagator: Recolored" << changed.size()
                 << "annotations to" << color.name();
    }
    return changed.size();
}
