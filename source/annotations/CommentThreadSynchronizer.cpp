// ============================================================================
// CommentThreadSynchronizer - Implementation
// ============================================================================

#include "CommentThreadSynchronizer.h"
#include "AnnotationController.h"
#include "CommentEditSession.h"

#include <QDebug>
#include <QSet>

CommentThreadSynchronizer::CommentThreadSynchronizer(AnnotationController* controller,
                                                     CommentEditSession* session,
                                                     QObject* parent)
    : QObject(parent)
    , m_controller(controller)
    , m_session(session)
    , m_propagator(controller)
{
    if (m_controller) {
        connect(m_controller, &AnnotationController::annotationEvent,
                this, &CommentThreadSynchronizer::handleEvent);
    }
}

bool CommentThreadSynchronizer::requiresRebuild(const AnnotationEvent& event) const
{
    if (!m_session || !m_session->isValid() || event.pageIndex != m_session->pageIndex()) {
        return false;
    }

    const CommentThreadNode* tree = m_session->tree();
    switch (event.type) {
    case AnnotationEvent::Type::Deleted:
        return tree->contains(event.ref);
    case AnnotationEvent::Type::Added:
        return !tree->contains(event.ref) && repliesIntoThread(event.ref);
    default:
        return false;
    }
}

bool CommentThreadSynchronizer::repliesIntoThread(const AnnotationRef& ref) const
{
    AnnotationStore* store = m_controller ? m_controller->store() : nullptr;
    if (!store || !m_session) {
        return false;
    }

    const CommentThreadNode* tree = m_session->tree();
    const MarkupAnnotation* current = store->annotation(ref);
    if (!current || !current->isMarkup()) {
        return false;
    }

    QSet<AnnotationRef> seen;
    seen.insert(current->ref);

    for (int depth = 0; depth < kMaxReplyChainDepth; ++depth) {
        const AnnotationRef target = current->inReplyTo;
        if (target.isNull()) {
            return false;
        }
        if (tree->contains(target)) {
            return true;
        }
        if (seen.contains(target)) {
            qWarning() << "CommentThreadSynchronizer: Cyclic IRT chain at" << target.toString()
                       << "starting from" << ref.toString();
            return false;
        }
        seen.insert(target);

        current = store->annotation(target);
        if (!current) {
            return false;
        }
    }

    qWarning() << "CommentThreadSynchronizer: IRT chain from" << ref.toString()
               << "exceeds" << kMaxReplyChainDepth << "links";
    return false;
}

void CommentThreadSynchronizer::handleEvent(const AnnotationEvent& event)
{
    if (!m_session || !m_session->isValid() || event.pageIndex != m_session->pageIndex()) {
        return;
    }

    switch (event.type) {
    case AnnotationEvent::Type::Added:
    case AnnotationEvent::Type::Deleted:
        if (requiresRebuild(event)) {
            m_session->rebuild();
        }
        break;

    case AnnotationEvent::Type::Updated:
        if (m_session->tree()->contains(event.ref)) {
            if (m_propagator.reconcile(m_session->tree(), event.ref) > 0) {
                m_session->requestDisplayRefresh();
            }
        }
        break;

    case AnnotationEvent::Type::SummaryUpdated:
        if (event.ref == m_session->popupRef() &&
            (event.source == nullptr || event.source != m_summarySource)) {
            emit summaryReceived(event.summaryText, event.summaryPrivate);
        }
        break;
    }
}
