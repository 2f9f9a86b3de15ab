#pragma once

// ============================================================================
// CommentThreadSynchronizer - Keeps a session's thread in step with the bus
// ============================================================================
// Part of the MarkupView annotation architecture
//
// Listens to AnnotationController::annotationEvent and decides, per event,
// whether the thread of its CommentEditSession is affected:
// - Deleted:        a thread member was removed -> rebuild
// - Added:          the new annotation replies (directly or through a chain
//                   of replies) to a thread member -> rebuild
// - Updated:        a thread member changed -> ThreadColorPropagator
// - SummaryUpdated: another view edited this popup's text -> summaryReceived()
//
// Events for other pages and events about unrelated annotations leave the
// tree untouched.
// ============================================================================

#include "AnnotationEvent.h"
#include "ThreadColorPropagator.h"

#include <QObject>

class AnnotationController;
class CommentEditSession;

class CommentThreadSynchronizer : public QObject {
    Q_OBJECT

public:
    /// Longest IRT chain followed when checking an added annotation
    static constexpr int kMaxReplyChainDepth = 256;

    /**
     * @brief Attach to a controller on behalf of a session.
     * @param controller Event source (not owned).
     * @param session Session whose tree is kept current (not owned).
     */
    CommentThreadSynchronizer(AnnotationController* controller,
                              CommentEditSession* session,
                              QObject* parent = nullptr);
    ~CommentThreadSynchronizer() override = default;

    /**
     * @brief True if the event requires a rebuild of the session's tree.
     *
     * Only Added and Deleted events can require a rebuild.
     */
    bool requiresRebuild(const AnnotationEvent& event) const;

    /**
     * @brief True if an annotation replies, directly or indirectly, to a thread member.
     *
     * Follows the IRT chain through the store for at most
     * kMaxReplyChainDepth links. A chain that revisits an annotation is
     * reported as a data-integrity problem and treated as unrelated.
     */
    bool repliesIntoThread(const AnnotationRef& ref) const;

    /**
     * @brief Source identity to put into SummaryUpdated events so this
     *        synchronizer ignores its own publications.
     */
    void setSummarySource(const void* source) { m_summarySource = source; }

public slots:
    void handleEvent(const AnnotationEvent& event);

signals:
    /**
     * @brief Another view changed the summary text of this popup.
     */
    void summaryReceived(const QString& text, bool isPrivate);

private:
    AnnotationController* m_controller = nullptr;
    CommentEditSession* m_session = nullptr;
    ThreadColorPropagator m_propagator;
    const void* m_summarySource = nullptr;
};
