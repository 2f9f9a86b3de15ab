#pragma once

// ============================================================================
// ThreadColorPropagator - Keeps all members of a comment thread one color
// ============================================================================
// Part of the MarkupView annotation architecture
//
// When one member of a thread changes color (e.g. from the properties
// panel), every other member takes the same color. Each changed annotation
// is stamped and persisted through the controller, which publishes Updated
// for it. Those follow-up events find a consistent thread and stop there.
// ============================================================================

#include "CommentThread.h"

class AnnotationController;

class ThreadColorPropagator {
public:
    /**
     * @brief Construct a propagator.
     * @param controller Used to resolve references and persist changes (not owned).
     */
    explicit ThreadColorPropagator(AnnotationController* controller);

    /**
     * @brief Copy the trigger's color to every member of the thread.
     * @param tree Synthetic root of the thread.
     * @param triggerRef Annotation whose color wins.
     * @return Number of annotations whose color changed.
     *
     * All colors are changed before the first Updated is published, so a
     * receiver reacting synchronously already sees a consistent thread.
     * Members that no longer resolve in the store are skipped.
     */
    int reconcile(const CommentThreadNode* tree, const AnnotationRef& triggerRef);

private:
    AnnotationController* m_controller = nullptr;
};
