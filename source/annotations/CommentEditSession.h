#pragma once

// ============================================================================
// CommentEditSession - User edits of one popup's comment thread
// ============================================================================
// Part of the MarkupView annotation architecture
//
// One session per popup annotation. It owns the thread tree of the popup's
// markup parent and the selection inside it, and turns user actions into
// document mutations:
// - selectNode():      change the selected reply
// - editContent():     write the text area into the selected annotation
// - setPrivacy():      toggle the thread's private-contents flag
// - reply():           add a reply under the selected annotation
// - deleteSelected():  delete a reply (or the whole thread) and its replies
// - setReviewStatus(): add a review-state reply ("Accepted", ...)
// - minimize():        close the popup window
//
// Every mutation goes through AnnotationController, so other popups showing
// the same thread hear about it. The session itself never listens to the
// bus; CommentThreadSynchronizer does that and calls rebuild().
//
// Annotations are resolved through the store on every access. A session
// never keeps a raw annotation pointer across calls.
// ============================================================================

#include "CommentThread.h"
#include "PopupGeometry.h"
#include "../core/AnnotationSettings.h"

#include <QObject>
#include <memory>

class AnnotationController;
class AnnotationStore;

class CommentEditSession : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Open a session for a popup annotation.
     * @param controller Mutation entry point (not owned).
     * @param popupRef The popup annotation whose thread is edited.
     * @param settings User name and privacy defaults.
     * @param geometry View geometry for placing new replies (not owned, may be nullptr).
     *
     * If the popup or its markup parent cannot be resolved the session is
     * not valid and every operation is a no-op.
     */
    CommentEditSession(AnnotationController* controller,
                       const AnnotationRef& popupRef,
                       const AnnotationSettings& settings,
                       const ViewGeometryProvider* geometry = nullptr,
                       QObject* parent = nullptr);
    ~CommentEditSession() override;

    /**
     * @brief True if the popup and its parent annotation were resolved at construction.
     */
    bool isValid() const { return m_valid; }

    // ===== Accessors =====
    AnnotationController* controller() const { return m_controller; }
    AnnotationStore* store() const;
    const AnnotationSettings& settings() const { return m_settings; }
    const AnnotationRef& popupRef() const { return m_popupRef; }
    int pageIndex() const { return m_pageIndex; }

    MarkupAnnotation* popupAnnotation() const;
    MarkupAnnotation* parentAnnotation() const;

    /**
     * @brief The selected annotation, falling back to the top-level one.
     */
    MarkupAnnotation* selectedAnnotation() const;

    const ThreadState& state() const { return m_state; }
    const CommentThreadNode* tree() const { return m_tree.get(); }
    bool hasReplies() const { return m_state.hasReplies; }

    /**
     * @brief True if the privacy toggle may be offered to the current user.
     *
     * Requires the private property to be enabled and the user to be the
     * author of the thread's top-level annotation.
     */
    bool canTogglePrivacy() const;

    /**
     * @brief Every annotation of the thread in tree pre-order.
     */
    QVector<MarkupAnnotation*> allAnnotations() const;

    // ===== Operations =====

    /**
     * @brief Select a node of the thread.
     * @return False if the reference is not a member (selection unchanged).
     */
    bool selectNode(const AnnotationRef& ref);

    /**
     * @brief Replace the contents of the selected annotation.
     * @return False if nothing was written (empty text or no selection).
     *
     * Publishes Updated for the selected annotation and for the popup.
     */
    bool editContent(const QString& text);

    /**
     * @brief Set or clear the private-contents flag of the top-level annotation.
     *
     * Publishes Updated for the top-level annotation and for the popup.
     */
    bool setPrivacy(bool isPrivate);

    /**
     * @brief Add a reply to the selected annotation.
     * @param title Author of the reply.
     * @param content Initial text.
     * @return The new annotation, or nullptr if the store refused it.
     *
     * The reply is inserted into the live tree and selected before Added is
     * published, so this session does not rebuild because of its own reply.
     */
    MarkupAnnotation* reply(const QString& title, const QString& content);

    /**
     * @brief Delete the selected annotation (or the whole thread) with all replies.
     * @param deleteWholeThread Delete from the top-level annotation down.
     * @return Number of annotations deleted.
     *
     * Replies are deleted deepest first, then the tree is rebuilt.
     */
    int deleteSelected(bool deleteWholeThread);

    /**
     * @brief Add a review-state reply.
     * @param titleTemplate Title of the reply, "%1" is replaced by the selected author.
     * @param bodyTemplate Contents of the reply, "%1" is replaced by the selected author.
     * @param status One of the MarkupAnnotation::STATE_REVIEW_* values.
     */
    MarkupAnnotation* setReviewStatus(const QString& titleTemplate,
                                      const QString& bodyTemplate,
                                      const QString& status);

    /**
     * @brief Close the popup window (clears /Open and persists it).
     */
    bool minimize();

    /**
     * @brief Persist popup font sizes (unscaled points).
     */
    bool setFontSizes(qreal textAreaSize, qreal headerSize);

    /**
     * @brief Rebuild the thread from the store.
     *
     * The selection survives if its annotation is still in the thread,
     * otherwise it falls back to the top-level annotation. selectionChanged
     * is emitted only when the selection moved.
     */
    void rebuild();

    /**
     * @brief Ask the display to refresh the selected annotation.
     *
     * Used after the color propagator changed members of the thread.
     */
    void requestDisplayRefresh();

signals:
    /**
     * @brief The tree was replaced.
     */
    void threadRebuilt(bool hasReplies);

    /**
     * @brief A different node was selected (or a reply became selected).
     */
    void selectionChanged(const AnnotationRef& ref);

    /**
     * @brief Selected annotation fields changed outside the text area.
     */
    void displayRefreshRequested();

    /**
     * @brief The popup window was closed.
     */
    void minimized();

private:
    MarkupAnnotation* createReply(const QString& title, const QString& content,
                                  const QString& stateModel, const QString& state);
    QVector<AnnotationRef> collectReplyChain(const AnnotationRef& target) const;
    static QString fillTemplate(const QString& pattern, const QString& value);

    AnnotationController* m_controller = nullptr;
    AnnotationSettings m_settings;
    PopupGeometry m_geometry;
    AnnotationRef m_popupRef;
    int m_pageIndex = 0;
    bool m_valid = false;

    ThreadState m_state;
    std::unique_ptr<CommentThreadNode> m_tree;
};
