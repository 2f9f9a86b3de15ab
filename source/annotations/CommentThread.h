#pragma once

// ============================================================================
// CommentThread - Reply tree of a popup's markup annotation
// ============================================================================
// Part of the MarkupView annotation architecture
//
// A comment thread is derived from the flat annotation list of a page:
// every markup annotation whose in-reply-to (IRT) reference names another
// annotation becomes a child of that annotation. The tree is never stored in
// the document; it is rebuilt as a unit whenever the thread changes.
//
// Shape:
//   synthetic root (no annotation)
//     └─ top-level annotation
//          ├─ reply 1
//          │    └─ reply to reply 1
//          └─ reply 2
// ============================================================================

#include "MarkupAnnotation.h"

#include <QHash>
#include <QSet>
#include <QVector>
#include <memory>
#include <vector>

/**
 * @brief One node of a comment thread.
 *
 * The node does not own its annotation. It keeps a copy of the reference so
 * membership checks stay valid after the store dropped the record.
 */
class CommentThreadNode {
public:
    explicit CommentThreadNode(MarkupAnnotation* annotation = nullptr);

    // Non-copyable (owns its children)
    CommentThreadNode(const CommentThreadNode&) = delete;
    CommentThreadNode& operator=(const CommentThreadNode&) = delete;

    MarkupAnnotation* annotation() const { return m_annotation; }
    const AnnotationRef& ref() const { return m_ref; }

    /**
     * @brief True for the synthetic root, which wraps no annotation.
     */
    bool isSyntheticRoot() const { return m_annotation == nullptr; }

    CommentThreadNode* parent() const { return m_parent; }
    int childCount() const { return static_cast<int>(m_children.size()); }
    CommentThreadNode* child(int index) const;
    bool isLeaf() const { return m_children.empty(); }

    /**
     * @brief Append a node for an annotation as the last child.
     * @return The new child node.
     */
    CommentThreadNode* appendChild(MarkupAnnotation* annotation);

    /**
     * @brief First leaf in depth-first order (this node if it has no children).
     */
    CommentThreadNode* firstLeaf();

    /**
     * @brief Find the node of an annotation in this subtree.
     * @return The node, or nullptr if the reference is not a member.
     */
    CommentThreadNode* find(const AnnotationRef& ref);
    const CommentThreadNode* find(const AnnotationRef& ref) const;

    bool contains(const AnnotationRef& ref) const { return find(ref) != nullptr; }
    bool containsAny(const QSet<AnnotationRef>& refs) const;

    /**
     * @brief Number of annotation nodes in this subtree (synthetic root excluded).
     */
    int annotationCount() const;

    /**
     * @brief References of this subtree in depth-first pre-order.
     */
    QVector<AnnotationRef> refs() const;

private:
    void collectRefs(QVector<AnnotationRef>& refs) const;

    MarkupAnnotation* m_annotation = nullptr;
    AnnotationRef m_ref;
    CommentThreadNode* m_parent = nullptr;
    std::vector<std::unique_ptr<CommentThreadNode>> m_children;
};

/**
 * @brief Per-popup thread state.
 */
struct ThreadState {
    AnnotationRef rootAnnotationRef;    ///< Top-level annotation of the thread
    AnnotationRef selectedRef;          ///< Selected node (top-level after a rebuild)
    bool hasReplies = false;
};

/**
 * @brief Result of CommentThreadBuilder::build().
 */
struct CommentThreadBuildResult {
    std::unique_ptr<CommentThreadNode> root;    ///< Synthetic root
    bool hasReplies = false;
};

/**
 * @brief Builds comment threads from a flat annotation list.
 */
class CommentThreadBuilder {
public:
    /**
     * @brief Build the reply tree of a top-level annotation.
     * @param rootAnnotation Top-level annotation (may be nullptr).
     * @param annotations All annotations of the page, in document order.
     * @return Synthetic root plus whether any annotation replies to the root.
     *
     * Children of a node are the markup annotations whose IRT equals the
     * node's reference, in list order. Popups never become nodes. An
     * annotation already in the tree is not added a second time, so cyclic
     * IRT data cannot recurse forever.
     */
    static CommentThreadBuildResult build(MarkupAnnotation* rootAnnotation,
                                          const QVector<MarkupAnnotation*>& annotations);

    /**
     * @brief True if any markup annotation in the list replies to the given one.
     */
    static bool hasReplies(const MarkupAnnotation* annotation,
                           const QVector<MarkupAnnotation*>& annotations);

private:
    using ReplyIndex = QHash<AnnotationRef, QVector<MarkupAnnotation*>>;

    static ReplyIndex indexReplies(const QVector<MarkupAnnotation*>& annotations);
    static void buildRecursive(CommentThreadNode* node, const ReplyIndex& index,
                               QSet<AnnotationRef>& visited);
};
