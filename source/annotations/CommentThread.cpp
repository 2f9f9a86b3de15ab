// ============================================================================
// CommentThread - Implementation
// ============================================================================

#include "CommentThread.h"

#include <QDebug>

// ============================================================================
// CommentThreadNode
// ============================================================================

CommentThreadNode::CommentThreadNode(MarkupAnnotation* annotation)
    : m_annotation(annotation)
{
    if (annotation) {
        m_ref = annotation->ref;
    }
}

CommentThreadNode* CommentThreadNode::child(int index) const
{
    if (index < 0 || index >= childCount()) {
        return nullptr;
    }
    return m_children[static_cast<size_t>(index)].get();
}

CommentThreadNode* CommentThreadNode::appendChild(MarkupAnnotation* annotation)
{
    auto node = std::make_unique<CommentThreadNode>(annotation);
    node->m_parent = this;
    CommentThreadNode* ptr = node.get();
    m_children.push_back(std::move(node));
    return ptr;
}

CommentThreadNode* CommentThreadNode::firstLeaf()
{
    CommentThreadNode* node = this;
    while (!node->m_children.empty()) {
        node = node->m_children.front().get();
    }
    return node;
}

CommentThreadNode* CommentThreadNode::find(const AnnotationRef& ref)
{
    return const_cast<CommentThreadNode*>(static_cast<const CommentThreadNode*>(this)->find(ref));
}

const CommentThreadNode* CommentThreadNode::find(const AnnotationRef& ref) const
{
    if (ref.isNull()) {
        return nullptr;
    }
    if (!isSyntheticRoot() && m_ref == ref) {
        return this;
    }
    for (const auto& child : m_children) {
        if (const CommentThreadNode* found = child->find(ref)) {
            return found;
        }
    }
    return nullptr;
}

bool CommentThreadNode::containsAny(const QSet<AnnotationRef>& refs) const
{
    if (!isSyntheticRoot() && refs.contains(m_ref)) {
        return true;
    }
    for (const auto& child : m_children) {
        if (child->containsAny(refs)) {
            return true;
        }
    }
    return false;
}

int CommentThreadNode::annotationCount() const
{
    int count = isSyntheticRoot() ? 0 : 1;
    for (const auto& child : m_children) {
        count += child->annotationCount();
    }
    return count;
}

QVector<AnnotationRef> CommentThreadNode::refs() const
{
    QVector<AnnotationRef> result;
    collectRefs(result);
    return result;
}

void CommentThreadNode::collectRefs(QVector<AnnotationRef>& refs) const
{
    if (!isSyntheticRoot()) {
        refs.append(m_ref);
    }
    for (const auto& child : m_children) {
        child->collectRefs(refs);
    }
}

// ============================================================================
// CommentThreadBuilder
// ============================================================================

CommentThreadBuildResult CommentThreadBuilder::build(MarkupAnnotation* rootAnnotation,
                                                     const QVector<MarkupAnnotation*>& annotations)
{
    CommentThreadBuildResult result;
    result.root = std::make_unique<CommentThreadNode>();

    if (!rootAnnotation) {
        return result;
    }

    CommentThreadNode* top = result.root->appendChild(rootAnnotation);
    result.hasReplies = hasReplies(rootAnnotation, annotations);
    if (!result.hasReplies) {
        return result;
    }

    const ReplyIndex index = indexReplies(annotations);
    QSet<AnnotationRef> visited;
    visited.insert(rootAnnotation->ref);
    buildRecursive(top, index, visited);
    return result;
}

bool CommentThreadBuilder::hasReplies(const MarkupAnnotation* annotation,
                                      const QVector<MarkupAnnotation*>& annotations)
{
    if (!annotation || annotation->ref.isNull()) {
        return false;
    }
    for (const MarkupAnnotation* candidate : annotations) {
        if (candidate && candidate != annotation && candidate->isMarkup() &&
            candidate->inReplyTo == annotation->ref) {
            return true;
        }
    }
    return false;
}

CommentThreadBuilder::ReplyIndex CommentThreadBuilder::indexReplies(
    const QVector<MarkupAnnotation*>& annotations)
{
    ReplyIndex index;
    for (MarkupAnnotation* annot : annotations) {
        if (annot && annot->isMarkup() && annot->isReply()) {
            index[annot->inReplyTo].append(annot);
        }
    }
    return index;
}

void CommentThreadBuilder::buildRecursive(CommentThreadNode* node, const ReplyIndex& index,
                                          QSet<AnnotationRef>& visited)
{
    const auto it = index.constFind(node->ref());
    if (it == index.constEnd()) {
        return;
    }

    for (MarkupAnnotation* reply : it.value()) {
        if (visited.contains(reply->ref)) {
            qWarning() << "CommentThreadBuilder: Annotation" << reply->ref.toString()
                       << "is already in the thread, IRT chain is cyclic";
            continue;
        }
        visited.insert(reply->ref);
        CommentThreadNode* childNode = node->appendChild(reply);
        buildRecursive(childNode, index, visited);
    }
}
