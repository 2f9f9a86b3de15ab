// ============================================================================
// CommentEditSession - Implementation
// ============================================================================

#include "CommentEditSession.h"
#include "AnnotationController.h"

#include <QDebug>
#include <QSet>

CommentEditSession::CommentEditSession(AnnotationController* controller,
                                       const AnnotationRef& popupRef,
                                       const AnnotationSettings& settings,
                                       const ViewGeometryProvider* geometry,
                                       QObject* parent)
    : QObject(parent)
    , m_controller(controller)
    , m_settings(settings)
    , m_geometry(geometry, 0)
    , m_popupRef(popupRef)
    , m_tree(std::make_unique<CommentThreadNode>())
{
    MarkupAnnotation* popup = popupAnnotation();
    if (!popup) {
        qWarning() << "CommentEditSession: Popup" << popupRef.toString() << "not found";
        return;
    }
    m_pageIndex = popup->pageIndex;
    m_geometry.setPageIndex(m_pageIndex);

    if (!parentAnnotation()) {
        qWarning() << "CommentEditSession: Popup" << popupRef.toString()
                   << "has no markup parent";
        return;
    }

    m_valid = true;
    rebuild();
}

CommentEditSession::~CommentEditSession() = default;

AnnotationStore* CommentEditSession::store() const
{
    return m_controller ? m_controller->store() : nullptr;
}

MarkupAnnotation* CommentEditSession::popupAnnotation() const
{
    AnnotationStore* s = store();
    return s ? s->annotation(m_popupRef) : nullptr;
}

MarkupAnnotation* CommentEditSession::parentAnnotation() const
{
    AnnotationStore* s = store();
    MarkupAnnotation* popup = popupAnnotation();
    if (!s || !popup) {
        return nullptr;
    }
    MarkupAnnotation* parent = s->annotation(popup->parentRef);
    if (parent && !parent->isMarkup()) {
        return nullptr;
    }
    return parent;
}

MarkupAnnotation* CommentEditSession::selectedAnnotation() const
{
    AnnotationStore* s = store();
    if (!s) {
        return nullptr;
    }
    if (m_tree->contains(m_state.selectedRef)) {
        if (MarkupAnnotation* selected = s->annotation(m_state.selectedRef)) {
            return selected;
        }
    }
    return s->annotation(m_state.rootAnnotationRef);
}

bool CommentEditSession::canTogglePrivacy() const
{
    if (!m_settings.privatePropertyEnabled) {
        return false;
    }
    const MarkupAnnotation* parent = parentAnnotation();
    return parent && !m_settings.userName.isEmpty() && parent->titleText == m_settings.userName;
}

QVector<MarkupAnnotation*> CommentEditSession::allAnnotations() const
{
    QVector<MarkupAnnotation*> result;
    AnnotationStore* s = store();
    if (!s) {
        return result;
    }
    for (const AnnotationRef& ref : m_tree->refs()) {
        if (MarkupAnnotation* annot = s->annotation(ref)) {
            result.append(annot);
        }
    }
    return result;
}

// ============================================================================
// Operations
// ============================================================================

bool CommentEditSession::selectNode(const AnnotationRef& ref)
{
    if (!m_tree->contains(ref)) {
        qDebug() << "CommentEditSession: Cannot select" << ref.toString() << "- not in thread";
        return false;
    }
    if (m_state.selectedRef != ref) {
        m_state.selectedRef = ref;
        emit selectionChanged(ref);
    }
    return true;
}

bool CommentEditSession::editContent(const QString& text)
{
    if (!m_valid || text.isEmpty()) {
        return false;
    }

    MarkupAnnotation* selected = selectedAnnotation();
    if (!selected) {
        qDebug() << "CommentEditSession: Edit dropped, no selected annotation";
        return false;
    }

    selected->touch();
    selected->contents = text;
    m_controller->updateAnnotation(selected);

    if (MarkupAnnotation* popup = popupAnnotation()) {
        popup->touch();
        m_controller->updateAnnotation(popup);
    }
    return true;
}

bool CommentEditSession::setPrivacy(bool isPrivate)
{
    if (!m_valid) {
        return false;
    }

    // The private flag of a thread is kept on its top-level annotation
    MarkupAnnotation* parent = parentAnnotation();
    if (!parent) {
        qDebug() << "CommentEditSession: Privacy change dropped, no top-level annotation";
        return false;
    }

    parent->setFlag(MarkupAnnotation::FLAG_PRIVATE_CONTENTS, isPrivate);
    parent->touch();
    m_controller->updateAnnotation(parent);

    if (MarkupAnnotation* popup = popupAnnotation()) {
        popup->touch();
        m_controller->updateAnnotation(popup);
    }
    return true;
}

MarkupAnnotation* CommentEditSession::reply(const QString& title, const QString& content)
{
    return createReply(title, content,
                       MarkupAnnotation::STATE_MODEL_REVIEW,
                       MarkupAnnotation::STATE_REVIEW_NONE);
}

MarkupAnnotation* CommentEditSession::setReviewStatus(const QString& titleTemplate,
                                                      const QString& bodyTemplate,
                                                      const QString& status)
{
    const MarkupAnnotation* selected = selectedAnnotation();
    if (!m_valid || !selected) {
        qDebug() << "CommentEditSession: Status change dropped, no selected annotation";
        return nullptr;
    }

    const QString author = selected->titleText;
    return createReply(fillTemplate(titleTemplate, author),
                       fillTemplate(bodyTemplate, author),
                       MarkupAnnotation::STATE_MODEL_REVIEW, status);
}

MarkupAnnotation* CommentEditSession::createReply(const QString& title, const QString& content,
                                                  const QString& stateModel, const QString& state)
{
    if (!m_valid) {
        return nullptr;
    }

    MarkupAnnotation* selected = selectedAnnotation();
    AnnotationStore* s = store();
    if (!selected || !s) {
        qDebug() << "CommentEditSession: Reply dropped, no selected annotation";
        return nullptr;
    }

    auto annot = std::make_unique<MarkupAnnotation>(MarkupAnnotation::Subtype::Text);
    annot->setFlag(MarkupAnnotation::FLAG_PRIVATE_CONTENTS, !m_settings.publicByDefault);
    annot->titleText = title;
    annot->contents = content;
    annot->state = state;
    annot->stateModel = stateModel;
    annot->inReplyTo = selected->ref;
    annot->color = selected->color;
    annot->open = false;

    // Off screen until the user opens it
    const QRectF offscreen = m_geometry.refreshAnnotationRect(QRect(-20, -20, 20, 20));
    annot->rect = offscreen.isNull() ? QRectF(-20, -20, 20, 20) : offscreen;

    MarkupAnnotation* stored = s->addAnnotation(m_pageIndex, std::move(annot));
    if (!stored) {
        qWarning() << "CommentEditSession: Store refused reply on page" << m_pageIndex;
        return nullptr;
    }

    // Insert under the replied-to node, or the first leaf if it left the tree
    CommentThreadNode* node = m_tree->find(selected->ref);
    if (!node) {
        node = m_tree->firstLeaf();
    }
    node->appendChild(stored);
    m_state.hasReplies = true;
    m_state.selectedRef = stored->ref;

    emit threadRebuilt(true);
    emit selectionChanged(stored->ref);

    m_controller->publish(AnnotationEvent::added(stored->pageIndex, stored->ref));
    return stored;
}

int CommentEditSession::deleteSelected(bool deleteWholeThread)
{
    if (!m_valid) {
        return 0;
    }

    const MarkupAnnotation* target = deleteWholeThread ? parentAnnotation() : selectedAnnotation();
    if (!target) {
        qDebug() << "CommentEditSession: Delete dropped, nothing selected";
        return 0;
    }

    // Collect first: deleting publishes events that may rebuild the tree
    const AnnotationRef targetRef = target->ref;
    QVector<AnnotationRef> chain = collectReplyChain(targetRef);

    int deleted = 0;
    for (auto it = chain.crbegin(); it != chain.crend(); ++it) {
        if (m_controller->deleteAnnotation(*it)) {
            ++deleted;
        }
    }
    if (m_controller->deleteAnnotation(targetRef)) {
        ++deleted;
    }

    rebuild();
    return deleted;
}

bool CommentEditSession::minimize()
{
    MarkupAnnotation* popup = popupAnnotation();
    if (!popup) {
        return false;
    }
    popup->open = false;
    popup->touch();
    m_controller->updateAnnotation(popup);
    emit minimized();
    return true;
}

bool CommentEditSession::setFontSizes(qreal textAreaSize, qreal headerSize)
{
    MarkupAnnotation* popup = popupAnnotation();
    if (!popup || textAreaSize <= 0 || headerSize <= 0) {
        return false;
    }
    if (qFuzzyCompare(popup->textAreaFontSize, textAreaSize) &&
        qFuzzyCompare(popup->headerFontSize, headerSize)) {
        return false;
    }
    popup->textAreaFontSize = textAreaSize;
    popup->headerFontSize = headerSize;
    m_controller->updateAnnotation(popup);
    return true;
}

void CommentEditSession::rebuild()
{
    AnnotationStore* s = store();
    MarkupAnnotation* parent = parentAnnotation();

    CommentThreadBuildResult result = CommentThreadBuilder::build(
        parent, s ? s->annotations(m_pageIndex) : QVector<MarkupAnnotation*>());

    const AnnotationRef previousSelection = m_state.selectedRef;

    m_tree = std::move(result.root);
    m_state.hasReplies = result.hasReplies;
    m_state.rootAnnotationRef = parent ? parent->ref : AnnotationRef();

    // Keep the selection while it is still part of the thread
    if (previousSelection.isNull() || !m_tree->contains(previousSelection)) {
        m_state.selectedRef = m_state.rootAnnotationRef;
    }

    emit threadRebuilt(m_state.hasReplies);
    if (m_state.selectedRef != previousSelection) {
        emit selectionChanged(m_state.selectedRef);
    }
}

void CommentEditSession::requestDisplayRefresh()
{
    emit displayRefreshRequested();
}

// ============================================================================
// Helpers
// ============================================================================

QVector<AnnotationRef> CommentEditSession::collectReplyChain(const AnnotationRef& target) const
{
    // Breadth-first over IRT links: reversing the result gives deepest first
    QVector<AnnotationRef> chain;
    AnnotationStore* s = store();
    if (!s) {
        return chain;
    }

    const QVector<MarkupAnnotation*> pageAnnotations = s->annotations(m_pageIndex);
    QSet<AnnotationRef> visited;
    visited.insert(target);

    QVector<AnnotationRef> frontier;
    frontier.append(target);
    while (!frontier.isEmpty()) {
        QVector<AnnotationRef> next;
        for (const AnnotationRef& ref : frontier) {
            for (const MarkupAnnotation* annot : pageAnnotations) {
                if (!annot->isMarkup() || annot->inReplyTo != ref || visited.contains(annot->ref)) {
                    continue;
                }
                visited.insert(annot->ref);
                chain.append(annot->ref);
                next.append(annot->ref);
            }
        }
        frontier = next;
    }
    return chain;
}

QString CommentEditSession::fillTemplate(const QString& pattern, const QString& value)
{
    if (!pattern.contains(QLatin1String("%1"))) {
        return pattern;
    }
    return pattern.arg(value);
}
