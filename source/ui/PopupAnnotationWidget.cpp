#include "PopupAnnotationWidget.h"
#include "ThemeColors.h"
#include "../annotations/AnnotationCapabilities.h"
#include "../annotations/AnnotationController.h"
#include "../annotations/CommentEditSession.h"
#include "../annotations/CommentThreadSynchronizer.h"
#include "../annotations/FileDropHandlerRegistry.h"

#include <QContextMenuEvent>
#include <QDebug>
#include <QDragEnterEvent>
#include <QDropEvent>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QLabel>
#include <QMenu>
#include <QMimeData>
#include <QMouseEvent>
#include <QPainter>
#include <QPlainTextEdit>
#include <QShortcut>
#include <QSignalBlocker>
#include <QToolButton>
#include <QTreeWidget>
#include <QTreeWidgetItemIterator>
#include <QUrl>
#include <QVBoxLayout>
#include <QWheelEvent>

namespace {
constexpr int kResizeGripSize = 12;     ///< Bottom-right corner area that resizes
constexpr qreal kFontStep = 1.0;
}

PopupAnnotationWidget::PopupAnnotationWidget(AnnotationController* controller,
                                             const AnnotationRef& popupRef,
                                             const AnnotationSettings& settings,
                                             const ViewGeometryProvider* geometry,
                                             const FileDropHandlerRegistry* dropHandlers,
                                             QWidget* parent)
    : QFrame(parent)
    , m_controller(controller)
    , m_popupRef(popupRef)
    , m_settings(settings)
    , m_geometry(geometry, 0)
    , m_dropHandlers(dropHandlers)
{
    setObjectName("PopupAnnotationWidget");

    m_session = new CommentEditSession(controller, popupRef, settings, geometry, this);
    if (!m_session->isValid()) {
        qWarning() << "PopupAnnotationWidget: Cannot build popup" << popupRef.toString();
        QFrame::setVisible(false);
        return;
    }
    m_geometry.setPageIndex(m_session->pageIndex());

    m_synchronizer = new CommentThreadSynchronizer(controller, m_session, this);
    m_synchronizer->setSummarySource(this);

    setupUI();
    setupShortcuts();

    connect(m_session, &CommentEditSession::threadRebuilt, this, &PopupAnnotationWidget::onThreadRebuilt);
    connect(m_session, &CommentEditSession::selectionChanged, this, &PopupAnnotationWidget::onSessionSelectionChanged);
    connect(m_session, &CommentEditSession::displayRefreshRequested, this, &PopupAnnotationWidget::onDisplayRefreshRequested);
    connect(m_session, &CommentEditSession::minimized, this, [this]() { QFrame::setVisible(false); });
    connect(m_synchronizer, &CommentThreadSynchronizer::summaryReceived, this, &PopupAnnotationWidget::onSummaryReceived);

    m_built = true;

    onThreadRebuilt(m_session->hasReplies());
    refreshDirtyBounds();

    const MarkupAnnotation* popup = m_session->popupAnnotation();
    setVisible(popup && popup->open);
}

PopupAnnotationWidget::~PopupAnnotationWidget() = default;

// ============================================================================
// UI Setup
// ============================================================================

void PopupAnnotationWidget::setupUI()
{
    setFrameShape(QFrame::NoFrame);
    setMouseTracking(true);
    setAcceptDrops(m_dropHandlers != nullptr);
    setAutoFillBackground(false);

    m_layout = new QVBoxLayout(this);
    m_layout->setContentsMargins(4, 2, 4, 4);
    m_layout->setSpacing(2);

    // Header: title, privacy toggle, minimize
    m_header = new QWidget(this);
    m_header->setObjectName("PopupHeader");
    auto* headerLayout = new QHBoxLayout(m_header);
    headerLayout->setContentsMargins(2, 0, 0, 0);
    headerLayout->setSpacing(2);

    m_titleLabel = new QLabel(m_header);
    m_titleLabel->setObjectName("PopupTitleLabel");
    m_titleLabel->setAttribute(Qt::WA_TransparentForMouseEvents);

    m_privacyButton = new QToolButton(m_header);
    m_privacyButton->setObjectName("PopupPrivacyButton");
    m_privacyButton->setCheckable(true);
    m_privacyButton->setAutoRaise(true);
    m_privacyButton->setText(tr("Private"));
    m_privacyButton->setToolTip(tr("Only the author can read this comment"));
    connect(m_privacyButton, &QToolButton::toggled, this, &PopupAnnotationWidget::onPrivacyToggled);

    m_minimizeButton = new QToolButton(m_header);
    m_minimizeButton->setObjectName("PopupMinimizeButton");
    m_minimizeButton->setAutoRaise(true);
    m_minimizeButton->setText(QStringLiteral("-"));
    m_minimizeButton->setToolTip(tr("Minimize"));
    connect(m_minimizeButton, &QToolButton::clicked, this, &PopupAnnotationWidget::minimize);

    headerLayout->addWidget(m_titleLabel, 1);
    headerLayout->addWidget(m_privacyButton);
    headerLayout->addWidget(m_minimizeButton);

    // Reply tree
    m_commentTree = new QTreeWidget(this);
    m_commentTree->setObjectName("PopupCommentTree");
    m_commentTree->setHeaderHidden(true);
    m_commentTree->setRootIsDecorated(true);
    m_commentTree->setSelectionMode(QAbstractItemView::SingleSelection);
    m_commentTree->setContextMenuPolicy(Qt::DefaultContextMenu);
    m_commentTree->setMaximumHeight(90);
    connect(m_commentTree, &QTreeWidget::itemSelectionChanged,
            this, &PopupAnnotationWidget::onTreeSelectionChanged);

    m_creationLabel = new QLabel(this);
    m_creationLabel->setObjectName("PopupCreationLabel");
    m_creationLabel->setAttribute(Qt::WA_TransparentForMouseEvents);

    m_textArea = new QPlainTextEdit(this);
    m_textArea->setObjectName("PopupTextArea");
    m_textArea->setFrameShape(QFrame::NoFrame);
    connect(m_textArea, &QPlainTextEdit::textChanged, this, &PopupAnnotationWidget::onTextChanged);

    m_layout->addWidget(m_header);
    m_layout->addWidget(m_commentTree);
    m_layout->addWidget(m_creationLabel);
    m_layout->addWidget(m_textArea, 1);
}

void PopupAnnotationWidget::setupShortcuts()
{
    auto addShortcut = [this](const QKeySequence& seq, void (PopupAnnotationWidget::*slot)()) {
        auto* shortcut = new QShortcut(seq, this);
        shortcut->setContext(Qt::WidgetWithChildrenShortcut);
        connect(shortcut, &QShortcut::activated, this, slot);
    };
    addShortcut(QKeySequence(Qt::CTRL | Qt::Key_Equal), &PopupAnnotationWidget::increaseFontSize);
    addShortcut(QKeySequence(Qt::CTRL | Qt::Key_Minus), &PopupAnnotationWidget::decreaseFontSize);
    addShortcut(QKeySequence(Qt::CTRL | Qt::Key_0), &PopupAnnotationWidget::resetFontSize);
}

// ============================================================================
// Thread display
// ============================================================================

void PopupAnnotationWidget::populateTree()
{
    QSignalBlocker blocker(m_commentTree);
    m_commentTree->clear();

    const CommentThreadNode* tree = m_session->tree();
    const CommentThreadNode* top = tree ? tree->child(0) : nullptr;
    if (top) {
        addTreeItems(nullptr, top);
    }
    m_commentTree->expandAll();

    const AnnotationRef selected = m_session->state().selectedRef;
    for (QTreeWidgetItemIterator it(m_commentTree); *it; ++it) {
        if ((*it)->data(0, Qt::UserRole).value<AnnotationRef>() == selected) {
            m_commentTree->setCurrentItem(*it);
            break;
        }
    }
}

void PopupAnnotationWidget::addTreeItems(QTreeWidgetItem* parentItem, const CommentThreadNode* node)
{
    const MarkupAnnotation* annot = m_controller->store()->annotation(node->ref());
    if (!annot) {
        return;
    }

    QTreeWidgetItem* item = parentItem ? new QTreeWidgetItem(parentItem)
                                       : new QTreeWidgetItem(m_commentTree);
    item->setText(0, annot->displayText());
    item->setToolTip(0, annot->contents);
    item->setData(0, Qt::UserRole, QVariant::fromValue(node->ref()));

    for (int i = 0; i < node->childCount(); ++i) {
        addTreeItems(item, node->child(i));
    }
}

void PopupAnnotationWidget::refreshSelectionDisplay()
{
    const MarkupAnnotation* parent = m_session->parentAnnotation();
    const MarkupAnnotation* selected = m_session->selectedAnnotation();

    m_titleLabel->setText(parent ? parent->formattedTitleText() : QString());
    m_creationLabel->setText(selected ? selected->formattedCreationDate() : QString());

    {
        QSignalBlocker blocker(m_textArea);
        const QString text = selected ? selected->contents : QString();
        if (m_textArea->toPlainText() != text) {
            m_textArea->setPlainText(text);
        }
    }
    const bool readOnly = !selected || selected->isReadOnly() ||
                          selected->hasFlag(MarkupAnnotation::FLAG_LOCKED_CONTENTS);
    m_textArea->setReadOnly(readOnly);

    m_privacyButton->setVisible(m_session->canTogglePrivacy());
    {
        QSignalBlocker blocker(m_privacyButton);
        m_privacyButton->setChecked(parent && parent->isPrivate());
    }

    // Keep the row of the selection in step with its text
    if (selected) {
        for (QTreeWidgetItemIterator it(m_commentTree); *it; ++it) {
            if ((*it)->data(0, Qt::UserRole).value<AnnotationRef>() == selected->ref) {
                (*it)->setText(0, selected->displayText());
                break;
            }
        }
    }
}

void PopupAnnotationWidget::applyColors()
{
    const MarkupAnnotation* parent = m_session->parentAnnotation();
    m_backgroundColor = (parent && parent->color.isValid()) ? parent->color
                                                            : ThemeColors::popupBackground();
    const QColor text = contrastColor(m_backgroundColor);

    m_header->setStyleSheet(QString(
        "QLabel, QToolButton { color: %1; background: transparent; }"
    ).arg(text.name()));
    m_creationLabel->setStyleSheet(QString("QLabel { color: %1; }").arg(text.name()));
    update();
}

void PopupAnnotationWidget::applyFontSizes()
{
    const MarkupAnnotation* popup = m_session->popupAnnotation();
    if (!popup || !m_textArea) {
        return;
    }

    QFont textFont = m_textArea->font();
    textFont.setPointSizeF(m_geometry.scaledFontSize(popup->textAreaFontSize));
    m_textArea->setFont(textFont);

    QFont headerFont = m_titleLabel->font();
    headerFont.setPointSizeF(m_geometry.scaledFontSize(popup->headerFontSize));
    headerFont.setBold(true);
    m_titleLabel->setFont(headerFont);

    headerFont.setBold(false);
    m_creationLabel->setFont(headerFont);
    m_commentTree->setFont(headerFont);
}

QColor PopupAnnotationWidget::contrastColor(const QColor& background)
{
    return ThemeColors::contrastText(background);
}

bool PopupAnnotationWidget::isTopLevelPopup() const
{
    if (!m_built) {
        return false;
    }
    const MarkupAnnotation* parent = m_session->parentAnnotation();
    return parent && !parent->isReply();
}

// ============================================================================
// Session / synchronizer notifications
// ============================================================================

void PopupAnnotationWidget::onThreadRebuilt(bool hasReplies)
{
    if (!m_built) {
        return;
    }
    populateTree();
    m_commentTree->setVisible(hasReplies);
    refreshSelectionDisplay();
    applyColors();
}

void PopupAnnotationWidget::onSessionSelectionChanged()
{
    if (!m_built) {
        return;
    }
    {
        QSignalBlocker blocker(m_commentTree);
        const AnnotationRef selected = m_session->state().selectedRef;
        for (QTreeWidgetItemIterator it(m_commentTree); *it; ++it) {
            if ((*it)->data(0, Qt::UserRole).value<AnnotationRef>() == selected) {
                m_commentTree->setCurrentItem(*it);
                break;
            }
        }
    }
    refreshSelectionDisplay();
}

void PopupAnnotationWidget::onTreeSelectionChanged()
{
    QTreeWidgetItem* item = m_commentTree->currentItem();
    if (!item) {
        return;
    }
    m_session->selectNode(item->data(0, Qt::UserRole).value<AnnotationRef>());
}

void PopupAnnotationWidget::onTextChanged()
{
    const QString text = m_textArea->toPlainText();
    if (!m_session->editContent(text)) {
        return;
    }

    const MarkupAnnotation* selected = m_session->selectedAnnotation();
    if (!selected) {
        return;
    }
    for (QTreeWidgetItemIterator it(m_commentTree); *it; ++it) {
        if ((*it)->data(0, Qt::UserRole).value<AnnotationRef>() == selected->ref) {
            (*it)->setText(0, selected->displayText());
            break;
        }
    }

    // Other views of this popup show the top-level text as their summary
    if (selected->ref == m_session->state().rootAnnotationRef) {
        m_controller->publish(AnnotationEvent::summaryUpdated(
            m_session->pageIndex(), m_popupRef, text, selected->isPrivate(), this));
    }
}

void PopupAnnotationWidget::onPrivacyToggled(bool checked)
{
    m_session->setPrivacy(checked);
}

void PopupAnnotationWidget::onDisplayRefreshRequested()
{
    refreshSelectionDisplay();
    applyColors();
}

void PopupAnnotationWidget::onSummaryReceived(const QString& text, bool isPrivate)
{
    const MarkupAnnotation* selected = m_session->selectedAnnotation();
    if (selected && selected->ref == m_session->state().rootAnnotationRef) {
        QSignalBlocker blocker(m_textArea);
        m_textArea->setPlainText(text);
    }
    QSignalBlocker blocker(m_privacyButton);
    m_privacyButton->setChecked(isPrivate);
}

// ============================================================================
// Actions
// ============================================================================

void PopupAnnotationWidget::replyToSelected()
{
    if (!m_built) {
        return;
    }
    showPopup(true);
    if (m_session->reply(m_settings.userName, QString())) {
        m_textArea->setFocus();
    }
}

void PopupAnnotationWidget::deleteSelected(bool wholeThread)
{
    if (!m_built) {
        return;
    }
    m_session->deleteSelected(wholeThread);
}

void PopupAnnotationWidget::setStatusOfSelected(const QString& status)
{
    if (!m_built) {
        return;
    }

    QString statusName = status;
    if (status == MarkupAnnotation::STATE_REVIEW_ACCEPTED) {
        statusName = tr("Accepted");
    } else if (status == MarkupAnnotation::STATE_REVIEW_REJECTED) {
        statusName = tr("Rejected");
    } else if (status == MarkupAnnotation::STATE_REVIEW_CANCELLED) {
        statusName = tr("Cancelled");
    } else if (status == MarkupAnnotation::STATE_REVIEW_COMPLETED) {
        statusName = tr("Completed");
    } else if (status == MarkupAnnotation::STATE_REVIEW_NONE) {
        statusName = tr("None");
    }

    // %1 is filled with the author of the selected comment
    QString body = tr("%1 status: %2");
    body.replace(QLatin1String("%2"), statusName);

    showPopup(true);
    m_session->setReviewStatus(m_settings.userName, body, status);
}

void PopupAnnotationWidget::minimize()
{
    if (!m_built) {
        return;
    }
    m_session->minimize();
}

// ============================================================================
// Geometry
// ============================================================================

void PopupAnnotationWidget::refreshDirtyBounds()
{
    if (!m_built) {
        return;
    }
    const MarkupAnnotation* popup = m_session->popupAnnotation();
    if (!popup) {
        return;
    }

    QRect bounds = m_geometry.refreshDirtyBounds(*popup);
    if (bounds.isNull()) {
        return;
    }
    if (isVisible()) {
        bounds = PopupGeometry::ensureMinimumSize(bounds);
    }
    setGeometry(bounds);
    applyFontSizes();
}

void PopupAnnotationWidget::refreshAnnotationRect()
{
    if (!m_built) {
        return;
    }
    MarkupAnnotation* popup = m_session->popupAnnotation();
    if (popup && m_geometry.syncAnnotationRect(*popup, geometry())) {
        popup->touch();
        m_controller->updateAnnotation(popup);
    }
}

void PopupAnnotationWidget::setBoundsRelativeToParent(const QPoint& pagePoint)
{
    if (!m_built) {
        return;
    }
    setGeometry(m_geometry.boundsRelativeToParent(pagePoint));
    refreshAnnotationRect();
}

void PopupAnnotationWidget::showPopup(bool visible)
{
    if (!m_built) {
        return;
    }
    MarkupAnnotation* popup = m_session->popupAnnotation();
    if (popup && popup->open != visible) {
        popup->open = visible;
        popup->touch();
        m_controller->updateAnnotation(popup);
    }
    setVisible(visible);
    if (visible) {
        raise();
    }
}

void PopupAnnotationWidget::setVisible(bool visible)
{
    // An unbuilt popup has nothing to show
    if (visible && !m_built) {
        return;
    }

    QFrame::setVisible(visible);

    if (visible) {
        const QRect bounds = PopupGeometry::ensureMinimumSize(geometry());
        if (bounds != geometry()) {
            setGeometry(bounds);
        }
        if (m_textArea) {
            m_textArea->setFocus();
        }
    }
}

// ============================================================================
// Font size
// ============================================================================

void PopupAnnotationWidget::increaseFontSize()
{
    changeFontSize(kFontStep);
}

void PopupAnnotationWidget::decreaseFontSize()
{
    changeFontSize(-kFontStep);
}

void PopupAnnotationWidget::resetFontSize()
{
    if (!m_built) {
        return;
    }
    m_session->setFontSizes(m_settings.defaultFontSize, m_settings.defaultFontSize);
    applyFontSizes();
}

void PopupAnnotationWidget::changeFontSize(qreal delta)
{
    if (!m_built) {
        return;
    }
    const MarkupAnnotation* popup = m_session->popupAnnotation();
    if (!popup) {
        return;
    }
    const qreal textSize = qBound(MIN_FONT_SIZE, popup->textAreaFontSize + delta, MAX_FONT_SIZE);
    const qreal headerSize = qBound(MIN_FONT_SIZE, popup->headerFontSize + delta, MAX_FONT_SIZE);
    if (m_session->setFontSizes(textSize, headerSize)) {
        applyFontSizes();
    }
}

// ============================================================================
// Events
// ============================================================================

void PopupAnnotationWidget::paintEvent(QPaintEvent* event)
{
    QPainter painter(this);
    painter.fillRect(rect(), m_backgroundColor.isValid() ? m_backgroundColor
                                                         : ThemeColors::popupBackground());
    painter.setPen(ThemeColors::popupBorder());
    painter.drawRect(rect().adjusted(0, 0, -1, -1));

    // Resize grip
    if (canInteract()) {
        const QColor grip = contrastColor(m_backgroundColor);
        painter.setPen(grip);
        const QPoint corner = rect().bottomRight();
        for (int i = 4; i <= kResizeGripSize - 2; i += 4) {
            painter.drawLine(corner - QPoint(i, 1), corner - QPoint(1, i));
        }
    }
    QFrame::paintEvent(event);
}

bool PopupAnnotationWidget::canInteract() const
{
    if (!m_built || !m_settings.interactiveAnnotations) {
        return false;
    }
    const MarkupAnnotation* popup = m_session->popupAnnotation();
    return popup && AnnotationCapabilities::forSubtype(popup->subtype, popup).movable;
}

void PopupAnnotationWidget::mousePressEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton || !canInteract()) {
        QFrame::mousePressEvent(event);
        return;
    }

    m_mousePressed = true;
    m_pressOffset = event->position().toPoint();
    m_pressGeometry = geometry();

    const QRect grip(width() - kResizeGripSize, height() - kResizeGripSize,
                     kResizeGripSize, kResizeGripSize);
    m_dragMode = grip.contains(m_pressOffset) ? DragMode::Resize : DragMode::Move;
    raise();
    event->accept();
}

void PopupAnnotationWidget::mouseMoveEvent(QMouseEvent* event)
{
    const QPoint pos = event->position().toPoint();

    if (!m_mousePressed || m_dragMode == DragMode::None) {
        if (canInteract()) {
            const bool onGrip = pos.x() >= width() - kResizeGripSize &&
                                pos.y() >= height() - kResizeGripSize;
            setCursor(onGrip ? Qt::SizeFDiagCursor : Qt::SizeAllCursor);
        }
        QFrame::mouseMoveEvent(event);
        return;
    }

    QRect requested;
    if (m_dragMode == DragMode::Move) {
        requested = QRect(mapToParent(pos) - m_pressOffset, size());
    } else {
        const QPoint delta = pos - m_pressOffset;
        requested = QRect(m_pressGeometry.topLeft(),
                          QSize(qMax(1, m_pressGeometry.width() + delta.x()),
                                qMax(1, m_pressGeometry.height() + delta.y())));
    }

    setGeometry(m_geometry.constrainBounds(geometry(), requested, m_mousePressed));
    event->accept();
}

void PopupAnnotationWidget::mouseReleaseEvent(QMouseEvent* event)
{
    if (!m_mousePressed) {
        QFrame::mouseReleaseEvent(event);
        return;
    }

    const bool changed = geometry() != m_pressGeometry;
    m_mousePressed = false;
    m_dragMode = DragMode::None;

    if (changed) {
        const QRect bounds = PopupGeometry::ensureMinimumSize(geometry());
        if (bounds != geometry()) {
            setGeometry(bounds);
        }
        refreshAnnotationRect();
    }
    event->accept();
}

void PopupAnnotationWidget::wheelEvent(QWheelEvent* event)
{
    if (m_built && (event->modifiers() & Qt::ControlModifier)) {
        const int steps = event->angleDelta().y();
        if (steps > 0) {
            increaseFontSize();
        } else if (steps < 0) {
            decreaseFontSize();
        }
        event->accept();
        return;
    }
    QFrame::wheelEvent(event);
}

void PopupAnnotationWidget::dragEnterEvent(QDragEnterEvent* event)
{
    if (!m_built || !m_dropHandlers || !event->mimeData()->hasUrls()) {
        event->ignore();
        return;
    }
    for (const QUrl& url : event->mimeData()->urls()) {
        if (url.isLocalFile() && m_dropHandlers->canHandle(url.toLocalFile())) {
            event->acceptProposedAction();
            return;
        }
    }
    event->ignore();
}

void PopupAnnotationWidget::dropEvent(QDropEvent* event)
{
    if (!m_built || !m_dropHandlers || !event->mimeData()->hasUrls()) {
        qDebug() << "PopupAnnotationWidget: Unsupported drop data";
        event->ignore();
        return;
    }

    MarkupAnnotation* popup = m_session->popupAnnotation();
    bool consumed = false;
    for (const QUrl& url : event->mimeData()->urls()) {
        if (!url.isLocalFile()) {
            continue;
        }
        if (m_dropHandlers->dispatch(url.toLocalFile(), popup)) {
            consumed = true;
        }
    }

    if (!consumed) {
        event->ignore();
        return;
    }
    event->acceptProposedAction();
    refreshSelectionDisplay();
}

void PopupAnnotationWidget::contextMenuEvent(QContextMenuEvent* event)
{
    if (!m_built) {
        QFrame::contextMenuEvent(event);
        return;
    }

    const bool dark = palette().color(QPalette::Window).lightness() < 128;
    QMenu menu(this);
    ThemeColors::styleMenu(&menu, dark);

    const MarkupAnnotation* selected = m_session->selectedAnnotation();
    const bool editable = selected && !selected->isReadOnly();

    QAction* replyAction = menu.addAction(tr("Reply"));
    replyAction->setEnabled(selected != nullptr);
    connect(replyAction, &QAction::triggered, this, &PopupAnnotationWidget::replyToSelected);

    QAction* deleteAction = menu.addAction(tr("Delete"));
    deleteAction->setEnabled(editable);
    connect(deleteAction, &QAction::triggered, this, [this]() { deleteSelected(false); });

    QAction* deleteThreadAction = menu.addAction(tr("Delete Thread"));
    deleteThreadAction->setEnabled(editable);
    connect(deleteThreadAction, &QAction::triggered, this, [this]() { deleteSelected(true); });

    menu.addSeparator();

    QMenu* statusMenu = menu.addMenu(tr("Set Status"));
    ThemeColors::styleMenu(statusMenu, dark);
    const QList<QPair<QString, QString>> states = {
        { tr("Accepted"),  MarkupAnnotation::STATE_REVIEW_ACCEPTED },
        { tr("Rejected"),  MarkupAnnotation::STATE_REVIEW_REJECTED },
        { tr("Cancelled"), MarkupAnnotation::STATE_REVIEW_CANCELLED },
        { tr("Completed"), MarkupAnnotation::STATE_REVIEW_COMPLETED },
        { tr("None"),      MarkupAnnotation::STATE_REVIEW_NONE },
    };
    for (const auto& state : states) {
        QAction* action = statusMenu->addAction(state.first);
        const QString value = state.second;
        connect(action, &QAction::triggered, this, [this, value]() { setStatusOfSelected(value); });
    }
    statusMenu->setEnabled(selected != nullptr);

    menu.addSeparator();
    QAction* minimizeAction = menu.addAction(tr("Minimize"));
    connect(minimizeAction, &QAction::triggered, this, &PopupAnnotationWidget::minimize);

    menu.exec(event->globalPos());
}
