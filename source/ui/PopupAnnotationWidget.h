#ifndef POPUPANNOTATIONWIDGET_H
#define POPUPANNOTATIONWIDGET_H

// ============================================================================
// PopupAnnotationWidget - On-page comment window of a markup annotation
// ============================================================================
// Shows the comment thread of one popup annotation:
//   ┌───────────────────────────────┐
//   │ Author             [P] [-]    │  header (title, privacy, minimize)
//   │ ┌───────────────────────────┐ │
//   │ │ Author - First comment    │ │  reply tree (hidden without replies)
//   │ │   └ Reviewer - Reply      │ │
//   │ └───────────────────────────┘ │
//   │ 2024-03-01 10:12              │  creation date of the selection
//   │ ┌───────────────────────────┐ │
//   │ │ text of the selection     │ │  editable text area
//   │ └───────────────────────────┘ │
//   └───────────────────────────────┘
//
// The widget only does presentation. Thread state and edits live in
// CommentEditSession, bus handling in CommentThreadSynchronizer and
// placement in PopupGeometry.
// ============================================================================

#include <QFrame>

#include "../annotations/AnnotationRef.h"
#include "../annotations/PopupGeometry.h"
#include "../core/AnnotationSettings.h"

class QLabel;
class QToolButton;
class QTreeWidget;
class QTreeWidgetItem;
class QPlainTextEdit;
class QVBoxLayout;

class AnnotationController;
class CommentEditSession;
class CommentThreadNode;
class CommentThreadSynchronizer;
class FileDropHandlerRegistry;

class PopupAnnotationWidget : public QFrame {
    Q_OBJECT

public:
    static constexpr qreal MIN_FONT_SIZE = 6.0;
    static constexpr qreal MAX_FONT_SIZE = 48.0;

    /**
     * @brief Build the comment window of a popup annotation.
     * @param controller Mutation entry point and event bus (not owned).
     * @param popupRef The popup annotation.
     * @param settings User name and privacy defaults.
     * @param geometry View geometry of the hosting page view (not owned).
     * @param dropHandlers Handlers for dropped files (not owned, may be nullptr).
     *
     * If the popup or its parent annotation cannot be resolved the widget
     * stays empty and hidden; isBuilt() returns false.
     */
    PopupAnnotationWidget(AnnotationController* controller,
                          const AnnotationRef& popupRef,
                          const AnnotationSettings& settings,
                          const ViewGeometryProvider* geometry,
                          const FileDropHandlerRegistry* dropHandlers,
                          QWidget* parent = nullptr);
    ~PopupAnnotationWidget() override;

    bool isBuilt() const { return m_built; }
    const AnnotationRef& popupRef() const { return m_popupRef; }
    CommentEditSession* session() const { return m_session; }
    CommentThreadSynchronizer* synchronizer() const { return m_synchronizer; }

    /**
     * @brief True if the popup belongs to a top-level annotation (not a reply).
     */
    bool isTopLevelPopup() const;

    // ===== Geometry =====

    /**
     * @brief Move/resize the widget to the popup's page rectangle under the current view.
     */
    void refreshDirtyBounds();

    /**
     * @brief Write the widget bounds back to the popup's page rectangle.
     */
    void refreshAnnotationRect();

    /**
     * @brief Place the popup at a page-local view point with the default size.
     */
    void setBoundsRelativeToParent(const QPoint& pagePoint);

    /**
     * @brief Show or hide the popup and persist its /Open state.
     */
    void showPopup(bool visible);

    void setVisible(bool visible) override;

    // ===== Font size =====
    void increaseFontSize();
    void decreaseFontSize();
    void resetFontSize();

    /**
     * @brief Black or white, whichever reads better on the background.
     */
    static QColor contrastColor(const QColor& background);

    // ===== Child widgets (tests) =====
    QTreeWidget* commentTree() const { return m_commentTree; }
    QPlainTextEdit* textArea() const { return m_textArea; }
    QLabel* titleLabel() const { return m_titleLabel; }
    QLabel* creationLabel() const { return m_creationLabel; }
    QToolButton* privacyButton() const { return m_privacyButton; }
    QToolButton* minimizeButton() const { return m_minimizeButton; }

public slots:
    void replyToSelected();
    void deleteSelected(bool wholeThread);
    void setStatusOfSelected(const QString& status);
    void minimize();

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void dragEnterEvent(QDragEnterEvent* event) override;
    void dropEvent(QDropEvent* event) override;
    void contextMenuEvent(QContextMenuEvent* event) override;

private slots:
    void onThreadRebuilt(bool hasReplies);
    void onSessionSelectionChanged();
    void onTreeSelectionChanged();
    void onTextChanged();
    void onPrivacyToggled(bool checked);
    void onDisplayRefreshRequested();
    void onSummaryReceived(const QString& text, bool isPrivate);

private:
    enum class DragMode { None, Move, Resize };

    void setupUI();
    void setupShortcuts();
    void populateTree();
    void addTreeItems(QTreeWidgetItem* parentItem, const CommentThreadNode* node);
    void refreshSelectionDisplay();
    void applyColors();
    void applyFontSizes();
    void changeFontSize(qreal delta);
    bool canInteract() const;

    AnnotationController* m_controller = nullptr;
    AnnotationRef m_popupRef;
    AnnotationSettings m_settings;
    PopupGeometry m_geometry;
    const FileDropHandlerRegistry* m_dropHandlers = nullptr;

    CommentEditSession* m_session = nullptr;               // Child object
    CommentThreadSynchronizer* m_synchronizer = nullptr;   // Child object
    bool m_built = false;

    // Header
    QWidget* m_header = nullptr;
    QLabel* m_titleLabel = nullptr;
    QToolButton* m_privacyButton = nullptr;
    QToolButton* m_minimizeButton = nullptr;

    // Body
    QVBoxLayout* m_layout = nullptr;
    QTreeWidget* m_commentTree = nullptr;
    QLabel* m_creationLabel = nullptr;
    QPlainTextEdit* m_textArea = nullptr;

    QColor m_backgroundColor;

    // Drag state
    DragMode m_dragMode = DragMode::None;
    QPoint m_pressOffset;           ///< Press position inside the widget
    QRect m_pressGeometry;          ///< Geometry when the press started
    bool m_mousePressed = false;
};

#endif // POPUPANNOTATIONWIDGET_H
