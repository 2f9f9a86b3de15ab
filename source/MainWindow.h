#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <memory>

#include "annotations/FileDropHandlerRegistry.h"
#include "core/AnnotationSettings.h"

class QAction;
class QLabel;
class QScrollArea;
class QToolBar;
class AnnotationController;
class MarkupAnnotation;
class MuPdfAnnotationStore;
class PageWidget;
class PdfProvider;

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    static constexpr qreal MIN_ZOOM = 0.25;
    static constexpr qreal MAX_ZOOM = 8.0;
    static constexpr qreal ZOOM_STEP = 1.25;

    /**
     * @brief Construct MainWindow.
     * @param settings Annotation settings loaded in main().
     * @param parent Parent widget.
     */
    explicit MainWindow(const AnnotationSettings& settings, QWidget* parent = nullptr);
    ~MainWindow() override;

    /**
     * @brief Open a PDF file, replacing the current document.
     * @return True if the file was opened.
     */
    bool openPdf(const QString& filePath);

    bool hasDocument() const;

    // ===== Navigation =====
    void goToPage(int pageIndex);
    int currentPage() const { return m_currentPage; }
    int pageCount() const;

    // ===== View =====
    void setZoom(qreal zoom);
    qreal zoom() const { return m_zoom; }
    void setRotation(int degrees);
    int rotation() const { return m_rotation; }

public slots:
    void showOpenPdfDialog();
    void previousPage();
    void nextPage();
    void zoomIn();
    void zoomOut();
    void rotateClockwise();
    void setPopupsVisible(bool visible);
    bool saveDocument();
    bool saveDocumentAs();

protected:
    void closeEvent(QCloseEvent* event) override;

private:
    void setupUi();
    void setupShortcuts();
    void registerDropHandlers();
    void closeDocument();
    void updateTitle();
    void updatePageLabel();
    void loadViewerSettings();
    void saveViewerSettings() const;

    /**
     * @brief Append the text of a dropped file to the popup's parent annotation.
     */
    bool appendFileText(const QString& filePath, MarkupAnnotation* popup);

    AnnotationSettings m_settings;
    FileDropHandlerRegistry m_dropHandlers;

    // Document
    std::unique_ptr<MuPdfAnnotationStore> m_store;
    std::unique_ptr<PdfProvider> m_pdf;
    AnnotationController* m_controller = nullptr;

    // UI
    QToolBar* m_toolbar = nullptr;
    QScrollArea* m_scrollArea = nullptr;
    PageWidget* m_pageWidget = nullptr;
    QLabel* m_pageLabel = nullptr;
    QAction* m_showPopupsAction = nullptr;

    int m_currentPage = 0;
    qreal m_zoom = 1.0;
    int m_rotation = 0;
    QString m_lastDirectory;
};

#endif // MAINWINDOW_H
