#include "MainWindow.h"

#include "annotations/AnnotationController.h"
#include "pdf/MuPdfAnnotationStore.h"
#include "pdf/PdfProvider.h"
#include "viewport/PageWidget.h"

#include <QAction>
#include <QCloseEvent>
#include <QDebug>
#include <QFile>
#include <QFileDialog>
#include <QFileInfo>
#include <QGuiApplication>
#include <QLabel>
#include <QMessageBox>
#include <QScreen>
#include <QScrollArea>
#include <QSettings>
#include <QShortcut>
#include <QStatusBar>
#include <QToolBar>

MainWindow::MainWindow(const AnnotationSettings& settings, QWidget* parent)
    : QMainWindow(parent)
    , m_settings(settings)
{
    setWindowTitle(tr("MarkupView"));

    QScreen* screen = QGuiApplication::primaryScreen();
    if (screen) {
        resize(screen->availableGeometry().size() * 0.75);
    }

    loadViewerSettings();
    registerDropHandlers();
    setupUi();
    setupShortcuts();
    updateTitle();
    updatePageLabel();
}

MainWindow::~MainWindow()
{
    closeDocument();
}

// ============================================================================
// UI Setup
// ============================================================================

void MainWindow::setupUi()
{
    m_toolbar = addToolBar(tr("Main"));
    m_toolbar->setMovable(false);

    QAction* openAction = m_toolbar->addAction(tr("Open"));
    openAction->setToolTip(tr("Open PDF (Ctrl+O)"));
    connect(openAction, &QAction::triggered, this, &MainWindow::showOpenPdfDialog);

    QAction* saveAction = m_toolbar->addAction(tr("Save"));
    saveAction->setToolTip(tr("Save (Ctrl+S)"));
    connect(saveAction, &QAction::triggered, this, &MainWindow::saveDocument);

    QAction* saveAsAction = m_toolbar->addAction(tr("Save As"));
    connect(saveAsAction, &QAction::triggered, this, &MainWindow::saveDocumentAs);

    m_toolbar->addSeparator();

    QAction* prevAction = m_toolbar->addAction(tr("Previous"));
    connect(prevAction, &QAction::triggered, this, &MainWindow::previousPage);
    QAction* nextAction = m_toolbar->addAction(tr("Next"));
    connect(nextAction, &QAction::triggered, this, &MainWindow::nextPage);

    m_toolbar->addSeparator();

    QAction* zoomOutAction = m_toolbar->addAction(tr("Zoom Out"));
    connect(zoomOutAction, &QAction::triggered, this, &MainWindow::zoomOut);
    QAction* zoomInAction = m_toolbar->addAction(tr("Zoom In"));
    connect(zoomInAction, &QAction::triggered, this, &MainWindow::zoomIn);
    QAction* rotateAction = m_toolbar->addAction(tr("Rotate"));
    connect(rotateAction, &QAction::triggered, this, &MainWindow::rotateClockwise);

    m_toolbar->addSeparator();

    m_showPopupsAction = m_toolbar->addAction(tr("Show Comments"));
    m_showPopupsAction->setCheckable(true);
    connect(m_showPopupsAction, &QAction::toggled, this, &MainWindow::setPopupsVisible);

    m_pageWidget = new PageWidget();
    m_pageWidget->setZoom(m_zoom);
    m_pageWidget->setUserRotation(m_rotation);

    m_scrollArea = new QScrollArea(this);
    m_scrollArea->setWidget(m_pageWidget);
    m_scrollArea->setWidgetResizable(false);
    m_scrollArea->setAlignment(Qt::AlignCenter);
    setCentralWidget(m_scrollArea);

    m_pageLabel = new QLabel(this);
    statusBar()->addPermanentWidget(m_pageLabel);
}

void MainWindow::setupShortcuts()
{
    QShortcut* openShortcut = new QShortcut(QKeySequence::Open, this);
    openShortcut->setContext(Qt::ApplicationShortcut);
    connect(openShortcut, &QShortcut::activated, this, &MainWindow::showOpenPdfDialog);

    QShortcut* saveShortcut = new QShortcut(QKeySequence::Save, this);
    saveShortcut->setContext(Qt::ApplicationShortcut);
    connect(saveShortcut, &QShortcut::activated, this, &MainWindow::saveDocument);

    QShortcut* prevShortcut = new QShortcut(QKeySequence(Qt::Key_PageUp), this);
    connect(prevShortcut, &QShortcut::activated, this, &MainWindow::previousPage);

    QShortcut* nextShortcut = new QShortcut(QKeySequence(Qt::Key_PageDown), this);
    connect(nextShortcut, &QShortcut::activated, this, &MainWindow::nextPage);

    QShortcut* rotateShortcut = new QShortcut(QKeySequence(Qt::CTRL | Qt::Key_R), this);
    connect(rotateShortcut, &QShortcut::activated, this, &MainWindow::rotateClockwise);
}

void MainWindow::registerDropHandlers()
{
    const auto appendText = [this](const QString& path, MarkupAnnotation* popup) {
        return appendFileText(path, popup);
    };
    m_dropHandlers.registerHandler("txt", appendText);
    m_dropHandlers.registerHandler("md", appendText);
}

bool MainWindow::appendFileText(const QString& filePath, MarkupAnnotation* popup)
{
    if (!m_controller || !popup) {
        return false;
    }
    MarkupAnnotation* parent = m_controller->store()->annotation(popup->parentRef);
    if (!parent) {
        qDebug() << "MainWindow: Dropped file has no annotation to go to";
        return false;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "MainWindow: Cannot read dropped file" << filePath << file.errorString();
        return false;
    }
    const QString text = QString::fromUtf8(file.readAll()).trimmed();
    if (text.isEmpty()) {
        return false;
    }

    parent->contents = parent->contents.isEmpty() ? text : parent->contents + "\n" + text;
    parent->touch();
    m_controller->updateAnnotation(parent);
    return true;
}

// ============================================================================
// Document
// ============================================================================

bool MainWindow::hasDocument() const
{
    return m_store && m_store->isValid();
}

int MainWindow::pageCount() const
{
    return hasDocument() ? m_store->pageCount() : 0;
}

bool MainWindow::openPdf(const QString& filePath)
{
    auto store = std::make_unique<MuPdfAnnotationStore>(filePath);
    if (!store->isValid()) {
        QMessageBox::warning(this, tr("Open PDF"),
            tr("Could not open \"%1\".").arg(QFileInfo(filePath).fileName()));
        return false;
    }

    std::unique_ptr<PdfProvider> pdf = PdfProvider::create(filePath);
    if (!pdf) {
        // Annotations still work on a blank page
        qWarning() << "MainWindow: No renderer for" << filePath;
    } else if (pdf->isLocked()) {
        QMessageBox::warning(this, tr("Open PDF"), tr("The document is password protected."));
        return false;
    }

    closeDocument();

    m_store = std::move(store);
    m_pdf = std::move(pdf);
    m_controller = new AnnotationController(m_store.get(), this);

    m_pageWidget->setPdfProvider(m_pdf.get());
    m_pageWidget->setAnnotationController(m_controller, m_settings, &m_dropHandlers);

    m_lastDirectory = QFileInfo(filePath).absolutePath();
    m_currentPage = -1;
    goToPage(0);
    updateTitle();

    qDebug() << "MainWindow: Opened" << filePath << "with" << PdfProvider::backendName();
    return true;
}

void MainWindow::closeDocument()
{
    if (m_pageWidget) {
        m_pageWidget->setAnnotationController(nullptr, m_settings);
        m_pageWidget->setPdfProvider(nullptr);
    }
    delete m_controller;
    m_controller = nullptr;
    m_pdf.reset();
    m_store.reset();
    m_currentPage = 0;
}

void MainWindow::showOpenPdfDialog()
{
    const QString path = QFileDialog::getOpenFileName(this, tr("Open PDF"), m_lastDirectory,
                                                      tr("PDF Files (*.pdf)"));
    if (!path.isEmpty()) {
        openPdf(path);
    }
}

bool MainWindow::saveDocument()
{
    if (!hasDocument()) {
        return false;
    }
    if (!m_store->save()) {
        QMessageBox::warning(this, tr("Save"), tr("Could not save the document."));
        return false;
    }
    updateTitle();
    statusBar()->showMessage(tr("Saved"), 2000);
    return true;
}

bool MainWindow::saveDocumentAs()
{
    if (!hasDocument()) {
        return false;
    }
    QString path = QFileDialog::getSaveFileName(this, tr("Save PDF As"), m_store->filePath(),
                                                tr("PDF Files (*.pdf)"));
    if (path.isEmpty()) {
        return false;
    }
    if (!path.endsWith(".pdf", Qt::CaseInsensitive)) {
        path += ".pdf";
    }
    if (!m_store->save(path)) {
        QMessageBox::warning(this, tr("Save"), tr("Could not save \"%1\".").arg(path));
        return false;
    }
    updateTitle();
    return true;
}

// ============================================================================
// Navigation / View
// ============================================================================

void MainWindow::goToPage(int pageIndex)
{
    if (!hasDocument()) {
        return;
    }
    pageIndex = qBound(0, pageIndex, pageCount() - 1);
    if (pageIndex == m_currentPage) {
        return;
    }
    m_currentPage = pageIndex;
    m_pageWidget->setPage(pageIndex, m_store->pageBoundary(pageIndex),
                          m_store->pageRotation(pageIndex));
    if (m_showPopupsAction->isChecked()) {
        m_pageWidget->setPopupsVisible(true);
    }
    updatePageLabel();
}

void MainWindow::previousPage()
{
    goToPage(m_currentPage - 1);
}

void MainWindow::nextPage()
{
    goToPage(m_currentPage + 1);
}

void MainWindow::setZoom(qreal zoom)
{
    m_zoom = qBound(MIN_ZOOM, zoom, MAX_ZOOM);
    m_pageWidget->setZoom(m_zoom);
    updatePageLabel();
}

void MainWindow::zoomIn()
{
    setZoom(m_zoom * ZOOM_STEP);
}

void MainWindow::zoomOut()
{
    setZoom(m_zoom / ZOOM_STEP);
}

void MainWindow::setRotation(int degrees)
{
    m_pageWidget->setUserRotation(degrees);
    m_rotation = m_pageWidget->userRotation();
}

void MainWindow::rotateClockwise()
{
    setRotation(m_rotation + 90);
}

void MainWindow::setPopupsVisible(bool visible)
{
    m_pageWidget->setPopupsVisible(visible);
}

// ============================================================================
// Title / status
// ============================================================================

void MainWindow::updateTitle()
{
    if (!hasDocument()) {
        setWindowTitle(tr("MarkupView (%1)").arg(PdfProvider::backendName()));
        return;
    }
    QString name = m_pdf ? m_pdf->title() : QString();
    if (name.isEmpty()) {
        name = QFileInfo(m_store->filePath()).fileName();
    }
    setWindowTitle(tr("%1%2 - MarkupView (%3)")
                   .arg(name, m_store->isModified() ? "*" : "", PdfProvider::backendName()));
}

void MainWindow::updatePageLabel()
{
    if (!m_pageLabel) {
        return;
    }
    if (!hasDocument()) {
        m_pageLabel->clear();
        return;
    }
    m_pageLabel->setText(tr("Page %1 / %2   %3%")
                         .arg(m_currentPage + 1)
                         .arg(pageCount())
                         .arg(qRound(m_zoom * 100)));
}

// ============================================================================
// Settings
// ============================================================================

void MainWindow::loadViewerSettings()
{
    QSettings settings("MarkupView", "App");
    m_zoom = qBound(MIN_ZOOM, settings.value("viewer/zoom", 1.0).toReal(), MAX_ZOOM);
    m_rotation = settings.value("viewer/rotation", 0).toInt();
    m_lastDirectory = settings.value("viewer/lastDirectory").toString();
}

void MainWindow::saveViewerSettings() const
{
    QSettings settings("MarkupView", "App");
    settings.setValue("viewer/zoom", m_zoom);
    settings.setValue("viewer/rotation", m_rotation);
    settings.setValue("viewer/lastDirectory", m_lastDirectory);
    if (hasDocument()) {
        settings.setValue("viewer/lastFile", m_store->filePath());
    }
}

void MainWindow::closeEvent(QCloseEvent* event)
{
    if (hasDocument() && m_store->isModified()) {
        const auto answer = QMessageBox::question(this, tr("Unsaved Comments"),
            tr("Save the changes to the comments before closing?"),
            QMessageBox::Save | QMessageBox::Discard | QMessageBox::Cancel,
            QMessageBox::Save);
        if (answer == QMessageBox::Cancel) {
            event->ignore();
            return;
        }
        if (answer == QMessageBox::Save && !saveDocument()) {
            event->ignore();
            return;
        }
    }

    saveViewerSettings();
    m_settings.save();
    event->accept();
}
