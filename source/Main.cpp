// ============================================================================
// MarkupView - Main Entry Point
// ============================================================================

#include <QApplication>
#include <QDebug>
#include <QJsonDocument>
#include <QLocale>
#include <QSettings>
#include <QStandardPaths>
#include <QTest>
#include <QTextStream>
#include <QTranslator>

#include "MainWindow.h"
#include "core/AnnotationSettings.h"
#include "pdf/MuPdfAnnotationStore.h"

#include "annotations/CommentEditSessionTests.h"
#include "annotations/CommentThreadSynchronizerTests.h"
#include "annotations/CommentThreadTests.h"
#include "annotations/PageSpaceMapperTests.h"
#include "annotations/PopupGeometryTests.h"
#include "ui/PopupAnnotationWidgetTests.h"

// ============================================================================
// Translation Loading
// ============================================================================

static void loadTranslations(QApplication& app, QTranslator& translator)
{
    QSettings settings("MarkupView", "App");
    bool useSystemLanguage = settings.value("useSystemLanguage", true).toBool();

    QString langCode;
    if (useSystemLanguage) {
        langCode = QLocale::system().name().section('_', 0, 0);
    } else {
        langCode = settings.value("languageOverride", "en").toString();
    }

    QStringList translationPaths = {
        QCoreApplication::applicationDirPath(),
        QCoreApplication::applicationDirPath() + "/translations",
        "/usr/share/markupview/translations",
        "/usr/local/share/markupview/translations",
        QStandardPaths::locate(QStandardPaths::GenericDataLocation,
                               "markupview/translations", QStandardPaths::LocateDirectory)
    };

    for (const QString& path : translationPaths) {
        if (!path.isEmpty() && translator.load(path + "/app_" + langCode + ".qm")) {
            app.installTranslator(&translator);
            break;
        }
    }
}

// ============================================================================
// Test Runners
// ============================================================================

/**
 * @brief Run one QtTest suite, or all of them for "all".
 * @return 0 when every selected suite passed.
 *
 * Only argv[0] is forwarded so our own switches don't reach QTest's parser.
 */
static int runTests(const QString& testType, char* programName)
{
    char* testArgv[] = { programName };
    const int testArgc = 1;
    const bool all = (testType == "all");
    int failures = 0;
    int suites = 0;

    if (all || testType == "thread") {
        CommentThreadTests tests;
        failures += QTest::qExec(&tests, testArgc, testArgv);
        ++suites;
    }
    if (all || testType == "mapper") {
        PageSpaceMapperTests tests;
        failures += QTest::qExec(&tests, testArgc, testArgv);
        ++suites;
    }
    if (all || testType == "geometry") {
        PopupGeometryTests tests;
        failures += QTest::qExec(&tests, testArgc, testArgv);
        ++suites;
    }
    if (all || testType == "sync") {
        CommentThreadSynchronizerTests tests;
        failures += QTest::qExec(&tests, testArgc, testArgv);
        ++suites;
    }
    if (all || testType == "session") {
        CommentEditSessionTests tests;
        failures += QTest::qExec(&tests, testArgc, testArgv);
        ++suites;
    }
    if (all || testType == "popup") {
        PopupAnnotationWidgetTests tests;
        failures += QTest::qExec(&tests, testArgc, testArgv);
        ++suites;
    }

    if (suites == 0) {
        qWarning() << "MarkupView: Unknown test suite" << testType;
        return 1;
    }
    return failures == 0 ? 0 : 1;
}

/**
 * @brief Print every annotation of a PDF as JSON on stdout.
 */
static int dumpAnnotations(const QString& pdfPath)
{
    MuPdfAnnotationStore store(pdfPath);
    if (!store.isValid()) {
        qWarning() << "MarkupView: Cannot open" << pdfPath;
        return 1;
    }

    QTextStream out(stdout);
    out << QJsonDocument(store.toJson()).toJson(QJsonDocument::Indented);
    out.flush();
    return 0;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    app.setOrganizationName("MarkupView");
    app.setApplicationName("App");

    QTranslator translator;
    loadTranslations(app, translator);

    // ========== Parse Command Line Arguments ==========
    QString inputFile;
    QString testToRun;
    QString dumpFile;
    QString userOverride;
    int startPage = -1;
    qreal startZoom = 0.0;
    int startRotation = -1;

    for (int i = 1; i < argc; ++i) {
        QString arg = QString::fromLocal8Bit(argv[i]);

        if (arg == "--page" && i + 1 < argc) {
            startPage = QString::fromLocal8Bit(argv[++i]).toInt() - 1;
        } else if (arg == "--zoom" && i + 1 < argc) {
            startZoom = QString::fromLocal8Bit(argv[++i]).toDouble();
        } else if (arg == "--rotate" && i + 1 < argc) {
            startRotation = QString::fromLocal8Bit(argv[++i]).toInt();
        } else if (arg == "--user" && i + 1 < argc) {
            userOverride = QString::fromLocal8Bit(argv[++i]);
        } else if (arg == "--dump-annotations" && i + 1 < argc) {
            dumpFile = QString::fromLocal8Bit(argv[++i]);
        } else if (arg.startsWith("--test-")) {
            testToRun = arg.mid(7);
        } else if (!arg.startsWith("--") && inputFile.isEmpty()) {
            inputFile = arg;
        } else {
            qWarning() << "MarkupView: Ignoring unknown argument" << arg;
        }
    }

    // Handle test commands
    if (!testToRun.isEmpty()) {
        return runTests(testToRun, argv[0]);
    }

    if (!dumpFile.isEmpty()) {
        return dumpAnnotations(dumpFile);
    }

    // ========== Launch Application ==========
    AnnotationSettings settings = AnnotationSettings::load();
    if (!userOverride.isEmpty()) {
        settings.userName = userOverride;
    }

    MainWindow w(settings);
    w.show();

    if (!inputFile.isEmpty() && w.openPdf(inputFile)) {
        if (startPage >= 0) {
            w.goToPage(startPage);
        }
        if (startZoom > 0.0) {
            w.setZoom(startZoom);
        }
        if (startRotation >= 0) {
            w.setRotation(startRotation);
        }
    }

    return app.exec();
}
