#ifndef POPUPGEOMETRYTESTS_H
#define POPUPGEOMETRYTESTS_H

#include <QObject>
#include <QTest>

#include "AnnotationTestFixtures.h"
#include "PopupGeometry.h"

/**
 * Unit tests for PopupGeometry (placement, clamping, page-space sync).
 * Run with: markupview --test-geometry
 */
class PopupGeometryTests : public QObject {
    Q_OBJECT

private slots:
    void testMinimumSize() {
        QCOMPARE(PopupGeometry::ensureMinimumSize(QRect(10, 10, 100, 100)),
                 QRect(10, 10, PopupGeometry::DEFAULT_WIDTH, PopupGeometry::DEFAULT_HEIGHT));
        QCOMPARE(PopupGeometry::ensureMinimumSize(QRect(0, 0, 300, 100)),
                 QRect(0, 0, PopupGeometry::DEFAULT_WIDTH, PopupGeometry::DEFAULT_HEIGHT));
        QCOMPARE(PopupGeometry::ensureMinimumSize(QRect(5, 6, 300, 200)), QRect(5, 6, 300, 200));
    }

    void testMoveIsClampedToView() {
        FixedViewGeometry view;
        view.state.documentViewSize = QSize(800, 600);
        PopupGeometry geometry(&view, 0);

        const QRect current(100, 100, 215, 150);

        QCOMPARE(geometry.constrainBounds(current, QRect(-50, 100, 215, 150), true),
                 QRect(0, 100, 215, 150));
        QCOMPARE(geometry.constrainBounds(current, QRect(700, 100, 215, 150), true),
                 QRect(585, 100, 215, 150));
        QCOMPARE(geometry.constrainBounds(current, QRect(100, 580, 215, 150), true),
                 QRect(100, 450, 215, 150));
        QCOMPARE(geometry.constrainBounds(current, QRect(100, -10, 215, 150), true),
                 QRect(100, 0, 215, 150));
    }

    void testResizeShrinksInsteadOfOverflowing() {
        FixedViewGeometry view;
        view.state.documentViewSize = QSize(800, 600);
        PopupGeometry geometry(&view, 0);

        const QRect current(600, 100, 215, 150);
        QCOMPARE(geometry.constrainBounds(current, QRect(600, 100, 300, 150), true),
                 QRect(600, 100, 200, 150));

        const QRect lower(100, 400, 215, 150);
        QCOMPARE(geometry.constrainBounds(lower, QRect(100, 400, 215, 300), true),
                 QRect(100, 400, 215, 200));
    }

    void testNoClampWithoutMousePress() {
        FixedViewGeometry view;
        view.state.documentViewSize = QSize(800, 600);
        PopupGeometry geometry(&view, 0);

        const QRect requested(-50, 900, 215, 150);
        QCOMPARE(geometry.constrainBounds(QRect(0, 0, 215, 150), requested, false), requested);
    }

    void testRefreshRoundTrip() {
        FixedViewGeometry view;
        view.state.rotation = 90;
        view.state.zoom = 2.0;
        PopupGeometry geometry(&view, 0);

        MarkupAnnotation popup(MarkupAnnotation::Subtype::Popup);
        popup.rect = QRectF(100, 500, 200, 120);

        const QRect bounds = geometry.refreshDirtyBounds(popup);
        QCOMPARE(bounds, QRect(1020, 220, 240, 400));

        const QRectF back = geometry.refreshAnnotationRect(bounds);
        QVERIFY(qAbs(back.x() - 100) < 1e-6);
        QVERIFY(qAbs(back.y() - 500) < 1e-6);
        QVERIFY(qAbs(back.width() - 200) < 1e-6);
        QVERIFY(qAbs(back.height() - 120) < 1e-6);
    }

    void testSyncAnnotationRect() {
        FixedViewGeometry view;
        PopupGeometry geometry(&view, 0);

        MarkupAnnotation popup(MarkupAnnotation::Subtype::Popup);
        popup.rect = QRectF(100, 500, 200, 120);

        const QRect bounds = geometry.refreshDirtyBounds(popup);
        QVERIFY(!geometry.syncAnnotationRect(popup, bounds));

        QVERIFY(geometry.syncAnnotationRect(popup, bounds.translated(10, 0)));
        QVERIFY(qAbs(popup.rect.x() - 110) < 1e-6);
    }

    void testUnknownPageGivesEmptyRects() {
        FixedViewGeometry view;
        PopupGeometry geometry(&view, 3);

        MarkupAnnotation popup(MarkupAnnotation::Subtype::Popup);
        popup.rect = QRectF(100, 500, 200, 120);
        QVERIFY(geometry.refreshDirtyBounds(popup).isNull());
        QVERIFY(geometry.refreshAnnotationRect(QRect(0, 0, 10, 10)).isNull());

        PopupGeometry detached(nullptr, 0);
        QVERIFY(detached.refreshDirtyBounds(popup).isNull());
    }

    void testBoundsRelativeToParent() {
        FixedViewGeometry view;
        PopupGeometry geometry(&view, 0);
        QCOMPARE(geometry.boundsRelativeToParent(QPoint(5, 7)),
                 QRect(25, 27, PopupGeometry::DEFAULT_WIDTH, PopupGeometry::DEFAULT_HEIGHT));
    }

    void testFontSizeFollowsZoom() {
        FixedViewGeometry view;
        view.state.zoom = 2.0;
        PopupGeometry geometry(&view, 0);
        QCOMPARE(geometry.scaledFontSize(12.0), 24.0);
    }
};

#endif // POPUPGEOMETRYTESTS_H
