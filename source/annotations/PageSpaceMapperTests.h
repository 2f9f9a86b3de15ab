#ifndef PAGESPACEMAPPERTESTS_H
#define PAGESPACEMAPPERTESTS_H

#include <QObject>
#include <QRegularExpression>
#include <QTest>

#include "PageSpaceMapper.h"

/**
 * Unit tests for PageSpaceMapper.
 * Run with: markupview --test-mapper
 */
class PageSpaceMapperTests : public QObject {
    Q_OBJECT

private:
    static bool nearlyEqual(const QRectF& a, const QRectF& b, qreal epsilon = 1e-6) {
        return qAbs(a.left() - b.left()) < epsilon && qAbs(a.top() - b.top()) < epsilon &&
               qAbs(a.width() - b.width()) < epsilon && qAbs(a.height() - b.height()) < epsilon;
    }

private slots:
    void testRoundTrip_data() {
        QTest::addColumn<QRectF>("boundary");
        QTest::addColumn<int>("rotation");
        QTest::addColumn<qreal>("zoom");

        const QVector<QRectF> boundaries = { QRectF(0, 0, 612, 792), QRectF(10, 20, 600, 800) };
        const QVector<int> rotations = { 0, 90, 180, 270 };
        const QVector<qreal> zooms = { 0.5, 1.0, 2.5 };

        for (const QRectF& boundary : boundaries) {
            for (int rotation : rotations) {
                for (qreal zoom : zooms) {
                    const QString name = QString("box%1 rot%2 zoom%3")
                                             .arg(boundary.left()).arg(rotation).arg(zoom);
                    QTest::newRow(qPrintable(name)) << boundary << rotation << zoom;
                }
            }
        }
    }

    void testRoundTrip() {
        QFETCH(QRectF, boundary);
        QFETCH(int, rotation);
        QFETCH(qreal, zoom);

        const QRectF pageRect(100, 200, 50, 30);
        const QPointF offset(20, 35);

        const QRectF view = PageSpaceMapper::toViewSpace(pageRect, boundary, rotation, zoom, offset);
        const QRectF back = PageSpaceMapper::toPageSpace(view, boundary, rotation, zoom, offset);
        QVERIFY2(nearlyEqual(back, pageRect),
                 qPrintable(QString("got %1,%2 %3x%4").arg(back.x()).arg(back.y())
                                .arg(back.width()).arg(back.height())));
    }

    void testUnrotatedMapping() {
        const QRectF boundary(0, 0, 612, 792);

        // Top-left 100x100 corner of the page (PDF y grows upwards)
        const QRectF view = PageSpaceMapper::toViewSpace(QRectF(0, 692, 100, 100), boundary,
                                                         0, 1.0, QPointF(20, 20));
        QVERIFY(nearlyEqual(view, QRectF(20, 20, 100, 100)));

        const QRectF zoomed = PageSpaceMapper::toViewSpace(QRectF(0, 692, 100, 100), boundary,
                                                           0, 2.0, QPointF());
        QVERIFY(nearlyEqual(zoomed, QRectF(0, 0, 200, 200)));
    }

    void testQuarterTurnMapping() {
        const QRectF boundary(0, 0, 612, 792);

        // Clockwise: the top-left corner of the page ends up top-right
        const QRectF view = PageSpaceMapper::toViewSpace(QRectF(0, 692, 100, 100), boundary,
                                                         90, 1.0, QPointF());
        QVERIFY(nearlyEqual(view, QRectF(692, 0, 100, 100)));

        const QRectF upsideDown = PageSpaceMapper::toViewSpace(QRectF(0, 692, 100, 100), boundary,
                                                               180, 1.0, QPointF());
        QVERIFY(nearlyEqual(upsideDown, QRectF(512, 692, 100, 100)));

        const QRectF counter = PageSpaceMapper::toViewSpace(QRectF(0, 692, 100, 100), boundary,
                                                            270, 1.0, QPointF());
        QVERIFY(nearlyEqual(counter, QRectF(0, 512, 100, 100)));
    }

    void testBoundaryOffset() {
        // A CropBox that does not start at the origin
        const QRectF boundary(50, 40, 500, 700);
        const QRectF view = PageSpaceMapper::toViewSpace(QRectF(50, 640, 100, 100), boundary,
                                                         0, 1.0, QPointF());
        QVERIFY(nearlyEqual(view, QRectF(0, 0, 100, 100)));
    }

    void testViewSize() {
        const QRectF boundary(0, 0, 612, 792);
        QCOMPARE(PageSpaceMapper::viewSize(boundary, 0, 1.0), QSizeF(612, 792));
        QCOMPARE(PageSpaceMapper::viewSize(boundary, 90, 1.0), QSizeF(792, 612));
        QCOMPARE(PageSpaceMapper::viewSize(boundary, 180, 2.0), QSizeF(1224, 1584));
        QCOMPARE(PageSpaceMapper::viewSize(boundary, 270, 0.5), QSizeF(396, 306));
    }

    void testNormalizeRotation() {
        QCOMPARE(PageSpaceMapper::normalizeRotation(0), 0);
        QCOMPARE(PageSpaceMapper::normalizeRotation(360), 0);
        QCOMPARE(PageSpaceMapper::normalizeRotation(450), 90);
        QCOMPARE(PageSpaceMapper::normalizeRotation(-90), 270);
        QCOMPARE(PageSpaceMapper::normalizeRotation(-540), 180);
    }

    void testRotationSnapping() {
        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("not a quarter turn"));
        QCOMPARE(PageSpaceMapper::normalizeRotation(100), 90);

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("not a quarter turn"));
        QCOMPARE(PageSpaceMapper::normalizeRotation(359), 0);

        QTest::ignoreMessage(QtWarningMsg, QRegularExpression("not a quarter turn"));
        QCOMPARE(PageSpaceMapper::normalizeRotation(-100), 270);
    }

    void testInverseIsInverse() {
        const QRectF boundary(0, 0, 612, 792);
        const QTransform forward = PageSpaceMapper::pageTransform(boundary, 270, 1.5);
        const QTransform inverse = PageSpaceMapper::inversePageTransform(boundary, 270, 1.5);
        const QPointF p(123.5, 456.25);
        const QPointF q = inverse.map(forward.map(p));
        QVERIFY(qAbs(q.x() - p.x()) < 1e-9);
        QVERIFY(qAbs(q.y() - p.y()) < 1e-9);
    }
};

#endif // PAGESPACEMAPPERTESTS_H
