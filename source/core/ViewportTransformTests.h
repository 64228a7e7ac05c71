#ifndef VIEWPORTTRANSFORMTESTS_H
#define VIEWPORTTRANSFORMTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include <QtMath>
#include <QWheelEvent>

#include "ViewportTransform.h"

/**
 * Unit tests for ViewportTransform.
 * Run with: spherocanvas_tests viewport
 */
class ViewportTransformTests : public QObject {
    Q_OBJECT

private:
    static bool near(const QPointF& a, const QPointF& b, qreal eps = 1e-6)
    {
        return qAbs(a.x() - b.x()) < eps && qAbs(a.y() - b.y()) < eps;
    }

    // On-screen overlap of the scaled image with the container along one axis
    static qreal overlap(qreal offset, qreal zoom, qreal imageExtent, qreal containerExtent)
    {
        const qreal left = offset * zoom;
        const qreal right = left + imageExtent * zoom;
        return qMin(right, containerExtent) - qMax(left, 0.0);
    }

private slots:
    void testDefaults() {
        ViewportTransform vt;
        QCOMPARE(vt.zoom(), 1.0);
        QCOMPARE(vt.offset(), QPointF(0, 0));
        QCOMPARE(vt.minZoom(), 0.1);
        QCOMPARE(vt.maxZoom(), 10.0);
    }

    void testCoordinateMapping() {
        ViewportTransform vt;
        Viewport v;
        v.zoom = 2.0;
        v.offset = QPointF(10, -5);
        vt.setViewport(v);

        QCOMPARE(vt.imageToScreen(QPointF(0, 0)), QPointF(20, -10));
        QCOMPARE(vt.screenToImage(QPointF(20, -10)), QPointF(0, 0));
        QVERIFY(near(vt.screenToImage(vt.imageToScreen(QPointF(123.5, 77.25))), QPointF(123.5, 77.25)));
    }

    void testWheelZoomKeepsCursorPointFixed() {
        ViewportTransform vt;
        vt.setContainerSize(QSizeF(800, 600));
        vt.setImageSize(QSizeF(800, 600));

        const QPointF cursor(400, 300);
        const QPointF imagePoint = vt.screenToImage(cursor);

        QSignalSpy zoomSpy(&vt, &ViewportTransform::zoomChanged);
        vt.handleWheel(-120, cursor);

        QVERIFY(qFuzzyCompare(vt.zoom(), 1.05));
        QCOMPARE(zoomSpy.count(), 1);
        QVERIFY(near(vt.imageToScreen(imagePoint), cursor));
    }

    void testWheelDirectionAndZero() {
        ViewportTransform vt;
        vt.setContainerSize(QSizeF(800, 600));
        vt.setImageSize(QSizeF(800, 600));

        vt.handleWheel(0, QPointF(100, 100));
        QCOMPARE(vt.zoom(), 1.0);
        QCOMPARE(vt.appliedWheelUpdates(), 0);

        vt.handleWheel(120, QPointF(100, 100));
        QVERIFY(qFuzzyCompare(vt.zoom(), 1.0 / 1.05));
    }

    void testWheelEventPixelDeltaOnly() {
        ViewportTransform vt;
        vt.setContainerSize(QSizeF(800, 600));
        vt.setImageSize(QSizeF(800, 600));

        const QPointF cursor(200, 150);
        const QPointF imagePoint = vt.screenToImage(cursor);

        // Touchpad scroll: no angle delta, pixels away from the user
        QWheelEvent event(cursor, cursor, QPoint(0, 30), QPoint(),
                          Qt::NoButton, Qt::NoModifier, Qt::ScrollUpdate, false);
        vt.handleWheel(&event);

        QVERIFY(event.isAccepted());
        QVERIFY(qFuzzyCompare(vt.zoom(), 1.05));
        QVERIFY(near(vt.imageToScreen(imagePoint), cursor));
    }

    void testWheelCoalescing() {
        EditorSettings settings;
        settings.frameIntervalMs = 16;
        ViewportTransform vt(settings);
        vt.setContainerSize(QSizeF(800, 600));
        vt.setImageSize(QSizeF(800, 600));

        QSignalSpy spy(&vt, &ViewportTransform::viewportChanged);
        for (int i = 0; i < 5; ++i) {
            vt.handleWheel(-120, QPointF(400, 300));
        }

        // Leading edge applied, the rest waits for the frame end
        QCOMPARE(vt.appliedWheelUpdates(), 1);
        QCOMPARE(spy.count(), 1);
        QVERIFY(vt.hasPendingWheelUpdate());

        QTRY_VERIFY(!vt.hasPendingWheelUpdate());
        QCOMPARE(vt.appliedWheelUpdates(), 2);
        QCOMPARE(spy.count(), 2);

        // No notch lost
        QVERIFY(qFuzzyCompare(vt.zoom(), qPow(1.05, 5)));

        // Idle frames emit nothing
        QTest::qWait(50);
        QCOMPARE(spy.count(), 2);
    }

    void testDirectMutationFlushesPendingWheel() {
        ViewportTransform vt;
        vt.setContainerSize(QSizeF(800, 600));
        vt.setImageSize(QSizeF(800, 600));

        vt.handleWheel(-120, QPointF(400, 300));
        vt.handleWheel(-120, QPointF(400, 300));
        QVERIFY(vt.hasPendingWheelUpdate());

        vt.panBy(QPointF(10, 0));
        QVERIFY(!vt.hasPendingWheelUpdate());
        QVERIFY(qFuzzyCompare(vt.zoom(), 1.05 * 1.05));

        // The frame end must not overwrite the pan
        const QPointF offset = vt.offset();
        QTest::qWait(40);
        QCOMPARE(vt.offset(), offset);
    }

    void testZoomBounds() {
        ViewportTransform vt;
        vt.setContainerSize(QSizeF(800, 600));
        vt.setImageSize(QSizeF(800, 600));

        vt.setZoom(100.0);
        QCOMPARE(vt.zoom(), vt.maxZoom());
        vt.zoomIn();
        QCOMPARE(vt.zoom(), vt.maxZoom());

        vt.setZoom(0.0001);
        QCOMPARE(vt.zoom(), vt.minZoom());
        vt.zoomOut();
        QCOMPARE(vt.zoom(), vt.minZoom());

        // Invalid values leave the zoom alone
        vt.setZoom(-3.0);
        QCOMPARE(vt.zoom(), vt.minZoom());
        vt.setZoom(qQNaN());
        QCOMPARE(vt.zoom(), vt.minZoom());
    }

    void testButtonZoomAroundCenter() {
        ViewportTransform vt;
        vt.setContainerSize(QSizeF(800, 600));
        vt.setImageSize(QSizeF(800, 600));

        const QPointF center(400, 300);
        const QPointF imageCenter = vt.screenToImage(center);

        vt.zoomIn();
        QVERIFY(qFuzzyCompare(vt.zoom(), 1.2));
        QVERIFY(near(vt.imageToScreen(imageCenter), center));

        vt.zoomOut();
        QVERIFY(qFuzzyCompare(vt.zoom(), 1.0));
    }

    void testCenterOnFitsImage() {
        ViewportTransform vt;
        vt.setContainerSize(QSizeF(1000, 800));
        vt.centerOn(QSizeF(500, 500));

        // Height constrains: 800 * 0.8 / 500
        QVERIFY(qFuzzyCompare(vt.zoom(), 1.28));
        QVERIFY(near(vt.imageToScreen(QPointF(0, 0)), QPointF(180, 80)));
        QVERIFY(near(vt.imageToScreen(QPointF(500, 500)), QPointF(820, 720)));

        vt.centerOn(QSizeF());
        QVERIFY(vt.viewport() == Viewport());
    }

    void testPanKeepsImageVisible() {
        ViewportTransform vt;
        const QSizeF container(800, 600);
        const QSizeF image(2000, 1500);
        vt.setContainerSize(container);
        vt.setImageSize(image);

        const QPointF pans[] = { QPointF(1e5, 1e5), QPointF(-1e5, -1e5), QPointF(1e5, -1e5), QPointF(-1e5, 1e5) };
        const qreal zooms[] = { 0.1, 0.5, 1.0, 4.0 };

        for (qreal zoom : zooms) {
            vt.setZoom(zoom);
            for (const QPointF& pan : pans) {
                vt.panBy(pan);
                const qreal z = vt.zoom();
                const qreal minX = qMin(0.25 * image.width() * z, container.width());
                const qreal minY = qMin(0.25 * image.height() * z, container.height());
                QVERIFY(overlap(vt.offset().x(), z, image.width(), container.width()) >= minX - 1e-6);
                QVERIFY(overlap(vt.offset().y(), z, image.height(), container.height()) >= minY - 1e-6);
            }
        }
    }

    void testConstrainWithoutSizesIsIdentity() {
        ViewportTransform vt;
        QCOMPARE(vt.constrain(QPointF(-5000, 9000), 2.0), QPointF(-5000, 9000));
    }

    void testPanDoesNotEmitZoom() {
        ViewportTransform vt;
        vt.setContainerSize(QSizeF(800, 600));
        vt.setImageSize(QSizeF(800, 600));

        QSignalSpy zoomSpy(&vt, &ViewportTransform::zoomChanged);
        QSignalSpy panSpy(&vt, &ViewportTransform::panChanged);
        vt.panBy(QPointF(20, 10));

        QCOMPARE(zoomSpy.count(), 0);
        QCOMPARE(panSpy.count(), 1);
        QVERIFY(near(vt.offset(), QPointF(20, 10)));
    }
};

#endif // VIEWPORTTRANSFORMTESTS_H
