#ifndef POLYGONTESTS_H
#define POLYGONTESTS_H

#include <QObject>
#include <QTest>
#include <QJsonArray>
#include <QJsonDocument>
#include <QtMath>

#include <algorithm>

#include "Polygon.h"
#include "PolygonSlicer.h"

/**
 * Unit tests for the polygon model, geometry helpers and the slicer.
 * Run with: spherocanvas_tests polygon
 */
class PolygonTests : public QObject {
    Q_OBJECT

private:
    static Polygon square(const QString& id, qreal x, qreal y, qreal size,
                          PolygonKind kind = PolygonKind::External)
    {
        Polygon p;
        p.id = id;
        p.kind = kind;
        p.points = { QPointF(x, y), QPointF(x + size, y),
                     QPointF(x + size, y + size), QPointF(x, y + size) };
        return p;
    }

private slots:
    // ===== Model =====

    void testValidity() {
        Polygon p = square("p1", 0, 0, 10);
        QVERIFY(p.isValid());

        QString reason;
        Polygon noId = p;
        noId.id.clear();
        QVERIFY(!noId.isValid(&reason));
        QVERIFY(!reason.isEmpty());

        Polygon tooFew = p;
        tooFew.points.resize(2);
        QVERIFY(!tooFew.isValid());

        Polygon nan = p;
        nan.points[1] = QPointF(qQNaN(), 3);
        QVERIFY(!nan.isValid());
    }

    void testSanitizeDropsInvalidAndDuplicates() {
        Polygon a = square("a", 0, 0, 10);
        Polygon dup = square("a", 50, 50, 10);
        Polygon bad = square("", 0, 0, 10);
        Polygon b = square("b", 20, 20, 5);

        const QVector<Polygon> kept = sanitizePolygons({a, dup, bad, b});
        QCOMPARE(kept.size(), 2);
        QCOMPARE(kept[0].id, QString("a"));
        QCOMPARE(kept[0].points.first(), QPointF(0, 0));   // First occurrence wins
        QCOMPARE(kept[1].id, QString("b"));
    }

    void testFromJsonAcceptsBothPointFormats() {
        const QByteArray json = R"({
            "imageId": "img-1",
            "image_width": 640,
            "imageHeight": 480,
            "polygons": [
                {"id": "p1", "type": "external", "class": "spheroid",
                 "points": [{"x": 1, "y": 1}, {"x": 20, "y": 1}, {"x": 20, "y": 20}]},
                {"id": "p2", "type": "internal", "parent_id": "p1", "confidence": 0.5,
                 "points": [[5, 5], [8, 5], [8, 8]]},
                {"id": "", "points": [[0, 0], [1, 0], [1, 1]]},
                {"id": "p3", "points": [[0, 0], [1, 1]]}
            ]
        })";

        QString error;
        bool ok = false;
        SegmentationResult result = SegmentationResult::fromJson(QJsonDocument::fromJson(json).object(), &error, &ok);
        QVERIFY2(ok, qPrintable(error));
        QCOMPARE(result.imageId, QString("img-1"));
        QCOMPARE(result.imageWidth, 640);
        QCOMPARE(result.imageHeight, 480);
        QCOMPARE(result.polygons.size(), 2);

        const Polygon* p2 = result.polygon("p2");
        QVERIFY(p2);
        QVERIFY(!p2->isExternal());
        QCOMPARE(p2->parentId, QString("p1"));
        QCOMPARE(p2->confidence, 0.5);
        QCOMPARE(result.polygon("p1")->classLabel, QString("spheroid"));
    }

    void testFromJsonRejectsMissingDimensions() {
        QJsonObject obj;
        obj["imageId"] = "x";
        obj["polygons"] = QJsonArray();

        QString error;
        bool ok = true;
        SegmentationResult::fromJson(obj, &error, &ok);
        QVERIFY(!ok);
        QVERIFY(error.contains("dimensions"));
    }

    void testJsonRoundTripKeepsPolygons() {
        SegmentationResult original;
        original.imageId = "img";
        original.imageWidth = 100;
        original.imageHeight = 50;
        original.polygons = { square("outer", 0, 0, 40), square("hole", 10, 10, 5, PolygonKind::Internal) };
        original.polygons[1].parentId = "outer";

        bool ok = false;
        SegmentationResult decoded = SegmentationResult::fromJson(original.toJson(), nullptr, &ok);
        QVERIFY(ok);
        QCOMPARE(decoded.polygons.size(), 2);
        QVERIFY(decoded.polygons[1].kind == PolygonKind::Internal);
        QCOMPARE(decoded.polygons[1].parentId, QString("outer"));
        QCOMPARE(decoded.polygons[0].points, original.polygons[0].points);
    }

    void testHitTestPrefersInternal() {
        SegmentationResult result;
        result.imageWidth = 100;
        result.imageHeight = 100;
        result.polygons = { square("outer", 0, 0, 50), square("hole", 10, 10, 10, PolygonKind::Internal) };

        QCOMPARE(result.hitTest(QPointF(15, 15)), QString("hole"));
        QCOMPARE(result.hitTest(QPointF(40, 40)), QString("outer"));
        QCOMPARE(result.hitTest(QPointF(80, 80)), QString());
    }

    void testRemovePolygon() {
        SegmentationResult result;
        result.polygons = { square("a", 0, 0, 1), square("b", 2, 2, 1) };
        QVERIFY(result.removePolygon("a"));
        QVERIFY(!result.removePolygon("a"));
        QVERIFY(!result.contains("a"));
        QVERIFY(result.contains("b"));
    }

    void testGeneratedIdsAreUnique() {
        const QString a = Polygon::generateId();
        const QString b = Polygon::generateId();
        QVERIFY(a.startsWith("polygon_"));
        QVERIFY(a != b);
    }

    // ===== Geometry =====

    void testAreaAndPerimeter() {
        const Polygon p = square("s", 0, 0, 10);
        QCOMPARE(Geometry::polygonArea(p.points), 100.0);
        QCOMPARE(Geometry::polygonPerimeter(p.points), 40.0);
        QCOMPARE(Geometry::boundingBox(p.points), QRectF(0, 0, 10, 10));
        QVERIFY(Geometry::isClockwise(p.points));

        QVector<QPointF> reversed = p.points;
        std::reverse(reversed.begin(), reversed.end());
        QVERIFY(!Geometry::isClockwise(reversed));
        QCOMPARE(Geometry::polygonArea(reversed), 100.0);
    }

    void testContainsPoint() {
        const Polygon p = square("s", 0, 0, 10);
        QVERIFY(Geometry::containsPoint(p.points, QPointF(5, 5)));
        QVERIFY(!Geometry::containsPoint(p.points, QPointF(15, 5)));
        QVERIFY(!Geometry::containsPoint(p.points, QPointF(-1, -1)));
    }

    void testDistances() {
        const QPointF a(0, 0);
        const QPointF b(10, 0);
        QCOMPARE(Geometry::distanceToSegment(QPointF(5, 3), a, b), 3.0);
        QCOMPARE(Geometry::distanceToSegment(QPointF(13, 4), a, b), 5.0);     // Beyond b
        QCOMPARE(Geometry::perpendicularDistance(QPointF(13, 4), a, b), 4.0); // Infinite line
        QCOMPARE(Geometry::perpendicularDistance(QPointF(3, 4), a, a), 5.0);  // Degenerate line
    }

    void testSegmentIntersection() {
        QPointF hit;
        QVERIFY(Geometry::segmentIntersection(QPointF(0, 0), QPointF(10, 10),
                                              QPointF(0, 10), QPointF(10, 0), &hit));
        QCOMPARE(hit, QPointF(5, 5));

        QVERIFY(!Geometry::segmentIntersection(QPointF(0, 0), QPointF(1, 1),
                                               QPointF(0, 10), QPointF(10, 0), &hit));
        QVERIFY(!Geometry::segmentIntersection(QPointF(0, 0), QPointF(10, 0),
                                               QPointF(0, 1), QPointF(10, 1), &hit));   // Parallel

        QVERIFY(Geometry::lineSegmentIntersection(QPointF(0, 0), QPointF(1, 1),
                                                  QPointF(0, 10), QPointF(10, 0), &hit));
        QCOMPARE(hit, QPointF(5, 5));
    }

    // ===== Slicer =====

    void testSpliceOutlineKeepsLongerChain() {
        const QVector<QPointF> sq = square("s", 0, 0, 100).points;

        // Bump outwards over the top edge
        QVector<QPointF> out = Geometry::spliceOutline(sq, 0, 1, { QPointF(50, -50) });
        QCOMPARE(out.size(), 5);
        QVERIFY(qAbs(Geometry::polygonArea(out) - 12500.0) < 1e-6);

        // Dent inwards over the same edge
        out = Geometry::spliceOutline(sq, 0, 1, { QPointF(50, 50) });
        QVERIFY(qAbs(Geometry::polygonArea(out) - 7500.0) < 1e-6);

        // Run across the wrap-around edge (3 -> 0)
        out = Geometry::spliceOutline(sq, 3, 0, { QPointF(-50, 50) });
        QCOMPARE(out.size(), 5);
        QVERIFY(qAbs(Geometry::polygonArea(out) - 12500.0) < 1e-6);
        QVERIFY(out.contains(QPointF(-50, 50)));
    }

    void testSpliceOutlineRejectsBadInput() {
        const QVector<QPointF> sq = square("s", 0, 0, 100).points;
        QVERIFY(Geometry::spliceOutline(sq, 0, 1, {}).isEmpty());
        QVERIFY(Geometry::spliceOutline(sq, 1, 1, { QPointF(5, 5) }).isEmpty());
        QVERIFY(Geometry::spliceOutline(sq, 0, 4, { QPointF(5, 5) }).isEmpty());
        QVERIFY(Geometry::spliceOutline(sq.mid(0, 2), 0, 1, { QPointF(5, 5) }).isEmpty());
    }

    void testSliceSquareThroughMiddle() {
        Polygon p = square("sq", 0, 0, 10);
        p.classLabel = "spheroid";

        SliceResult result = PolygonSlicer::slicePolygon(p, QPointF(5, -5), QPointF(5, 15));
        QVERIFY2(result.valid, qPrintable(result.error));
        QVERIFY(!result.usedInfiniteLine);

        const qreal a1 = Geometry::polygonArea(result.first.points);
        const qreal a2 = Geometry::polygonArea(result.second.points);
        QVERIFY(qAbs(a1 + a2 - 100.0) < 1e-9);
        QVERIFY(qAbs(a1 - 50.0) < 1e-9);

        QVERIFY(result.first.id != p.id);
        QVERIFY(result.second.id != p.id);
        QVERIFY(result.first.id != result.second.id);
        QCOMPARE(result.first.classLabel, QString("spheroid"));
        QVERIFY(result.second.kind == p.kind);
    }

    void testSliceFallsBackToInfiniteLine() {
        Polygon p = square("sq", 0, 0, 10);

        // Both endpoints inside: the segment never crosses the outline
        SliceResult result = PolygonSlicer::slicePolygon(p, QPointF(5, 2), QPointF(5, 8));
        QVERIFY2(result.valid, qPrintable(result.error));
        QVERIFY(result.usedInfiniteLine);
        QVERIFY(qAbs(Geometry::polygonArea(result.first.points)
                     + Geometry::polygonArea(result.second.points) - 100.0) < 1e-9);
    }

    void testSliceRejectsBadLines() {
        Polygon p = square("sq", 0, 0, 10);
        QString reason;

        QVERIFY(!PolygonSlicer::validateSliceLine(p, QPointF(5, 5), QPointF(5.5, 5), &reason));
        QVERIFY(reason.contains("short"));

        // Misses the polygon entirely
        QVERIFY(!PolygonSlicer::validateSliceLine(p, QPointF(20, 0), QPointF(20, 10), &reason));

        SliceResult result = PolygonSlicer::slicePolygon(p, QPointF(20, 0), QPointF(20, 10));
        QVERIFY(!result.valid);
        QVERIFY(!result.error.isEmpty());
    }
};

#endif // POLYGONTESTS_H
