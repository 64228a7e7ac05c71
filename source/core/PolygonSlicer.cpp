#include "PolygonSlicer.h"

#include <QDebug>
#include <QVector>
#include <algorithm>
#include <cmath>

namespace {

struct Crossing {
    QPointF point;
    int edgeIndex = -1;     ///< Edge i runs from points[i] to points[i + 1]
    qreal alongSlice = 0;   ///< Projection onto the slice direction
};

// Collects crossings of the slice with every polygon edge. A crossing that
// lands exactly on a vertex is reported by both adjacent edges; keep one.
QVector<Crossing> findCrossings(const QVector<QPointF>& points, const QPointF& a,
                                const QPointF& b, bool infiniteLine)
{
    QVector<Crossing> crossings;
    const int n = points.size();
    const QPointF dir = b - a;

    for (int i = 0; i < n; ++i) {
        const QPointF& p = points[i];
        const QPointF& q = points[(i + 1) % n];
        QPointF hit;
        bool found = infiniteLine ? Geometry::lineSegmentIntersection(a, b, p, q, &hit)
                                  : Geometry::segmentIntersection(a, b, p, q, &hit);
        if (!found) {
            continue;
        }

        bool duplicate = false;
        for (const Crossing& c : crossings) {
            if (std::hypot(c.point.x() - hit.x(), c.point.y() - hit.y()) < 1e-9) {
                duplicate = true;
                break;
            }
        }
        if (duplicate) {
            continue;
        }

        Crossing c;
        c.point = hit;
        c.edgeIndex = i;
        c.alongSlice = QPointF::dotProduct(hit - a, dir);
        crossings.append(c);
    }
    return crossings;
}

void appendDistinct(QVector<QPointF>& out, const QPointF& pt)
{
    if (!out.isEmpty()) {
        const QPointF& last = out.last();
        if (std::hypot(last.x() - pt.x(), last.y() - pt.y()) < 1e-9) {
            return;
        }
    }
    out.append(pt);
}

// Walks the ring from the vertex after `from`'s edge up to and including
// the start vertex of `to`'s edge's successor, bracketed by the crossings.
bool buildPiece(const QVector<QPointF>& points, const Crossing& from,
                const Crossing& to, QVector<QPointF>& out)
{
    const int n = points.size();
    appendDistinct(out, from.point);

    int index = (from.edgeIndex + 1) % n;
    const int stop = (to.edgeIndex + 1) % n;
    int guard = 0;
    while (index != stop) {
        if (++guard > n) {
            return false;
        }
        appendDistinct(out, points[index]);
        index = (index + 1) % n;
    }

    appendDistinct(out, to.point);
    return true;
}

} // namespace

namespace PolygonSlicer {

bool validateSliceLine(const Polygon& polygon, const QPointF& sliceStart,
                       const QPointF& sliceEnd, QString* reason)
{
    if (polygon.points.size() < 3) {
        if (reason) *reason = QStringLiteral("Polygon must have at least 3 points");
        return false;
    }

    const QPointF d = sliceEnd - sliceStart;
    if (std::hypot(d.x(), d.y()) < MIN_SLICE_LENGTH) {
        if (reason) *reason = QStringLiteral("Slice line is too short");
        return false;
    }

    const int segmentCount = findCrossings(polygon.points, sliceStart, sliceEnd, false).size();
    if (segmentCount == 2) {
        return true;
    }

    const int lineCount = findCrossings(polygon.points, sliceStart, sliceEnd, true).size();
    if (lineCount == 2) {
        return true;
    }

    if (reason) {
        *reason = QStringLiteral("Expected 2 intersections, found %1 with segment, %2 with infinite line")
                      .arg(segmentCount).arg(lineCount);
    }
    return false;
}

SliceResult slicePolygon(const Polygon& polygon, const QPointF& sliceStart, const QPointF& sliceEnd)
{
    SliceResult result;

    if (!validateSliceLine(polygon, sliceStart, sliceEnd, &result.error)) {
        qWarning() << "PolygonSlicer: Cannot slice" << polygon.id << "-" << result.error;
        return result;
    }

    QVector<Crossing> crossings = findCrossings(polygon.points, sliceStart, sliceEnd, false);
    if (crossings.size() != 2) {
        crossings = findCrossings(polygon.points, sliceStart, sliceEnd, true);
        result.usedInfiniteLine = true;
    }

    std::sort(crossings.begin(), crossings.end(), [](const Crossing& a, const Crossing& b) {
        return a.alongSlice < b.alongSlice;
    });

    QVector<QPointF> firstPoints;
    QVector<QPointF> secondPoints;
    if (!buildPiece(polygon.points, crossings[0], crossings[1], firstPoints)
        || !buildPiece(polygon.points, crossings[1], crossings[0], secondPoints)) {
        result.error = QStringLiteral("Ring traversal did not terminate");
        qWarning() << "PolygonSlicer: Cannot slice" << polygon.id << "-" << result.error;
        return result;
    }

    if (firstPoints.size() < 3 || secondPoints.size() < 3) {
        result.error = QStringLiteral("Slice produced a degenerate piece");
        qWarning() << "PolygonSlicer: Cannot slice" << polygon.id << "-" << result.error;
        return result;
    }

    result.first = polygon;
    result.first.id = Polygon::generateId();
    result.first.points = firstPoints;

    result.second = polygon;
    result.second.id = Polygon::generateId();
    result.second.points = secondPoints;

    result.valid = true;
    return result;
}

} // namespace PolygonSlicer
