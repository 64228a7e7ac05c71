#include "PolygonSimplifier.h"

namespace PolygonSimplifier {

// Appends the simplified chain [start, end) to out; the caller appends the
// final endpoint once. Avoids building and splicing temporary vectors.
static void simplifyRange(const QVector<QPointF>& points, int start, int end,
                          qreal tolerance, QVector<QPointF>& out)
{
    qreal maxDistance = 0.0;
    int maxIndex = start;

    for (int i = start + 1; i < end; ++i) {
        qreal distance = Geometry::perpendicularDistance(points[i], points[start], points[end]);
        if (distance > maxDistance) {
            maxDistance = distance;
            maxIndex = i;
        }
    }

    if (maxDistance > tolerance) {
        simplifyRange(points, start, maxIndex, tolerance, out);
        simplifyRange(points, maxIndex, end, tolerance, out);
    } else {
        out.append(points[start]);
    }
}

QVector<QPointF> simplify(const QVector<QPointF>& points, qreal tolerance)
{
    if (points.size() <= 3) {
        return points;
    }

    QVector<QPointF> result;
    result.reserve(points.size());
    simplifyRange(points, 0, points.size() - 1, tolerance, result);
    result.append(points.last());
    return result;
}

qreal toleranceForImage(int imageWidth, int imageHeight)
{
    if (imageWidth <= 0 || imageHeight <= 0) {
        return 0.0;
    }
    return qMin(imageWidth, imageHeight) * TOLERANCE_FRACTION;
}

Polygon simplifyForDisplay(const Polygon& polygon, qreal tolerance)
{
    if (polygon.points.size() <= MIN_POINTS_TO_SIMPLIFY || tolerance <= 0.0) {
        return polygon;
    }

    QVector<QPointF> simplified = simplify(polygon.points, tolerance);
    if (simplified.size() < 3) {
        // Chain collapsed to its endpoints (closed ring with first == last);
        // keep the original so the polygon does not disappear
        return polygon;
    }

    Polygon display = polygon;
    display.points = std::move(simplified);
    return display;
}

} // namespace PolygonSimplifier
