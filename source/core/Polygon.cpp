#include "Polygon.h"

#include <QJsonArray>
#include <QJsonValue>
#include <QSet>
#include <QUuid>
#include <QDebug>
#include <QtMath>
#include <cmath>

// ===== Polygon =====

bool Polygon::isValid(QString* reason) const
{
    if (id.isEmpty()) {
        if (reason) *reason = QStringLiteral("missing id");
        return false;
    }
    if (points.size() < 3) {
        if (reason) *reason = QStringLiteral("fewer than 3 points (%1)").arg(points.size());
        return false;
    }
    for (const QPointF& pt : points) {
        if (!std::isfinite(pt.x()) || !std::isfinite(pt.y())) {
            if (reason) *reason = QStringLiteral("non-finite coordinate");
            return false;
        }
    }
    return true;
}

QRectF Polygon::boundingBox() const
{
    return Geometry::boundingBox(points);
}

QJsonObject Polygon::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["type"] = isExternal() ? QStringLiteral("external") : QStringLiteral("internal");
    if (!classLabel.isEmpty()) {
        obj["class"] = classLabel;
    }
    obj["confidence"] = confidence;
    if (!parentId.isEmpty()) {
        obj["parent_id"] = parentId;
    }

    QJsonArray pointsArray;
    for (const QPointF& pt : points) {
        QJsonObject p;
        p["x"] = pt.x();
        p["y"] = pt.y();
        pointsArray.append(p);
    }
    obj["points"] = pointsArray;
    return obj;
}

Polygon Polygon::fromJson(const QJsonObject& obj)
{
    Polygon polygon;

    // Numeric ids show up in older exports
    QJsonValue idValue = obj.value("id");
    if (idValue.isString()) {
        polygon.id = idValue.toString().trimmed();
    } else if (idValue.isDouble()) {
        polygon.id = QString::number(idValue.toInteger());
    }

    QString type = obj.value("type").toString().toLower();
    polygon.kind = (type == "internal") ? PolygonKind::Internal : PolygonKind::External;
    polygon.classLabel = obj.value("class").toString();
    polygon.confidence = obj.value("confidence").toDouble(1.0);
    polygon.parentId = obj.contains("parent_id") ? obj.value("parent_id").toString()
                                                 : obj.value("parentId").toString();

    const QJsonArray pointsArray = obj.value("points").toArray();
    polygon.points.reserve(pointsArray.size());
    for (const QJsonValue& value : pointsArray) {
        if (value.isArray()) {
            QJsonArray pair = value.toArray();
            if (pair.size() >= 2) {
                polygon.points.append(QPointF(pair.at(0).toDouble(qQNaN()), pair.at(1).toDouble(qQNaN())));
            }
        } else if (value.isObject()) {
            QJsonObject p = value.toObject();
            polygon.points.append(QPointF(p.value("x").toDouble(qQNaN()), p.value("y").toDouble(qQNaN())));
        }
    }

    return polygon;
}

QString Polygon::generateId()
{
    return QStringLiteral("polygon_") + QUuid::createUuid().toString(QUuid::WithoutBraces);
}

// ===== SegmentationResult =====

const Polygon* SegmentationResult::polygon(const QString& id) const
{
    if (id.isEmpty()) {
        return nullptr;
    }
    for (const Polygon& p : polygons) {
        if (p.id == id) {
            return &p;
        }
    }
    return nullptr;
}

bool SegmentationResult::removePolygon(const QString& id)
{
    for (int i = 0; i < polygons.size(); ++i) {
        if (polygons[i].id == id) {
            polygons.removeAt(i);
            return true;
        }
    }
    return false;
}

QString SegmentationResult::hitTest(const QPointF& imagePoint) const
{
    // Walk back to front so later polygons (drawn on top) win, internal first
    for (int i = polygons.size() - 1; i >= 0; --i) {
        const Polygon& p = polygons[i];
        if (!p.isExternal() && Geometry::containsPoint(p.points, imagePoint)) {
            return p.id;
        }
    }
    for (int i = polygons.size() - 1; i >= 0; --i) {
        const Polygon& p = polygons[i];
        if (p.isExternal() && Geometry::containsPoint(p.points, imagePoint)) {
            return p.id;
        }
    }
    return QString();
}

QJsonObject SegmentationResult::toJson() const
{
    QJsonObject obj;
    obj["imageId"] = imageId;
    obj["imageWidth"] = imageWidth;
    obj["imageHeight"] = imageHeight;
    QJsonArray polygonArray;
    for (const Polygon& p : polygons) {
        polygonArray.append(p.toJson());
    }
    obj["polygons"] = polygonArray;
    return obj;
}

SegmentationResult SegmentationResult::fromJson(const QJsonObject& obj, QString* errorMessage, bool* ok)
{
    SegmentationResult result;
    if (ok) *ok = false;

    result.imageId = obj.contains("imageId") ? obj.value("imageId").toString()
                                             : obj.value("image_id").toString();
    result.imageWidth = obj.contains("imageWidth") ? obj.value("imageWidth").toInt()
                                                   : obj.value("image_width").toInt();
    result.imageHeight = obj.contains("imageHeight") ? obj.value("imageHeight").toInt()
                                                     : obj.value("image_height").toInt();

    if (result.imageWidth <= 0 || result.imageHeight <= 0) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("invalid image dimensions %1x%2")
                                .arg(result.imageWidth).arg(result.imageHeight);
        }
        return result;
    }

    if (!obj.value("polygons").isArray()) {
        if (errorMessage) *errorMessage = QStringLiteral("missing polygons array");
        return result;
    }

    QVector<Polygon> decoded;
    const QJsonArray polygonArray = obj.value("polygons").toArray();
    decoded.reserve(polygonArray.size());
    for (const QJsonValue& value : polygonArray) {
        if (value.isObject()) {
            decoded.append(Polygon::fromJson(value.toObject()));
        }
    }
    result.polygons = sanitizePolygons(decoded);

    if (ok) *ok = true;
    return result;
}

// ===== Sanitization =====

QVector<Polygon> sanitizePolygons(const QVector<Polygon>& polygons)
{
    QVector<Polygon> kept;
    kept.reserve(polygons.size());
    QSet<QString> seenIds;

    for (int i = 0; i < polygons.size(); ++i) {
        const Polygon& p = polygons[i];
        QString reason;
        if (!p.isValid(&reason)) {
            qWarning() << "Polygon: Dropping polygon at index" << i << "-" << reason;
            continue;
        }
        if (seenIds.contains(p.id)) {
            qWarning() << "Polygon: Dropping duplicate polygon id" << p.id;
            continue;
        }
        seenIds.insert(p.id);
        kept.append(p);
    }
    return kept;
}

// ===== Geometry =====

namespace Geometry {

QRectF boundingBox(const QVector<QPointF>& points)
{
    if (points.isEmpty()) {
        return QRectF();
    }
    qreal minX = points[0].x(), maxX = minX;
    qreal minY = points[0].y(), maxY = minY;
    for (const QPointF& pt : points) {
        minX = qMin(minX, pt.x());
        maxX = qMax(maxX, pt.x());
        minY = qMin(minY, pt.y());
        maxY = qMax(maxY, pt.y());
    }
    return QRectF(QPointF(minX, minY), QPointF(maxX, maxY));
}

qreal polygonArea(const QVector<QPointF>& points)
{
    const int n = points.size();
    if (n < 3) {
        return 0.0;
    }
    qreal area = 0.0;
    for (int i = 0; i < n; ++i) {
        const int j = (i + 1) % n;
        area += points[i].x() * points[j].y();
        area -= points[j].x() * points[i].y();
    }
    return qAbs(area) / 2.0;
}

qreal polygonPerimeter(const QVector<QPointF>& points)
{
    const int n = points.size();
    qreal perimeter = 0.0;
    for (int i = 0; i < n; ++i) {
        const QPointF d = points[(i + 1) % n] - points[i];
        perimeter += std::hypot(d.x(), d.y());
    }
    return perimeter;
}

bool isClockwise(const QVector<QPointF>& points)
{
    const int n = points.size();
    if (n < 3) {
        return true;
    }
    qreal sum = 0.0;
    for (int i = 0; i < n; ++i) {
        const int j = (i + 1) % n;
        sum += (points[j].x() - points[i].x()) * (points[j].y() + points[i].y());
    }
    // Image space is y-down, so the sign flips relative to math convention
    return sum < 0;
}

bool containsPoint(const QVector<QPointF>& points, const QPointF& p)
{
    bool inside = false;
    const int n = points.size();
    if (n < 3) {
        return false;
    }
    for (int i = 0, j = n - 1; i < n; j = i++) {
        const qreal xi = points[i].x(), yi = points[i].y();
        const qreal xj = points[j].x(), yj = points[j].y();
        if ((yi > p.y()) != (yj > p.y())
            && p.x() < (xj - xi) * (p.y() - yi) / (yj - yi) + xi) {
            inside = !inside;
        }
    }
    return inside;
}

qreal distanceToSegment(const QPointF& p, const QPointF& a, const QPointF& b)
{
    const qreal dx = b.x() - a.x();
    const qreal dy = b.y() - a.y();
    if (dx == 0.0 && dy == 0.0) {
        return std::hypot(p.x() - a.x(), p.y() - a.y());
    }
    qreal t = ((p.x() - a.x()) * dx + (p.y() - a.y()) * dy) / (dx * dx + dy * dy);
    t = qBound(0.0, t, 1.0);
    return std::hypot(p.x() - (a.x() + t * dx), p.y() - (a.y() + t * dy));
}

qreal perpendicularDistance(const QPointF& p, const QPointF& a, const QPointF& b)
{
    const qreal dx = b.x() - a.x();
    const qreal dy = b.y() - a.y();
    if (dx == 0.0 && dy == 0.0) {
        return std::hypot(p.x() - a.x(), p.y() - a.y());
    }
    const qreal length = std::hypot(dx, dy);
    return qAbs(dy * p.x() - dx * p.y() + b.x() * a.y() - b.y() * a.x()) / length;
}

static bool intersectParams(const QPointF& p1, const QPointF& p2,
                            const QPointF& p3, const QPointF& p4,
                            qreal* t, qreal* u)
{
    const qreal denom = (p1.x() - p2.x()) * (p3.y() - p4.y())
                      - (p1.y() - p2.y()) * (p3.x() - p4.x());
    if (qAbs(denom) < 1e-10) {
        return false;  // Parallel or degenerate
    }
    *t = ((p1.x() - p3.x()) * (p3.y() - p4.y()) - (p1.y() - p3.y()) * (p3.x() - p4.x())) / denom;
    *u = -((p1.x() - p2.x()) * (p1.y() - p3.y()) - (p1.y() - p2.y()) * (p1.x() - p3.x())) / denom;
    return true;
}

bool segmentIntersection(const QPointF& p1, const QPointF& p2,
                         const QPointF& p3, const QPointF& p4, QPointF* out)
{
    qreal t = 0, u = 0;
    if (!intersectParams(p1, p2, p3, p4, &t, &u)) {
        return false;
    }
    if (t < 0.0 || t > 1.0 || u < 0.0 || u > 1.0) {
        return false;
    }
    if (out) {
        *out = p1 + t * (p2 - p1);
    }
    return true;
}

bool lineSegmentIntersection(const QPointF& p1, const QPointF& p2,
                             const QPointF& p3, const QPointF& p4, QPointF* out)
{
    qreal t = 0, u = 0;
    if (!intersectParams(p1, p2, p3, p4, &t, &u)) {
        return false;
    }
    // Only the edge parameter is bounded; the slice line is infinite
    if (u < 0.0 || u > 1.0) {
        return false;
    }
    if (out) {
        *out = p1 + t * (p2 - p1);
    }
    return true;
}

QVector<QPointF> spliceOutline(const QVector<QPointF>& points, int startIndex, int endIndex,
                               const QVector<QPointF>& inserted)
{
    const int n = points.size();
    if (n < 3 || inserted.isEmpty() || startIndex == endIndex
        || startIndex < 0 || startIndex >= n || endIndex < 0 || endIndex >= n) {
        return QVector<QPointF>();
    }

    // Keep end .. start, then walk the new points from start to end
    QVector<QPointF> replaceForward;
    for (int i = endIndex; ; i = (i + 1) % n) {
        replaceForward.append(points[i]);
        if (i == startIndex) {
            break;
        }
    }
    replaceForward += inserted;

    // Keep start .. end, then walk the new points back from end to start
    QVector<QPointF> replaceBackward;
    for (int i = startIndex; ; i = (i + 1) % n) {
        replaceBackward.append(points[i]);
        if (i == endIndex) {
            break;
        }
    }
    for (int i = inserted.size() - 1; i >= 0; --i) {
        replaceBackward.append(inserted[i]);
    }

    return polygonPerimeter(replaceForward) >= polygonPerimeter(replaceBackward)
        ? replaceForward : replaceBackward;
}

} // namespace Geometry
