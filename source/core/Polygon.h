#pragma once

// ============================================================================
// Polygon - Segmentation polygons and the geometry the canvas needs
// ============================================================================
// A SegmentationResult is the per-image output of the segmentation service:
// a list of outlines in image pixel space plus the image dimensions.
// Everything that reaches the renderer or the selection logic has passed
// through sanitizePolygons() first.
// ============================================================================

#include <QString>
#include <QVector>
#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <QJsonObject>

/**
 * @brief Whether a polygon is an object boundary or a hole inside one.
 */
enum class PolygonKind {
    External,   ///< Outer boundary of a cell/spheroid
    Internal    ///< Hole or sub-region inside an external polygon
};

/**
 * @brief A single segmentation outline.
 *
 * Points are an open ring: the closing edge from the last point back to the
 * first is implied and never stored.
 */
struct Polygon {
    QString id;                     ///< Unique within one image, never empty
    QVector<QPointF> points;        ///< Vertices in image pixel space (>= 3)
    PolygonKind kind = PolygonKind::External;
    QString classLabel;             ///< Optional class name ("spheroid", ...)
    qreal confidence = 1.0;         ///< Model confidence, 1.0 for hand-drawn
    QString parentId;               ///< Owning external polygon (internal only)

    bool isExternal() const { return kind == PolygonKind::External; }

    /**
     * @brief Check the structural invariants (id, >= 3 finite points).
     * @param reason Optional out parameter, set to a human readable cause.
     */
    bool isValid(QString* reason = nullptr) const;

    QRectF boundingBox() const;

    QJsonObject toJson() const;

    /**
     * @brief Decode a polygon from the segmentation service JSON.
     *
     * Accepts points as [{"x":..,"y":..}] or [[x, y]] and the kind as
     * "type": "external" | "internal". Validity is not checked here.
     */
    static Polygon fromJson(const QJsonObject& obj);

    /**
     * @brief Generate a fresh unique polygon id.
     */
    static QString generateId();
};

/**
 * @brief Per-image segmentation output.
 */
struct SegmentationResult {
    QString imageId;
    QVector<Polygon> polygons;
    int imageWidth = 0;
    int imageHeight = 0;

    QSizeF imageSize() const { return QSizeF(imageWidth, imageHeight); }

    /**
     * @brief Find a polygon by id.
     * @return Pointer into polygons, or nullptr when the id is unknown.
     */
    const Polygon* polygon(const QString& id) const;
    bool contains(const QString& id) const { return polygon(id) != nullptr; }

    /**
     * @brief Remove a polygon by id.
     * @return True if a polygon was removed.
     */
    bool removePolygon(const QString& id);

    /**
     * @brief Id of the polygon under an image-space point.
     *
     * Internal polygons are drawn on top of external ones and win the hit
     * test. Returns an empty string if no polygon contains the point.
     */
    QString hitTest(const QPointF& imagePoint) const;

    QJsonObject toJson() const;

    /**
     * @brief Decode and sanitize a segmentation result.
     * @param obj JSON object from the segmentation service.
     * @param errorMessage Set when the object is unusable.
     * @param ok Set to false when decoding failed.
     */
    static SegmentationResult fromJson(const QJsonObject& obj, QString* errorMessage = nullptr, bool* ok = nullptr);
};

/**
 * @brief Drop polygons that must never reach the renderer.
 *
 * Removes polygons with fewer than 3 points, non-finite coordinates, an
 * empty id, or an id already seen earlier in the list. Each drop is logged.
 * @return The surviving polygons in their original order.
 */
QVector<Polygon> sanitizePolygons(const QVector<Polygon>& polygons);

// ===== Geometry =====

namespace Geometry {

QRectF boundingBox(const QVector<QPointF>& points);

/// Absolute area (shoelace formula). Zero for fewer than 3 points.
qreal polygonArea(const QVector<QPointF>& points);

qreal polygonPerimeter(const QVector<QPointF>& points);

/// True for clockwise winding in a y-down coordinate system.
bool isClockwise(const QVector<QPointF>& points);

/// Ray casting point-in-polygon test.
bool containsPoint(const QVector<QPointF>& points, const QPointF& p);

/// Distance from p to the closed segment [a, b].
qreal distanceToSegment(const QPointF& p, const QPointF& a, const QPointF& b);

/// Distance from p to the infinite line through a and b.
qreal perpendicularDistance(const QPointF& p, const QPointF& a, const QPointF& b);

/**
 * @brief Intersection of two closed segments [p1,p2] and [p3,p4].
 * @return False for parallel or non-overlapping segments.
 */
bool segmentIntersection(const QPointF& p1, const QPointF& p2,
                         const QPointF& p3, const QPointF& p4, QPointF* out);

/**
 * @brief Intersection of the infinite line through p1,p2 with segment [p3,p4].
 */
bool lineSegmentIntersection(const QPointF& p1, const QPointF& p2,
                             const QPointF& p3, const QPointF& p4, QPointF* out);

/**
 * @brief Replace the outline between two vertices with new points.
 *
 * The outline has two chains joining startIndex and endIndex. The inserted
 * points (ordered from start towards end) replace one of them; the result
 * with the longer perimeter is returned.
 * @return The new outline, or an empty vector for bad indices or no points.
 */
QVector<QPointF> spliceOutline(const QVector<QPointF>& points, int startIndex, int endIndex,
                               const QVector<QPointF>& inserted);

} // namespace Geometry
