#pragma once

// ============================================================================
// PolygonSimplifier - Douglas-Peucker outline reduction for display
// ============================================================================
// Pure functions, no shared state: safe to call from QtConcurrent workers
// (ThumbnailRenderer does).
// ============================================================================

#include "Polygon.h"

#include <QVector>
#include <QPointF>

namespace PolygonSimplifier {

/// Polygons at or below this many points are drawn as-is.
constexpr int MIN_POINTS_TO_SIMPLIFY = 10;

/// Tolerance as a fraction of min(imageWidth, imageHeight).
constexpr qreal TOLERANCE_FRACTION = 0.005;

/**
 * @brief Reduce the point count of an outline.
 *
 * Recursive Douglas-Peucker over the open chain points[0..n-1]. The first
 * and last points are always kept and the result never has more points
 * than the input. Every dropped point lies within @p tolerance of the
 * simplified chain. Inputs with 3 or fewer points are returned unchanged.
 *
 * @param points Outline vertices.
 * @param tolerance Maximum perpendicular deviation in image pixels.
 */
QVector<QPointF> simplify(const QVector<QPointF>& points, qreal tolerance);

/**
 * @brief Tolerance for an image: 0.5% of its shorter side.
 */
qreal toleranceForImage(int imageWidth, int imageHeight);

/**
 * @brief Simplify a polygon for rendering.
 *
 * Polygons with MIN_POINTS_TO_SIMPLIFY points or fewer are returned
 * unchanged. The simplified outline keeps at least 3 points so the
 * polygon stays drawable.
 */
Polygon simplifyForDisplay(const Polygon& polygon, qreal tolerance);

} // namespace PolygonSimplifier
