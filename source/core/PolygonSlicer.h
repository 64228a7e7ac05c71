#pragma once

// ============================================================================
// PolygonSlicer - Split one polygon into two along a line
// ============================================================================

#include "Polygon.h"

#include <QString>

/**
 * @brief Outcome of a slice attempt.
 */
struct SliceResult {
    bool valid = false;
    Polygon first;
    Polygon second;
    QString error;          ///< Why the slice was rejected (empty when valid)
    bool usedInfiniteLine = false;
};

namespace PolygonSlicer {

/// Slice lines shorter than this (image pixels) are rejected.
constexpr qreal MIN_SLICE_LENGTH = 1.0;

/**
 * @brief Check whether a slice line cuts a polygon into exactly two parts.
 *
 * The segment is tried first. If it does not cross the outline exactly
 * twice (one or both endpoints inside the polygon), the infinite line
 * through the two points is tried instead.
 *
 * @param reason Set to the rejection cause when the line is invalid.
 */
bool validateSliceLine(const Polygon& polygon, const QPointF& sliceStart,
                       const QPointF& sliceEnd, QString* reason = nullptr);

/**
 * @brief Slice a polygon.
 *
 * Both pieces inherit kind, class label, confidence and parent of the source
 * polygon and get fresh ids. Invalid slices are logged and returned with
 * valid == false; nothing is thrown.
 */
SliceResult slicePolygon(const Polygon& polygon, const QPointF& sliceStart, const QPointF& sliceEnd);

} // namespace PolygonSlicer
