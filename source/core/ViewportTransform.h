#pragma once

// ============================================================================
// ViewportTransform - Zoom/offset state of the segmentation canvas
// ============================================================================
// Owns the mapping between screen (widget) pixels and image pixels:
//
//     imageX  = screenX / zoom - offsetX
//     screenX = (imageX + offsetX) * zoom
//
// The offset is expressed in image pixels. Every mutation goes through
// constrain(), so zoom stays within [minZoom, maxZoom] and at least
// minVisibleFraction of the image stays inside the container on each axis.
//
// Wheel input is rate limited to one applied update per frame: the first
// event of an idle frame applies at once, later events in the same frame
// only replace the pending target, which is applied when the frame ends.
// ============================================================================

#include "EditorSettings.h"

#include <QObject>
#include <QPointF>
#include <QSizeF>
#include <QRectF>
#include <QTimer>

class QWheelEvent;

/**
 * @brief Zoom + offset pair.
 */
struct Viewport {
    qreal zoom = 1.0;
    QPointF offset;     ///< In image pixels

    bool operator==(const Viewport& other) const {
        return qFuzzyCompare(zoom, other.zoom)
            && qFuzzyCompare(1.0 + offset.x(), 1.0 + other.offset.x())
            && qFuzzyCompare(1.0 + offset.y(), 1.0 + other.offset.y());
    }
    bool operator!=(const Viewport& other) const { return !(*this == other); }
};

class ViewportTransform : public QObject {
    Q_OBJECT

public:
    explicit ViewportTransform(const EditorSettings& settings = EditorSettings(), QObject* parent = nullptr);
    ~ViewportTransform() override;

    // ===== State =====

    Viewport viewport() const { return m_viewport; }
    qreal zoom() const { return m_viewport.zoom; }
    QPointF offset() const { return m_viewport.offset; }
    qreal minZoom() const { return m_settings.minZoom; }
    qreal maxZoom() const { return m_settings.maxZoom; }

    QSizeF containerSize() const { return m_containerSize; }
    QSizeF imageSize() const { return m_imageSize; }

    /**
     * @brief Set the visible widget area (logical pixels).
     *
     * Re-applies the pan constraint, since the allowed range depends on it.
     */
    void setContainerSize(const QSizeF& size);

    /**
     * @brief Set the image extent without changing zoom.
     */
    void setImageSize(const QSizeF& size);

    // ===== Coordinate mapping =====

    QPointF screenToImage(const QPointF& screenPt) const;
    QPointF imageToScreen(const QPointF& imagePt) const;

    /**
     * @brief Image-space rectangle currently covered by the container.
     */
    QRectF visibleImageRect() const;

    // ===== Mutations =====

    /**
     * @brief Zoom in by the button factor around the container center.
     */
    void zoomIn();

    /**
     * @brief Zoom out by the button factor around the container center.
     */
    void zoomOut();

    /**
     * @brief Wheel zoom around the cursor.
     *
     * deltaY < 0 zooms in by wheelZoomStep, deltaY > 0 zooms out by the
     * inverse factor, deltaY == 0 is ignored. Rate limited per frame.
     *
     * @param deltaY Vertical wheel delta (sign only).
     * @param cursorPos Cursor position in screen coordinates.
     */
    void handleWheel(qreal deltaY, const QPointF& cursorPos);
    void handleWheel(QWheelEvent* event);

    /**
     * @brief Fit the image into fitFraction of the container and center it.
     *
     * The zoom comes from the constraining axis (smaller fit ratio).
     */
    void centerOn(const QSizeF& imageSize);

    /**
     * @brief Pan by a screen-space delta.
     */
    void panBy(const QPointF& screenDelta);

    /**
     * @brief Zoom by a factor keeping a screen point fixed.
     */
    void zoomAtPoint(qreal factor, const QPointF& screenPt);

    void setZoom(qreal zoom);
    void setViewport(const Viewport& viewport);

    // ===== Constraints =====

    qreal clampZoom(qreal zoom) const;

    /**
     * @brief Clamp an offset for a given zoom.
     *
     * On each axis the on-screen overlap of the scaled image with the
     * container is kept at or above min(fraction * scaledExtent,
     * containerExtent). Without a container or image size the offset is
     * returned unchanged.
     */
    QPointF constrain(const QPointF& offset, qreal zoom) const;

    /**
     * @brief True while a coalesced wheel update waits for the frame end.
     */
    bool hasPendingWheelUpdate() const { return m_hasPendingWheel; }

    /**
     * @brief Number of viewport updates applied from wheel input.
     */
    int appliedWheelUpdates() const { return m_appliedWheelUpdates; }

signals:
    void zoomChanged(qreal zoom);
    void panChanged(QPointF offset);
    void viewportChanged();

private slots:
    void onFrameTimeout();

private:
    /**
     * @brief New viewport for zooming `base` by factor around screenPt.
     */
    Viewport zoomedAround(const Viewport& base, qreal factor, const QPointF& screenPt) const;

    /**
     * @brief Apply a pending wheel target now so a direct mutation does not
     *        get overwritten at the end of the frame.
     */
    void flushPendingWheel();

    void applyViewport(const Viewport& next);

    EditorSettings m_settings;
    Viewport m_viewport;
    QSizeF m_containerSize;
    QSizeF m_imageSize;

    // ----- Wheel rate limiting -----
    QTimer* m_frameTimer = nullptr;
    Viewport m_pendingWheel;
    bool m_hasPendingWheel = false;
    int m_appliedWheelUpdates = 0;
};
