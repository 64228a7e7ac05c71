#include "ViewportTransform.h"

#include <QWheelEvent>
#include <QDebug>
#include <QtMath>

ViewportTransform::ViewportTransform(const EditorSettings& settings, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
{
    m_settings.sanitize();

    m_frameTimer = new QTimer(this);
    m_frameTimer->setSingleShot(true);
    m_frameTimer->setInterval(m_settings.frameIntervalMs);
    connect(m_frameTimer, &QTimer::timeout, this, &ViewportTransform::onFrameTimeout);
}

ViewportTransform::~ViewportTransform() = default;

// ===== Sizes =====

void ViewportTransform::setContainerSize(const QSizeF& size)
{
    if (size == m_containerSize) {
        return;
    }
    m_containerSize = size;
    applyViewport(m_viewport);
}

void ViewportTransform::setImageSize(const QSizeF& size)
{
    if (size == m_imageSize) {
        return;
    }
    m_imageSize = size;
    applyViewport(m_viewport);
}

// ===== Coordinate mapping =====

QPointF ViewportTransform::screenToImage(const QPointF& screenPt) const
{
    return screenPt / m_viewport.zoom - m_viewport.offset;
}

QPointF ViewportTransform::imageToScreen(const QPointF& imagePt) const
{
    return (imagePt + m_viewport.offset) * m_viewport.zoom;
}

QRectF ViewportTransform::visibleImageRect() const
{
    const QPointF topLeft = screenToImage(QPointF(0, 0));
    return QRectF(topLeft, m_containerSize / m_viewport.zoom);
}

// ===== Mutations =====

void ViewportTransform::zoomIn()
{
    zoomAtPoint(m_settings.buttonZoomFactor,
                QPointF(m_containerSize.width() / 2.0, m_containerSize.height() / 2.0));
}

void ViewportTransform::zoomOut()
{
    zoomAtPoint(1.0 / m_settings.buttonZoomFactor,
                QPointF(m_containerSize.width() / 2.0, m_containerSize.height() / 2.0));
}

void ViewportTransform::handleWheel(qreal deltaY, const QPointF& cursorPos)
{
    if (qFuzzyIsNull(deltaY)) {
        return;
    }

    const qreal step = 1.0 + m_settings.wheelZoomStep;
    const qreal factor = deltaY < 0 ? step : 1.0 / step;

    // Chain from the pending target so no notch is lost inside a frame
    const Viewport base = m_hasPendingWheel ? m_pendingWheel : m_viewport;
    const Viewport target = zoomedAround(base, factor, cursorPos);

    if (!m_frameTimer->isActive()) {
        // Leading edge: idle frame, apply now and open the frame
        m_hasPendingWheel = false;
        ++m_appliedWheelUpdates;
        applyViewport(target);
        m_frameTimer->start();
    } else {
        m_pendingWheel = target;
        m_hasPendingWheel = true;
    }
}

void ViewportTransform::handleWheel(QWheelEvent* event)
{
    if (!event) {
        return;
    }
    // Both deltas are positive when rotated away from the user (zoom in).
    // Some touchpads only report pixelDelta().
    int rawDelta = event->angleDelta().y();
    if (rawDelta == 0) {
        rawDelta = event->pixelDelta().y();
    }
    const qreal deltaY = -rawDelta;
    handleWheel(deltaY, event->position());
    event->accept();
}

void ViewportTransform::onFrameTimeout()
{
    if (!m_hasPendingWheel) {
        return;
    }
    m_hasPendingWheel = false;
    ++m_appliedWheelUpdates;
    applyViewport(m_pendingWheel);

    // Keep the frame open so trailing updates stay one per interval
    m_frameTimer->start();
}

void ViewportTransform::centerOn(const QSizeF& imageSize)
{
    flushPendingWheel();
    m_imageSize = imageSize;

    if (imageSize.isEmpty() || m_containerSize.isEmpty()) {
        applyViewport(Viewport());
        return;
    }

    const qreal fitX = m_containerSize.width() * m_settings.fitFraction / imageSize.width();
    const qreal fitY = m_containerSize.height() * m_settings.fitFraction / imageSize.height();

    Viewport next;
    next.zoom = clampZoom(qMin(fitX, fitY));

    // Screen-space left/top of the scaled image, converted back to image units
    const qreal left = (m_containerSize.width() - imageSize.width() * next.zoom) / 2.0;
    const qreal top = (m_containerSize.height() - imageSize.height() * next.zoom) / 2.0;
    next.offset = QPointF(left / next.zoom, top / next.zoom);

    applyViewport(next);
}

void ViewportTransform::panBy(const QPointF& screenDelta)
{
    flushPendingWheel();
    Viewport next = m_viewport;
    next.offset += screenDelta / m_viewport.zoom;
    applyViewport(next);
}

void ViewportTransform::zoomAtPoint(qreal factor, const QPointF& screenPt)
{
    flushPendingWheel();
    applyViewport(zoomedAround(m_viewport, factor, screenPt));
}

void ViewportTransform::setZoom(qreal zoom)
{
    flushPendingWheel();
    const qreal factor = clampZoom(zoom) / m_viewport.zoom;
    applyViewport(zoomedAround(m_viewport, factor,
                               QPointF(m_containerSize.width() / 2.0, m_containerSize.height() / 2.0)));
}

void ViewportTransform::setViewport(const Viewport& viewport)
{
    flushPendingWheel();
    applyViewport(viewport);
}

// ===== Constraints =====

qreal ViewportTransform::clampZoom(qreal zoom) const
{
    if (!qIsFinite(zoom) || zoom <= 0) {
        return m_viewport.zoom;
    }
    return qBound(m_settings.minZoom, zoom, m_settings.maxZoom);
}

QPointF ViewportTransform::constrain(const QPointF& offset, qreal zoom) const
{
    if (m_containerSize.isEmpty() || m_imageSize.isEmpty() || zoom <= 0) {
        return offset;
    }

    auto clampAxis = [this, zoom](qreal offsetAxis, qreal imageExtent, qreal containerExtent) {
        const qreal scaled = imageExtent * zoom;
        const qreal minVisible = qMin(m_settings.minVisibleFraction * scaled, containerExtent);
        const qreal edge = offsetAxis * zoom;
        const qreal lo = minVisible - scaled;
        const qreal hi = containerExtent - minVisible;
        return qBound(lo, edge, hi) / zoom;
    };

    return QPointF(clampAxis(offset.x(), m_imageSize.width(), m_containerSize.width()),
                   clampAxis(offset.y(), m_imageSize.height(), m_containerSize.height()));
}

// ===== Internals =====

Viewport ViewportTransform::zoomedAround(const Viewport& base, qreal factor, const QPointF& screenPt) const
{
    Viewport next;
    next.zoom = qBound(m_settings.minZoom, base.zoom * factor, m_settings.maxZoom);

    // Keep the image point under screenPt fixed
    const QPointF imagePt = screenPt / base.zoom - base.offset;
    next.offset = screenPt / next.zoom - imagePt;
    next.offset = constrain(next.offset, next.zoom);
    return next;
}

void ViewportTransform::flushPendingWheel()
{
    if (!m_hasPendingWheel) {
        return;
    }
    m_hasPendingWheel = false;
    ++m_appliedWheelUpdates;
    applyViewport(m_pendingWheel);
}

void ViewportTransform::applyViewport(const Viewport& next)
{
    Viewport constrained;
    constrained.zoom = qBound(m_settings.minZoom, next.zoom, m_settings.maxZoom);
    constrained.offset = constrain(next.offset, constrained.zoom);

    if (constrained == m_viewport) {
        return;
    }

    const bool zoomDiffers = !qFuzzyCompare(constrained.zoom, m_viewport.zoom);
    m_viewport = constrained;

#ifdef SPHEROCANVAS_DEBUG
    qDebug() << "ViewportTransform: zoom =" << m_viewport.zoom << "offset =" << m_viewport.offset;
#endif

    if (zoomDiffers) {
        emit zoomChanged(m_viewport.zoom);
    }
    emit panChanged(m_viewport.offset);
    emit viewportChanged();
}
