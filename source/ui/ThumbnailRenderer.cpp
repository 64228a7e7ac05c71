#include "ThumbnailRenderer.h"
#include "../core/PolygonSimplifier.h"

#include <QBuffer>
#include <QPainter>
#include <QPainterPath>
#include <QtConcurrent>
#include <QDebug>

namespace {

const QColor EXTERNAL_STROKE(239, 68, 68);
const QColor EXTERNAL_FILL(239, 68, 68, 77);
const QColor INTERNAL_STROKE(14, 165, 233);
const QColor INTERNAL_FILL(14, 165, 233, 77);

}

ThumbnailRenderer::ThumbnailRenderer(QObject* parent)
    : QObject(parent)
{
}

ThumbnailRenderer::~ThumbnailRenderer()
{
    m_shuttingDown = true;
    cancelAll();
}

void ThumbnailRenderer::requestThumbnail(const SegmentationResult& result, LevelOfDetail lod,
                                         const QImage& background)
{
    if (result.imageId.isEmpty() || result.imageWidth <= 0 || result.imageHeight <= 0) {
        qWarning() << "ThumbnailRenderer: Cannot render" << result.imageId << "- missing id or image size";
        return;
    }

    const QString key = ThumbnailCacheEntry::makeKey(result.imageId, lod);

    QMutexLocker locker(&m_mutex);

    if (m_activeKeys.contains(key)) {
        return;  // Already rendering
    }
    for (const ThumbnailSnapshot& pending : m_pendingTasks) {
        if (pending.key == key) {
            return;  // Already queued
        }
    }

    locker.unlock();

    // Snapshot on the main thread: simplification and deep copies happen here
    ThumbnailSnapshot snapshot = createSnapshot(result, lod, background);
    if (!snapshot.valid) {
        return;
    }

    locker.relock();
    m_pendingTasks.append(std::move(snapshot));
    locker.unlock();

    startNextTask();
}

void ThumbnailRenderer::cancelAll()
{
    QMutexLocker locker(&m_mutex);

    m_pendingTasks.clear();

    for (QFutureWatcher<RenderOutput>* watcher : m_activeWatchers) {
        watcher->cancel();
        watcher->waitForFinished();
        delete watcher;
    }
    m_activeWatchers.clear();
    m_activeKeys.clear();
}

bool ThumbnailRenderer::isPending(const QString& imageId, LevelOfDetail lod) const
{
    const QString key = ThumbnailCacheEntry::makeKey(imageId, lod);

    QMutexLocker locker(&m_mutex);

    if (m_activeKeys.contains(key)) {
        return true;
    }
    for (const ThumbnailSnapshot& pending : m_pendingTasks) {
        if (pending.key == key) {
            return true;
        }
    }
    return false;
}

void ThumbnailRenderer::setMaxConcurrentRenders(int max)
{
    QMutexLocker locker(&m_mutex);
    m_maxConcurrent = qMax(1, max);
}

void ThumbnailRenderer::startNextTask()
{
    QMutexLocker locker(&m_mutex);

    while (m_activeWatchers.size() < m_maxConcurrent && !m_pendingTasks.isEmpty()) {
        ThumbnailSnapshot snapshot = m_pendingTasks.takeFirst();
        m_activeKeys.insert(snapshot.key);

        auto* watcher = new QFutureWatcher<RenderOutput>(this);
        connect(watcher, &QFutureWatcher<RenderOutput>::finished,
                this, &ThumbnailRenderer::onRenderFinished);
        m_activeWatchers.append(watcher);

        QFuture<RenderOutput> future = QtConcurrent::run([snapshot = std::move(snapshot)]() {
            return renderFromSnapshot(snapshot);
        });
        watcher->setFuture(future);
    }
}

void ThumbnailRenderer::onRenderFinished()
{
    if (m_shuttingDown) {
        return;
    }

    // QFutureWatcher is a template without Q_OBJECT, so use static_cast
    auto* watcher = static_cast<QFutureWatcher<RenderOutput>*>(sender());
    if (!watcher) {
        return;
    }

    RenderOutput output;
    const bool wasCancelled = watcher->isCanceled();
    if (!wasCancelled) {
        output = watcher->result();
    }

    {
        QMutexLocker locker(&m_mutex);
        m_activeWatchers.removeOne(watcher);
        if (!wasCancelled) {
            m_activeKeys.remove(output.key);
        }
    }

    watcher->deleteLater();

    if (!wasCancelled) {
        if (output.png.isEmpty()) {
            qWarning() << "ThumbnailRenderer: Render failed for" << output.key;
        } else {
            emit thumbnailReady(output.imageId, output.lod, output.png);
        }
    }

    startNextTask();
}

ThumbnailRenderer::ThumbnailSnapshot ThumbnailRenderer::createSnapshot(
    const SegmentationResult& result, LevelOfDetail lod, const QImage& background)
{
    ThumbnailSnapshot snapshot;
    snapshot.key = ThumbnailCacheEntry::makeKey(result.imageId, lod);
    snapshot.imageId = result.imageId;
    snapshot.lod = lod;
    snapshot.width = levelOfDetailWidth(lod);

    snapshot.result.imageId = result.imageId;
    snapshot.result.imageWidth = result.imageWidth;
    snapshot.result.imageHeight = result.imageHeight;

    const qreal tolerance = PolygonSimplifier::toleranceForImage(result.imageWidth, result.imageHeight);
    const QVector<Polygon> clean = sanitizePolygons(result.polygons);
    snapshot.result.polygons.reserve(clean.size());
    for (const Polygon& polygon : clean) {
        snapshot.result.polygons.append(PolygonSimplifier::simplifyForDisplay(polygon, tolerance));
    }

    // Scale on the main thread so workers never touch the full-size image
    if (!background.isNull()) {
        snapshot.background = background.scaledToWidth(snapshot.width, Qt::SmoothTransformation);
    }

    snapshot.valid = true;
    return snapshot;
}

ThumbnailRenderer::RenderOutput ThumbnailRenderer::renderFromSnapshot(const ThumbnailSnapshot& snapshot)
{
    RenderOutput output;
    output.key = snapshot.key;
    output.imageId = snapshot.imageId;
    output.lod = snapshot.lod;

    QImage image = renderImage(snapshot.result, snapshot.background, snapshot.width);
    if (!image.isNull()) {
        output.png = encodePng(image);
    }
    return output;
}

QImage ThumbnailRenderer::renderImage(const SegmentationResult& result, const QImage& background, int width)
{
    if (width <= 0 || result.imageWidth <= 0 || result.imageHeight <= 0) {
        return QImage();
    }

    const qreal scale = static_cast<qreal>(width) / result.imageWidth;
    const int height = qMax(1, qRound(result.imageHeight * scale));

    QImage image(width, height, QImage::Format_ARGB32_Premultiplied);
    image.fill(Qt::transparent);

    QPainter painter(&image);
    painter.setRenderHint(QPainter::Antialiasing, true);

    if (!background.isNull()) {
        painter.drawImage(QRectF(0, 0, width, height), background);
    }

    painter.scale(scale, scale);

    // Externals first so holes end up on top
    for (int pass = 0; pass < 2; ++pass) {
        const bool externalPass = pass == 0;
        for (const Polygon& polygon : result.polygons) {
            if (polygon.isExternal() != externalPass || polygon.points.size() < 3) {
                continue;
            }
            QPainterPath path;
            path.addPolygon(QPolygonF(polygon.points));
            path.closeSubpath();

            QPen pen(externalPass ? EXTERNAL_STROKE : INTERNAL_STROKE);
            pen.setCosmetic(true);
            pen.setWidthF(1.0);
            pen.setJoinStyle(Qt::RoundJoin);
            painter.setPen(pen);
            painter.setBrush(externalPass ? EXTERNAL_FILL : INTERNAL_FILL);
            painter.drawPath(path);
        }
    }

    painter.end();
    return image;
}

QByteArray ThumbnailRenderer::encodePng(const QImage& image)
{
    QByteArray bytes;
    QBuffer buffer(&bytes);
    if (!buffer.open(QIODevice::WriteOnly) || !image.save(&buffer, "PNG")) {
        return QByteArray();
    }
    return bytes;
}
