#pragma once

// ============================================================================
// ThumbnailRenderer - Async segmentation thumbnail generation
// ============================================================================
// Renders the polygons of a SegmentationResult (optionally over the source
// image) into a PNG at a level of detail's width, in background threads
// using QtConcurrent. Emits thumbnailReady when rendering completes.
//
// Thread safety:
// Polygons are simplified and copied into a snapshot on the main thread.
// Background threads only see the snapshot and paint into a QImage.
// ============================================================================

#include <QObject>
#include <QImage>
#include <QSet>
#include <QMutex>
#include <QFuture>
#include <QFutureWatcher>
#include <QColor>

#include "../core/Polygon.h"
#include "../cache/ThumbnailCacheEntry.h"

/**
 * @brief Async thumbnail renderer feeding the ThumbnailCache.
 *
 * Limits concurrent renders (default 2). Duplicate requests for an
 * image/level of detail that is already queued or rendering are ignored.
 */
class ThumbnailRenderer : public QObject {
    Q_OBJECT

public:
    explicit ThumbnailRenderer(QObject* parent = nullptr);
    ~ThumbnailRenderer();

    /**
     * @brief Request a thumbnail for a segmentation result.
     *
     * Returns immediately. When rendering completes, thumbnailReady is
     * emitted. Results without an image size or image id are ignored.
     *
     * @param result Segmentation to render (copied).
     * @param lod Level of detail; selects the output width.
     * @param background Optional source image drawn under the polygons.
     */
    void requestThumbnail(const SegmentationResult& result, LevelOfDetail lod,
                          const QImage& background = QImage());

    /**
     * @brief Drop queued requests and wait out the ones already running.
     */
    void cancelAll();

    bool isPending(const QString& imageId, LevelOfDetail lod) const;

    void setMaxConcurrentRenders(int max);

    /**
     * @brief Synchronous render, used by the workers and by tests.
     * @return Thumbnail of the given width with the image aspect ratio,
     *         or a null image when the result has no size.
     */
    static QImage renderImage(const SegmentationResult& result, const QImage& background, int width);

    /**
     * @brief PNG-encode an image; null QByteArray on failure.
     */
    static QByteArray encodePng(const QImage& image);

signals:
    void thumbnailReady(const QString& imageId, LevelOfDetail lod, const QByteArray& png);

private slots:
    void onRenderFinished();

private:
    /**
     * @brief Thread-safe copy of everything a render needs.
     */
    struct ThumbnailSnapshot {
        QString key;                ///< imageId:lod
        QString imageId;
        LevelOfDetail lod = LevelOfDetail::Low;
        int width = 0;
        SegmentationResult result;  ///< Polygons already simplified
        QImage background;
        bool valid = false;
    };

    struct RenderOutput {
        QString key;
        QString imageId;
        LevelOfDetail lod = LevelOfDetail::Low;
        QByteArray png;
    };

    static ThumbnailSnapshot createSnapshot(const SegmentationResult& result, LevelOfDetail lod,
                                            const QImage& background);
    static RenderOutput renderFromSnapshot(const ThumbnailSnapshot& snapshot);

    void startNextTask();

    // Requests that have not started yet
    QList<ThumbnailSnapshot> m_pendingTasks;

    // Keys currently being rendered
    QSet<QString> m_activeKeys;

    QList<QFutureWatcher<RenderOutput>*> m_activeWatchers;

    mutable QMutex m_mutex;

    int m_maxConcurrent = 2;

    bool m_shuttingDown = false;
};
