#pragma once

// ============================================================================
// StatusReconciler - Keeps local image statuses in step with the backend
// ============================================================================
// Two event sources feed one local table:
//   - push updates (optimistic, applied immediately via applyPushUpdate)
//   - authoritative fetches from a StatusSource, merged by merge()
//
// Fetches are triggered by a periodic check (every reconcileIntervalMs while
// there is active or stale work) and by a delayed check after the processing
// queue drains. At most one fetch is in flight and fetches are at least
// reconcileThrottleMs apart. A result is applied whenever it arrives.
//
// Anti-flicker: an image completed locally within antiFlickerMs is not
// moved back to Processing/Queued by an authoritative value that lags behind.
// ============================================================================

#include "ImageStatus.h"
#include "../core/EditorSettings.h"

#include <QObject>
#include <QHash>
#include <QPointer>
#include <QStringList>
#include <QTimer>

#include <functional>

class StatusSource;

class StatusReconciler : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Outcome of merging an authoritative list into local records.
     */
    struct MergeResult {
        QVector<ImageStatusRecord> records;     ///< Local order preserved
        QStringList changedIds;
        QStringList keptIds;                    ///< Downgrades refused by anti-flicker
    };

    explicit StatusReconciler(const EditorSettings& settings = EditorSettings(), QObject* parent = nullptr);
    ~StatusReconciler() override;

    // ===== Pure merge logic =====

    /**
     * @brief Merge authoritative statuses into local ones.
     *
     * Images unknown locally are ignored; local images missing from the
     * authoritative list are kept unchanged.
     */
    static MergeResult merge(const QVector<ImageStatusRecord>& local,
                             const QVector<ImageStatusRecord>& authoritative,
                             qint64 now, int antiFlickerMs);

    /**
     * @brief True when local must win over the authoritative status.
     */
    static bool isProtectedCompletion(const ImageStatusRecord& local, ImageProcessingStatus authoritative,
                                      qint64 now, int antiFlickerMs);

    /**
     * @brief Processing images that look abandoned.
     *
     * Stale when Processing for longer than staleMs without an update, or
     * when Processing while the queue reports zero processing jobs.
     */
    static bool hasStaleProcessing(const QVector<ImageStatusRecord>& records, const QueueStats* queueStats,
                                   qint64 now, int staleMs);

    // ===== Wiring =====

    /**
     * @brief Set the authoritative source (not owned).
     */
    void setSource(StatusSource* source);
    StatusSource* source() const { return m_source; }

    void setProjectId(const QString& projectId);
    QString projectId() const { return m_projectId; }

    /**
     * @brief While disconnected no fetch is started.
     */
    void setConnected(bool connected);
    bool isConnected() const { return m_connected; }

    /**
     * @brief Override the wall clock (ms since epoch). Used by tests.
     */
    void setClock(std::function<qint64()> clock);

    // ===== Local state =====

    /**
     * @brief Replace the local table (image list loaded).
     */
    void setImages(const QVector<ImageStatusRecord>& records);
    QVector<ImageStatusRecord> images() const;
    ImageStatusRecord record(const QString& imageId) const;
    bool contains(const QString& imageId) const { return m_records.contains(imageId); }

    QueueStats queueStats() const { return m_queueStats; }

    /**
     * @brief Whether the periodic check would fetch right now.
     */
    bool needsPolling() const;

    bool isFetchInFlight() const { return m_fetchInFlight; }
    int fetchCount() const { return m_fetchCount; }

public slots:
    /**
     * @brief Optimistic update from the push channel.
     *
     * Applied at once. Ignored when older than the local record. Unknown
     * images are added.
     */
    void applyPushUpdate(const ImageStatusRecord& update);

    /**
     * @brief New counts from the processing queue.
     *
     * A non-empty -> empty transition schedules a check after
     * queueEmptyDelayMs.
     */
    void setQueueStats(const QueueStats& stats);

    /**
     * @brief Start a fetch unless throttled, in flight, or not configured.
     * @return True if a fetch was started.
     */
    bool reconcileNow();

signals:
    void statusesChanged(const QStringList& imageIds);
    void reconcileStarted();
    void reconcileFinished(bool success);

private slots:
    void onPollTimeout();
    void onStatusesFetched(const QString& projectId, const QVector<ImageStatusRecord>& records);
    void onFetchFailed(const QString& projectId, const QString& error);

private:
    qint64 now() const;

    EditorSettings m_settings;
    QPointer<StatusSource> m_source;
    QString m_projectId;
    bool m_connected = true;
    std::function<qint64()> m_clock;

    QHash<QString, ImageStatusRecord> m_records;
    QStringList m_order;

    QueueStats m_queueStats;
    bool m_hasQueueStats = false;

    bool m_fetchInFlight = false;
    qint64 m_lastReconcileAt = 0;
    bool m_hasReconciled = false;
    int m_fetchCount = 0;

    QTimer* m_pollTimer = nullptr;
    QTimer* m_queueEmptyTimer = nullptr;
};
