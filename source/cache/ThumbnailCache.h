#pragma once

// ============================================================================
// ThumbnailCache - Two-tier cache for rendered segmentation thumbnails
// ============================================================================
// Tier 1: in-memory hash, bounded by capacity (default 100). After each
//         insertion the oldest entries by cachedAt are dropped, ties broken by
//         insertion order.
// Tier 2: PersistentThumbnailStore (on disk), unbounded, swept hourly.
//
// Entries are keyed by "imageId:lod" and expire after the TTL (24h). A
// Tier-2 hit repopulates Tier 1. Tier-2 failures are logged by the store and
// the cache carries on memory-only; get()/set() never report them.
// ============================================================================

#include "ThumbnailCacheEntry.h"
#include "PersistentThumbnailStore.h"
#include "../core/EditorSettings.h"

#include <QObject>
#include <QHash>
#include <QSet>
#include <QList>
#include <QFutureWatcher>
#include <QTimer>

#include <functional>
#include <memory>

class ThumbnailCache : public QObject {
    Q_OBJECT

public:
    /**
     * @brief Hit/miss counters and footprint.
     */
    struct Stats {
        qint64 hits = 0;
        qint64 misses = 0;
        qint64 memoryHits = 0;
        qint64 diskHits = 0;
        int entryCount = 0;         ///< Tier-1 entries
        qint64 memoryBytes = 0;     ///< Estimated Tier-1 footprint

        qreal hitRate() const
        {
            const qint64 total = hits + misses;
            return total > 0 ? static_cast<qreal>(hits) / total : 0.0;
        }
    };

    /**
     * @param settings Capacity, TTL and sweep interval.
     * @param store Tier-2 store, owned. nullptr = memory-only.
     */
    explicit ThumbnailCache(const EditorSettings& settings,
                            std::unique_ptr<PersistentThumbnailStore> store,
                            QObject* parent = nullptr);
    ~ThumbnailCache() override;

    // ===== Cache operations =====

    /**
     * @brief Synchronous two-tier lookup.
     * @return The payload, or a null QByteArray when absent or expired.
     */
    QByteArray get(const QString& imageId, LevelOfDetail lod);

    /**
     * @brief Store a payload in both tiers.
     */
    void set(const QString& imageId, LevelOfDetail lod, const QByteArray& payload);

    /**
     * @brief Drop every level of detail of an image from both tiers.
     */
    void invalidate(const QString& imageId);

    /**
     * @brief Empty both tiers.
     */
    void clear();

    /**
     * @brief Lookup with the Tier-2 read on a worker thread.
     *
     * Result arrives as thumbnailReady() or thumbnailMissing(), always
     * after this call returns. A request for a key already being read is
     * ignored.
     */
    void getAsync(const QString& imageId, LevelOfDetail lod);

    /**
     * @brief Remove expired Tier-2 entries (the hourly sweep).
     * @return Number of entries removed.
     */
    int sweepExpired();

    // ===== Introspection / tuning =====

    bool containsInMemory(const QString& imageId, LevelOfDetail lod) const;
    int memoryEntryCount() const { return m_memory.size(); }

    int capacity() const { return m_capacity; }
    void setCapacity(int capacity);

    qint64 ttl() const { return m_ttlMs; }
    void setTtl(qint64 ttlMs);

    /**
     * @brief Override the wall clock (ms since epoch). Used by tests.
     */
    void setClock(std::function<qint64()> clock);

    Stats stats() const;
    void resetStats();

    PersistentThumbnailStore* persistentStore() const { return m_store.get(); }
    bool hasPersistentTier() const;

signals:
    void thumbnailReady(const QString& imageId, LevelOfDetail lod, const QByteArray& payload);
    void thumbnailMissing(const QString& imageId, LevelOfDetail lod);

private slots:
    void onDiskReadFinished();

private:
    struct MemoryEntry {
        ThumbnailCacheEntry entry;
        quint64 sequence = 0;       ///< Insertion order, breaks cachedAt ties
    };

    struct AsyncRead {
        QString key;
        QString imageId;
        LevelOfDetail lod = LevelOfDetail::Low;
        quint64 generation = 0;
    };

    qint64 now() const;
    void insertMemory(const ThumbnailCacheEntry& entry);
    void evictOverCapacity();
    QByteArray lookupMemory(const QString& key);
    quint64 generationOf(const QString& imageId) const;

    std::unique_ptr<PersistentThumbnailStore> m_store;
    std::function<qint64()> m_clock;

    QHash<QString, MemoryEntry> m_memory;
    quint64 m_nextSequence = 0;
    int m_capacity = 100;
    qint64 m_ttlMs = 24LL * 60 * 60 * 1000;

    // Stamped on invalidate()/clear() so in-flight reads cannot resurrect data.
    // clear() drops the per-image stamps; m_clearGeneration covers them.
    quint64 m_generationCounter = 0;
    QHash<QString, quint64> m_generations;
    quint64 m_clearGeneration = 0;

    QSet<QString> m_pendingKeys;
    QHash<QFutureWatcher<ThumbnailCacheEntry>*, AsyncRead> m_activeReads;
    bool m_shuttingDown = false;

    QTimer* m_sweepTimer = nullptr;

    Stats m_stats;
};
