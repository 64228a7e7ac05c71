#pragma once

// ============================================================================
// DiskThumbnailStore - On-disk PersistentThumbnailStore
// ============================================================================
// Layout under the store directory:
//
//     index.json          {"version": 1, "entries": [{key, imageId, lod,
//                          cachedAt, expiresAt, file}, ...]}
//     <sha1(key)>.thumb   raw payload bytes, one file per key
//
// The index is held in memory and rewritten after every change. A missing or
// corrupt index starts the store empty; orphaned payload files are removed on
// open. Every failure is logged and degrades, nothing is thrown.
// ============================================================================

#include "PersistentThumbnailStore.h"

#include <QHash>
#include <QMutex>

class DiskThumbnailStore : public PersistentThumbnailStore {
public:
    /**
     * @brief Open (and create if needed) a store.
     * @param directory Store directory. Empty = <CacheLocation>/thumbnails.
     */
    explicit DiskThumbnailStore(const QString& directory = QString());
    ~DiskThumbnailStore() override;

    bool isAvailable() const override;
    ThumbnailCacheEntry get(const QString& key) override;
    bool put(const ThumbnailCacheEntry& entry) override;
    int deleteByImage(const QString& imageId) override;
    int deleteExpired(qint64 now) override;
    void clear() override;
    int count() const override;

    QString directory() const { return m_directory; }

    static QString defaultDirectory();

private:
    /**
     * @brief Index record; the payload lives in `file`.
     */
    struct IndexRecord {
        QString key;
        QString imageId;
        LevelOfDetail lod = LevelOfDetail::Low;
        qint64 cachedAt = 0;
        qint64 expiresAt = 0;
        QString file;
    };

    static constexpr int INDEX_VERSION = 1;

    void loadIndex();
    bool writeIndex();
    void removeOrphanFiles();
    void removeRecord(const QString& key);

    /**
     * @brief Stop using the store after a write failure. Caller holds m_mutex.
     */
    void markUnavailable();

    QString payloadPath(const QString& file) const;
    static QString fileNameForKey(const QString& key);

    QString m_directory;
    bool m_available = false;

    mutable QMutex m_mutex;
    QHash<QString, IndexRecord> m_index;    ///< key -> record
};
