#pragma once

// ============================================================================
// PersistentThumbnailStore - Tier-2 storage interface of ThumbnailCache
// ============================================================================
// Implementations must be safe to call from QtConcurrent worker threads:
// ThumbnailCache::getAsync() reads through get() off the UI thread.
// ============================================================================

#include "ThumbnailCacheEntry.h"

class PersistentThumbnailStore {
public:
    virtual ~PersistentThumbnailStore() = default;

    /**
     * @brief False when the backing storage could not be opened, or after
     *        a write to it failed.
     *
     * An unavailable store answers every get() with a miss and ignores
     * writes, so the cache keeps working memory-only.
     */
    virtual bool isAvailable() const = 0;

    /**
     * @brief Look up an entry by its "imageId:lod" key.
     * @return The entry, or an invalid entry (isValid() == false) on miss.
     */
    virtual ThumbnailCacheEntry get(const QString& key) = 0;

    /**
     * @brief Insert or replace an entry.
     * @return false on write failure (already logged).
     */
    virtual bool put(const ThumbnailCacheEntry& entry) = 0;

    /**
     * @brief Remove every level of detail stored for an image.
     * @return Number of entries removed.
     */
    virtual int deleteByImage(const QString& imageId) = 0;

    /**
     * @brief Remove entries whose expiresAt is at or before now.
     * @return Number of entries removed.
     */
    virtual int deleteExpired(qint64 now) = 0;

    virtual void clear() = 0;

    virtual int count() const = 0;
};
