#include "ThumbnailCache.h"

#include <QDateTime>
#include <QtConcurrent>
#include <QDebug>

#include <utility>

ThumbnailCache::ThumbnailCache(const EditorSettings& settings,
                               std::unique_ptr<PersistentThumbnailStore> store,
                               QObject* parent)
    : QObject(parent)
    , m_store(std::move(store))
    , m_capacity(qMax(1, settings.memoryCacheCapacity))
    , m_ttlMs(settings.cacheTtlMs > 0 ? settings.cacheTtlMs : m_ttlMs)
{
    if (m_store && !m_store->isAvailable()) {
        qWarning() << "ThumbnailCache: Persistent tier unavailable, caching in memory only";
    }

    m_sweepTimer = new QTimer(this);
    m_sweepTimer->setInterval(settings.cacheSweepIntervalMs);
    connect(m_sweepTimer, &QTimer::timeout, this, [this]() {
        sweepExpired();
    });
    m_sweepTimer->start();
}

ThumbnailCache::~ThumbnailCache()
{
    m_shuttingDown = true;

    // Workers read through m_store; it must outlive them
    const auto watchers = m_activeReads.keys();
    for (QFutureWatcher<ThumbnailCacheEntry>* watcher : watchers) {
        watcher->waitForFinished();
        delete watcher;
    }
    m_activeReads.clear();
}

// ===== Cache operations =====

QByteArray ThumbnailCache::get(const QString& imageId, LevelOfDetail lod)
{
    const QString key = ThumbnailCacheEntry::makeKey(imageId, lod);

    QByteArray payload = lookupMemory(key);
    if (!payload.isNull()) {
        m_stats.hits++;
        m_stats.memoryHits++;
        return payload;
    }

    if (hasPersistentTier()) {
        ThumbnailCacheEntry entry = m_store->get(key);
        if (entry.isValid() && !entry.isExpired(now())) {
            insertMemory(entry);
            m_stats.hits++;
            m_stats.diskHits++;
            return entry.payload;
        }
    }

    m_stats.misses++;
    return QByteArray();
}

void ThumbnailCache::set(const QString& imageId, LevelOfDetail lod, const QByteArray& payload)
{
    if (imageId.isEmpty() || payload.isNull()) {
        qWarning() << "ThumbnailCache: Ignoring set() with empty image id or null payload";
        return;
    }

    ThumbnailCacheEntry entry;
    entry.key = ThumbnailCacheEntry::makeKey(imageId, lod);
    entry.imageId = imageId;
    entry.lod = lod;
    entry.payload = payload;
    entry.cachedAt = now();
    entry.expiresAt = entry.cachedAt + m_ttlMs;

    insertMemory(entry);

    if (hasPersistentTier() && !m_store->put(entry) && !m_store->isAvailable()) {
        qWarning() << "ThumbnailCache: Persistent tier failed, caching in memory only";
    }
}

void ThumbnailCache::invalidate(const QString& imageId)
{
    for (auto it = m_memory.begin(); it != m_memory.end();) {
        if (it.value().entry.imageId == imageId) {
            it = m_memory.erase(it);
        } else {
            ++it;
        }
    }

    m_generations.insert(imageId, ++m_generationCounter);

    if (hasPersistentTier()) {
        m_store->deleteByImage(imageId);
    }

#ifdef SPHEROCANVAS_DEBUG
    qDebug() << "ThumbnailCache: Invalidated" << imageId;
#endif
}

void ThumbnailCache::clear()
{
    m_memory.clear();
    m_clearGeneration = ++m_generationCounter;
    m_generations.clear();

    if (hasPersistentTier()) {
        m_store->clear();
    }
}

void ThumbnailCache::getAsync(const QString& imageId, LevelOfDetail lod)
{
    const QString key = ThumbnailCacheEntry::makeKey(imageId, lod);
    if (m_pendingKeys.contains(key)) {
        return;
    }

    QByteArray payload = lookupMemory(key);
    if (!payload.isNull()) {
        m_stats.hits++;
        m_stats.memoryHits++;
        QTimer::singleShot(0, this, [this, imageId, lod, payload]() {
            emit thumbnailReady(imageId, lod, payload);
        });
        return;
    }

    if (!hasPersistentTier()) {
        m_stats.misses++;
        QTimer::singleShot(0, this, [this, imageId, lod]() {
            emit thumbnailMissing(imageId, lod);
        });
        return;
    }

    AsyncRead read;
    read.key = key;
    read.imageId = imageId;
    read.lod = lod;
    read.generation = generationOf(imageId);

    m_pendingKeys.insert(key);

    auto* watcher = new QFutureWatcher<ThumbnailCacheEntry>(this);
    connect(watcher, &QFutureWatcher<ThumbnailCacheEntry>::finished,
            this, &ThumbnailCache::onDiskReadFinished);
    m_activeReads.insert(watcher, read);

    PersistentThumbnailStore* store = m_store.get();
    QFuture<ThumbnailCacheEntry> future = QtConcurrent::run([store, key]() {
        return store->get(key);
    });
    watcher->setFuture(future);
}

void ThumbnailCache::onDiskReadFinished()
{
    if (m_shuttingDown) {
        return;
    }

    // QFutureWatcher is a template without Q_OBJECT, so use static_cast
    auto* watcher = static_cast<QFutureWatcher<ThumbnailCacheEntry>*>(sender());
    if (!watcher || !m_activeReads.contains(watcher)) {
        return;
    }

    const AsyncRead read = m_activeReads.take(watcher);
    m_pendingKeys.remove(read.key);

    ThumbnailCacheEntry entry;
    if (!watcher->isCanceled()) {
        entry = watcher->result();
    }
    watcher->deleteLater();

    // Invalidated or cleared while the read was in flight
    const bool stale = read.generation != generationOf(read.imageId);

    if (!stale && entry.isValid() && !entry.isExpired(now())) {
        insertMemory(entry);
        m_stats.hits++;
        m_stats.diskHits++;
        emit thumbnailReady(read.imageId, read.lod, entry.payload);
        return;
    }

    m_stats.misses++;
    emit thumbnailMissing(read.imageId, read.lod);
}

int ThumbnailCache::sweepExpired()
{
    const qint64 current = now();

    for (auto it = m_memory.begin(); it != m_memory.end();) {
        if (it.value().entry.isExpired(current)) {
            it = m_memory.erase(it);
        } else {
            ++it;
        }
    }

    if (!hasPersistentTier()) {
        return 0;
    }
    return m_store->deleteExpired(current);
}

// ===== Introspection / tuning =====

bool ThumbnailCache::containsInMemory(const QString& imageId, LevelOfDetail lod) const
{
    return m_memory.contains(ThumbnailCacheEntry::makeKey(imageId, lod));
}

void ThumbnailCache::setCapacity(int capacity)
{
    m_capacity = qMax(1, capacity);
    evictOverCapacity();
}

void ThumbnailCache::setTtl(qint64 ttlMs)
{
    if (ttlMs <= 0) {
        qWarning() << "ThumbnailCache: Ignoring non-positive TTL" << ttlMs;
        return;
    }
    m_ttlMs = ttlMs;
}

void ThumbnailCache::setClock(std::function<qint64()> clock)
{
    m_clock = std::move(clock);
}

ThumbnailCache::Stats ThumbnailCache::stats() const
{
    Stats s = m_stats;
    s.entryCount = m_memory.size();
    s.memoryBytes = 0;
    for (const MemoryEntry& m : std::as_const(m_memory)) {
        s.memoryBytes += m.entry.payload.size() + m.entry.key.size() * 2 + m.entry.imageId.size() * 2;
    }
    return s;
}

void ThumbnailCache::resetStats()
{
    m_stats = Stats();
}

bool ThumbnailCache::hasPersistentTier() const
{
    return m_store && m_store->isAvailable();
}

// ===== Internals =====

qint64 ThumbnailCache::now() const
{
    return m_clock ? m_clock() : QDateTime::currentMSecsSinceEpoch();
}

QByteArray ThumbnailCache::lookupMemory(const QString& key)
{
    auto it = m_memory.find(key);
    if (it == m_memory.end()) {
        return QByteArray();
    }
    if (it.value().entry.isExpired(now())) {
        m_memory.erase(it);
        return QByteArray();
    }
    return it.value().entry.payload;
}

void ThumbnailCache::insertMemory(const ThumbnailCacheEntry& entry)
{
    MemoryEntry m;
    m.entry = entry;
    m.sequence = m_nextSequence++;
    m_memory.insert(entry.key, m);
    evictOverCapacity();
}

void ThumbnailCache::evictOverCapacity()
{
    while (m_memory.size() > m_capacity) {
        auto oldest = m_memory.begin();
        for (auto it = m_memory.begin(); it != m_memory.end(); ++it) {
            const MemoryEntry& a = it.value();
            const MemoryEntry& b = oldest.value();
            if (a.entry.cachedAt < b.entry.cachedAt
                || (a.entry.cachedAt == b.entry.cachedAt && a.sequence < b.sequence)) {
                oldest = it;
            }
        }
#ifdef SPHEROCANVAS_DEBUG
        qDebug() << "ThumbnailCache: Evicting" << oldest.key();
#endif
        m_memory.erase(oldest);
    }
}

quint64 ThumbnailCache::generationOf(const QString& imageId) const
{
    // Both values come from one increasing counter, so any invalidate() or
    // clear() after a read started yields a larger generation
    return qMax(m_generations.value(imageId), m_clearGeneration);
}
