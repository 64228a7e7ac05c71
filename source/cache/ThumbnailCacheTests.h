#ifndef THUMBNAILCACHETESTS_H
#define THUMBNAILCACHETESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include <QTemporaryDir>
#include <QDir>
#include <QFile>

#include <memory>

#include "ThumbnailCache.h"
#include "DiskThumbnailStore.h"

/**
 * Store whose writes fail once the disk "fills up", as a quota error would.
 */
class FullDiskThumbnailStore : public PersistentThumbnailStore {
public:
    bool isAvailable() const override { return m_available; }
    ThumbnailCacheEntry get(const QString&) override { getCalls++; return ThumbnailCacheEntry(); }
    bool put(const ThumbnailCacheEntry&) override
    {
        putCalls++;
        m_available = false;
        return false;
    }
    int deleteByImage(const QString&) override { return 0; }
    int deleteExpired(qint64) override { return 0; }
    void clear() override {}
    int count() const override { return 0; }

    int putCalls = 0;
    int getCalls = 0;

private:
    bool m_available = true;
};

/**
 * Unit tests for ThumbnailCache and DiskThumbnailStore.
 * Run with: spherocanvas_tests cache
 */
class ThumbnailCacheTests : public QObject {
    Q_OBJECT

private:
    static constexpr qint64 HOUR_MS = 60LL * 60 * 1000;
    static constexpr qint64 START_MS = 1700000000000LL;

    QTemporaryDir* m_dir = nullptr;
    qint64 m_now = START_MS;

    std::unique_ptr<ThumbnailCache> makeCache(int capacity = 100)
    {
        EditorSettings settings;
        settings.memoryCacheCapacity = capacity;
        auto cache = std::make_unique<ThumbnailCache>(
            settings, std::make_unique<DiskThumbnailStore>(m_dir->filePath("thumbs")));
        cache->setClock([this]() { return m_now; });
        return cache;
    }

private slots:
    void init() {
        m_dir = new QTemporaryDir();
        QVERIFY(m_dir->isValid());
        m_now = START_MS;
    }

    void cleanup() {
        delete m_dir;
        m_dir = nullptr;
    }

    // ===== Two-tier behaviour =====

    void testSetThenGetBeforeTtl() {
        auto cache = makeCache();
        cache->set("img", LevelOfDetail::Medium, QByteArray("png-bytes"));

        m_now += 23 * HOUR_MS;
        QCOMPARE(cache->get("img", LevelOfDetail::Medium), QByteArray("png-bytes"));
        QVERIFY(cache->get("img", LevelOfDetail::Low).isNull());
        QCOMPARE(cache->stats().hits, qint64(1));
        QCOMPARE(cache->stats().misses, qint64(1));
    }

    void testExpiredEntriesMiss() {
        auto cache = makeCache();
        cache->set("img", LevelOfDetail::Low, QByteArray("x"));

        m_now += 24 * HOUR_MS;
        QVERIFY(cache->get("img", LevelOfDetail::Low).isNull());
        QVERIFY(!cache->containsInMemory("img", LevelOfDetail::Low));

        QCOMPARE(cache->sweepExpired(), 1);
        QCOMPARE(cache->persistentStore()->count(), 0);
    }

    void testInvalidateMissesBothTiers() {
        auto cache = makeCache();
        cache->set("a", LevelOfDetail::Low, QByteArray("a-low"));
        cache->set("a", LevelOfDetail::High, QByteArray("a-high"));
        cache->set("b", LevelOfDetail::Low, QByteArray("b-low"));

        cache->invalidate("a");
        QVERIFY(cache->get("a", LevelOfDetail::Low).isNull());
        QVERIFY(cache->get("a", LevelOfDetail::High).isNull());
        QCOMPARE(cache->get("b", LevelOfDetail::Low), QByteArray("b-low"));
        QCOMPARE(cache->persistentStore()->count(), 1);
    }

    void testEvictsOldestButDiskStillServes() {
        auto cache = makeCache(100);
        for (int i = 0; i <= 100; ++i) {
            cache->set(QString("img-%1").arg(i), LevelOfDetail::Low, QByteArray::number(i));
            m_now += 1;
        }

        QCOMPARE(cache->memoryEntryCount(), 100);
        QVERIFY(!cache->containsInMemory("img-0", LevelOfDetail::Low));
        for (int i = 1; i <= 100; ++i) {
            QVERIFY(cache->containsInMemory(QString("img-%1").arg(i), LevelOfDetail::Low));
        }

        QCOMPARE(cache->get("img-0", LevelOfDetail::Low), QByteArray("0"));
        QCOMPARE(cache->stats().diskHits, qint64(1));

        // Promotion keeps the original cachedAt, so the bound still holds
        QCOMPARE(cache->memoryEntryCount(), 100);
    }

    void testEvictionTieBreaksOnInsertionOrder() {
        auto cache = makeCache(2);
        cache->set("first", LevelOfDetail::Low, QByteArray("1"));
        cache->set("second", LevelOfDetail::Low, QByteArray("2"));
        cache->set("third", LevelOfDetail::Low, QByteArray("3"));

        QVERIFY(!cache->containsInMemory("first", LevelOfDetail::Low));
        QVERIFY(cache->containsInMemory("second", LevelOfDetail::Low));
        QVERIFY(cache->containsInMemory("third", LevelOfDetail::Low));
    }

    void testSetRejectsBadInput() {
        auto cache = makeCache();
        cache->set("", LevelOfDetail::Low, QByteArray("x"));
        cache->set("img", LevelOfDetail::Low, QByteArray());
        QCOMPARE(cache->memoryEntryCount(), 0);
        QCOMPARE(cache->persistentStore()->count(), 0);
    }

    void testTtlMustBePositive() {
        auto cache = makeCache();
        cache->setTtl(0);
        QCOMPARE(cache->ttl(), 24 * HOUR_MS);
        cache->setTtl(HOUR_MS);
        QCOMPARE(cache->ttl(), HOUR_MS);
    }

    void testClear() {
        auto cache = makeCache();
        cache->set("a", LevelOfDetail::Low, QByteArray("a"));
        cache->clear();
        QVERIFY(cache->get("a", LevelOfDetail::Low).isNull());
        QCOMPARE(cache->persistentStore()->count(), 0);
    }

    // ===== Async reads =====

    void testGetAsyncFromDisk() {
        {
            auto writer = makeCache();
            writer->set("img", LevelOfDetail::High, QByteArray("stored"));
        }

        auto cache = makeCache();
        QVERIFY(!cache->containsInMemory("img", LevelOfDetail::High));

        QSignalSpy readySpy(cache.get(), &ThumbnailCache::thumbnailReady);
        cache->getAsync("img", LevelOfDetail::High);
        cache->getAsync("img", LevelOfDetail::High);   // Coalesced with the first

        QTRY_COMPARE(readySpy.count(), 1);
        QCOMPARE(readySpy.at(0).at(2).toByteArray(), QByteArray("stored"));
        QVERIFY(cache->containsInMemory("img", LevelOfDetail::High));
    }

    void testGetAsyncMissing() {
        auto cache = makeCache();
        QSignalSpy missingSpy(cache.get(), &ThumbnailCache::thumbnailMissing);
        cache->getAsync("nothing", LevelOfDetail::Low);
        QTRY_COMPARE(missingSpy.count(), 1);
        QCOMPARE(missingSpy.at(0).at(0).toString(), QString("nothing"));
    }

    void testInvalidateDuringAsyncRead() {
        {
            auto writer = makeCache();
            writer->set("img", LevelOfDetail::Low, QByteArray("old"));
        }

        auto cache = makeCache();
        QSignalSpy readySpy(cache.get(), &ThumbnailCache::thumbnailReady);
        QSignalSpy missingSpy(cache.get(), &ThumbnailCache::thumbnailMissing);

        cache->getAsync("img", LevelOfDetail::Low);
        cache->invalidate("img");

        QTRY_COMPARE(readySpy.count() + missingSpy.count(), 1);
        QCOMPARE(readySpy.count(), 0);
        QVERIFY(!cache->containsInMemory("img", LevelOfDetail::Low));
    }

    void testClearAfterInvalidateDuringAsyncRead() {
        auto cache = makeCache();
        cache->set("img", LevelOfDetail::Low, QByteArray("first"));
        cache->invalidate("img");
        cache->set("img", LevelOfDetail::Low, QByteArray("second"));

        // Drop the memory copy so the read goes to disk
        cache->setCapacity(1);
        cache->set("filler", LevelOfDetail::Low, QByteArray("f"));
        QVERIFY(!cache->containsInMemory("img", LevelOfDetail::Low));

        QSignalSpy readySpy(cache.get(), &ThumbnailCache::thumbnailReady);
        QSignalSpy missingSpy(cache.get(), &ThumbnailCache::thumbnailMissing);

        cache->getAsync("img", LevelOfDetail::Low);
        cache->clear();

        QTRY_COMPARE(readySpy.count() + missingSpy.count(), 1);
        QCOMPARE(missingSpy.count(), 1);
        QVERIFY(!cache->containsInMemory("img", LevelOfDetail::Low));
    }

    // ===== Degraded persistent tier =====

    void testUnavailableStoreFallsBackToMemory() {
        // A regular file where the cache directory should go
        const QString blocker = m_dir->filePath("blocker");
        QFile file(blocker);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.close();

        EditorSettings settings;
        ThumbnailCache cache(settings, std::make_unique<DiskThumbnailStore>(blocker + "/thumbs"));
        QVERIFY(!cache.hasPersistentTier());

        cache.set("img", LevelOfDetail::Low, QByteArray("mem"));
        QCOMPARE(cache.get("img", LevelOfDetail::Low), QByteArray("mem"));

        QSignalSpy missingSpy(&cache, &ThumbnailCache::thumbnailMissing);
        cache.getAsync("other", LevelOfDetail::Low);
        QTRY_COMPARE(missingSpy.count(), 1);
    }

    void testWriteFailureSwitchesToMemoryOnly() {
        auto* store = new FullDiskThumbnailStore();
        ThumbnailCache cache(EditorSettings(), std::unique_ptr<PersistentThumbnailStore>(store));
        QVERIFY(cache.hasPersistentTier());

        cache.set("a", LevelOfDetail::Low, QByteArray("a"));
        QCOMPARE(store->putCalls, 1);
        QVERIFY(!cache.hasPersistentTier());
        QCOMPARE(cache.get("a", LevelOfDetail::Low), QByteArray("a"));

        // No further writes or reads reach the failed tier
        cache.set("b", LevelOfDetail::Low, QByteArray("b"));
        QVERIFY(cache.get("c", LevelOfDetail::Low).isNull());
        QCOMPARE(store->putCalls, 1);
        QCOMPARE(store->getCalls, 0);
    }

    void testDiskStoreDisablesItselfWhenDirectoryVanishes() {
        const QString path = m_dir->filePath("vanishing");
        DiskThumbnailStore store(path);
        QVERIFY(store.isAvailable());

        ThumbnailCacheEntry entry;
        entry.key = ThumbnailCacheEntry::makeKey("img", LevelOfDetail::Low);
        entry.imageId = "img";
        entry.lod = LevelOfDetail::Low;
        entry.payload = QByteArray("payload");
        entry.cachedAt = START_MS;
        entry.expiresAt = START_MS + HOUR_MS;
        QVERIFY(store.put(entry));

        // Replace the directory with a regular file so every write fails
        QVERIFY(QDir(path).removeRecursively());
        QFile blocker(path);
        QVERIFY(blocker.open(QIODevice::WriteOnly));
        blocker.close();

        entry.key = ThumbnailCacheEntry::makeKey("img", LevelOfDetail::High);
        entry.lod = LevelOfDetail::High;
        QVERIFY(!store.put(entry));
        QVERIFY(!store.isAvailable());
        QCOMPARE(store.count(), 0);
        QVERIFY(!store.get(ThumbnailCacheEntry::makeKey("img", LevelOfDetail::Low)).isValid());
        QVERIFY(!store.put(entry));
    }

    void testMemoryOnlyWithoutStore() {
        ThumbnailCache cache(EditorSettings(), nullptr);
        QVERIFY(!cache.hasPersistentTier());
        cache.set("img", LevelOfDetail::Medium, QByteArray("m"));
        QCOMPARE(cache.get("img", LevelOfDetail::Medium), QByteArray("m"));
        cache.invalidate("img");
        QVERIFY(cache.get("img", LevelOfDetail::Medium).isNull());
    }

    // ===== Disk store =====

    void testDiskStoreSurvivesReopen() {
        const QString path = m_dir->filePath("store");
        ThumbnailCacheEntry entry;
        entry.key = ThumbnailCacheEntry::makeKey("img", LevelOfDetail::Medium);
        entry.imageId = "img";
        entry.lod = LevelOfDetail::Medium;
        entry.payload = QByteArray("payload");
        entry.cachedAt = START_MS;
        entry.expiresAt = START_MS + HOUR_MS;
        {
            DiskThumbnailStore store(path);
            QVERIFY(store.isAvailable());
            QVERIFY(store.put(entry));
        }

        DiskThumbnailStore reopened(path);
        QCOMPARE(reopened.count(), 1);
        const ThumbnailCacheEntry loaded = reopened.get(entry.key);
        QVERIFY(loaded.isValid());
        QCOMPARE(loaded.payload, entry.payload);
        QCOMPARE(loaded.expiresAt, entry.expiresAt);
        QVERIFY(loaded.lod == LevelOfDetail::Medium);

        QCOMPARE(reopened.deleteExpired(START_MS + HOUR_MS), 1);
        QCOMPARE(reopened.count(), 0);
    }

    void testDiskStoreCorruptIndexStartsEmpty() {
        const QString path = m_dir->filePath("corrupt");
        QVERIFY(QDir().mkpath(path));
        QFile index(path + "/index.json");
        QVERIFY(index.open(QIODevice::WriteOnly));
        index.write("{ not json");
        index.close();

        DiskThumbnailStore store(path);
        QVERIFY(store.isAvailable());
        QCOMPARE(store.count(), 0);
        QVERIFY(!store.get("img:low").isValid());
    }

    void testLevelOfDetailNames() {
        LevelOfDetail lod = LevelOfDetail::Low;
        QVERIFY(levelOfDetailFromName("high", &lod));
        QVERIFY(lod == LevelOfDetail::High);
        QVERIFY(!levelOfDetailFromName("huge", &lod));
        QCOMPARE(ThumbnailCacheEntry::makeKey("abc", LevelOfDetail::Medium), QString("abc:medium"));
        QVERIFY(levelOfDetailWidth(LevelOfDetail::Low) < levelOfDetailWidth(LevelOfDetail::High));
    }
};

#endif // THUMBNAILCACHETESTS_H
