#include "DiskThumbnailStore.h"

#include <QCryptographicHash>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutexLocker>
#include <QSaveFile>
#include <QSet>
#include <QStandardPaths>
#include <QDebug>

#include <utility>

DiskThumbnailStore::DiskThumbnailStore(const QString& directory)
    : m_directory(directory.isEmpty() ? defaultDirectory() : directory)
{
    if (!QDir().mkpath(m_directory)) {
        qWarning() << "DiskThumbnailStore: Cannot create" << m_directory << "- running memory-only";
        return;
    }

    m_available = true;
    loadIndex();
    removeOrphanFiles();
}

DiskThumbnailStore::~DiskThumbnailStore() = default;

QString DiskThumbnailStore::defaultDirectory()
{
    return QStandardPaths::writableLocation(QStandardPaths::CacheLocation) + "/thumbnails";
}

bool DiskThumbnailStore::isAvailable() const
{
    QMutexLocker locker(&m_mutex);
    return m_available;
}

int DiskThumbnailStore::count() const
{
    QMutexLocker locker(&m_mutex);
    return m_index.size();
}

// ===== Reads =====

ThumbnailCacheEntry DiskThumbnailStore::get(const QString& key)
{
    QMutexLocker locker(&m_mutex);

    if (!m_available) {
        return ThumbnailCacheEntry();
    }

    auto it = m_index.constFind(key);
    if (it == m_index.constEnd()) {
        return ThumbnailCacheEntry();
    }

    const IndexRecord record = it.value();
    QFile file(payloadPath(record.file));
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "DiskThumbnailStore: Payload missing for" << key << "- dropping index entry";
        removeRecord(key);
        writeIndex();
        return ThumbnailCacheEntry();
    }

    ThumbnailCacheEntry entry;
    entry.key = record.key;
    entry.imageId = record.imageId;
    entry.lod = record.lod;
    entry.cachedAt = record.cachedAt;
    entry.expiresAt = record.expiresAt;
    entry.payload = file.readAll();
    file.close();

    if (entry.payload.isNull()) {
        // Zero-length file: store an empty but non-null payload
        entry.payload = QByteArray("");
    }
    return entry;
}

// ===== Writes =====

bool DiskThumbnailStore::put(const ThumbnailCacheEntry& entry)
{
    if (!entry.isValid()) {
        return false;
    }

    QMutexLocker locker(&m_mutex);

    if (!m_available) {
        return false;
    }

    IndexRecord record;
    record.key = entry.key;
    record.imageId = entry.imageId;
    record.lod = entry.lod;
    record.cachedAt = entry.cachedAt;
    record.expiresAt = entry.expiresAt;
    record.file = fileNameForKey(entry.key);

    QSaveFile file(payloadPath(record.file));
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "DiskThumbnailStore: Failed to open" << file.fileName() << ":" << file.errorString();
        markUnavailable();
        return false;
    }
    if (file.write(entry.payload) != entry.payload.size() || !file.commit()) {
        qWarning() << "DiskThumbnailStore: Failed to write" << file.fileName() << ":" << file.errorString();
        markUnavailable();
        return false;
    }

    m_index.insert(record.key, record);
    return writeIndex();
}

int DiskThumbnailStore::deleteByImage(const QString& imageId)
{
    QMutexLocker locker(&m_mutex);

    QStringList doomed;
    for (auto it = m_index.constBegin(); it != m_index.constEnd(); ++it) {
        if (it.value().imageId == imageId) {
            doomed.append(it.key());
        }
    }

    for (const QString& key : doomed) {
        removeRecord(key);
    }
    if (!doomed.isEmpty()) {
        writeIndex();
    }
    return doomed.size();
}

int DiskThumbnailStore::deleteExpired(qint64 now)
{
    QMutexLocker locker(&m_mutex);

    QStringList doomed;
    for (auto it = m_index.constBegin(); it != m_index.constEnd(); ++it) {
        if (now >= it.value().expiresAt) {
            doomed.append(it.key());
        }
    }

    for (const QString& key : doomed) {
        removeRecord(key);
    }
    if (!doomed.isEmpty()) {
        writeIndex();
#ifdef SPHEROCANVAS_DEBUG
        qDebug() << "DiskThumbnailStore: Removed" << doomed.size() << "expired entries";
#endif
    }
    return doomed.size();
}

void DiskThumbnailStore::clear()
{
    QMutexLocker locker(&m_mutex);

    if (!m_available) {
        return;
    }

    const QStringList keys = m_index.keys();
    for (const QString& key : keys) {
        removeRecord(key);
    }
    writeIndex();
}

// ===== Index persistence =====

void DiskThumbnailStore::loadIndex()
{
    m_index.clear();

    QFile file(m_directory + "/index.json");
    if (!file.exists()) {
        return; // Fresh store
    }

    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "DiskThumbnailStore: Failed to open" << file.fileName();
        return;
    }

    const QByteArray data = file.readAll();
    file.close();

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "DiskThumbnailStore: Corrupt index, starting empty:" << parseError.errorString();
        return;
    }

    QJsonObject root = doc.object();
    int version = root["version"].toInt(1);
    if (version > INDEX_VERSION) {
        qWarning() << "DiskThumbnailStore: Index version" << version
                   << "is newer than supported version" << INDEX_VERSION;
    }

    const QJsonArray entries = root["entries"].toArray();
    int skipped = 0;
    for (const auto& value : entries) {
        QJsonObject obj = value.toObject();

        IndexRecord record;
        record.key = obj["key"].toString();
        record.imageId = obj["imageId"].toString();
        record.cachedAt = static_cast<qint64>(obj["cachedAt"].toDouble());
        record.expiresAt = static_cast<qint64>(obj["expiresAt"].toDouble());
        record.file = obj["file"].toString();

        if (record.key.isEmpty() || record.file.isEmpty()
            || !levelOfDetailFromName(obj["lod"].toString(), &record.lod)) {
            skipped++;
            continue;
        }
        m_index.insert(record.key, record);
    }

    if (skipped > 0) {
        qWarning() << "DiskThumbnailStore: Skipped" << skipped << "malformed index entries";
    }
}

bool DiskThumbnailStore::writeIndex()
{
    QJsonArray entries;
    for (const IndexRecord& record : std::as_const(m_index)) {
        QJsonObject obj;
        obj["key"] = record.key;
        obj["imageId"] = record.imageId;
        obj["lod"] = levelOfDetailName(record.lod);
        obj["cachedAt"] = static_cast<double>(record.cachedAt);
        obj["expiresAt"] = static_cast<double>(record.expiresAt);
        obj["file"] = record.file;
        entries.append(obj);
    }

    QJsonObject root;
    root["version"] = INDEX_VERSION;
    root["entries"] = entries;

    QSaveFile file(m_directory + "/index.json");
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qWarning() << "DiskThumbnailStore: Failed to save index to" << file.fileName();
        markUnavailable();
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Compact));
    if (!file.commit()) {
        qWarning() << "DiskThumbnailStore: Failed to save index to" << file.fileName() << ":" << file.errorString();
        markUnavailable();
        return false;
    }
    return true;
}

void DiskThumbnailStore::markUnavailable()
{
    if (!m_available) {
        return;
    }
    m_available = false;
    m_index.clear();

    // The file on disk may list entries invalidated since; a later run must
    // not serve them. Unreferenced payloads are removed on the next open.
    QFile::remove(m_directory + "/index.json");

    qWarning() << "DiskThumbnailStore: Disabled after write failure in" << m_directory << "- running memory-only";
}

void DiskThumbnailStore::removeOrphanFiles()
{
    QSet<QString> referenced;
    for (const IndexRecord& record : std::as_const(m_index)) {
        referenced.insert(record.file);
    }

    QDir dir(m_directory);
    const QFileInfoList files = dir.entryInfoList({"*.thumb"}, QDir::Files);
    for (const QFileInfo& info : files) {
        if (!referenced.contains(info.fileName())) {
            QFile::remove(info.absoluteFilePath());
        }
    }
}

void DiskThumbnailStore::removeRecord(const QString& key)
{
    auto it = m_index.find(key);
    if (it == m_index.end()) {
        return;
    }
    const QString path = payloadPath(it.value().file);
    if (QFile::exists(path) && !QFile::remove(path)) {
        qWarning() << "DiskThumbnailStore: Failed to remove" << path;
    }
    m_index.erase(it);
}

QString DiskThumbnailStore::payloadPath(const QString& file) const
{
    return m_directory + "/" + file;
}

QString DiskThumbnailStore::fileNameForKey(const QString& key)
{
    // Image ids may contain characters that are not valid in file names
    const QByteArray hash = QCryptographicHash::hash(key.toUtf8(), QCryptographicHash::Sha1);
    return QString::fromLatin1(hash.toHex()) + ".thumb";
}
