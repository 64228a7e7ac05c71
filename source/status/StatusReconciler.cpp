#include "StatusReconciler.h"
#include "StatusSource.h"

#include <QDateTime>
#include <QDebug>

StatusReconciler::StatusReconciler(const EditorSettings& settings, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
{
    m_settings.sanitize();

    m_pollTimer = new QTimer(this);
    m_pollTimer->setInterval(m_settings.reconcileIntervalMs);
    connect(m_pollTimer, &QTimer::timeout, this, &StatusReconciler::onPollTimeout);
    m_pollTimer->start();

    m_queueEmptyTimer = new QTimer(this);
    m_queueEmptyTimer->setSingleShot(true);
    m_queueEmptyTimer->setInterval(m_settings.queueEmptyDelayMs);
    connect(m_queueEmptyTimer, &QTimer::timeout, this, [this]() {
        reconcileNow();
    });
}

StatusReconciler::~StatusReconciler() = default;

// ===== Pure merge logic =====

bool StatusReconciler::isProtectedCompletion(const ImageStatusRecord& local, ImageProcessingStatus authoritative,
                                             qint64 now, int antiFlickerMs)
{
    if (local.status != ImageProcessingStatus::Completed || !isActiveStatus(authoritative)) {
        return false;
    }
    const qint64 age = now - local.updatedAt;
    return age < antiFlickerMs;
}

StatusReconciler::MergeResult StatusReconciler::merge(const QVector<ImageStatusRecord>& local,
                                                      const QVector<ImageStatusRecord>& authoritative,
                                                      qint64 now, int antiFlickerMs)
{
    QHash<QString, ImageStatusRecord> byId;
    byId.reserve(authoritative.size());
    for (const ImageStatusRecord& record : authoritative) {
        byId.insert(record.imageId, record);
    }

    MergeResult result;
    result.records.reserve(local.size());

    for (const ImageStatusRecord& current : local) {
        auto it = byId.constFind(current.imageId);
        if (it == byId.constEnd() || it.value().status == current.status) {
            result.records.append(current);
            continue;
        }

        const ImageStatusRecord& remote = it.value();
        if (isProtectedCompletion(current, remote.status, now, antiFlickerMs)) {
#ifdef SPHEROCANVAS_DEBUG
            qDebug() << "StatusReconciler: Keeping" << current.imageId << "completed, backend still reports"
                     << statusName(remote.status);
#endif
            result.records.append(current);
            result.keptIds.append(current.imageId);
            continue;
        }

        ImageStatusRecord next = current;
        next.status = remote.status;
        next.updatedAt = remote.updatedAt > 0 ? remote.updatedAt : now;
        result.records.append(next);
        result.changedIds.append(current.imageId);
    }

    return result;
}

bool StatusReconciler::hasStaleProcessing(const QVector<ImageStatusRecord>& records, const QueueStats* queueStats,
                                          qint64 now, int staleMs)
{
    for (const ImageStatusRecord& record : records) {
        if (record.status != ImageProcessingStatus::Processing) {
            continue;
        }
        if (queueStats && queueStats->processing == 0) {
            return true;
        }
        if (record.updatedAt > 0 && now - record.updatedAt > staleMs) {
            return true;
        }
    }
    return false;
}

// ===== Wiring =====

void StatusReconciler::setSource(StatusSource* source)
{
    if (m_source == source) {
        return;
    }
    if (m_source) {
        disconnect(m_source.data(), nullptr, this, nullptr);
    }
    m_source = source;
    m_fetchInFlight = false;
    if (m_source) {
        connect(m_source.data(), &StatusSource::statusesFetched, this, &StatusReconciler::onStatusesFetched);
        connect(m_source.data(), &StatusSource::fetchFailed, this, &StatusReconciler::onFetchFailed);
    }
}

void StatusReconciler::setProjectId(const QString& projectId)
{
    m_projectId = projectId;
}

void StatusReconciler::setConnected(bool connected)
{
    m_connected = connected;
}

void StatusReconciler::setClock(std::function<qint64()> clock)
{
    m_clock = std::move(clock);
}

// ===== Local state =====

void StatusReconciler::setImages(const QVector<ImageStatusRecord>& records)
{
    m_records.clear();
    m_order.clear();
    for (const ImageStatusRecord& record : records) {
        if (record.imageId.isEmpty() || m_records.contains(record.imageId)) {
            continue;
        }
        m_records.insert(record.imageId, record);
        m_order.append(record.imageId);
    }
}

QVector<ImageStatusRecord> StatusReconciler::images() const
{
    QVector<ImageStatusRecord> result;
    result.reserve(m_order.size());
    for (const QString& id : m_order) {
        result.append(m_records.value(id));
    }
    return result;
}

ImageStatusRecord StatusReconciler::record(const QString& imageId) const
{
    return m_records.value(imageId);
}

bool StatusReconciler::needsPolling() const
{
    if (m_records.isEmpty()) {
        return false;
    }

    if (m_hasQueueStats && !m_queueStats.isEmpty()) {
        return true;
    }

    for (const ImageStatusRecord& record : m_records) {
        if (isActiveStatus(record.status)) {
            return true;
        }
    }

    return hasStaleProcessing(images(), m_hasQueueStats ? &m_queueStats : nullptr,
                              now(), m_settings.staleProcessingMs);
}

// ===== Event sources =====

void StatusReconciler::applyPushUpdate(const ImageStatusRecord& update)
{
    if (update.imageId.isEmpty()) {
        return;
    }

    ImageStatusRecord next = update;
    if (next.updatedAt <= 0) {
        next.updatedAt = now();
    }

    auto it = m_records.find(next.imageId);
    if (it == m_records.end()) {
        m_records.insert(next.imageId, next);
        m_order.append(next.imageId);
        emit statusesChanged(QStringList{next.imageId});
        return;
    }

    if (next.updatedAt < it.value().updatedAt) {
#ifdef SPHEROCANVAS_DEBUG
        qDebug() << "StatusReconciler: Ignoring out-of-order push for" << next.imageId;
#endif
        return;
    }

    const bool statusDiffers = it.value().status != next.status;
    it.value() = next;
    if (statusDiffers) {
        emit statusesChanged(QStringList{next.imageId});
    }
}

void StatusReconciler::setQueueStats(const QueueStats& stats)
{
    const bool wasBusy = m_hasQueueStats && !m_queueStats.isEmpty();
    m_queueStats = stats;
    m_hasQueueStats = true;

    if (wasBusy && stats.isEmpty()) {
        // Let the last push updates arrive before asking the backend
        m_queueEmptyTimer->start();
    }
}

bool StatusReconciler::reconcileNow()
{
    if (!m_source || m_projectId.isEmpty() || !m_connected) {
        return false;
    }
    if (m_fetchInFlight) {
        return false;
    }

    const qint64 current = now();
    if (m_hasReconciled && current - m_lastReconcileAt < m_settings.reconcileThrottleMs) {
        return false;
    }

    m_hasReconciled = true;
    m_lastReconcileAt = current;
    m_fetchInFlight = true;
    m_fetchCount++;

#ifdef SPHEROCANVAS_DEBUG
    qDebug() << "StatusReconciler: Fetching statuses for project" << m_projectId;
#endif

    emit reconcileStarted();
    m_source->fetchStatuses(m_projectId);
    return true;
}

void StatusReconciler::onPollTimeout()
{
    if (needsPolling()) {
        reconcileNow();
    }
}

void StatusReconciler::onStatusesFetched(const QString& projectId, const QVector<ImageStatusRecord>& records)
{
    m_fetchInFlight = false;

    if (projectId != m_projectId) {
        qDebug() << "StatusReconciler: Dropping statuses for previous project" << projectId;
        emit reconcileFinished(false);
        return;
    }

    const MergeResult result = merge(images(), records, now(), m_settings.antiFlickerMs);
    for (const ImageStatusRecord& record : result.records) {
        m_records.insert(record.imageId, record);
    }

    if (!result.changedIds.isEmpty()) {
        emit statusesChanged(result.changedIds);
    }
    emit reconcileFinished(true);
}

void StatusReconciler::onFetchFailed(const QString& projectId, const QString& error)
{
    m_fetchInFlight = false;
    qWarning() << "StatusReconciler: Reconciliation failed for project" << projectId << ":" << error;
    emit reconcileFinished(false);
}

qint64 StatusReconciler::now() const
{
    return m_clock ? m_clock() : QDateTime::currentMSecsSinceEpoch();
}
