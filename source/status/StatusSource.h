#pragma once

// ============================================================================
// StatusSource - Authoritative per-image status provider
// ============================================================================
// One asynchronous call, two outcome signals. Exactly one of them is emitted
// for every fetchStatuses() call, always after the call has returned.
// Sources do not log failures; whoever handles fetchFailed does.
// ============================================================================

#include "ImageStatus.h"

#include <QObject>

class StatusSource : public QObject {
    Q_OBJECT

public:
    explicit StatusSource(QObject* parent = nullptr) : QObject(parent) {}
    ~StatusSource() override = default;

    virtual void fetchStatuses(const QString& projectId) = 0;

signals:
    void statusesFetched(const QString& projectId, const QVector<ImageStatusRecord>& records);
    void fetchFailed(const QString& projectId, const QString& error);
};
