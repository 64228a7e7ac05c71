#include "ImageStatus.h"

#include <QDateTime>
#include <QDebug>

QString statusName(ImageProcessingStatus status)
{
    switch (status) {
        case ImageProcessingStatus::Pending:    return QStringLiteral("pending");
        case ImageProcessingStatus::Queued:     return QStringLiteral("queued");
        case ImageProcessingStatus::Processing: return QStringLiteral("processing");
        case ImageProcessingStatus::Completed:  return QStringLiteral("completed");
        case ImageProcessingStatus::Failed:     return QStringLiteral("failed");
    }
    return QStringLiteral("pending");
}

bool normalizeStatus(const QString& raw, ImageProcessingStatus* out)
{
    const QString s = raw.trimmed().toLower();

    ImageProcessingStatus status;
    if (s == "segmented" || s == "completed" || s == "done") {
        status = ImageProcessingStatus::Completed;
    } else if (s == "processing" || s == "running") {
        status = ImageProcessingStatus::Processing;
    } else if (s == "queued") {
        status = ImageProcessingStatus::Queued;
    } else if (s == "failed" || s == "error") {
        status = ImageProcessingStatus::Failed;
    } else if (s.isEmpty() || s == "pending" || s == "no_segmentation") {
        status = ImageProcessingStatus::Pending;
    } else {
        return false;
    }

    if (out) {
        *out = status;
    }
    return true;
}

namespace {

qint64 parseTimestamp(const QJsonValue& value)
{
    if (value.isDouble()) {
        return static_cast<qint64>(value.toDouble());
    }
    if (value.isString()) {
        QDateTime dt = QDateTime::fromString(value.toString(), Qt::ISODateWithMs);
        if (!dt.isValid()) {
            dt = QDateTime::fromString(value.toString(), Qt::ISODate);
        }
        if (dt.isValid()) {
            return dt.toMSecsSinceEpoch();
        }
    }
    return 0;
}

}

ImageStatusRecord ImageStatusRecord::fromJson(const QJsonObject& obj, bool* ok)
{
    ImageStatusRecord record;

    record.imageId = obj.contains("id") ? obj["id"].toString() : obj["imageId"].toString();

    const QString raw = obj.contains("segmentationStatus")
        ? obj["segmentationStatus"].toString()
        : obj["segmentation_status"].toString();

    record.updatedAt = parseTimestamp(obj.contains("updatedAt") ? obj["updatedAt"] : obj["updated_at"]);

    bool valid = true;
    if (record.imageId.isEmpty()) {
        qWarning() << "ImageStatusRecord: Skipping image without id";
        valid = false;
    } else if (!normalizeStatus(raw, &record.status)) {
        qWarning() << "ImageStatusRecord: Unknown status" << raw << "for image" << record.imageId;
        valid = false;
    }

    if (ok) {
        *ok = valid;
    }
    return record;
}
