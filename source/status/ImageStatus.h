#pragma once

// ============================================================================
// ImageStatus - Segmentation processing status of an image
// ============================================================================
// Backend strings are loosely typed ("segmented", "no_segmentation", ...).
// They are mapped onto ImageProcessingStatus once, at the boundary, by
// normalizeStatus(); nothing past that point compares raw strings.
// ============================================================================

#include <QString>
#include <QVector>
#include <QJsonObject>
#include <QMetaType>

enum class ImageProcessingStatus {
    Pending,
    Queued,
    Processing,
    Completed,
    Failed
};

QString statusName(ImageProcessingStatus status);

/**
 * @brief Map a backend status string onto ImageProcessingStatus.
 *
 * segmented/completed/done -> Completed, processing/running -> Processing,
 * queued -> Queued, failed/error -> Failed, pending/no_segmentation/"" ->
 * Pending. Case-insensitive.
 *
 * @return false for any other string; *out is left untouched.
 */
bool normalizeStatus(const QString& raw, ImageProcessingStatus* out);

/**
 * @brief Processing or Queued.
 */
inline bool isActiveStatus(ImageProcessingStatus status)
{
    return status == ImageProcessingStatus::Processing || status == ImageProcessingStatus::Queued;
}

struct ImageStatusRecord {
    QString imageId;
    ImageProcessingStatus status = ImageProcessingStatus::Pending;
    qint64 updatedAt = 0;       ///< ms since epoch, 0 = unknown

    bool operator==(const ImageStatusRecord& other) const {
        return imageId == other.imageId && status == other.status && updatedAt == other.updatedAt;
    }
    bool operator!=(const ImageStatusRecord& other) const { return !(*this == other); }

    /**
     * @brief Decode one image of the status endpoint.
     *
     * Reads "id" (or "imageId"), "segmentationStatus" (or
     * "segmentation_status") and "updatedAt" (or "updated_at", ISO 8601 or
     * ms since epoch).
     *
     * @param ok Set to false when the id is missing or the status string is
     *        unknown; the record must then be skipped.
     */
    static ImageStatusRecord fromJson(const QJsonObject& obj, bool* ok = nullptr);
};

/**
 * @brief Counts reported by the processing queue.
 */
struct QueueStats {
    int processing = 0;
    int queued = 0;

    bool isEmpty() const { return processing == 0 && queued == 0; }
};

Q_DECLARE_METATYPE(ImageProcessingStatus)
Q_DECLARE_METATYPE(ImageStatusRecord)
Q_DECLARE_METATYPE(QVector<ImageStatusRecord>)
Q_DECLARE_METATYPE(QueueStats)
