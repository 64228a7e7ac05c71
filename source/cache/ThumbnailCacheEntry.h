#pragma once

// ============================================================================
// ThumbnailCacheEntry - One cached derived thumbnail
// ============================================================================

#include <QString>
#include <QByteArray>
#include <QMetaType>

/**
 * @brief Quality tiers of a rendered thumbnail.
 */
enum class LevelOfDetail {
    Low,        ///< 64 px wide
    Medium,     ///< 160 px wide
    High        ///< 320 px wide
};

inline QString levelOfDetailName(LevelOfDetail lod)
{
    switch (lod) {
        case LevelOfDetail::Low:    return QStringLiteral("low");
        case LevelOfDetail::Medium: return QStringLiteral("medium");
        case LevelOfDetail::High:   return QStringLiteral("high");
    }
    return QStringLiteral("low");
}

inline int levelOfDetailWidth(LevelOfDetail lod)
{
    switch (lod) {
        case LevelOfDetail::Low:    return 64;
        case LevelOfDetail::Medium: return 160;
        case LevelOfDetail::High:   return 320;
    }
    return 64;
}

/**
 * @brief Parse "low" / "medium" / "high".
 * @return false for anything else; *out is left untouched.
 */
inline bool levelOfDetailFromName(const QString& name, LevelOfDetail* out)
{
    LevelOfDetail lod;
    if (name == QLatin1String("low")) {
        lod = LevelOfDetail::Low;
    } else if (name == QLatin1String("medium")) {
        lod = LevelOfDetail::Medium;
    } else if (name == QLatin1String("high")) {
        lod = LevelOfDetail::High;
    } else {
        return false;
    }
    if (out) {
        *out = lod;
    }
    return true;
}

struct ThumbnailCacheEntry {
    QString key;                ///< imageId + ":" + lod name
    QString imageId;
    LevelOfDetail lod = LevelOfDetail::Low;
    QByteArray payload;         ///< Opaque bytes (PNG from ThumbnailRenderer)
    qint64 cachedAt = 0;        ///< ms since epoch
    qint64 expiresAt = 0;       ///< ms since epoch

    bool isValid() const { return !key.isEmpty() && !payload.isNull(); }
    bool isExpired(qint64 now) const { return now >= expiresAt; }

    static QString makeKey(const QString& imageId, LevelOfDetail lod)
    {
        return imageId + QLatin1Char(':') + levelOfDetailName(lod);
    }
};

Q_DECLARE_METATYPE(LevelOfDetail)
