#pragma once

// ============================================================================
// EditorSettings - Tunables of the canvas engine
// ============================================================================
// Persisted in QSettings("SpheroCanvas", "App") under the groups
// viewport/, cache/, reconcile/ and network/. Defaults are the values the
// engine was designed around; load() clamps anything out of range.
// ============================================================================

#include <QString>

class QSettings;

struct EditorSettings {
    // ----- Viewport -----
    qreal minZoom = 0.1;
    qreal maxZoom = 10.0;
    qreal buttonZoomFactor = 1.2;       ///< zoomIn()/zoomOut() step
    qreal wheelZoomStep = 0.05;         ///< Fractional change per wheel event
    qreal minVisibleFraction = 0.25;    ///< Share of the image kept on screen per axis
    qreal fitFraction = 0.8;            ///< centerOn() fills this share of the container
    int frameIntervalMs = 16;           ///< Wheel coalescing window (~60 Hz)

    // ----- Thumbnail cache -----
    int memoryCacheCapacity = 100;
    qint64 cacheTtlMs = 24LL * 60 * 60 * 1000;
    int cacheSweepIntervalMs = 60 * 60 * 1000;
    QString cacheDirectory;             ///< Empty = <CacheLocation>/thumbnails

    // ----- Status reconciliation -----
    int reconcileIntervalMs = 5000;
    int queueEmptyDelayMs = 5000;
    int reconcileThrottleMs = 2000;
    int antiFlickerMs = 30000;          ///< Recently completed images are not downgraded
    int staleProcessingMs = 5 * 60 * 1000;

    // ----- Network -----
    QString statusBaseUrl;              ///< e.g. https://host/api
    QString statusToken;                ///< Bearer token, optional
    int requestTimeoutMs = 5000;

    /**
     * @brief Load from the application QSettings.
     */
    static EditorSettings load();

    /**
     * @brief Load from an explicit settings object (tests use an INI file).
     */
    static EditorSettings load(QSettings& settings);

    void save() const;
    void save(QSettings& settings) const;

    /**
     * @brief Clamp every field into its supported range.
     */
    void sanitize();
};
