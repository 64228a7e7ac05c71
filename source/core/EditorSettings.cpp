#include "EditorSettings.h"

#include <QSettings>
#include <QDebug>

EditorSettings EditorSettings::load()
{
    QSettings settings("SpheroCanvas", "App");
    return load(settings);
}

EditorSettings EditorSettings::load(QSettings& settings)
{
    EditorSettings s;

    settings.beginGroup("viewport");
    s.minZoom = settings.value("minZoom", s.minZoom).toDouble();
    s.maxZoom = settings.value("maxZoom", s.maxZoom).toDouble();
    s.buttonZoomFactor = settings.value("buttonZoomFactor", s.buttonZoomFactor).toDouble();
    s.wheelZoomStep = settings.value("wheelZoomStep", s.wheelZoomStep).toDouble();
    s.minVisibleFraction = settings.value("minVisibleFraction", s.minVisibleFraction).toDouble();
    s.fitFraction = settings.value("fitFraction", s.fitFraction).toDouble();
    s.frameIntervalMs = settings.value("frameIntervalMs", s.frameIntervalMs).toInt();
    settings.endGroup();

    settings.beginGroup("cache");
    s.memoryCacheCapacity = settings.value("memoryCapacity", s.memoryCacheCapacity).toInt();
    s.cacheTtlMs = settings.value("ttlMs", s.cacheTtlMs).toLongLong();
    s.cacheSweepIntervalMs = settings.value("sweepIntervalMs", s.cacheSweepIntervalMs).toInt();
    s.cacheDirectory = settings.value("directory", s.cacheDirectory).toString();
    settings.endGroup();

    settings.beginGroup("reconcile");
    s.reconcileIntervalMs = settings.value("intervalMs", s.reconcileIntervalMs).toInt();
    s.queueEmptyDelayMs = settings.value("queueEmptyDelayMs", s.queueEmptyDelayMs).toInt();
    s.reconcileThrottleMs = settings.value("throttleMs", s.reconcileThrottleMs).toInt();
    s.antiFlickerMs = settings.value("antiFlickerMs", s.antiFlickerMs).toInt();
    s.staleProcessingMs = settings.value("staleProcessingMs", s.staleProcessingMs).toInt();
    settings.endGroup();

    settings.beginGroup("network");
    s.statusBaseUrl = settings.value("statusBaseUrl", s.statusBaseUrl).toString();
    s.statusToken = settings.value("statusToken", s.statusToken).toString();
    s.requestTimeoutMs = settings.value("requestTimeoutMs", s.requestTimeoutMs).toInt();
    settings.endGroup();

    s.sanitize();
    return s;
}

void EditorSettings::save() const
{
    QSettings settings("SpheroCanvas", "App");
    save(settings);
}

void EditorSettings::save(QSettings& settings) const
{
    settings.beginGroup("viewport");
    settings.setValue("minZoom", minZoom);
    settings.setValue("maxZoom", maxZoom);
    settings.setValue("buttonZoomFactor", buttonZoomFactor);
    settings.setValue("wheelZoomStep", wheelZoomStep);
    settings.setValue("minVisibleFraction", minVisibleFraction);
    settings.setValue("fitFraction", fitFraction);
    settings.setValue("frameIntervalMs", frameIntervalMs);
    settings.endGroup();

    settings.beginGroup("cache");
    settings.setValue("memoryCapacity", memoryCacheCapacity);
    settings.setValue("ttlMs", cacheTtlMs);
    settings.setValue("sweepIntervalMs", cacheSweepIntervalMs);
    settings.setValue("directory", cacheDirectory);
    settings.endGroup();

    settings.beginGroup("reconcile");
    settings.setValue("intervalMs", reconcileIntervalMs);
    settings.setValue("queueEmptyDelayMs", queueEmptyDelayMs);
    settings.setValue("throttleMs", reconcileThrottleMs);
    settings.setValue("antiFlickerMs", antiFlickerMs);
    settings.setValue("staleProcessingMs", staleProcessingMs);
    settings.endGroup();

    settings.beginGroup("network");
    settings.setValue("statusBaseUrl", statusBaseUrl);
    settings.setValue("statusToken", statusToken);
    settings.setValue("requestTimeoutMs", requestTimeoutMs);
    settings.endGroup();
}

void EditorSettings::sanitize()
{
    const EditorSettings defaults;

    minZoom = qBound(0.01, minZoom, 1.0);
    maxZoom = qBound(1.0, maxZoom, 100.0);
    if (buttonZoomFactor <= 1.0 || buttonZoomFactor > 4.0) {
        qWarning() << "EditorSettings: buttonZoomFactor" << buttonZoomFactor << "out of range, using default";
        buttonZoomFactor = defaults.buttonZoomFactor;
    }
    if (wheelZoomStep <= 0.0 || wheelZoomStep >= 1.0) {
        qWarning() << "EditorSettings: wheelZoomStep" << wheelZoomStep << "out of range, using default";
        wheelZoomStep = defaults.wheelZoomStep;
    }
    minVisibleFraction = qBound(0.0, minVisibleFraction, 1.0);
    fitFraction = qBound(0.1, fitFraction, 1.0);
    frameIntervalMs = qBound(1, frameIntervalMs, 100);

    memoryCacheCapacity = qMax(1, memoryCacheCapacity);
    if (cacheTtlMs <= 0) {
        cacheTtlMs = defaults.cacheTtlMs;
    }
    cacheSweepIntervalMs = qMax(1000, cacheSweepIntervalMs);

    reconcileIntervalMs = qMax(100, reconcileIntervalMs);
    queueEmptyDelayMs = qMax(0, queueEmptyDelayMs);
    reconcileThrottleMs = qMax(0, reconcileThrottleMs);
    antiFlickerMs = qMax(0, antiFlickerMs);
    staleProcessingMs = qMax(1000, staleProcessingMs);
    requestTimeoutMs = qMax(100, requestTimeoutMs);

    while (statusBaseUrl.endsWith('/')) {
        statusBaseUrl.chop(1);
    }
}
