#ifndef EDITORSETTINGSTESTS_H
#define EDITORSETTINGSTESTS_H

#include <QObject>
#include <QTest>
#include <QSettings>
#include <QTemporaryDir>

#include "EditorSettings.h"

/**
 * Unit tests for EditorSettings persistence and clamping.
 * Run with: spherocanvas_tests settings
 */
class EditorSettingsTests : public QObject {
    Q_OBJECT

private slots:
    void testDefaultsSurviveSanitize() {
        EditorSettings s;
        s.sanitize();
        const EditorSettings defaults;
        QCOMPARE(s.minZoom, defaults.minZoom);
        QCOMPARE(s.maxZoom, defaults.maxZoom);
        QCOMPARE(s.memoryCacheCapacity, 100);
        QCOMPARE(s.cacheTtlMs, 24LL * 60 * 60 * 1000);
        QCOMPARE(s.antiFlickerMs, 30000);
        QCOMPARE(s.frameIntervalMs, 16);
    }

    void testRoundTripThroughIni() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("settings.ini");

        EditorSettings original;
        original.maxZoom = 20.0;
        original.memoryCacheCapacity = 42;
        original.cacheDirectory = dir.filePath("thumbs");
        original.antiFlickerMs = 10000;
        original.statusBaseUrl = "https://example.test/api";
        original.statusToken = "secret";
        {
            QSettings ini(path, QSettings::IniFormat);
            original.save(ini);
            ini.sync();
            QCOMPARE(ini.status(), QSettings::NoError);
        }

        QSettings ini(path, QSettings::IniFormat);
        const EditorSettings loaded = EditorSettings::load(ini);
        QCOMPARE(loaded.maxZoom, 20.0);
        QCOMPARE(loaded.memoryCacheCapacity, 42);
        QCOMPARE(loaded.cacheDirectory, original.cacheDirectory);
        QCOMPARE(loaded.antiFlickerMs, 10000);
        QCOMPARE(loaded.statusBaseUrl, original.statusBaseUrl);
        QCOMPARE(loaded.statusToken, QString("secret"));
        QCOMPARE(loaded.reconcileIntervalMs, original.reconcileIntervalMs);
    }

    void testLoadClampsBadValues() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QSettings ini(dir.filePath("bad.ini"), QSettings::IniFormat);
        ini.setValue("viewport/minZoom", 0.0);
        ini.setValue("viewport/maxZoom", 1000.0);
        ini.setValue("viewport/buttonZoomFactor", 0.5);
        ini.setValue("viewport/frameIntervalMs", 0);
        ini.setValue("cache/memoryCapacity", -3);
        ini.setValue("cache/ttlMs", 0);
        ini.setValue("reconcile/intervalMs", 1);
        ini.setValue("network/statusBaseUrl", "https://example.test/api//");

        const EditorSettings s = EditorSettings::load(ini);
        QCOMPARE(s.minZoom, 0.01);
        QCOMPARE(s.maxZoom, 100.0);
        QCOMPARE(s.buttonZoomFactor, 1.2);
        QCOMPARE(s.frameIntervalMs, 1);
        QCOMPARE(s.memoryCacheCapacity, 1);
        QCOMPARE(s.cacheTtlMs, EditorSettings().cacheTtlMs);
        QCOMPARE(s.reconcileIntervalMs, 100);
        QCOMPARE(s.statusBaseUrl, QString("https://example.test/api"));
    }
};

#endif // EDITORSETTINGSTESTS_H
