// ============================================================================
// SpheroCanvas - Test Runner
// ============================================================================
// Usage: spherocanvas_tests <suite|all> [QTest options]
//
// Suites: polygon, simplifier, viewport, selection, settings, session,
//         cache, status, renderer, canvas
// ============================================================================

#include <QApplication>
#include <QStringList>
#include <QTest>
#include <QTextStream>

#include "core/EditorSessionTests.h"
#include "core/EditorSettingsTests.h"
#include "core/PolygonSimplifierTests.h"
#include "core/PolygonTests.h"
#include "core/SelectionStateMachineTests.h"
#include "core/ViewportTransformTests.h"
#include "cache/ThumbnailCacheTests.h"
#include "status/StatusReconcilerTests.h"
#include "ui/SegmentationCanvasTests.h"
#include "ui/ThumbnailRendererTests.h"

static const QStringList SUITES = {
    "polygon", "simplifier", "viewport", "selection", "settings",
    "session", "cache", "status", "renderer", "canvas"
};

static int runSuite(const QString& name, const QStringList& qtestArgs)
{
    if (name == "polygon") {
        PolygonTests tests;
        return QTest::qExec(&tests, qtestArgs);
    } else if (name == "simplifier") {
        PolygonSimplifierTests tests;
        return QTest::qExec(&tests, qtestArgs);
    } else if (name == "viewport") {
        ViewportTransformTests tests;
        return QTest::qExec(&tests, qtestArgs);
    } else if (name == "selection") {
        SelectionStateMachineTests tests;
        return QTest::qExec(&tests, qtestArgs);
    } else if (name == "settings") {
        EditorSettingsTests tests;
        return QTest::qExec(&tests, qtestArgs);
    } else if (name == "session") {
        EditorSessionTests tests;
        return QTest::qExec(&tests, qtestArgs);
    } else if (name == "cache") {
        ThumbnailCacheTests tests;
        return QTest::qExec(&tests, qtestArgs);
    } else if (name == "status") {
        StatusReconcilerTests tests;
        return QTest::qExec(&tests, qtestArgs);
    } else if (name == "renderer") {
        ThumbnailRendererTests tests;
        return QTest::qExec(&tests, qtestArgs);
    } else if (name == "canvas") {
        SegmentationCanvasTests tests;
        return QTest::qExec(&tests, qtestArgs);
    }

    QTextStream(stderr) << "Unknown test suite: " << name << "\n";
    return 1;
}

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    app.setOrganizationName("SpheroCanvas");
    app.setApplicationName("Tests");

    const QStringList args = app.arguments();
    if (args.size() < 2) {
        QTextStream(stderr) << "Usage: spherocanvas_tests <" << SUITES.join('|') << "|all> [QTest options]\n";
        return 1;
    }

    const QString suite = args.at(1);

    // QTest expects the program name first
    QStringList qtestArgs = { args.at(0) };
    qtestArgs += args.mid(2);

    if (suite != "all") {
        return runSuite(suite, qtestArgs);
    }

    int failures = 0;
    for (const QString& name : SUITES) {
        failures += runSuite(name, qtestArgs);
    }
    return failures == 0 ? 0 : 1;
}
