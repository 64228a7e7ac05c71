// ============================================================================
// SpheroCanvas - Main Entry Point
// ============================================================================
// Usage: spherocanvas <segmentation.json> [--image <file>] [--project <id>]
//
// Opens one segmentation result in the canvas. With --project and a
// configured network/statusBaseUrl the image statuses of that project are
// reconciled in the background.
// ============================================================================

#include <QApplication>
#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QIcon>
#include <QImage>
#include <QPixmap>
#include <QImageReader>
#include <QJsonDocument>
#include <QLabel>
#include <QMainWindow>
#include <QStatusBar>
#include <QTextStream>

#include <memory>

#include "core/EditorSession.h"
#include "core/EditorSettings.h"
#include "cache/DiskThumbnailStore.h"
#include "cache/ThumbnailCache.h"
#include "status/HttpStatusSource.h"
#include "status/StatusReconciler.h"
#include "ui/SegmentationCanvas.h"

// ============================================================================
// Helpers
// ============================================================================

static void printUsage()
{
    QTextStream err(stderr);
    err << "Usage: spherocanvas <segmentation.json> [--image <file>] [--project <id>]\n";
}

static bool loadSegmentation(const QString& path, SegmentationResult* result, QString* error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        *error = QString("Cannot open %1: %2").arg(path, file.errorString());
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        *error = QString("%1 is not a JSON object: %2").arg(path, parseError.errorString());
        return false;
    }

    bool ok = false;
    *result = SegmentationResult::fromJson(doc.object(), error, &ok);
    if (!ok) {
        return false;
    }
    if (result->imageId.isEmpty()) {
        result->imageId = QFileInfo(path).completeBaseName();
    }
    return true;
}

static QString statusText(EditorSession* session)
{
    const QString selected = session->selectedPolygonId();
    return QString("%1 | zoom %2% | %3 polygons%4")
        .arg(editModeName(session->editMode()))
        .arg(qRound(session->viewport().zoom * 100))
        .arg(session->segmentation().polygons.size())
        .arg(selected.isEmpty() ? QString() : QString(" | selected %1").arg(selected));
}

// ============================================================================
// Main Entry Point
// ============================================================================

int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    app.setOrganizationName("SpheroCanvas");
    app.setApplicationName("App");

    // ========== Parse Command Line Arguments ==========
    QString inputFile;
    QString imageFile;
    QString projectId;

    for (int i = 1; i < argc; ++i) {
        QString arg = QString::fromLocal8Bit(argv[i]);

        if (arg == "--image" && i + 1 < argc) {
            imageFile = QString::fromLocal8Bit(argv[++i]);
        } else if (arg == "--project" && i + 1 < argc) {
            projectId = QString::fromLocal8Bit(argv[++i]);
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else if (!arg.startsWith("--") && inputFile.isEmpty()) {
            inputFile = arg;
        }
    }

    if (inputFile.isEmpty()) {
        printUsage();
        return 1;
    }

    SegmentationResult result;
    QString error;
    if (!loadSegmentation(inputFile, &result, &error)) {
        QTextStream(stderr) << "spherocanvas: " << error << "\n";
        return 1;
    }

    const EditorSettings settings = EditorSettings::load();

    // ========== Shared Services ==========
    ThumbnailCache cache(settings, std::make_unique<DiskThumbnailStore>(settings.cacheDirectory));

    StatusReconciler reconciler(settings);
    HttpStatusSource* statusSource = nullptr;
    if (!settings.statusBaseUrl.isEmpty() && !projectId.isEmpty()) {
        statusSource = new HttpStatusSource(settings.statusBaseUrl, &reconciler);
        statusSource->setToken(settings.statusToken);
        statusSource->setTimeout(settings.requestTimeoutMs);
        reconciler.setSource(statusSource);
        reconciler.setProjectId(projectId);

        ImageStatusRecord record;
        record.imageId = result.imageId;
        record.status = ImageProcessingStatus::Completed;
        reconciler.setImages({record});
    }

    // ========== Editor ==========
    EditorSession session(settings, &cache, &reconciler);

    QMainWindow window;
    window.setWindowTitle(QString("SpheroCanvas - %1").arg(QFileInfo(inputFile).fileName()));

    auto* canvas = new SegmentationCanvas(&session, &window);
    window.setCentralWidget(canvas);

    auto* statusLabel = new QLabel(&window);
    window.statusBar()->addPermanentWidget(statusLabel);

    auto refreshStatus = [&session, statusLabel]() {
        statusLabel->setText(statusText(&session));
    };
    QObject::connect(&session, &EditorSession::viewportChanged, statusLabel, refreshStatus);
    QObject::connect(&session, &EditorSession::selectionChanged, statusLabel, refreshStatus);
    QObject::connect(&session, &EditorSession::editModeChanged, statusLabel, refreshStatus);
    QObject::connect(&session, &EditorSession::segmentationChanged, statusLabel, refreshStatus);
    QObject::connect(canvas, &SegmentationCanvas::statusMessage, &window, [&window](const QString& message) {
        window.statusBar()->showMessage(message, 4000);
    });
    QObject::connect(&reconciler, &StatusReconciler::statusesChanged, &window, [&window, &reconciler](const QStringList& ids) {
        for (const QString& id : ids) {
            window.statusBar()->showMessage(
                QString("%1: %2").arg(id, statusName(reconciler.record(id).status)), 4000);
        }
    });

    session.setSegmentation(result);

    if (!imageFile.isEmpty()) {
        QImageReader reader(imageFile);
        reader.setAutoTransform(true);
        QImage image = reader.read();
        if (image.isNull()) {
            qWarning() << "SpheroCanvas: Cannot read image" << imageFile << ":" << reader.errorString();
        } else {
            session.setBackgroundImage(image);
        }
    }

    // Window icon from the cached (or freshly rendered) thumbnail
    auto applyIcon = [&window](const QByteArray& png) {
        const QImage thumbnail = QImage::fromData(png, "PNG");
        if (!thumbnail.isNull()) {
            window.setWindowIcon(QIcon(QPixmap::fromImage(thumbnail)));
        }
    };
    QObject::connect(&session, &EditorSession::thumbnailReady, &window,
                     [applyIcon](const QString&, LevelOfDetail, const QByteArray& png) {
        applyIcon(png);
    });
    const QByteArray cached = session.getThumbnail(result.imageId, LevelOfDetail::Low);
    if (!cached.isNull()) {
        applyIcon(cached);
    }

    refreshStatus();
    window.resize(1280, 900);
    window.show();

    return app.exec();
}
