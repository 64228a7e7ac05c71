#pragma once

// ============================================================================
// EditorSession - State of one open segmentation editor
// ============================================================================
// The session owns the viewport, the selection state machine and the
// segmentation of the image being edited. The thumbnail cache and the status
// reconciler are shared between sessions and only referenced.
//
// Everything outside reads through accessors and listens to signals; all
// mutations go through the methods below.
// ============================================================================

#include "Polygon.h"
#include "EditMode.h"
#include "EditorSettings.h"
#include "ViewportTransform.h"
#include "SelectionStateMachine.h"
#include "../cache/ThumbnailCacheEntry.h"

#include <QObject>
#include <QImage>
#include <QPointer>
#include <QStack>

class ThumbnailCache;
class ThumbnailRenderer;
class StatusReconciler;

class EditorSession : public QObject {
    Q_OBJECT

public:
    /**
     * @param cache Shared thumbnail cache (not owned, may be nullptr).
     * @param reconciler Shared status reconciler (not owned, may be nullptr).
     */
    explicit EditorSession(const EditorSettings& settings = EditorSettings(),
                           ThumbnailCache* cache = nullptr,
                           StatusReconciler* reconciler = nullptr,
                           QObject* parent = nullptr);
    ~EditorSession() override;

    // ===== Viewport =====

    Viewport viewport() const { return m_viewport->viewport(); }
    ViewportTransform* viewportTransform() const { return m_viewport; }

    // ===== Selection / mode =====

    QString selectedPolygonId() const { return m_selection->selectedPolygonId(); }
    EditMode editMode() const { return m_selection->editMode(); }
    void setEditMode(EditMode mode);

    /**
     * @brief Escape: back to View with nothing selected.
     */
    void cancel();

    /**
     * @brief Click on a polygon by id.
     *
     * In DeletePolygon mode the polygon is removed. Unknown ids behave like
     * an empty-canvas click.
     */
    void clickPolygon(const QString& polygonId);
    void clickCanvas();

    /**
     * @brief Hit-test a screen point and dispatch the click.
     * @return Id of the polygon under the point, or empty.
     */
    QString clickAt(const QPointF& screenPoint);

    // ===== Segmentation =====

    const SegmentationResult& segmentation() const { return m_result; }
    const Polygon* selectedPolygon() const;

    /**
     * @brief Replace the segmentation of the open image.
     *
     * Polygons are sanitized. Cached thumbnails of the image are invalidated.
     * Loading a different image resets selection and recenters the viewport;
     * reloading the same image keeps the selection if the polygon survived.
     */
    void setSegmentation(const SegmentationResult& result);

    void setBackgroundImage(const QImage& image);
    const QImage& backgroundImage() const { return m_background; }

    /**
     * @brief Remove a polygon.
     * @return False if the id is unknown.
     */
    bool deletePolygon(const QString& polygonId);

    /**
     * @brief Slice the selected polygon along an image-space line.
     *
     * On success the selected polygon is replaced by the two pieces and the
     * first piece becomes the selection.
     * @param error Set to the rejection cause on failure.
     */
    bool sliceSelected(const QPointF& imageStart, const QPointF& imageEnd, QString* error = nullptr);

    /**
     * @brief Move one vertex of a polygon (EditVertices drag).
     * @param recordHistory False for the follow-up moves of one drag, so the
     *        whole drag undoes in one step.
     */
    bool moveVertex(const QString& polygonId, int index, const QPointF& imagePoint,
                    bool recordHistory = true);

    /**
     * @brief Insert a vertex on the edge from index edgeIndex to the next one.
     */
    bool insertVertex(const QString& polygonId, int edgeIndex, const QPointF& imagePoint);

    /**
     * @brief Remove one vertex. Refused when fewer than 3 would remain.
     */
    bool removeVertex(const QString& polygonId, int index);

    /**
     * @brief AddPoints: replace the outline between two vertices with a run
     *        of new points (see Geometry::spliceOutline).
     */
    bool insertPoints(const QString& polygonId, int startIndex, int endIndex,
                      const QVector<QPointF>& imagePoints);

    /**
     * @brief Add a hand-drawn polygon (finishing CreatePolygon).
     * @return The new polygon id, or empty when the outline is invalid.
     */
    QString addPolygon(const QVector<QPointF>& imagePoints, PolygonKind kind = PolygonKind::External);

    /**
     * @brief Sanitized, simplified polygons for painting.
     *
     * Recomputed only after the segmentation changes. The selected polygon
     * is included unsimplified so its handles match the real vertices.
     */
    QVector<Polygon> displayPolygons() const;

    // ===== Undo/Redo =====

    /**
     * @brief Step back over the last geometry edit of the open image.
     *
     * Loading a segmentation clears the history. A selected polygon that
     * does not exist in the restored state is deselected.
     */
    bool undo();
    bool redo();
    bool canUndo() const { return !m_undoStack.isEmpty(); }
    bool canRedo() const { return !m_redoStack.isEmpty(); }

    // ===== Shared services =====

    /**
     * @brief Cached thumbnail of an image.
     *
     * On a miss for the open image a render is queued; thumbnailReady is
     * emitted when it lands in the cache.
     * @return The PNG bytes, or a null QByteArray when not cached yet.
     */
    QByteArray getThumbnail(const QString& imageId, LevelOfDetail lod);

    /**
     * @brief Ask the shared reconciler for an immediate status check.
     */
    bool reconcileNow();

    ThumbnailRenderer* renderer() const { return m_renderer; }

signals:
    void segmentationChanged();
    void selectionChanged(const QString& polygonId);
    void editModeChanged(EditMode mode);
    void viewportChanged();
    void polygonDeleted(const QString& polygonId);
    void polygonSliced(const QString& sourceId, const QString& firstId, const QString& secondId);
    void thumbnailReady(const QString& imageId, LevelOfDetail lod, const QByteArray& png);
    void undoAvailableChanged(bool available);
    void redoAvailableChanged(bool available);

private slots:
    void onDeleteRequested(const QString& polygonId);
    void onThumbnailRendered(const QString& imageId, LevelOfDetail lod, const QByteArray& png);

private:
    Polygon* mutablePolygon(const QString& polygonId);

    /**
     * @brief Invalidate derived data after an edit of the open image.
     */
    void segmentationEdited();

    /**
     * @brief Snapshot the polygons before an edit; drops the redo stack.
     */
    void pushUndoState();
    void clearHistory();
    void restoreState(const QVector<Polygon>& polygons);

    /// Max undo steps kept per session
    static const int MAX_UNDO_STEPS = 50;

    EditorSettings m_settings;

    ViewportTransform* m_viewport = nullptr;
    SelectionStateMachine* m_selection = nullptr;
    ThumbnailRenderer* m_renderer = nullptr;

    QPointer<ThumbnailCache> m_cache;
    QPointer<StatusReconciler> m_reconciler;

    SegmentationResult m_result;
    QImage m_background;

    QStack<QVector<Polygon>> m_undoStack;
    QStack<QVector<Polygon>> m_redoStack;

    // Simplified outlines, rebuilt lazily
    mutable QVector<Polygon> m_displayCache;
    mutable bool m_displayDirty = true;
};
