#include "EditorSession.h"
#include "PolygonSimplifier.h"
#include "PolygonSlicer.h"
#include "../cache/ThumbnailCache.h"
#include "../status/StatusReconciler.h"
#include "../ui/ThumbnailRenderer.h"

#include <QDebug>

EditorSession::EditorSession(const EditorSettings& settings,
                             ThumbnailCache* cache,
                             StatusReconciler* reconciler,
                             QObject* parent)
    : QObject(parent)
    , m_settings(settings)
    , m_cache(cache)
    , m_reconciler(reconciler)
{
    m_viewport = new ViewportTransform(m_settings, this);
    connect(m_viewport, &ViewportTransform::viewportChanged, this, &EditorSession::viewportChanged);

    m_selection = new SelectionStateMachine(this);
    m_selection->setPolygonLookup([this](const QString& id) {
        return m_result.contains(id);
    });
    connect(m_selection, &SelectionStateMachine::selectionChanged, this, &EditorSession::selectionChanged);
    connect(m_selection, &SelectionStateMachine::editModeChanged, this, &EditorSession::editModeChanged);
    connect(m_selection, &SelectionStateMachine::deleteRequested, this, &EditorSession::onDeleteRequested);

    m_renderer = new ThumbnailRenderer(this);
    connect(m_renderer, &ThumbnailRenderer::thumbnailReady, this, &EditorSession::onThumbnailRendered);
}

EditorSession::~EditorSession()
{
    m_renderer->cancelAll();
}

// ===== Selection / mode =====

void EditorSession::setEditMode(EditMode mode)
{
    m_selection->setEditMode(mode);
}

void EditorSession::cancel()
{
    m_selection->cancel();
}

void EditorSession::clickPolygon(const QString& polygonId)
{
    // DeletePolygon clicks come back through deleteRequested
    m_selection->clickPolygon(polygonId);
}

void EditorSession::clickCanvas()
{
    m_selection->clickCanvas();
}

QString EditorSession::clickAt(const QPointF& screenPoint)
{
    const QPointF imagePoint = m_viewport->screenToImage(screenPoint);
    const QString hit = m_result.hitTest(imagePoint);
    if (hit.isEmpty()) {
        clickCanvas();
    } else {
        clickPolygon(hit);
    }
    return hit;
}

// ===== Segmentation =====

const Polygon* EditorSession::selectedPolygon() const
{
    const QString id = m_selection->selectedPolygonId();
    return id.isEmpty() ? nullptr : m_result.polygon(id);
}

void EditorSession::setSegmentation(const SegmentationResult& result)
{
    const bool sameImage = !m_result.imageId.isEmpty() && m_result.imageId == result.imageId;

    m_result = result;
    m_result.polygons = sanitizePolygons(result.polygons);
    m_displayDirty = true;
    clearHistory();

    // A render still running was snapshotted from the old polygons
    m_renderer->cancelAll();
    if (m_cache && !m_result.imageId.isEmpty()) {
        m_cache->invalidate(m_result.imageId);
    }

    if (sameImage) {
        const QString selected = m_selection->selectedPolygonId();
        if (!selected.isEmpty() && !m_result.contains(selected)) {
            m_selection->polygonRemoved(selected);
        }
        m_viewport->setImageSize(m_result.imageSize());
    } else {
        m_selection->reset();
        m_viewport->centerOn(m_result.imageSize());
    }

    emit segmentationChanged();
}

void EditorSession::setBackgroundImage(const QImage& image)
{
    m_background = image;
    m_renderer->cancelAll();
    if (m_cache && !m_result.imageId.isEmpty()) {
        m_cache->invalidate(m_result.imageId);
    }
    emit segmentationChanged();
}

bool EditorSession::deletePolygon(const QString& polygonId)
{
    if (!m_result.contains(polygonId)) {
        qWarning() << "EditorSession: Cannot delete unknown polygon" << polygonId;
        return false;
    }

    pushUndoState();
    m_result.removePolygon(polygonId);

    m_selection->polygonRemoved(polygonId);
    segmentationEdited();
    emit polygonDeleted(polygonId);
    return true;
}

bool EditorSession::sliceSelected(const QPointF& imageStart, const QPointF& imageEnd, QString* error)
{
    const Polygon* target = selectedPolygon();
    if (!target) {
        if (error) {
            *error = QStringLiteral("No polygon selected");
        }
        return false;
    }

    const SliceResult slice = PolygonSlicer::slicePolygon(*target, imageStart, imageEnd);
    if (!slice.valid) {
        if (error) {
            *error = slice.error;
        }
        return false;
    }

    const QString sourceId = target->id;
    pushUndoState();
    for (int i = 0; i < m_result.polygons.size(); ++i) {
        if (m_result.polygons[i].id == sourceId) {
            m_result.polygons[i] = slice.first;
            m_result.polygons.insert(i + 1, slice.second);
            break;
        }
    }

    // The source id no longer exists; select the first piece
    m_selection->polygonRemoved(sourceId);
    m_selection->clickPolygon(slice.first.id);

    segmentationEdited();
    emit polygonSliced(sourceId, slice.first.id, slice.second.id);
    return true;
}

bool EditorSession::moveVertex(const QString& polygonId, int index, const QPointF& imagePoint,
                               bool recordHistory)
{
    const Polygon* polygon = m_result.polygon(polygonId);
    if (!polygon || index < 0 || index >= polygon->points.size()) {
        return false;
    }
    if (!qIsFinite(imagePoint.x()) || !qIsFinite(imagePoint.y())) {
        return false;
    }

    if (recordHistory) {
        pushUndoState();
    }
    mutablePolygon(polygonId)->points[index] = imagePoint;
    segmentationEdited();
    return true;
}

bool EditorSession::insertVertex(const QString& polygonId, int edgeIndex, const QPointF& imagePoint)
{
    const Polygon* polygon = m_result.polygon(polygonId);
    if (!polygon || edgeIndex < 0 || edgeIndex >= polygon->points.size()) {
        return false;
    }
    if (!qIsFinite(imagePoint.x()) || !qIsFinite(imagePoint.y())) {
        return false;
    }

    pushUndoState();
    mutablePolygon(polygonId)->points.insert(edgeIndex + 1, imagePoint);
    segmentationEdited();
    return true;
}

bool EditorSession::removeVertex(const QString& polygonId, int index)
{
    const Polygon* polygon = m_result.polygon(polygonId);
    if (!polygon || index < 0 || index >= polygon->points.size()) {
        return false;
    }
    if (polygon->points.size() <= 3) {
        qWarning() << "EditorSession: Refusing to remove vertex of triangle" << polygonId;
        return false;
    }

    pushUndoState();
    mutablePolygon(polygonId)->points.removeAt(index);
    segmentationEdited();
    return true;
}

bool EditorSession::insertPoints(const QString& polygonId, int startIndex, int endIndex,
                                 const QVector<QPointF>& imagePoints)
{
    const Polygon* polygon = m_result.polygon(polygonId);
    if (!polygon) {
        return false;
    }

    Polygon updated = *polygon;
    updated.points = Geometry::spliceOutline(polygon->points, startIndex, endIndex, imagePoints);

    QString reason;
    if (updated.points.isEmpty() || !updated.isValid(&reason)) {
        qWarning() << "EditorSession: Cannot add points to" << polygonId << reason;
        return false;
    }

    pushUndoState();
    *mutablePolygon(polygonId) = updated;
    segmentationEdited();
    return true;
}

QString EditorSession::addPolygon(const QVector<QPointF>& imagePoints, PolygonKind kind)
{
    Polygon polygon;
    polygon.id = Polygon::generateId();
    polygon.points = imagePoints;
    polygon.kind = kind;

    QString reason;
    if (!polygon.isValid(&reason)) {
        qWarning() << "EditorSession: Rejecting new polygon:" << reason;
        return QString();
    }

    pushUndoState();
    m_result.polygons.append(polygon);
    segmentationEdited();
    return polygon.id;
}

QVector<Polygon> EditorSession::displayPolygons() const
{
    if (m_displayDirty) {
        const qreal tolerance = PolygonSimplifier::toleranceForImage(m_result.imageWidth, m_result.imageHeight);
        m_displayCache.clear();
        m_displayCache.reserve(m_result.polygons.size());
        for (const Polygon& polygon : m_result.polygons) {
            m_displayCache.append(PolygonSimplifier::simplifyForDisplay(polygon, tolerance));
        }
        m_displayDirty = false;
    }

    const Polygon* selected = selectedPolygon();
    if (!selected) {
        return m_displayCache;
    }

    QVector<Polygon> result = m_displayCache;
    for (Polygon& polygon : result) {
        if (polygon.id == selected->id) {
            polygon = *selected;
            break;
        }
    }
    return result;
}

// ===== Undo/Redo =====

bool EditorSession::undo()
{
    if (m_undoStack.isEmpty()) {
        return false;
    }

    m_redoStack.push(m_result.polygons);
    restoreState(m_undoStack.pop());

    emit undoAvailableChanged(canUndo());
    emit redoAvailableChanged(canRedo());
    return true;
}

bool EditorSession::redo()
{
    if (m_redoStack.isEmpty()) {
        return false;
    }

    m_undoStack.push(m_result.polygons);
    restoreState(m_redoStack.pop());

    emit undoAvailableChanged(canUndo());
    emit redoAvailableChanged(canRedo());
    return true;
}

void EditorSession::pushUndoState()
{
    m_undoStack.push(m_result.polygons);
    while (m_undoStack.size() > MAX_UNDO_STEPS) {
        m_undoStack.removeFirst();
    }

    const bool hadRedo = !m_redoStack.isEmpty();
    m_redoStack.clear();
    if (hadRedo) {
        emit redoAvailableChanged(false);
    }
    emit undoAvailableChanged(true);
}

void EditorSession::clearHistory()
{
    const bool hadUndo = !m_undoStack.isEmpty();
    const bool hadRedo = !m_redoStack.isEmpty();
    m_undoStack.clear();
    m_redoStack.clear();
    if (hadUndo) {
        emit undoAvailableChanged(false);
    }
    if (hadRedo) {
        emit redoAvailableChanged(false);
    }
}

void EditorSession::restoreState(const QVector<Polygon>& polygons)
{
    m_result.polygons = polygons;

    const QString selected = m_selection->selectedPolygonId();
    if (!selected.isEmpty() && !m_result.contains(selected)) {
        m_selection->polygonRemoved(selected);
    }
    segmentationEdited();
}

// ===== Shared services =====

QByteArray EditorSession::getThumbnail(const QString& imageId, LevelOfDetail lod)
{
    if (!m_cache) {
        return QByteArray();
    }

    QByteArray payload = m_cache->get(imageId, lod);
    if (payload.isNull() && imageId == m_result.imageId) {
        m_renderer->requestThumbnail(m_result, lod, m_background);
    }
    return payload;
}

bool EditorSession::reconcileNow()
{
    return m_reconciler ? m_reconciler->reconcileNow() : false;
}

// ===== Internals =====

void EditorSession::onDeleteRequested(const QString& polygonId)
{
    deletePolygon(polygonId);
}

void EditorSession::onThumbnailRendered(const QString& imageId, LevelOfDetail lod, const QByteArray& png)
{
    if (m_cache) {
        m_cache->set(imageId, lod, png);
    }
    emit thumbnailReady(imageId, lod, png);
}

Polygon* EditorSession::mutablePolygon(const QString& polygonId)
{
    for (Polygon& polygon : m_result.polygons) {
        if (polygon.id == polygonId) {
            return &polygon;
        }
    }
    return nullptr;
}

void EditorSession::segmentationEdited()
{
    m_displayDirty = true;
    m_renderer->cancelAll();
    if (m_cache && !m_result.imageId.isEmpty()) {
        m_cache->invalidate(m_result.imageId);
    }
    emit segmentationChanged();
}
