#include "SegmentationCanvas.h"
#include "../core/EditorSession.h"

#include <QPainter>
#include <QPainterPath>
#include <QPaintEvent>
#include <QMouseEvent>
#include <QWheelEvent>
#include <QKeyEvent>
#include <QResizeEvent>
#include <QLineF>
#include <QKeySequence>
#include <QDebug>

namespace {

const QColor BACKGROUND_COLOR(64, 64, 64);
const QColor EXTERNAL_COLOR(239, 68, 68);
const QColor INTERNAL_COLOR(14, 165, 233);
const QColor SELECTED_COLOR(250, 204, 21);
const QColor DRAFT_COLOR(34, 197, 94);

}

SegmentationCanvas::SegmentationCanvas(EditorSession* session, QWidget* parent)
    : QWidget(parent)
    , m_session(session)
{
    setFocusPolicy(Qt::StrongFocus);
    setMouseTracking(true);
    setAttribute(Qt::WA_OpaquePaintEvent);

    if (m_session) {
        auto repaint = [this]() { update(); };
        connect(m_session, &EditorSession::viewportChanged, this, repaint);
        connect(m_session, &EditorSession::segmentationChanged, this, repaint);
        connect(m_session, &EditorSession::selectionChanged, this, [this]() {
            resetAddPoints();
            update();
        });
        connect(m_session, &EditorSession::editModeChanged, this, &SegmentationCanvas::onEditModeChanged);
    }
}

SegmentationCanvas::~SegmentationCanvas() = default;

QSize SegmentationCanvas::sizeHint() const
{
    return QSize(1024, 768);
}

// ===== Painting =====

void SegmentationCanvas::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event);

    QPainter painter(this);
    painter.fillRect(rect(), BACKGROUND_COLOR);

    if (!m_session || m_session->segmentation().imageId.isEmpty()) {
        painter.setPen(Qt::white);
        painter.drawText(rect(), Qt::AlignCenter, tr("No segmentation loaded"));
        m_lastPaintedCount = 0;
        return;
    }

    const ViewportTransform* vt = m_session->viewportTransform();
    const qreal zoom = vt->zoom();
    const QPointF offset = vt->offset();

    painter.setRenderHint(QPainter::Antialiasing, true);
    painter.setRenderHint(QPainter::SmoothPixmapTransform, zoom < 1.0);

    // Image space: screen = (image + offset) * zoom
    painter.save();
    painter.scale(zoom, zoom);
    painter.translate(offset);

    const QImage& background = m_session->backgroundImage();
    const QSizeF imageSize = m_session->segmentation().imageSize();
    if (!background.isNull()) {
        painter.drawImage(QRectF(QPointF(0, 0), imageSize), background);
    } else {
        painter.fillRect(QRectF(QPointF(0, 0), imageSize), Qt::black);
    }

    // Cull against the visible rect plus a margin on every side
    QRectF visible = vt->visibleImageRect();
    visible.adjust(-visible.width() * CULL_MARGIN, -visible.height() * CULL_MARGIN,
                   visible.width() * CULL_MARGIN, visible.height() * CULL_MARGIN);

    const QString selectedId = m_session->selectedPolygonId();
    const QVector<Polygon> polygons = m_session->displayPolygons();

    int painted = 0;
    const Polygon* selected = nullptr;
    for (int pass = 0; pass < 2; ++pass) {
        const bool externalPass = pass == 0;
        for (const Polygon& polygon : polygons) {
            if (polygon.isExternal() != externalPass) {
                continue;
            }
            if (!polygon.boundingBox().intersects(visible)) {
                continue;
            }
            if (polygon.id == selectedId) {
                selected = &polygon;    // Drawn last, on top
                continue;
            }
            drawPolygon(painter, polygon, false);
            painted++;
        }
    }
    if (selected) {
        drawPolygon(painter, *selected, true);
        painted++;
    }

    painter.restore();

    // Screen-space overlays keep a constant size at any zoom
    if (selected && (m_session->editMode() == EditMode::EditVertices
                     || m_session->editMode() == EditMode::AddPoints)) {
        drawHandles(painter, *selected);
    }
    drawGestureOverlay(painter);

    m_lastPaintedCount = painted;
}

void SegmentationCanvas::drawPolygon(QPainter& painter, const Polygon& polygon, bool selected) const
{
    QPainterPath path;
    path.addPolygon(QPolygonF(polygon.points));
    path.closeSubpath();

    QColor stroke = polygon.isExternal() ? EXTERNAL_COLOR : INTERNAL_COLOR;
    QColor fill = stroke;
    fill.setAlpha(selected ? 110 : 70);
    if (selected) {
        stroke = SELECTED_COLOR;
    }

    QPen pen(stroke);
    pen.setCosmetic(true);
    pen.setWidthF(selected ? 2.5 : 1.5);
    pen.setJoinStyle(Qt::RoundJoin);
    painter.setPen(pen);
    painter.setBrush(fill);
    painter.drawPath(path);
}

void SegmentationCanvas::drawHandles(QPainter& painter, const Polygon& polygon) const
{
    const ViewportTransform* vt = m_session->viewportTransform();

    painter.setPen(QPen(Qt::black, 1.0));
    painter.setBrush(SELECTED_COLOR);
    for (int i = 0; i < polygon.points.size(); ++i) {
        const QPointF p = vt->imageToScreen(polygon.points[i]);
        const qreal r = (m_gesture == Gesture::DragVertex && i == m_dragVertex) ? HANDLE_RADIUS + 2 : HANDLE_RADIUS;
        painter.drawEllipse(p, r, r);
    }
}

void SegmentationCanvas::drawGestureOverlay(QPainter& painter) const
{
    const ViewportTransform* vt = m_session->viewportTransform();

    if (m_gesture == Gesture::SliceLine) {
        QPen pen(SELECTED_COLOR, 1.5, Qt::DashLine);
        painter.setPen(pen);
        painter.drawLine(m_pressPos, m_lastPos);
    }

    const Polygon* selected = m_session->selectedPolygon();
    if (m_addStartVertex >= 0 && selected && m_addStartVertex < selected->points.size()) {
        QPolygonF screen;
        screen << vt->imageToScreen(selected->points[m_addStartVertex]);
        for (const QPointF& p : m_addPoints) {
            screen << vt->imageToScreen(p);
        }
        painter.setPen(QPen(DRAFT_COLOR, 1.5, Qt::DashLine));
        painter.setBrush(Qt::NoBrush);
        painter.drawPolyline(screen);
        painter.drawLine(screen.last(), m_lastPos);

        painter.setBrush(DRAFT_COLOR);
        for (const QPointF& p : screen) {
            painter.drawEllipse(p, HANDLE_RADIUS - 1, HANDLE_RADIUS - 1);
        }
    }

    if (!m_draftPoints.isEmpty()) {
        QPolygonF screen;
        for (const QPointF& p : m_draftPoints) {
            screen << vt->imageToScreen(p);
        }
        painter.setPen(QPen(DRAFT_COLOR, 1.5));
        painter.setBrush(Qt::NoBrush);
        painter.drawPolyline(screen);
        painter.drawLine(screen.last(), m_lastPos);

        painter.setBrush(DRAFT_COLOR);
        for (const QPointF& p : screen) {
            painter.drawEllipse(p, HANDLE_RADIUS - 1, HANDLE_RADIUS - 1);
        }
    }
}

// ===== Geometry helpers =====

int SegmentationCanvas::vertexAt(const QPointF& screenPos) const
{
    const Polygon* polygon = m_session ? m_session->selectedPolygon() : nullptr;
    if (!polygon) {
        return -1;
    }

    const ViewportTransform* vt = m_session->viewportTransform();
    int best = -1;
    qreal bestDistance = HANDLE_HIT_RADIUS;
    for (int i = 0; i < polygon->points.size(); ++i) {
        const qreal d = QLineF(vt->imageToScreen(polygon->points[i]), screenPos).length();
        if (d <= bestDistance) {
            bestDistance = d;
            best = i;
        }
    }
    return best;
}

int SegmentationCanvas::edgeAt(const QPointF& screenPos) const
{
    const Polygon* polygon = m_session ? m_session->selectedPolygon() : nullptr;
    if (!polygon) {
        return -1;
    }

    const ViewportTransform* vt = m_session->viewportTransform();
    const int n = polygon->points.size();
    int best = -1;
    qreal bestDistance = HANDLE_HIT_RADIUS;
    for (int i = 0; i < n; ++i) {
        const qreal d = Geometry::distanceToSegment(screenPos,
                                                    vt->imageToScreen(polygon->points[i]),
                                                    vt->imageToScreen(polygon->points[(i + 1) % n]));
        if (d <= bestDistance) {
            bestDistance = d;
            best = i;
        }
    }
    return best;
}

// ===== Input =====

void SegmentationCanvas::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);
    if (!m_session) {
        return;
    }

    ViewportTransform* vt = m_session->viewportTransform();
    vt->setContainerSize(QSizeF(width(), height()));

    // The session may have centered before the widget had a size
    if (!m_centeredOnce && !m_session->segmentation().imageSize().isEmpty()) {
        vt->centerOn(m_session->segmentation().imageSize());
        m_centeredOnce = true;
    }
}

void SegmentationCanvas::mousePressEvent(QMouseEvent* event)
{
    if (!m_session) {
        event->ignore();
        return;
    }

    m_pressPos = event->position();
    m_lastPos = m_pressPos;

    if (event->button() == Qt::MiddleButton
        || (event->button() == Qt::LeftButton && m_spaceHeld)) {
        m_gesture = Gesture::Pan;
        setCursor(Qt::ClosedHandCursor);
        event->accept();
        return;
    }

    const EditMode mode = m_session->editMode();

    if (event->button() == Qt::RightButton && mode == EditMode::EditVertices) {
        const int vertex = vertexAt(m_pressPos);
        if (vertex >= 0) {
            if (!m_session->removeVertex(m_session->selectedPolygonId(), vertex)) {
                emit statusMessage(tr("A polygon needs at least 3 vertices"));
            }
            event->accept();
            return;
        }
    }

    if (event->button() != Qt::LeftButton) {
        event->ignore();
        return;
    }

    if (mode == EditMode::CreatePolygon) {
        m_draftPoints.append(m_session->viewportTransform()->screenToImage(m_pressPos));
        update();
        event->accept();
        return;
    }

    if (mode == EditMode::EditVertices) {
        const int vertex = vertexAt(m_pressPos);
        if (vertex >= 0) {
            m_gesture = Gesture::DragVertex;
            m_dragVertex = vertex;
            m_dragPolygonId = m_session->selectedPolygonId();
            m_dragMoved = false;
            event->accept();
            return;
        }
        if (edgeAt(m_pressPos) >= 0) {
            // Edge presses never change the selection; a double click inserts
            m_gesture = Gesture::None;
            event->accept();
            return;
        }
    }

    if (mode == EditMode::AddPoints && m_session->selectedPolygon()
        && (m_addStartVertex >= 0 || vertexAt(m_pressPos) >= 0)) {
        m_gesture = Gesture::None;
        handleAddPointsPress(m_pressPos);
        event->accept();
        return;
    }

    if (mode == EditMode::Slice && !m_session->selectedPolygonId().isEmpty()) {
        m_gesture = Gesture::SliceLine;
        event->accept();
        return;
    }

    m_gesture = Gesture::Click;
    event->accept();
}

void SegmentationCanvas::mouseMoveEvent(QMouseEvent* event)
{
    if (!m_session) {
        event->ignore();
        return;
    }

    const QPointF pos = event->position();
    const QPointF delta = pos - m_lastPos;
    m_lastPos = pos;

    switch (m_gesture) {
        case Gesture::Pan:
            m_session->viewportTransform()->panBy(delta);
            break;
        case Gesture::DragVertex:
            m_session->moveVertex(m_dragPolygonId, m_dragVertex,
                                  m_session->viewportTransform()->screenToImage(pos), !m_dragMoved);
            m_dragMoved = true;
            break;
        case Gesture::SliceLine:
            update();
            break;
        case Gesture::Click:
        case Gesture::None:
            if (!m_draftPoints.isEmpty() || m_addStartVertex >= 0) {
                update();   // Rubber band to the cursor
            }
            break;
    }
    event->accept();
}

void SegmentationCanvas::mouseReleaseEvent(QMouseEvent* event)
{
    if (!m_session) {
        event->ignore();
        return;
    }

    const QPointF pos = event->position();
    const Gesture gesture = m_gesture;
    m_gesture = Gesture::None;
    m_dragVertex = -1;
    m_dragPolygonId.clear();
    unsetCursor();

    const bool moved = QLineF(m_pressPos, pos).length() > CLICK_SLOP;

    if (gesture == Gesture::SliceLine) {
        if (moved) {
            const ViewportTransform* vt = m_session->viewportTransform();
            QString error;
            if (!m_session->sliceSelected(vt->screenToImage(m_pressPos), vt->screenToImage(pos), &error)) {
                emit statusMessage(tr("Slice rejected: %1").arg(error));
            }
        } else {
            m_session->clickAt(pos);
        }
    } else if (gesture == Gesture::Click && !moved) {
        m_session->clickAt(pos);
    }

    update();
    event->accept();
}

void SegmentationCanvas::mouseDoubleClickEvent(QMouseEvent* event)
{
    if (m_session && m_session->editMode() == EditMode::CreatePolygon && event->button() == Qt::LeftButton) {
        // The first click of the pair already placed this point
        finishDraft();
        event->accept();
        return;
    }
    if (m_session && m_session->editMode() == EditMode::EditVertices && event->button() == Qt::LeftButton
        && vertexAt(event->position()) < 0) {
        const int edge = edgeAt(event->position());
        if (edge >= 0) {
            m_session->insertVertex(m_session->selectedPolygonId(), edge,
                                    m_session->viewportTransform()->screenToImage(event->position()));
            event->accept();
            return;
        }
    }
    QWidget::mouseDoubleClickEvent(event);
}

void SegmentationCanvas::wheelEvent(QWheelEvent* event)
{
    if (!m_session) {
        event->ignore();
        return;
    }
    m_session->viewportTransform()->handleWheel(event);
}

void SegmentationCanvas::keyPressEvent(QKeyEvent* event)
{
    if (!m_session) {
        QWidget::keyPressEvent(event);
        return;
    }

    if (event->matches(QKeySequence::Undo)) {
        m_session->undo();
        event->accept();
        return;
    }
    if (event->matches(QKeySequence::Redo)) {
        m_session->redo();
        event->accept();
        return;
    }

    ViewportTransform* vt = m_session->viewportTransform();

    switch (event->key()) {
        case Qt::Key_Space:
            if (!event->isAutoRepeat()) {
                m_spaceHeld = true;
                setCursor(Qt::OpenHandCursor);
            }
            break;
        case Qt::Key_Plus:
        case Qt::Key_Equal:
            vt->zoomIn();
            break;
        case Qt::Key_Minus:
            vt->zoomOut();
            break;
        case Qt::Key_0:
            vt->centerOn(m_session->segmentation().imageSize());
            break;
        case Qt::Key_V:
            m_session->setEditMode(EditMode::View);
            break;
        case Qt::Key_E:
            m_session->setEditMode(EditMode::EditVertices);
            break;
        case Qt::Key_N:
            m_session->setEditMode(EditMode::CreatePolygon);
            break;
        case Qt::Key_A:
            m_session->setEditMode(EditMode::AddPoints);
            break;
        case Qt::Key_S:
            m_session->setEditMode(EditMode::Slice);
            break;
        case Qt::Key_D:
            m_session->setEditMode(EditMode::DeletePolygon);
            break;
        case Qt::Key_Return:
        case Qt::Key_Enter:
            finishDraft();
            break;
        case Qt::Key_Delete:
        case Qt::Key_Backspace:
            if (!m_session->selectedPolygonId().isEmpty()) {
                m_session->deletePolygon(m_session->selectedPolygonId());
            }
            break;
        case Qt::Key_Escape:
            m_draftPoints.clear();
            resetAddPoints();
            m_gesture = Gesture::None;
            m_session->cancel();
            update();
            break;
        default:
            QWidget::keyPressEvent(event);
            return;
    }
    event->accept();
}

void SegmentationCanvas::keyReleaseEvent(QKeyEvent* event)
{
    if (event->key() == Qt::Key_Space && !event->isAutoRepeat()) {
        m_spaceHeld = false;
        unsetCursor();
        event->accept();
        return;
    }
    QWidget::keyReleaseEvent(event);
}

// ===== Drafting =====

bool SegmentationCanvas::finishDraft()
{
    if (!m_session || m_draftPoints.size() < 3) {
        return false;
    }

    const QString id = m_session->addPolygon(m_draftPoints);
    m_draftPoints.clear();
    update();

    if (id.isEmpty()) {
        emit statusMessage(tr("Polygon rejected"));
        return false;
    }
    m_session->clickPolygon(id);
    return true;
}

void SegmentationCanvas::onEditModeChanged(EditMode mode)
{
    if (mode != EditMode::CreatePolygon) {
        m_draftPoints.clear();
    }
    if (mode != EditMode::AddPoints) {
        resetAddPoints();
    }
    update();
}

// ===== Adding points =====

void SegmentationCanvas::handleAddPointsPress(const QPointF& screenPos)
{
    const QString polygonId = m_session->selectedPolygonId();
    const int vertex = vertexAt(screenPos);

    if (m_addStartVertex < 0) {
        m_addStartVertex = vertex;
        m_addPoints.clear();
        update();
        return;
    }

    if (vertex < 0 || vertex == m_addStartVertex) {
        m_addPoints.append(m_session->viewportTransform()->screenToImage(screenPos));
        update();
        return;
    }

    // Second vertex closes the run
    const int startVertex = m_addStartVertex;
    const QVector<QPointF> points = m_addPoints;
    resetAddPoints();

    if (!m_session->insertPoints(polygonId, startVertex, vertex, points)) {
        emit statusMessage(tr("Place at least one point before closing on a vertex"));
    }
    m_session->setEditMode(EditMode::EditVertices);
    update();
}

void SegmentationCanvas::resetAddPoints()
{
    m_addStartVertex = -1;
    m_addPoints.clear();
}
