#pragma once

// ============================================================================
// SegmentationCanvas - Widget that shows and edits one segmentation
// ============================================================================
// Paints the source image and the session's display polygons through the
// session's viewport, and turns mouse, wheel and key input into session
// calls. The canvas keeps no editing state of its own beyond the gesture in
// progress (pan drag, vertex drag, slice line, polygon being drawn).
// ============================================================================

#include <QWidget>
#include <QPointer>
#include <QVector>
#include <QPointF>

#include "../core/EditMode.h"

class EditorSession;
struct Polygon;

class SegmentationCanvas : public QWidget {
    Q_OBJECT

public:
    /**
     * @param session Session to display (not owned).
     */
    explicit SegmentationCanvas(EditorSession* session, QWidget* parent = nullptr);
    ~SegmentationCanvas() override;

    EditorSession* session() const { return m_session; }

    /**
     * @brief Number of polygons painted by the last paintEvent (after culling).
     */
    int lastPaintedPolygonCount() const { return m_lastPaintedCount; }

    /**
     * @brief Points placed so far in CreatePolygon mode (image space).
     */
    const QVector<QPointF>& draftPoints() const { return m_draftPoints; }

    /**
     * @brief AddPoints run in progress: start vertex (-1 when none) and the
     *        points placed after it (image space).
     */
    int addPointsStartVertex() const { return m_addStartVertex; }
    const QVector<QPointF>& addPoints() const { return m_addPoints; }

    /**
     * @brief Close the polygon being drawn (Enter / double click).
     * @return True if a polygon was added.
     */
    bool finishDraft();

    QSize sizeHint() const override;

signals:
    /**
     * @brief Human readable feedback (rejected slice, ...).
     */
    void statusMessage(const QString& message);

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void mouseDoubleClickEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;
    void keyReleaseEvent(QKeyEvent* event) override;

private:
    enum class Gesture {
        None,
        Pan,
        DragVertex,
        SliceLine,
        Click
    };

    /**
     * @brief Index of the selected polygon's vertex under a screen point.
     * @return -1 when no handle is within reach.
     */
    int vertexAt(const QPointF& screenPos) const;

    /**
     * @brief Index of the selected polygon's edge (i, i+1) under a screen point.
     * @return -1 when no edge is within reach.
     */
    int edgeAt(const QPointF& screenPos) const;

    /**
     * @brief AddPoints click: start a run on a vertex, extend it, or close it
     *        on a second vertex.
     */
    void handleAddPointsPress(const QPointF& screenPos);
    void resetAddPoints();

    void drawPolygon(QPainter& painter, const Polygon& polygon, bool selected) const;
    void drawHandles(QPainter& painter, const Polygon& polygon) const;
    void drawGestureOverlay(QPainter& painter) const;

    void onEditModeChanged(EditMode mode);

    QPointer<EditorSession> m_session;

    Gesture m_gesture = Gesture::None;
    QPointF m_pressPos;             ///< Screen
    QPointF m_lastPos;              ///< Screen
    int m_dragVertex = -1;
    QString m_dragPolygonId;
    bool m_dragMoved = false;       ///< First move of a drag records undo
    bool m_spaceHeld = false;

    QVector<QPointF> m_draftPoints; ///< CreatePolygon, image space

    int m_addStartVertex = -1;      ///< AddPoints
    QVector<QPointF> m_addPoints;   ///< AddPoints, image space

    bool m_centeredOnce = false;
    int m_lastPaintedCount = 0;

    static constexpr qreal HANDLE_RADIUS = 4.0;
    static constexpr qreal HANDLE_HIT_RADIUS = 8.0;
    static constexpr qreal CLICK_SLOP = 3.0;
    static constexpr qreal CULL_MARGIN = 0.2;
};
