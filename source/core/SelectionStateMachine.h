#pragma once

// ============================================================================
// SelectionStateMachine - Single authority over polygon selection and mode
// ============================================================================
// Every click, tool switch and removal that can change which polygon is
// selected goes through transition(). Nothing else writes the selected id,
// so at most one polygon is ever marked selected.
// ============================================================================

#include "EditMode.h"

#include <QObject>
#include <QString>
#include <functional>

/**
 * @brief Selection + mode pair the state machine owns.
 */
struct SelectionState {
    QString selectedPolygonId;      ///< Empty when nothing is selected
    EditMode mode = EditMode::View;

    bool hasSelection() const { return !selectedPolygonId.isEmpty(); }
    bool operator==(const SelectionState& other) const {
        return selectedPolygonId == other.selectedPolygonId && mode == other.mode;
    }
    bool operator!=(const SelectionState& other) const { return !(*this == other); }
};

/**
 * @brief Input that can change the selection.
 */
struct SelectionEvent {
    enum Type {
        PolygonClick,   ///< Click on a polygon (polygonId set)
        CanvasClick,    ///< Click on empty canvas
        ModeChange,     ///< Tool switch (mode set)
        PolygonRemoved, ///< A polygon disappeared from the result (polygonId set)
        Cancel          ///< Escape
    };

    Type type = CanvasClick;
    QString polygonId;
    EditMode mode = EditMode::View;

    static SelectionEvent polygonClick(const QString& id) { return {PolygonClick, id, EditMode::View}; }
    static SelectionEvent canvasClick() { return {CanvasClick, QString(), EditMode::View}; }
    static SelectionEvent modeChange(EditMode m) { return {ModeChange, QString(), m}; }
    static SelectionEvent polygonRemoved(const QString& id) { return {PolygonRemoved, id, EditMode::View}; }
    static SelectionEvent cancel() { return {Cancel, QString(), EditMode::View}; }
};

/**
 * @brief Result of a transition.
 *
 * In DeletePolygon mode a polygon click does not select anything; instead
 * deletePolygonId names the polygon the owner must remove.
 */
struct SelectionTransition {
    SelectionState state;
    QString deletePolygonId;
};

class SelectionStateMachine : public QObject {
    Q_OBJECT

public:
    explicit SelectionStateMachine(QObject* parent = nullptr);

    /**
     * @brief Pure transition function.
     *
     * @param current State before the event.
     * @param event The input.
     * @param targetExists For PolygonClick: whether polygonId is present in
     *        the current segmentation. A click on a stale id behaves like a
     *        click on empty canvas.
     */
    static SelectionTransition transition(const SelectionState& current,
                                          const SelectionEvent& event,
                                          bool targetExists = true);

    /**
     * @brief Convenience wrapper used by tests and the session:
     *        transition for a polygon click in a given mode.
     */
    static SelectionTransition onPolygonClick(const QString& polygonId, EditMode currentMode,
                                              const QString& previousSelection = QString());

    // ===== Live state =====

    const SelectionState& state() const { return m_state; }
    QString selectedPolygonId() const { return m_state.selectedPolygonId; }
    EditMode editMode() const { return m_state.mode; }

    /**
     * @brief Install the lookup used to reject stale polygon ids.
     *
     * Without a lookup every id is treated as present.
     */
    void setPolygonLookup(std::function<bool(const QString&)> lookup);

    /**
     * @brief Feed an event through transition() and publish the result.
     * @return The polygon to delete, or an empty string.
     */
    QString dispatch(const SelectionEvent& event);

    QString clickPolygon(const QString& polygonId) { return dispatch(SelectionEvent::polygonClick(polygonId)); }
    void clickCanvas() { dispatch(SelectionEvent::canvasClick()); }
    void setEditMode(EditMode mode) { dispatch(SelectionEvent::modeChange(mode)); }
    void polygonRemoved(const QString& polygonId) { dispatch(SelectionEvent::polygonRemoved(polygonId)); }
    void cancel() { dispatch(SelectionEvent::cancel()); }

    /**
     * @brief Drop selection and return to View (new image loaded).
     */
    void reset();

signals:
    void selectionChanged(const QString& polygonId);
    void editModeChanged(EditMode mode);

    /**
     * @brief A DeletePolygon click hit this polygon.
     */
    void deleteRequested(const QString& polygonId);

private:
    void apply(const SelectionState& next);

    SelectionState m_state;
    std::function<bool(const QString&)> m_lookup;
};
