#include "SelectionStateMachine.h"

#include <QDebug>

SelectionStateMachine::SelectionStateMachine(QObject* parent)
    : QObject(parent)
{
}

// ===== Pure transition =====

SelectionTransition SelectionStateMachine::transition(const SelectionState& current,
                                                      const SelectionEvent& event,
                                                      bool targetExists)
{
    SelectionTransition result;
    result.state = current;
    SelectionState& next = result.state;

    // Clearing the selection while editing vertices leaves nothing to edit
    auto clearSelection = [&next]() {
        next.selectedPolygonId.clear();
        if (next.mode == EditMode::EditVertices) {
            next.mode = EditMode::View;
        }
    };

    switch (event.type) {
        case SelectionEvent::PolygonClick:
            if (event.polygonId.isEmpty() || !targetExists) {
                // Stale reference (deleted polygon, old id): same as empty canvas
                return transition(current, SelectionEvent::canvasClick(), true);
            }
            switch (current.mode) {
                case EditMode::DeletePolygon:
                    result.deletePolygonId = event.polygonId;
                    break;
                case EditMode::View:
                    next.selectedPolygonId = event.polygonId;
                    next.mode = EditMode::EditVertices;
                    break;
                case EditMode::Slice:
                case EditMode::EditVertices:
                case EditMode::AddPoints:
                case EditMode::CreatePolygon:
                    next.selectedPolygonId = event.polygonId;
                    break;
            }
            break;

        case SelectionEvent::CanvasClick:
            // Empty clicks place points while creating or slicing
            if (current.mode != EditMode::CreatePolygon && current.mode != EditMode::Slice) {
                clearSelection();
            }
            break;

        case SelectionEvent::ModeChange:
            next.mode = event.mode;
            if (event.mode == EditMode::View || event.mode == EditMode::CreatePolygon) {
                next.selectedPolygonId.clear();
            }
            break;

        case SelectionEvent::PolygonRemoved:
            if (!event.polygonId.isEmpty() && current.selectedPolygonId == event.polygonId) {
                clearSelection();
            }
            break;

        case SelectionEvent::Cancel:
            next.selectedPolygonId.clear();
            next.mode = EditMode::View;
            break;
    }

    return result;
}

SelectionTransition SelectionStateMachine::onPolygonClick(const QString& polygonId, EditMode currentMode,
                                                          const QString& previousSelection)
{
    SelectionState current;
    current.selectedPolygonId = previousSelection;
    current.mode = currentMode;
    return transition(current, SelectionEvent::polygonClick(polygonId), true);
}

// ===== Live state =====

void SelectionStateMachine::setPolygonLookup(std::function<bool(const QString&)> lookup)
{
    m_lookup = std::move(lookup);
}

QString SelectionStateMachine::dispatch(const SelectionEvent& event)
{
    bool targetExists = true;
    if (event.type == SelectionEvent::PolygonClick && m_lookup) {
        targetExists = m_lookup(event.polygonId);
        if (!targetExists) {
            qDebug() << "SelectionStateMachine: Ignoring click on unknown polygon" << event.polygonId;
        }
    }

    SelectionTransition t = transition(m_state, event, targetExists);
    apply(t.state);

    if (!t.deletePolygonId.isEmpty()) {
        emit deleteRequested(t.deletePolygonId);
    }
    return t.deletePolygonId;
}

void SelectionStateMachine::reset()
{
    SelectionState initial;
    apply(initial);
}

void SelectionStateMachine::apply(const SelectionState& next)
{
    if (next == m_state) {
        return;
    }

    const bool selectionDiffers = next.selectedPolygonId != m_state.selectedPolygonId;
    const bool modeDiffers = next.mode != m_state.mode;
    m_state = next;

#ifdef SPHEROCANVAS_DEBUG
    qDebug() << "SelectionStateMachine:" << editModeName(m_state.mode)
             << "selected =" << m_state.selectedPolygonId;
#endif

    if (selectionDiffers) {
        emit selectionChanged(m_state.selectedPolygonId);
    }
    if (modeDiffers) {
        emit editModeChanged(m_state.mode);
    }
}
