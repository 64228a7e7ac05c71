#ifndef SELECTIONSTATEMACHINETESTS_H
#define SELECTIONSTATEMACHINETESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include <QSet>

#include "SelectionStateMachine.h"

/**
 * Unit tests for the selection / edit mode state machine.
 * Run with: spherocanvas_tests selection
 */
class SelectionStateMachineTests : public QObject {
    Q_OBJECT

private:
    static SelectionState state(const QString& selected, EditMode mode)
    {
        SelectionState s;
        s.selectedPolygonId = selected;
        s.mode = mode;
        return s;
    }

private slots:
    void testClickInViewSelectsAndEdits() {
        SelectionStateMachine machine;
        QSignalSpy selectionSpy(&machine, &SelectionStateMachine::selectionChanged);
        QSignalSpy modeSpy(&machine, &SelectionStateMachine::editModeChanged);

        machine.clickPolygon("p1");
        QCOMPARE(machine.selectedPolygonId(), QString("p1"));
        QVERIFY(machine.editMode() == EditMode::EditVertices);
        QCOMPARE(selectionSpy.count(), 1);
        QCOMPARE(modeSpy.count(), 1);

        machine.clickCanvas();
        QVERIFY(machine.selectedPolygonId().isEmpty());
        QVERIFY(machine.editMode() == EditMode::View);
        QCOMPARE(selectionSpy.count(), 2);
        QCOMPARE(modeSpy.count(), 2);
    }

    void testClickKeepsEditingModes() {
        const EditMode modes[] = { EditMode::EditVertices, EditMode::AddPoints,
                                   EditMode::Slice, EditMode::CreatePolygon };
        for (EditMode mode : modes) {
            SelectionTransition t = SelectionStateMachine::onPolygonClick("p2", mode, "p1");
            QCOMPARE(t.state.selectedPolygonId, QString("p2"));
            QVERIFY(t.state.mode == mode);
            QVERIFY(t.deletePolygonId.isEmpty());
        }
    }

    void testDeleteModeRequestsDeletion() {
        SelectionTransition t = SelectionStateMachine::onPolygonClick("p1", EditMode::DeletePolygon, "p9");
        QCOMPARE(t.deletePolygonId, QString("p1"));
        QVERIFY(t.state.mode == EditMode::DeletePolygon);
        QCOMPARE(t.state.selectedPolygonId, QString("p9"));

        SelectionStateMachine machine;
        machine.setEditMode(EditMode::DeletePolygon);
        QSignalSpy deleteSpy(&machine, &SelectionStateMachine::deleteRequested);
        QCOMPARE(machine.clickPolygon("p3"), QString("p3"));
        QCOMPARE(deleteSpy.count(), 1);
        QCOMPARE(deleteSpy.at(0).at(0).toString(), QString("p3"));
    }

    void testCanvasClickWhileDrawingKeepsSelection() {
        const EditMode modes[] = { EditMode::CreatePolygon, EditMode::Slice };
        for (EditMode mode : modes) {
            SelectionTransition t = SelectionStateMachine::transition(state("p1", mode),
                                                                      SelectionEvent::canvasClick());
            QCOMPARE(t.state.selectedPolygonId, QString("p1"));
            QVERIFY(t.state.mode == mode);
        }

        // AddPoints clears the selection but stays in its mode
        SelectionTransition t = SelectionStateMachine::transition(state("p1", EditMode::AddPoints),
                                                                  SelectionEvent::canvasClick());
        QVERIFY(t.state.selectedPolygonId.isEmpty());
        QVERIFY(t.state.mode == EditMode::AddPoints);
    }

    void testModeChangeRules() {
        SelectionTransition toView = SelectionStateMachine::transition(state("p1", EditMode::EditVertices),
                                                                       SelectionEvent::modeChange(EditMode::View));
        QVERIFY(toView.state.selectedPolygonId.isEmpty());

        SelectionTransition toCreate = SelectionStateMachine::transition(state("p1", EditMode::EditVertices),
                                                                         SelectionEvent::modeChange(EditMode::CreatePolygon));
        QVERIFY(toCreate.state.selectedPolygonId.isEmpty());
        QVERIFY(toCreate.state.mode == EditMode::CreatePolygon);

        SelectionTransition toSlice = SelectionStateMachine::transition(state("p1", EditMode::EditVertices),
                                                                        SelectionEvent::modeChange(EditMode::Slice));
        QCOMPARE(toSlice.state.selectedPolygonId, QString("p1"));
        QVERIFY(toSlice.state.mode == EditMode::Slice);
    }

    void testCancelReturnsToView() {
        SelectionTransition t = SelectionStateMachine::transition(state("p1", EditMode::Slice),
                                                                  SelectionEvent::cancel());
        QVERIFY(t.state.selectedPolygonId.isEmpty());
        QVERIFY(t.state.mode == EditMode::View);
    }

    void testStaleClickActsLikeCanvasClick() {
        SelectionStateMachine machine;
        QSet<QString> existing = { "p1" };
        machine.setPolygonLookup([&existing](const QString& id) { return existing.contains(id); });

        machine.clickPolygon("p1");
        QCOMPARE(machine.selectedPolygonId(), QString("p1"));

        machine.clickPolygon("gone");
        QVERIFY(machine.selectedPolygonId().isEmpty());
        QVERIFY(machine.editMode() == EditMode::View);

        // Stale click in delete mode deletes nothing
        machine.setEditMode(EditMode::DeletePolygon);
        QSignalSpy deleteSpy(&machine, &SelectionStateMachine::deleteRequested);
        QVERIFY(machine.clickPolygon("gone").isEmpty());
        QCOMPARE(deleteSpy.count(), 0);
    }

    void testRemovedSelectionIsCleared() {
        SelectionStateMachine machine;
        machine.clickPolygon("p1");
        QVERIFY(machine.editMode() == EditMode::EditVertices);

        machine.polygonRemoved("other");
        QCOMPARE(machine.selectedPolygonId(), QString("p1"));

        machine.polygonRemoved("p1");
        QVERIFY(machine.selectedPolygonId().isEmpty());
        QVERIFY(machine.editMode() == EditMode::View);
    }

    void testNoSignalWithoutChange() {
        SelectionStateMachine machine;
        QSignalSpy selectionSpy(&machine, &SelectionStateMachine::selectionChanged);
        QSignalSpy modeSpy(&machine, &SelectionStateMachine::editModeChanged);

        machine.clickCanvas();
        machine.setEditMode(EditMode::View);
        machine.cancel();
        QCOMPARE(selectionSpy.count(), 0);
        QCOMPARE(modeSpy.count(), 0);
    }

    void testEditModeNames() {
        QCOMPARE(editModeName(EditMode::View), QString("View"));
        QVERIFY(editModeName(EditMode::DeletePolygon) != editModeName(EditMode::Slice));
    }
};

#endif // SELECTIONSTATEMACHINETESTS_H
