#include <sankeyedit/sankeyedit.h>
#include <iostream>
#include <iomanip>

using namespace sankeyedit;

void printNodes(const EditorSession& session, const std::string& title) {
    std::cout << title << "\n";
    for (const auto& name : session.model().nodes()) {
        auto pos = session.synchronizer().getFinalPosition(name);
        if (!pos) {
            continue;
        }
        std::cout << "  " << std::left << std::setw(10) << name << std::right
                  << " (" << std::fixed << std::setprecision(1) << pos->x << ", " << pos->y << ")";
        if (session.synchronizer().hasCustomPosition(name)) {
            std::cout << "  [custom]";
        }
        std::cout << "\n";
    }
    std::cout << "\n";
}

void printHistory(const ActionLog& history) {
    std::cout << "  undo: " << history.undoCount() << ", redo: " << history.redoCount();
    if (auto last = history.lastActionDescription()) {
        std::cout << ", last: " << *last;
    }
    std::cout << "\n\n";
}

int main(int argc, char* argv[]) {
    std::cout << "=== SankeyEdit v" << versionString() << ": overlay demo ===\n\n";

    EditorConfig config;
    if (argc > 1) {
        config = EditorConfigSerializer::loadFromFile(argv[1]);
    }

    ColumnLayoutEngine engine;
    RecordingRenderTarget target;
    EditorSession session(engine, target, config);

    // 1. Build a small budget diagram
    session.commands().addFlow("Salary", "Budget", 3.0);
    session.commands().addFlow("Bonus", "Budget", 1.0);
    session.commands().addFlow("Budget", "Rent", 2.0);
    session.commands().addFlow("Budget", "Savings", 2.0);
    session.history().clear();
    printNodes(session, "Initial layout:");

    // 2. Drag "Rent" down by 40 and move its label
    session.drag().startDrag(ElementKind::Node, "Rent", 0, 0);
    session.drag().updateDrag(5, 20);
    session.drag().updateDrag(10, 40);
    std::cout << "Drag outcome: " << toString(session.drag().endDrag()) << "\n";

    session.drag().startDrag(ElementKind::Label, "Rent", 0, 0);
    session.drag().updateDrag(0, -15);
    session.drag().endDrag();
    printNodes(session, "After dragging Rent:");
    printHistory(session.history());

    // 3. A cancelled drag changes nothing
    session.drag().startDrag(ElementKind::Node, "Savings", 0, 0);
    session.drag().updateDrag(200, 200);
    session.drag().cancelDrag();
    printHistory(session.history());

    // 4. Structural edit: layout recomputes, the Rent offset rides along
    session.commands().addFlow("Savings", "Stocks", 1.5);
    printNodes(session, "After adding Savings -> Stocks:");

    // 5. Undo everything, then redo it
    while (session.history().undo()) {
    }
    printNodes(session, "After undoing all:");
    printHistory(session.history());

    while (session.history().redo()) {
    }
    printNodes(session, "After redoing all:");

    // 6. Self-check and persistence
    for (const auto& name : session.model().nodes()) {
        PositionCheck check = session.synchronizer().verifyPosition(name);
        if (!check.valid) {
            std::cout << "  MISMATCH " << name << ": " << check.reason << "\n";
        }
    }

    std::cout << "Overlay document:\n  " << session.overlays().serialize() << "\n";
    return 0;
}
