#include <gtest/gtest.h>
#include <sankeyedit/history/ActionLog.h>
#include <sankeyedit/history/EditCommands.h>

#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace sankeyedit;

namespace {

/// Applier that keeps node offsets in a plain map and records every payload
class MapApplier : public IActionApplier {
public:
    void apply(const ActionPayload& payload) override {
        applied.push_back(payload);
        if (const auto* node = std::get_if<NodePositionPayload>(&payload)) {
            if (node->offset) {
                offsets[node->nodeId] = *node->offset;
            } else {
                offsets.erase(node->nodeId);
            }
        }
    }

    std::map<std::string, Offset> offsets;
    std::vector<ActionPayload> applied;
};

}  // namespace

class ActionLogTest : public ::testing::Test {
protected:
    /// Commit "node id moved to offset" the way a drag would
    void move(const std::string& id, float dx, float dy) {
        std::optional<Offset> old;
        if (auto it = applier_.offsets.find(id); it != applier_.offsets.end()) {
            old = it->second;
        }
        log_.perform(EditCommands::createNodePositionAction(id, old, Offset{dx, dy}));
    }

    MapApplier applier_;
    ActionLog log_{applier_, 5};
};

// ============== Recording ==============

TEST_F(ActionLogTest, EmptyLog) {
    EXPECT_FALSE(log_.canUndo());
    EXPECT_FALSE(log_.canRedo());
    EXPECT_FALSE(log_.undo());
    EXPECT_FALSE(log_.redo());
    EXPECT_FALSE(log_.lastActionDescription().has_value());
    EXPECT_FALSE(log_.lastUndoneDescription().has_value());
}

TEST_F(ActionLogTest, PerformAppliesForwardThenRecords) {
    move("N1", 10.0f, 5.0f);

    ASSERT_EQ(applier_.applied.size(), 1u);
    EXPECT_EQ(applier_.offsets.at("N1"), Offset(10.0f, 5.0f));
    EXPECT_EQ(log_.undoCount(), 1u);
    EXPECT_GT(log_.undoStack().back().timestamp, 0);
}

TEST_F(ActionLogTest, RecordDoesNotApply) {
    log_.record(EditCommands::createNodePositionAction("N1", std::nullopt, Offset{1.0f, 1.0f}));

    EXPECT_TRUE(applier_.applied.empty());
    EXPECT_EQ(log_.undoCount(), 1u);
}

TEST_F(ActionLogTest, ZeroBoundFallsBackToDefault) {
    ActionLog log(applier_, 0);

    EXPECT_EQ(log.maxStackSize(), ActionLog::MAX_STACK_SIZE);
}

// ============== Undo / Redo ==============

TEST_F(ActionLogTest, UndoAppliesInverse) {
    move("N1", 10.0f, 5.0f);

    EXPECT_TRUE(log_.undo());

    EXPECT_EQ(applier_.offsets.count("N1"), 0u);
    EXPECT_EQ(log_.undoCount(), 0u);
    EXPECT_EQ(log_.redoCount(), 1u);
}

TEST_F(ActionLogTest, UndoRestoresPreviousValue) {
    move("N1", 10.0f, 5.0f);
    move("N1", 13.0f, 3.0f);

    log_.undo();

    EXPECT_EQ(applier_.offsets.at("N1"), Offset(10.0f, 5.0f));
}

TEST_F(ActionLogTest, RedoReappliesForward) {
    move("N1", 10.0f, 5.0f);
    log_.undo();

    EXPECT_TRUE(log_.redo());

    EXPECT_EQ(applier_.offsets.at("N1"), Offset(10.0f, 5.0f));
    EXPECT_EQ(log_.undoCount(), 1u);
    EXPECT_EQ(log_.redoCount(), 0u);
}

TEST_F(ActionLogTest, UndoRedoSymmetry) {
    move("A", 1.0f, 1.0f);
    move("B", 2.0f, 2.0f);
    move("A", 3.0f, 3.0f);
    const auto before = applier_.offsets;

    for (int i = 0; i < 3; ++i) {
        log_.undo();
    }
    EXPECT_TRUE(applier_.offsets.empty());

    for (int i = 0; i < 3; ++i) {
        log_.redo();
    }
    EXPECT_EQ(applier_.offsets, before);
}

TEST_F(ActionLogTest, NewActionInvalidatesRedo) {
    move("N1", 10.0f, 5.0f);
    move("N2", 1.0f, 1.0f);
    log_.undo();
    ASSERT_TRUE(log_.canRedo());

    move("N3", 2.0f, 2.0f);

    EXPECT_FALSE(log_.canRedo());
    EXPECT_EQ(log_.redoCount(), 0u);
    EXPECT_FALSE(log_.redo());
}

// ============== Bound ==============

TEST_F(ActionLogTest, OldestActionEvictedBeyondBound) {
    for (int i = 0; i < 8; ++i) {
        move("N" + std::to_string(i), static_cast<float>(i), 0.0f);
    }

    EXPECT_EQ(log_.undoCount(), 5u);
    EXPECT_EQ(log_.undoStack().front().description, "Move node \"N3\"");
    EXPECT_EQ(log_.undoStack().back().description, "Move node \"N7\"");
}

TEST_F(ActionLogTest, UndoingAllAfterEvictionKeepsEvictedEffects) {
    for (int i = 0; i < 7; ++i) {
        move("N" + std::to_string(i), 1.0f, 1.0f);
    }

    while (log_.undo()) {
    }

    // N0 and N1 fell off the stack and can no longer be reverted
    EXPECT_EQ(applier_.offsets.size(), 2u);
    EXPECT_EQ(applier_.offsets.count("N0"), 1u);
    EXPECT_EQ(applier_.offsets.count("N1"), 1u);
}

// ============== Descriptions ==============

TEST_F(ActionLogTest, Descriptions) {
    move("N1", 10.0f, 5.0f);
    EXPECT_EQ(log_.lastActionDescription(), "Move node \"N1\"");

    log_.undo();
    EXPECT_FALSE(log_.lastActionDescription().has_value());
    EXPECT_EQ(log_.lastUndoneDescription(), "Move node \"N1\"");
}

TEST_F(ActionLogTest, DescriptionFallsBackToType) {
    Action action = EditCommands::createFlowAddAction("A", "B", 1.0);
    action.description.clear();

    log_.record(action);

    EXPECT_EQ(log_.lastActionDescription(), "flowAdd action");
}

// ============== Listeners ==============

TEST_F(ActionLogTest, StackChangeEmittedOnEveryTransition) {
    std::vector<StackChangeEvent> events;
    log_.onStackChange([&](const StackChangeEvent& e) { events.push_back(e); });

    move("N1", 1.0f, 1.0f);
    log_.undo();
    log_.redo();
    log_.clear();

    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[0], (StackChangeEvent{true, false}));
    EXPECT_EQ(events[1], (StackChangeEvent{false, true}));
    EXPECT_EQ(events[2], (StackChangeEvent{true, false}));
    EXPECT_EQ(events[3], (StackChangeEvent{false, false}));
}

TEST_F(ActionLogTest, UndoAndRedoListenersReceiveAction) {
    std::vector<std::string> undone;
    std::vector<std::string> redone;
    log_.onUndo([&](const Action& a) { undone.push_back(a.description); });
    log_.onRedo([&](const Action& a) { redone.push_back(a.description); });

    move("N1", 1.0f, 1.0f);
    log_.undo();
    log_.redo();

    EXPECT_EQ(undone, std::vector<std::string>{"Move node \"N1\""});
    EXPECT_EQ(redone, std::vector<std::string>{"Move node \"N1\""});
}

TEST_F(ActionLogTest, OffRemovesListener) {
    int calls = 0;
    auto id = log_.onStackChange([&](const StackChangeEvent&) { ++calls; });

    move("N1", 1.0f, 1.0f);
    log_.off(id);
    move("N2", 1.0f, 1.0f);

    EXPECT_EQ(calls, 1);
}

TEST_F(ActionLogTest, ResetDropsListenersAndStacks) {
    int calls = 0;
    log_.onStackChange([&](const StackChangeEvent&) { ++calls; });
    move("N1", 1.0f, 1.0f);

    log_.reset();
    move("N2", 1.0f, 1.0f);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(log_.undoCount(), 1u);
}
