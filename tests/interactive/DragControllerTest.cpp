#include <gtest/gtest.h>
#include <sankeyedit/sankeyedit.h>

#include <limits>
#include <vector>

using namespace sankeyedit;

namespace {

class FixedLayoutEngine : public ILayoutEngine {
public:
    void recompute(const DiagramModel&) override {}
    std::vector<BasePosition> snapshot() const override { return positions; }

    std::vector<BasePosition> positions{
        {"N1", 100.0f, 50.0f, ElementKind::Node},
        {"N1", 130.0f, 60.0f, ElementKind::Label},
        {"N2", 300.0f, 50.0f, ElementKind::Node},
    };
};

}  // namespace

class DragControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        session_.synchronizer().onLayoutRecomputed();
    }

    DragController& drag() { return session_.drag(); }
    OverlayStore& overlays() { return session_.overlays(); }
    ActionLog& history() { return session_.history(); }

    FixedLayoutEngine engine_;
    RecordingRenderTarget target_;
    EditorSession session_{engine_, target_};
};

// ============== State Machine ==============

TEST_F(DragControllerTest, IdleByDefault) {
    EXPECT_FALSE(drag().isDragging());
    EXPECT_FALSE(drag().dragKind().has_value());
    EXPECT_FALSE(drag().targetId().has_value());
    EXPECT_FALSE(drag().transientPosition().has_value());
    EXPECT_EQ(drag().delta(), Point(0.0f, 0.0f));
}

TEST_F(DragControllerTest, StartCapturesEffectiveBaseline) {
    overlays().setNodeOffset("N1", 10.0f, 0.0f);

    ASSERT_TRUE(drag().startDrag(ElementKind::Node, "N1", 5.0f, 5.0f).success);

    ASSERT_TRUE(drag().session().has_value());
    EXPECT_FLOAT_EQ(drag().session()->baselineX, 110.0f);
    EXPECT_FLOAT_EQ(drag().session()->baselineY, 50.0f);
    EXPECT_EQ(drag().dragKind(), ElementKind::Node);
    EXPECT_EQ(drag().targetId(), "N1");
}

TEST_F(DragControllerTest, LabelBaselineUsesOverlayOverBase) {
    overlays().setLabelPosition("N1", 400.0f, 10.0f);

    drag().startDrag(ElementKind::Label, "N1", 0.0f, 0.0f);

    EXPECT_FLOAT_EQ(drag().session()->baselineX, 400.0f);
    EXPECT_FLOAT_EQ(drag().session()->baselineY, 10.0f);
}

TEST_F(DragControllerTest, UpdateMovesVisualOnly) {
    drag().startDrag(ElementKind::Node, "N1", 0.0f, 0.0f);

    drag().updateDrag(10.0f, 5.0f);

    EXPECT_EQ(drag().delta(), Point(10.0f, 5.0f));
    EXPECT_EQ(drag().transientPosition(), Point(110.0f, 55.0f));
    EXPECT_EQ(target_.renderedPosition(ElementKind::Node, "N1"), Point(110.0f, 55.0f));
    EXPECT_FALSE(overlays().hasNodeOffset("N1"));
    EXPECT_EQ(history().undoCount(), 0u);
}

TEST_F(DragControllerTest, UpdateAndEndWhileIdleAreIgnored) {
    drag().updateDrag(10.0f, 5.0f);

    EXPECT_EQ(drag().endDrag(), DragOutcome::Ignored);
    EXPECT_FALSE(drag().cancelDrag());
    EXPECT_EQ(history().undoCount(), 0u);
    EXPECT_TRUE(overlays().state().isEmpty());
}

TEST_F(DragControllerTest, StartRejectsEmptyIdAndKeepsSession) {
    drag().startDrag(ElementKind::Node, "N1", 0.0f, 0.0f);

    EXPECT_FALSE(drag().startDrag(ElementKind::Node, "", 0.0f, 0.0f).success);

    EXPECT_EQ(drag().targetId(), "N1");
}

TEST_F(DragControllerTest, StartRejectsNonFiniteCoordinates) {
    const float nan = std::numeric_limits<float>::quiet_NaN();

    EXPECT_FALSE(drag().startDrag(ElementKind::Node, "N1", nan, 0.0f).success);
    EXPECT_FALSE(drag().isDragging());
}

TEST_F(DragControllerTest, NewStartCancelsActiveSession) {
    drag().startDrag(ElementKind::Node, "N1", 0.0f, 0.0f);
    drag().updateDrag(50.0f, 50.0f);

    drag().startDrag(ElementKind::Node, "N2", 0.0f, 0.0f);

    EXPECT_EQ(drag().targetId(), "N2");
    EXPECT_EQ(target_.renderedPosition(ElementKind::Node, "N1"), Point(100.0f, 50.0f));
    EXPECT_FALSE(overlays().hasNodeOffset("N1"));
    EXPECT_EQ(history().undoCount(), 0u);
}

// ============== Commit ==============

TEST_F(DragControllerTest, NodeCommitWritesOffsetAndOneAction) {
    drag().startDrag(ElementKind::Node, "N1", 0.0f, 0.0f);
    drag().updateDrag(10.0f, 5.0f);

    EXPECT_EQ(drag().endDrag(), DragOutcome::Committed);

    EXPECT_FALSE(drag().isDragging());
    EXPECT_EQ(overlays().getNodeOffset("N1"), Offset(10.0f, 5.0f));
    EXPECT_EQ(history().undoCount(), 1u);
    EXPECT_EQ(history().undoStack().back().type, ActionType::NodePosition);
    EXPECT_EQ(session_.synchronizer().getFinalPosition("N1"), Point(110.0f, 55.0f));
}

TEST_F(DragControllerTest, NodeCommitAccumulatesExistingOffset) {
    overlays().setNodeOffset("N1", 10.0f, 5.0f);
    session_.synchronizer().applyOverlays();

    drag().startDrag(ElementKind::Node, "N1", 0.0f, 0.0f);
    drag().updateDrag(3.0f, -2.0f);
    drag().endDrag();

    EXPECT_EQ(overlays().getNodeOffset("N1"), Offset(13.0f, 3.0f));

    const auto& inverse = std::get<NodePositionPayload>(history().undoStack().back().inverse);
    EXPECT_EQ(inverse.offset, Offset(10.0f, 5.0f));
}

TEST_F(DragControllerTest, LabelCommitWritesAbsolutePosition) {
    drag().startDrag(ElementKind::Label, "N1", 0.0f, 0.0f);
    drag().updateDrag(-30.0f, 20.0f);

    EXPECT_EQ(drag().endDrag(), DragOutcome::Committed);

    EXPECT_EQ(overlays().getLabelPosition("N1"), Point(100.0f, 80.0f));
    EXPECT_FALSE(overlays().hasNodeOffset("N1"));
    EXPECT_EQ(history().lastActionDescription(), "Move label for \"N1\"");
}

TEST_F(DragControllerTest, OverflowingCommitRecordsNothing) {
    const float big = std::numeric_limits<float>::max();
    overlays().setNodeOffset("N1", big, 0.0f);

    ASSERT_TRUE(drag().startDrag(ElementKind::Node, "N1", -big, 0.0f).success);
    drag().updateDrag(big, 0.0f);

    EXPECT_EQ(drag().endDrag(), DragOutcome::Ignored);
    EXPECT_FALSE(drag().isDragging());
    EXPECT_EQ(overlays().getNodeOffset("N1"), Offset(big, 0.0f));
    EXPECT_EQ(history().undoCount(), 0u);
}

// ============== Elements Not Laid Out ==============

TEST_F(DragControllerTest, StartRejectsNodeWithoutBasePosition) {
    EXPECT_FALSE(drag().startDrag(ElementKind::Node, "ghost", 0.0f, 0.0f).success);

    EXPECT_FALSE(drag().isDragging());
    EXPECT_EQ(drag().endDrag(), DragOutcome::Ignored);
    EXPECT_FALSE(overlays().hasNodeOffset("ghost"));
    EXPECT_EQ(history().undoCount(), 0u);
}

TEST_F(DragControllerTest, StartRejectsLabelWithOnlyOverlay) {
    overlays().setLabelPosition("ghost", 20.0f, 20.0f);

    EXPECT_FALSE(drag().startDrag(ElementKind::Label, "ghost", 0.0f, 0.0f).success);
    EXPECT_FALSE(drag().isDragging());
}

TEST_F(DragControllerTest, RejectedStartKeepsActiveSession) {
    drag().startDrag(ElementKind::Node, "N1", 0.0f, 0.0f);
    drag().updateDrag(10.0f, 0.0f);

    EXPECT_FALSE(drag().startDrag(ElementKind::Node, "ghost", 0.0f, 0.0f).success);

    EXPECT_EQ(drag().targetId(), "N1");
    EXPECT_EQ(drag().transientPosition(), Point(110.0f, 50.0f));
}

TEST_F(DragControllerTest, ElementWithoutBasePositionIsNeverRendered) {
    session_.commands().addFlow("A", "B", 1.0);

    drag().startDrag(ElementKind::Node, "ghost", 0.0f, 0.0f);
    drag().updateDrag(5.0f, 5.0f);
    drag().cancelDrag();

    EXPECT_FALSE(target_.renderedPosition(ElementKind::Node, "ghost").has_value());
}

// ============== Cancel ==============

TEST_F(DragControllerTest, CancelRestoresBaselineWithoutSideEffects) {
    overlays().setNodeOffset("N1", 1.0f, 1.0f);
    const OverlayState before = overlays().state();

    drag().startDrag(ElementKind::Node, "N1", 0.0f, 0.0f);
    drag().updateDrag(80.0f, 80.0f);

    EXPECT_TRUE(drag().cancelDrag());

    EXPECT_FALSE(drag().isDragging());
    EXPECT_EQ(overlays().state(), before);
    EXPECT_EQ(history().undoCount(), 0u);
    EXPECT_EQ(target_.renderedPosition(ElementKind::Node, "N1"), Point(101.0f, 51.0f));
}

TEST_F(DragControllerTest, CancelLabelRestoresLabelBaseline) {
    drag().startDrag(ElementKind::Label, "N1", 0.0f, 0.0f);
    drag().updateDrag(15.0f, 15.0f);
    drag().cancelDrag();

    EXPECT_EQ(target_.renderedPosition(ElementKind::Label, "N1"), Point(130.0f, 60.0f));
    EXPECT_FALSE(overlays().hasLabelPosition("N1"));
}

// ============== Threshold ==============

TEST_F(DragControllerTest, ShortMoveBelowThresholdIsClick) {
    FixedLayoutEngine engine;
    RecordingRenderTarget target;
    EditorConfig config;
    config.dragThreshold = 3.0f;
    EditorSession session(engine, target, config);
    session.synchronizer().onLayoutRecomputed();

    session.drag().startDrag(ElementKind::Node, "N1", 0.0f, 0.0f);
    session.drag().updateDrag(1.0f, 1.0f);

    EXPECT_EQ(session.drag().endDrag(), DragOutcome::Click);
    EXPECT_FALSE(session.overlays().hasNodeOffset("N1"));
    EXPECT_EQ(session.history().undoCount(), 0u);

    session.drag().startDrag(ElementKind::Node, "N1", 0.0f, 0.0f);
    session.drag().updateDrag(3.0f, 4.0f);

    EXPECT_EQ(session.drag().endDrag(), DragOutcome::Committed);
    EXPECT_EQ(session.history().undoCount(), 1u);
}

TEST_F(DragControllerTest, ThresholdMeasuresPointerTravel) {
    FixedLayoutEngine engine;
    RecordingRenderTarget target;
    EditorConfig config;
    config.dragThreshold = 5.0f;
    EditorSession session(engine, target, config);
    session.synchronizer().onLayoutRecomputed();

    session.drag().startDrag(ElementKind::Node, "N1", 100.0f, 100.0f);
    session.drag().updateDrag(103.0f, 103.0f);

    EXPECT_EQ(session.drag().endDrag(), DragOutcome::Click);
    EXPECT_EQ(session.history().undoCount(), 0u);
}

TEST_F(DragControllerTest, ZeroThresholdCommitsEvenWithoutMovement) {
    drag().startDrag(ElementKind::Node, "N1", 7.0f, 7.0f);

    EXPECT_EQ(drag().endDrag(), DragOutcome::Committed);
    EXPECT_EQ(history().undoCount(), 1u);
    EXPECT_EQ(overlays().getNodeOffset("N1"), Offset(0.0f, 0.0f));
}

TEST_F(DragControllerTest, OutcomeNames) {
    EXPECT_STREQ(toString(DragOutcome::Committed), "committed");
    EXPECT_STREQ(toString(DragOutcome::Click), "click");
    EXPECT_STREQ(toString(DragOutcome::Ignored), "ignored");
}
