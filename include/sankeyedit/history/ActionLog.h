#pragma once

#include "Action.h"

#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace sankeyedit {

/// Payload of the stackChange notification
struct StackChangeEvent {
    bool canUndo = false;
    bool canRedo = false;

    bool operator==(const StackChangeEvent&) const = default;
};

/// Bounded linear undo/redo history.
///
/// - record() pushes onto the undo stack, drops the whole redo stack and
///   evicts the oldest entries beyond the bound.
/// - undo() applies the top action's inverse payload, redo() its forward
///   payload, through the same IActionApplier.
/// - Every record/undo/redo/clear emits a stackChange notification.
class ActionLog {
public:
    using ListenerId = size_t;
    using StackChangeListener = std::function<void(const StackChangeEvent&)>;
    using ActionListener = std::function<void(const Action&)>;

    /// Default undo stack bound
    static constexpr size_t MAX_STACK_SIZE = 50;

    explicit ActionLog(IActionApplier& applier, size_t maxStackSize = MAX_STACK_SIZE);

    /// Append an already-performed action
    void record(Action action);

    /// Apply the forward payload, then record the action
    void perform(Action action);

    bool undo();
    bool redo();

    bool canUndo() const { return !undoStack_.empty(); }
    bool canRedo() const { return !redoStack_.empty(); }
    size_t undoCount() const { return undoStack_.size(); }
    size_t redoCount() const { return redoStack_.size(); }
    size_t maxStackSize() const { return maxStackSize_; }

    const std::deque<Action>& undoStack() const { return undoStack_; }
    const std::vector<Action>& redoStack() const { return redoStack_; }

    std::optional<std::string> lastActionDescription() const;
    std::optional<std::string> lastUndoneDescription() const;

    /// Empty both stacks (session reset)
    void clear();

    /// Empty both stacks and drop every listener
    void reset();

    // Listeners
    ListenerId onStackChange(StackChangeListener listener);
    ListenerId onUndo(ActionListener listener);
    ListenerId onRedo(ActionListener listener);
    void off(ListenerId id);

private:
    IActionApplier& applier_;
    size_t maxStackSize_;

    std::deque<Action> undoStack_;
    std::vector<Action> redoStack_;

    std::vector<std::pair<ListenerId, StackChangeListener>> stackListeners_;
    std::vector<std::pair<ListenerId, ActionListener>> undoListeners_;
    std::vector<std::pair<ListenerId, ActionListener>> redoListeners_;
    ListenerId nextListenerId_ = 1;

    void enforceBound();
    void emitStackChange();
    static void emitAction(const std::vector<std::pair<ListenerId, ActionListener>>& listeners,
                           const Action& action);
};

}  // namespace sankeyedit
