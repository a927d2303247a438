#include "sankeyedit/history/ActionLog.h"
#include "sankeyedit/common/Logger.h"

#include <chrono>

namespace sankeyedit {

namespace {

int64_t nowMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

}  // namespace

ActionLog::ActionLog(IActionApplier& applier, size_t maxStackSize)
    : applier_(applier)
    , maxStackSize_(maxStackSize > 0 ? maxStackSize : MAX_STACK_SIZE) {
    if (maxStackSize == 0) {
        LOG_WARN("Undo stack bound must be positive, using {}", maxStackSize_);
    }
}

void ActionLog::record(Action action) {
    action.timestamp = nowMillis();
    LOG_DEBUG("Recording {}", action.displayName());

    undoStack_.push_back(std::move(action));
    redoStack_.clear();
    enforceBound();
    emitStackChange();
}

void ActionLog::perform(Action action) {
    applier_.apply(action.forward);
    record(std::move(action));
}

bool ActionLog::undo() {
    if (undoStack_.empty()) {
        return false;
    }

    Action action = std::move(undoStack_.back());
    undoStack_.pop_back();

    LOG_DEBUG("Undo {}", action.displayName());
    applier_.apply(action.inverse);

    redoStack_.push_back(action);
    emitAction(undoListeners_, action);
    emitStackChange();
    return true;
}

bool ActionLog::redo() {
    if (redoStack_.empty()) {
        return false;
    }

    Action action = std::move(redoStack_.back());
    redoStack_.pop_back();

    LOG_DEBUG("Redo {}", action.displayName());
    applier_.apply(action.forward);

    undoStack_.push_back(action);
    emitAction(redoListeners_, action);
    emitStackChange();
    return true;
}

std::optional<std::string> ActionLog::lastActionDescription() const {
    if (undoStack_.empty()) {
        return std::nullopt;
    }
    return undoStack_.back().displayName();
}

std::optional<std::string> ActionLog::lastUndoneDescription() const {
    if (redoStack_.empty()) {
        return std::nullopt;
    }
    return redoStack_.back().displayName();
}

void ActionLog::clear() {
    undoStack_.clear();
    redoStack_.clear();
    emitStackChange();
}

void ActionLog::reset() {
    undoStack_.clear();
    redoStack_.clear();
    stackListeners_.clear();
    undoListeners_.clear();
    redoListeners_.clear();
}

ActionLog::ListenerId ActionLog::onStackChange(StackChangeListener listener) {
    ListenerId id = nextListenerId_++;
    stackListeners_.emplace_back(id, std::move(listener));
    return id;
}

ActionLog::ListenerId ActionLog::onUndo(ActionListener listener) {
    ListenerId id = nextListenerId_++;
    undoListeners_.emplace_back(id, std::move(listener));
    return id;
}

ActionLog::ListenerId ActionLog::onRedo(ActionListener listener) {
    ListenerId id = nextListenerId_++;
    redoListeners_.emplace_back(id, std::move(listener));
    return id;
}

void ActionLog::off(ListenerId id) {
    auto matches = [id](const auto& entry) { return entry.first == id; };
    std::erase_if(stackListeners_, matches);
    std::erase_if(undoListeners_, matches);
    std::erase_if(redoListeners_, matches);
}

void ActionLog::enforceBound() {
    while (undoStack_.size() > maxStackSize_) {
        LOG_TRACE("Evicting oldest action {}", undoStack_.front().displayName());
        undoStack_.pop_front();
    }
}

void ActionLog::emitStackChange() {
    StackChangeEvent event{canUndo(), canRedo()};
    auto listeners = stackListeners_;
    for (const auto& [id, listener] : listeners) {
        if (listener) {
            listener(event);
        }
    }
}

void ActionLog::emitAction(const std::vector<std::pair<ListenerId, ActionListener>>& listeners,
                           const Action& action) {
    auto copy = listeners;
    for (const auto& [id, listener] : copy) {
        if (listener) {
            listener(action);
        }
    }
}

}  // namespace sankeyedit
