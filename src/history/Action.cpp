#include "sankeyedit/history/Action.h"

namespace sankeyedit {

const char* toString(ActionType type) {
    switch (type) {
        case ActionType::NodePosition: return "nodePosition";
        case ActionType::LabelPosition: return "labelPosition";
        case ActionType::PropertyChange: return "propertyChange";
        case ActionType::FlowAdd: return "flowAdd";
        case ActionType::FlowDelete: return "flowDelete";
        case ActionType::NodeAdd: return "nodeAdd";
        case ActionType::NodeDelete: return "nodeDelete";
        case ActionType::LayoutReset: return "layoutReset";
    }
    return "unknown";
}

std::string Action::displayName() const {
    if (!description.empty()) {
        return description;
    }
    return std::string(toString(type)) + " action";
}

}  // namespace sankeyedit
