#include <statblock/layout/condition_evaluator.h>

namespace statblock::layout {

namespace {

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // anonymous namespace

bool has_data(const model::Value& value) {
    switch (value.kind()) {
        case model::Value::Kind::List:   return !value.as_list().empty();
        case model::Value::Kind::String: return !value.as_string().empty();
        case model::Value::Kind::Number: return true;
        default:                         return false;
    }
}

bool is_visible(const model::StatblockItem& item, const model::DataRecord& record) {
    if (!item.conditioned) return true;

    if (model::is_composite(item.type) && !item.nested.empty()) {
        for (const auto& child : item.nested) {
            if (is_visible(child, record)) return true;
        }
        return false;
    }

    if (item.type == model::ItemType::IfElse || item.type == model::ItemType::Javascript ||
        item.type == model::ItemType::Layout) {
        return true;
    }

    if (item.properties.empty()) return true;

    for (const auto& property : item.properties) {
        const model::Value* value = record.get(property);
        if (value && has_data(*value)) return true;
    }
    return false;
}

ConditionEvaluator::ConditionEvaluator(script::ScriptSandbox& sandbox,
                                       core::DiagnosticEmitter& diagnostics)
    : sandbox_(sandbox), diagnostics_(diagnostics) {}

bool ConditionEvaluator::evaluate_branch(const std::string& condition,
                                         const model::DataRecord& record,
                                         const model::Value& plugin) {
    script::ScriptBindings bindings = {
        {"monster", &record.as_value()},
        {"plugin", &plugin},
    };
    auto result = sandbox_.evaluate(condition, bindings);
    if (!result.ok) {
        diagnostics_.warn("condition", "ifelse",
                          "condition '" + condition + "' failed: " + result.message);
        return false;
    }
    return result.value;
}

const model::ConditionalBranch* ConditionEvaluator::select_branch(const model::StatblockItem& item,
                                                                  const model::DataRecord& record,
                                                                  const model::Value& plugin) {
    const auto& branches = item.branches;
    for (std::size_t i = 0; i < branches.size(); ++i) {
        const auto& branch = branches[i];
        if (is_blank(branch.condition)) {
            // Only the final branch may be the default.
            if (i + 1 == branches.size()) return &branch;
            continue;
        }
        if (evaluate_branch(branch.condition, record, plugin)) return &branch;
    }
    return nullptr;
}

} // namespace statblock::layout
