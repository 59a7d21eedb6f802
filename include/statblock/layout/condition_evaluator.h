#pragma once
#include <statblock/core/diagnostics.h>
#include <statblock/model/statblock_item.h>
#include <statblock/model/value.h>
#include <statblock/script/script_sandbox.h>

#include <string>

namespace statblock::layout {

// True when a record value counts as "has data" for a conditioned item:
// a non-empty list, a non-empty string, or any number.
bool has_data(const model::Value& value);

// Visibility of a declared item against a record. Unconditioned items are
// always visible; composites follow their children; ifelse, javascript and
// layout items decide for themselves; everything else needs at least one
// declared property with data.
bool is_visible(const model::StatblockItem& item, const model::DataRecord& record);

class ConditionEvaluator {
public:
    ConditionEvaluator(script::ScriptSandbox& sandbox, core::DiagnosticEmitter& diagnostics);

    bool is_visible(const model::StatblockItem& item, const model::DataRecord& record) const {
        return layout::is_visible(item, record);
    }

    // Runs one ifelse condition with `monster` and `plugin` bound. Script
    // errors are logged and count as false.
    bool evaluate_branch(const std::string& condition, const model::DataRecord& record,
                         const model::Value& plugin);

    // First branch whose condition holds; otherwise the last branch when its
    // condition is blank; otherwise nullptr.
    const model::ConditionalBranch* select_branch(const model::StatblockItem& item,
                                                  const model::DataRecord& record,
                                                  const model::Value& plugin);

private:
    script::ScriptSandbox& sandbox_;
    core::DiagnosticEmitter& diagnostics_;
};

} // namespace statblock::layout
