#pragma once
#include <statblock/core/config.h>
#include <statblock/model/value.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace statblock::script {

// Named values visible to an expression. Pointers must outlive evaluate().
using ScriptBindings = std::vector<std::pair<std::string, const model::Value*>>;

struct ScriptResult {
    bool ok = false;
    bool value = false;   // truthiness of the expression, valid when ok
    std::string message;  // error text when !ok
};

// Evaluates user-authored boolean expressions. Implementations must not let
// one evaluation observe state left behind by another.
class ScriptSandbox {
public:
    virtual ~ScriptSandbox() = default;
    virtual ScriptResult evaluate(const std::string& expression, const ScriptBindings& bindings) = 0;
};

struct SandboxLimits {
    std::size_t memory_limit = core::config::kScriptMemoryLimit;
    std::size_t stack_size = core::config::kScriptStackSize;
    std::uint32_t timeout_ms = core::config::kScriptTimeoutMs;
};

// QuickJS-backed sandbox. Every evaluate() call builds a fresh runtime and
// context, copies the bindings in as plain data, runs the expression under
// the configured limits and tears everything down again. The context has no
// host modules: no std, os, console or module loader.
class QuickJsSandbox : public ScriptSandbox {
public:
    explicit QuickJsSandbox(SandboxLimits limits = {});

    ScriptResult evaluate(const std::string& expression, const ScriptBindings& bindings) override;

    const SandboxLimits& limits() const { return limits_; }

    // Number of runtimes created so far; one per evaluation.
    std::size_t runtimes_created() const { return runtimes_created_; }

private:
    SandboxLimits limits_;
    std::size_t runtimes_created_ = 0;
};

// Wraps an expression into the function source that receives the bindings
// as parameters, e.g. "(function (monster, plugin) { ... })".
std::string wrap_expression(const std::string& expression, const ScriptBindings& bindings);

} // namespace statblock::script
