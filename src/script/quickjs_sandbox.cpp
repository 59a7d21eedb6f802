#include <statblock/script/script_sandbox.h>

extern "C" {
#include <quickjs.h>
}

#include <cctype>
#include <chrono>

namespace statblock::script {

namespace {

using Clock = std::chrono::steady_clock;

// Nesting beyond this is cut to null when copying values into the sandbox.
constexpr int kMaxValueDepth = 64;

struct InterruptState {
    Clock::time_point deadline;
    bool fired = false;
};

int interrupt_handler(JSRuntime* /*rt*/, void* opaque) {
    auto* state = static_cast<InterruptState*>(opaque);
    if (Clock::now() >= state->deadline) {
        state->fired = true;
        return 1;
    }
    return 0;
}

// Owns the runtime and context of a single evaluation.
class ScopedContext {
public:
    ScopedContext(const SandboxLimits& limits, InterruptState* interrupt) {
        rt_ = JS_NewRuntime();
        if (!rt_) return;

        JS_SetMemoryLimit(rt_, limits.memory_limit);
        JS_SetMaxStackSize(rt_, limits.stack_size);
        JS_SetInterruptHandler(rt_, interrupt_handler, interrupt);

        ctx_ = JS_NewContext(rt_);
    }

    ~ScopedContext() {
        if (ctx_) JS_FreeContext(ctx_);
        if (rt_) JS_FreeRuntime(rt_);
    }

    ScopedContext(const ScopedContext&) = delete;
    ScopedContext& operator=(const ScopedContext&) = delete;

    JSContext* context() const { return ctx_; }

private:
    JSRuntime* rt_ = nullptr;
    JSContext* ctx_ = nullptr;
};

std::string trim_expression(const std::string& expression) {
    auto start = expression.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = expression.find_last_not_of(" \t\r\n;");
    if (end == std::string::npos || end < start) return "";
    return expression.substr(start, end - start + 1);
}

bool is_identifier(const std::string& name) {
    if (name.empty()) return false;
    auto first = static_cast<unsigned char>(name[0]);
    if (!std::isalpha(first) && name[0] != '_' && name[0] != '$') return false;
    for (char c : name) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_' && c != '$') return false;
    }
    return true;
}

std::string exception_message(JSContext* ctx, const InterruptState& interrupt,
                              std::uint32_t timeout_ms) {
    if (interrupt.fired) {
        JS_FreeValue(ctx, JS_GetException(ctx));
        return "script interrupted after " + std::to_string(timeout_ms) + "ms";
    }

    std::string message;
    JSValue exception = JS_GetException(ctx);
    const char* str = JS_ToCString(ctx, exception);
    if (str) {
        message = str;
        JS_FreeCString(ctx, str);
    } else {
        message = "Unknown error";
    }
    JS_FreeValue(ctx, exception);
    return message;
}

// Deep copy of a record value into the sandbox heap. The script only ever
// sees these copies.
JSValue to_js(JSContext* ctx, const model::Value& value, int depth) {
    if (depth > kMaxValueDepth) return JS_NULL;

    switch (value.kind()) {
        case model::Value::Kind::Null:
            return JS_NULL;
        case model::Value::Kind::Bool:
            return JS_NewBool(ctx, value.as_bool());
        case model::Value::Kind::Number:
            return JS_NewFloat64(ctx, value.as_number());
        case model::Value::Kind::String: {
            const auto& s = value.as_string();
            return JS_NewStringLen(ctx, s.data(), s.size());
        }
        case model::Value::Kind::List: {
            JSValue array = JS_NewArray(ctx);
            std::uint32_t index = 0;
            for (const auto& item : value.as_list()) {
                JS_SetPropertyUint32(ctx, array, index++, to_js(ctx, item, depth + 1));
            }
            return array;
        }
        case model::Value::Kind::Map: {
            JSValue object = JS_NewObject(ctx);
            for (const auto& [key, item] : value.as_map()) {
                JS_SetPropertyStr(ctx, object, key.c_str(), to_js(ctx, item, depth + 1));
            }
            return object;
        }
    }
    return JS_UNDEFINED;
}

} // anonymous namespace

std::string wrap_expression(const std::string& expression, const ScriptBindings& bindings) {
    std::string params;
    for (const auto& binding : bindings) {
        if (!params.empty()) params += ", ";
        params += binding.first;
    }
    // The newline before ");" keeps a trailing line comment from swallowing it.
    return "(function (" + params + ") {\n\"use strict\";\nreturn (\n" + expression + "\n);\n})";
}

QuickJsSandbox::QuickJsSandbox(SandboxLimits limits) : limits_(limits) {}

ScriptResult QuickJsSandbox::evaluate(const std::string& expression, const ScriptBindings& bindings) {
    ScriptResult result;

    std::string body = trim_expression(expression);
    if (body.empty()) {
        result.message = "empty expression";
        return result;
    }
    for (const auto& binding : bindings) {
        if (!is_identifier(binding.first)) {
            result.message = "invalid binding name '" + binding.first + "'";
            return result;
        }
    }

    InterruptState interrupt;
    interrupt.deadline = Clock::now() + std::chrono::milliseconds(limits_.timeout_ms);

    ScopedContext scope(limits_, &interrupt);
    ++runtimes_created_;
    JSContext* ctx = scope.context();
    if (!ctx) {
        result.message = "failed to create script runtime";
        return result;
    }

    std::string source = wrap_expression(body, bindings);
    JSValue fn = JS_Eval(ctx, source.c_str(), source.size(), "<condition>", JS_EVAL_TYPE_GLOBAL);
    if (JS_IsException(fn)) {
        result.message = exception_message(ctx, interrupt, limits_.timeout_ms);
        return result;
    }

    std::vector<JSValue> args;
    args.reserve(bindings.size());
    for (const auto& binding : bindings) {
        args.push_back(binding.second ? to_js(ctx, *binding.second, 0) : JS_UNDEFINED);
    }

    JSValue ret = JS_Call(ctx, fn, JS_UNDEFINED, static_cast<int>(args.size()), args.data());
    for (auto& arg : args) {
        JS_FreeValue(ctx, arg);
    }
    JS_FreeValue(ctx, fn);

    if (JS_IsException(ret)) {
        result.message = exception_message(ctx, interrupt, limits_.timeout_ms);
        return result;
    }

    int truthy = JS_ToBool(ctx, ret);
    JS_FreeValue(ctx, ret);
    if (truthy < 0) {
        result.message = exception_message(ctx, interrupt, limits_.timeout_ms);
        return result;
    }

    result.ok = true;
    result.value = truthy != 0;
    return result;
}

} // namespace statblock::script
