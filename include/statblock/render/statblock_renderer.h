#pragma once
#include <statblock/core/config.h>
#include <statblock/core/diagnostics.h>
#include <statblock/layout/block.h>
#include <statblock/layout/column_balancer.h>
#include <statblock/layout/tree_expander.h>
#include <statblock/model/statblock_item.h>
#include <statblock/model/value.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace statblock::render {

struct ColumnLayout {
    std::uint64_t pass = 0;
    float split_height = 0;
    std::string column_width;
    std::vector<std::vector<layout::RenderedBlock>> columns;
};

// Display surface owned by the host. measure() renders the blocks off screen
// and calls on_built exactly once, with one height per block, after they are
// laid out. The callback may run synchronously or later on the host's loop;
// `blocks` stays valid until measure() returns either way.
class MeasureSurface {
public:
    using BuiltCallback = std::function<void(const std::vector<float>& heights)>;

    virtual ~MeasureSurface() = default;
    virtual void measure(const std::vector<layout::RenderedBlock>& blocks, BuiltCallback on_built) = 0;
    virtual void discard_measurement() = 0;
    virtual void present(const ColumnLayout& layout) = 0;
};

struct RenderOptions {
    int columns = core::config::kDefaultColumns;  // columns the container fits
    int max_columns = core::config::kDefaultMaxColumns;
    std::string column_width = core::config::kDefaultColumnWidth;
    std::string default_layout;                   // used when the record names none
    std::string context_id;
    const model::Value* plugin = nullptr;
};

// Drives one statblock instance: expand -> measure -> balance -> present.
// A new build() supersedes any pass still waiting for its heights.
class StatblockRenderer {
public:
    StatblockRenderer(layout::TreeExpander& expander, MeasureSurface& surface,
                      layout::LayoutLookup layouts, core::DiagnosticEmitter& diagnostics);

    // Starts a pass with an explicit layout. Returns the pass id.
    std::uint64_t build(const model::Layout& layout, const model::DataRecord& record,
                        const RenderOptions& options);

    // Starts a pass with the layout named by the record's "layout" field, or
    // options.default_layout. Returns 0 when neither resolves.
    std::uint64_t build(const model::DataRecord& record, const RenderOptions& options);

    bool ready() const { return ready_; }
    bool waiting_for_measurement() const { return pending_.has_value(); }
    std::uint64_t current_pass() const { return pass_counter_; }

    // Last presented layout; meaningful once ready().
    const ColumnLayout& result() const { return result_; }

private:
    struct PendingPass {
        std::uint64_t pass = 0;
        std::vector<layout::RenderedBlock> blocks;
        layout::ColumnConfig config;
        int columns = 1;
        std::string column_width;
    };

    void on_built(std::uint64_t pass, const std::vector<float>& heights);

    layout::TreeExpander& expander_;
    MeasureSurface& surface_;
    layout::LayoutLookup layouts_;
    core::DiagnosticEmitter& diagnostics_;

    std::uint64_t pass_counter_ = 0;
    std::optional<PendingPass> pending_;
    ColumnLayout result_;
    bool ready_ = false;
};

} // namespace statblock::render
