#include <statblock/render/statblock_renderer.h>

namespace statblock::render {

StatblockRenderer::StatblockRenderer(layout::TreeExpander& expander, MeasureSurface& surface,
                                     layout::LayoutLookup layouts,
                                     core::DiagnosticEmitter& diagnostics)
    : expander_(expander),
      surface_(surface),
      layouts_(std::move(layouts)),
      diagnostics_(diagnostics) {}

std::uint64_t StatblockRenderer::build(const model::DataRecord& record,
                                       const RenderOptions& options) {
    std::string name = record.string("layout").value_or("");
    if (name.empty()) name = options.default_layout;

    const model::Layout* layout = (layouts_ && !name.empty()) ? layouts_(name) : nullptr;
    if (!layout) {
        diagnostics_.error("render", "build",
                           name.empty() ? std::string("no layout selected")
                                        : "layout '" + name + "' not found");
        return 0;
    }
    return build(*layout, record, options);
}

std::uint64_t StatblockRenderer::build(const model::Layout& layout, const model::DataRecord& record,
                                       const RenderOptions& options) {
    std::uint64_t pass = ++pass_counter_;
    diagnostics_.set_correlation_id(pass);
    if (pending_) {
        diagnostics_.info("render", "build",
                          "pass " + std::to_string(pending_->pass) + " superseded");
        surface_.discard_measurement();
        pending_.reset();
    }
    ready_ = false;

    layout::ExpandContext ctx;
    ctx.context_id = options.context_id;
    ctx.plugin = options.plugin;
    ctx.layout_chain.push_back(layout.name);

    // measure() reads `blocks` until it returns, even if on_built already
    // consumed the pending pass.
    std::vector<layout::RenderedBlock> blocks = expander_.expand(layout.blocks, record, ctx);

    PendingPass next;
    next.pass = pass;
    next.blocks = blocks;
    next.config = layout::column_config_from_record(record, options.max_columns);
    next.columns = options.columns < 1 ? 1 : options.columns;
    next.column_width = layout::resolve_column_width(
        record, layout.column_width.value_or(options.column_width));

    diagnostics_.info("render", "expand",
                      std::to_string(next.blocks.size()) + " blocks from layout '" +
                      layout.name + "'");

    pending_ = std::move(next);
    surface_.measure(blocks, [this, pass](const std::vector<float>& heights) {
        on_built(pass, heights);
    });
    return pass;
}

void StatblockRenderer::on_built(std::uint64_t pass, const std::vector<float>& heights) {
    if (!pending_ || pending_->pass != pass) {
        diagnostics_.warn("render", "measure",
                          "ignoring heights from superseded pass " + std::to_string(pass));
        return;
    }
    diagnostics_.set_correlation_id(pass);

    PendingPass current = std::move(*pending_);
    pending_.reset();
    surface_.discard_measurement();

    if (heights.size() != current.blocks.size()) {
        diagnostics_.error("render", "measure",
                           "got " + std::to_string(heights.size()) + " heights for " +
                           std::to_string(current.blocks.size()) + " blocks");
        return;
    }

    auto assignment = layout::assign_columns(heights, current.columns, current.config);

    ColumnLayout layout;
    layout.pass = pass;
    layout.split_height = assignment.split_height;
    layout.column_width = current.column_width;
    layout.columns = layout::group_by_column(std::move(current.blocks), assignment);

    result_ = std::move(layout);
    ready_ = true;
    diagnostics_.info("render", "balance",
                      std::to_string(result_.columns.size()) + " columns, split height " +
                      model::format_number(result_.split_height));
    surface_.present(result_);
}

} // namespace statblock::render
