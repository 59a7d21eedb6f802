#include <statblock/core/diagnostics.h>
#include <statblock/layout/condition_evaluator.h>
#include <statblock/layout/layout_registry.h>
#include <statblock/layout/spell_grouper.h>
#include <statblock/layout/tree_expander.h>
#include <statblock/render/statblock_renderer.h>
#include "test_support.h"
#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using namespace statblock;
using statblock::fakes::make_item;
using statblock::model::DataRecord;
using statblock::model::ItemType;

namespace {

model::Layout text_layout(const std::string& name, int count) {
    model::Layout layout;
    layout.name = name;
    for (int i = 0; i < count; ++i) {
        layout.blocks.push_back(make_item(ItemType::Text, name + "-" + std::to_string(i)));
    }
    return layout;
}

// Wires the expander stack around a given surface.
template <typename Surface>
class RendererHarness : public ::testing::Test {
protected:
    template <typename... Args>
    explicit RendererHarness(Args&&... args) : surface(std::forward<Args>(args)...) {}

    fakes::RecordingProducer producer;
    fakes::FakeSandbox sandbox;
    core::DiagnosticEmitter diagnostics;
    layout::ConditionEvaluator conditions{sandbox, diagnostics};
    layout::SpellGrouper spells;
    layout::LayoutRegistry registry;
    layout::TreeExpander expander{producer, conditions, spells, registry.lookup(), diagnostics};
    Surface surface;
    render::StatblockRenderer renderer{expander, surface, registry.lookup(), diagnostics};
};

class SyncRendererTest : public RendererHarness<fakes::FixedHeightSurface> {
protected:
    SyncRendererTest() : RendererHarness(100.0f) {}
};

class AsyncRendererTest : public RendererHarness<fakes::ManualSurface> {};

// Measures synchronously, then reads the blocks again once on_built returns.
class ReadAfterBuiltSurface : public render::MeasureSurface {
public:
    void measure(const std::vector<layout::RenderedBlock>& blocks, BuiltCallback on_built) override {
        on_built(std::vector<float>(blocks.size(), 100.0f));
        for (const auto& block : blocks) ids_after_built.push_back(block.item_id);
    }
    void discard_measurement() override {}
    void present(const render::ColumnLayout& /*layout*/) override { ++presented; }

    std::vector<std::string> ids_after_built;
    int presented = 0;
};

class ReadAfterBuiltTest : public RendererHarness<ReadAfterBuiltSurface> {};

} // namespace

// ============================================================================
// Synchronous measurement
// ============================================================================
TEST_F(SyncRendererTest, BalancesTenBlocksIntoTwoColumns) {
    DataRecord record;
    record.set("columns", 2);
    render::RenderOptions options;
    options.columns = 2;

    auto pass = renderer.build(text_layout("Basic", 10), record, options);
    ASSERT_TRUE(renderer.ready());
    EXPECT_FALSE(renderer.waiting_for_measurement());

    const auto& result = renderer.result();
    EXPECT_EQ(result.pass, pass);
    EXPECT_FLOAT_EQ(result.split_height, 500);
    ASSERT_EQ(result.columns.size(), 2u);
    EXPECT_EQ(result.columns[0].size(), 5u);
    EXPECT_EQ(result.columns[1].size(), 5u);
    EXPECT_EQ(result.columns[1].front().item_id, "Basic-5");
    EXPECT_EQ(surface.presented, (std::vector<std::uint64_t>{pass}));
}

TEST_F(SyncRendererTest, ShortStatblockUsesOneColumn) {
    render::RenderOptions options;
    options.columns = 2;

    renderer.build(text_layout("Basic", 4), DataRecord{}, options);
    ASSERT_TRUE(renderer.ready());
    EXPECT_EQ(renderer.result().columns.size(), 1u);
    EXPECT_FLOAT_EQ(renderer.result().split_height, 600);
}

TEST_F(SyncRendererTest, ForceColumnsHonorsMaxColumns) {
    DataRecord record;
    record.set("forceColumns", true);
    render::RenderOptions options;
    options.columns = 1;
    options.max_columns = 3;

    renderer.build(text_layout("Basic", 9), record, options);
    ASSERT_TRUE(renderer.ready());
    EXPECT_FLOAT_EQ(renderer.result().split_height, 300);
    EXPECT_EQ(renderer.result().columns.size(), 3u);
}

TEST_F(SyncRendererTest, ColumnWidthPrecedence) {
    render::RenderOptions options;
    options.column_width = "400px";

    auto layout = text_layout("Basic", 1);
    renderer.build(layout, DataRecord{}, options);
    EXPECT_EQ(renderer.result().column_width, "400px");

    layout.column_width = "320px";
    renderer.build(layout, DataRecord{}, options);
    EXPECT_EQ(renderer.result().column_width, "320px");

    DataRecord record;
    record.set("columnWidth", 500);
    renderer.build(layout, record, options);
    EXPECT_EQ(renderer.result().column_width, "500px");
}

TEST_F(SyncRendererTest, RecordSelectsItsLayout) {
    registry.add(text_layout("Basic", 2));
    registry.add(text_layout("Pathfinder", 3));

    DataRecord record;
    record.set("layout", "Pathfinder");
    render::RenderOptions options;
    options.default_layout = "Basic";

    ASSERT_NE(renderer.build(record, options), 0u);
    ASSERT_EQ(renderer.result().columns.size(), 1u);
    EXPECT_EQ(renderer.result().columns[0].size(), 3u);
    EXPECT_EQ(renderer.result().columns[0][0].item_id, "Pathfinder-0");

    ASSERT_NE(renderer.build(DataRecord{}, options), 0u);
    EXPECT_EQ(renderer.result().columns[0][0].item_id, "Basic-0");
}

TEST_F(SyncRendererTest, UnknownLayoutStartsNoPass) {
    DataRecord record;
    record.set("layout", "Missing");

    EXPECT_EQ(renderer.build(record, render::RenderOptions{}), 0u);
    EXPECT_FALSE(renderer.ready());
    EXPECT_TRUE(surface.presented.empty());

    auto errors = diagnostics.events_by_severity(core::Severity::Error);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].module, "render");
}

TEST_F(SyncRendererTest, DiagnosticsCarryPassId) {
    auto pass = renderer.build(text_layout("Basic", 1), DataRecord{}, render::RenderOptions{});
    auto events = diagnostics.events_by_module("render");
    ASSERT_FALSE(events.empty());
    for (const auto& event : events) {
        EXPECT_EQ(event.correlation_id, pass);
    }
}

// ============================================================================
// Deferred measurement
// ============================================================================
TEST_F(AsyncRendererTest, WaitsForHeights) {
    renderer.build(text_layout("Basic", 3), DataRecord{}, render::RenderOptions{});
    EXPECT_FALSE(renderer.ready());
    EXPECT_TRUE(renderer.waiting_for_measurement());
    EXPECT_EQ(surface.measured_counts, (std::vector<std::size_t>{3}));

    surface.fire(0, {100, 100, 100});
    EXPECT_TRUE(renderer.ready());
    EXPECT_FALSE(renderer.waiting_for_measurement());
    EXPECT_EQ(surface.presented.size(), 1u);
    EXPECT_EQ(surface.discarded, 1);
}

TEST_F(AsyncRendererTest, StaleHeightsAreIgnored) {
    auto first = renderer.build(text_layout("Basic", 2), DataRecord{}, render::RenderOptions{});
    auto second = renderer.build(text_layout("Basic", 4), DataRecord{}, render::RenderOptions{});
    EXPECT_NE(first, second);
    EXPECT_EQ(renderer.current_pass(), second);
    EXPECT_EQ(surface.discarded, 1);

    surface.fire(0, {100, 100});
    EXPECT_FALSE(renderer.ready());
    EXPECT_TRUE(surface.presented.empty());
    EXPECT_TRUE(diagnostics.has_events(core::Severity::Warning));

    surface.fire(1, {100, 100, 100, 100});
    ASSERT_TRUE(renderer.ready());
    EXPECT_EQ(surface.presented, (std::vector<std::uint64_t>{second}));
    EXPECT_EQ(renderer.result().columns[0].size(), 4u);
}

TEST_F(AsyncRendererTest, HeightCountMismatchLeavesNothingPresented) {
    renderer.build(text_layout("Basic", 3), DataRecord{}, render::RenderOptions{});
    surface.fire(0, {100});

    EXPECT_FALSE(renderer.ready());
    EXPECT_FALSE(renderer.waiting_for_measurement());
    EXPECT_TRUE(surface.presented.empty());
    EXPECT_TRUE(diagnostics.has_events(core::Severity::Error));
}

TEST_F(AsyncRendererTest, RebuildAfterPresentStartsFresh) {
    renderer.build(text_layout("Basic", 1), DataRecord{}, render::RenderOptions{});
    surface.fire(0, {50});
    ASSERT_TRUE(renderer.ready());

    renderer.build(text_layout("Basic", 1), DataRecord{}, render::RenderOptions{});
    EXPECT_FALSE(renderer.ready());
    EXPECT_TRUE(renderer.waiting_for_measurement());
}

TEST_F(ReadAfterBuiltTest, BlocksOutliveSynchronousCallback) {
    renderer.build(text_layout("Basic", 4), DataRecord{}, render::RenderOptions{});

    ASSERT_TRUE(renderer.ready());
    EXPECT_EQ(surface.presented, 1);
    EXPECT_EQ(surface.ids_after_built,
              (std::vector<std::string>{"Basic-0", "Basic-1", "Basic-2", "Basic-3"}));
    EXPECT_EQ(renderer.result().columns[0].size(), 4u);
}
