#include <statblock/core/diagnostics.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace statblock::core;

TEST(DiagnosticsTest, SeverityNames) {
    EXPECT_STREQ(severity_name(Severity::Info), "info");
    EXPECT_STREQ(severity_name(Severity::Warning), "warning");
    EXPECT_STREQ(severity_name(Severity::Error), "error");
}

TEST(DiagnosticsTest, EmitRecordsStructuredFields) {
    DiagnosticEmitter emitter;
    emitter.set_correlation_id(7);
    emitter.error("expand", "traits", "bad record");

    ASSERT_EQ(emitter.size(), 1u);
    const auto e = emitter.events()[0];
    EXPECT_EQ(e.severity, Severity::Error);
    EXPECT_EQ(e.module, "expand");
    EXPECT_EQ(e.stage, "traits");
    EXPECT_EQ(e.message, "bad record");
    EXPECT_EQ(e.correlation_id, 7u);
    EXPECT_NE(e.timestamp, std::chrono::steady_clock::time_point{});
}

TEST(DiagnosticsTest, FormatIncludesPassAndLocation) {
    DiagnosticEvent event;
    event.severity = Severity::Warning;
    event.module = "condition";
    event.stage = "ifelse";
    event.message = "syntax error";
    event.correlation_id = 3;

    EXPECT_EQ(format_diagnostic(event), "[warning] condition/ifelse (pass:3): syntax error");
}

TEST(DiagnosticsTest, FormatOmitsMissingParts) {
    DiagnosticEvent event;
    event.message = "hello";
    EXPECT_EQ(format_diagnostic(event), "[info]: hello");
}

TEST(DiagnosticsTest, MinSeverityFiltersEvents) {
    DiagnosticEmitter emitter;
    emitter.set_min_severity(Severity::Warning);
    emitter.info("a", "b", "dropped");
    emitter.warn("a", "b", "kept");

    ASSERT_EQ(emitter.size(), 1u);
    EXPECT_EQ(emitter.events()[0].message, "kept");
    EXPECT_TRUE(emitter.has_events(Severity::Warning));
    EXPECT_FALSE(emitter.has_events(Severity::Error));
}

TEST(DiagnosticsTest, ObserversSeeEveryEvent) {
    DiagnosticEmitter emitter;
    std::vector<std::string> seen;
    emitter.add_observer([&](const DiagnosticEvent& e) { seen.push_back(e.message); });

    emitter.info("m", "s", "one");
    emitter.error("m", "s", "two");

    EXPECT_EQ(seen, (std::vector<std::string>{"one", "two"}));
}

TEST(DiagnosticsTest, HistoryIsBounded) {
    DiagnosticEmitter emitter(3);
    for (int i = 0; i < 5; ++i) {
        emitter.info("m", "s", std::to_string(i));
    }

    ASSERT_EQ(emitter.size(), 3u);
    auto events = emitter.events();
    EXPECT_EQ(events.front().message, "2");
    EXPECT_EQ(events.back().message, "4");
}

TEST(DiagnosticsTest, FilterByModuleAndSeverity) {
    DiagnosticEmitter emitter;
    emitter.info("render", "build", "a");
    emitter.warn("expand", "layout", "b");
    emitter.warn("render", "measure", "c");

    EXPECT_EQ(emitter.events_by_module("render").size(), 2u);
    EXPECT_EQ(emitter.events_by_severity(Severity::Warning).size(), 2u);

    emitter.clear();
    EXPECT_EQ(emitter.size(), 0u);
}
