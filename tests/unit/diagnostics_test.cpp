#include <stylec/core/diagnostics.h>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace stylec::core;

// ---------------------------------------------------------------------------
// Recording
// ---------------------------------------------------------------------------
TEST(DiagnosticsTest, EventsAreRecordedInOrder) {
    DiagnosticEmitter emitter;
    emitter.info("authoring", "parse", "3 rules");
    emitter.warning("authoring", "parse", "@font-face skipped");
    emitter.error("normalize", "button", "bad selector");

    ASSERT_EQ(emitter.size(), 3u);
    EXPECT_EQ(emitter.events()[0].severity, Severity::Info);
    EXPECT_EQ(emitter.events()[1].message, "@font-face skipped");
    EXPECT_EQ(emitter.events()[2].module, "normalize");
    EXPECT_TRUE(emitter.has_errors());
}

TEST(DiagnosticsTest, FilterBySeverityAndModule) {
    DiagnosticEmitter emitter;
    emitter.info("a", "", "one");
    emitter.warning("a", "", "two");
    emitter.warning("b", "", "three");

    EXPECT_EQ(emitter.count(Severity::Warning), 2u);
    EXPECT_EQ(emitter.events_by_severity(Severity::Info).size(), 1u);
    auto b = emitter.events_by_module("b");
    ASSERT_EQ(b.size(), 1u);
    EXPECT_EQ(b[0].message, "three");
    EXPECT_FALSE(emitter.has_errors());
}

TEST(DiagnosticsTest, MinSeverityDropsQuietEvents) {
    DiagnosticEmitter emitter;
    emitter.set_min_severity(Severity::Warning);
    emitter.info("a", "", "hidden");
    emitter.warning("a", "", "shown");
    ASSERT_EQ(emitter.size(), 1u);
    EXPECT_EQ(emitter.events()[0].message, "shown");
    EXPECT_EQ(emitter.min_severity(), Severity::Warning);
}

TEST(DiagnosticsTest, ObserversSeeEveryRecordedEvent) {
    DiagnosticEmitter emitter;
    std::vector<std::string> seen;
    emitter.add_observer([&seen](const DiagnosticEvent& event) { seen.push_back(event.message); });
    emitter.info("a", "", "one");
    emitter.error("a", "", "two");
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[1], "two");
}

TEST(DiagnosticsTest, SourceIsStampedOnEvents) {
    DiagnosticEmitter emitter;
    emitter.set_source("card.css");
    emitter.warning("authoring", "parse", "x");
    EXPECT_EQ(emitter.events()[0].source, "card.css");
    EXPECT_EQ(emitter.source(), "card.css");
}

TEST(DiagnosticsTest, ReportFormatsCompileError) {
    DiagnosticEmitter emitter;
    emitter.report("normalize", {ErrorKind::MissingSelector, "button", "button/& ", "target is empty"});
    ASSERT_EQ(emitter.size(), 1u);
    const auto& event = emitter.events()[0];
    EXPECT_EQ(event.severity, Severity::Error);
    EXPECT_EQ(event.stage, "button");
    EXPECT_EQ(event.message, "MissingSelector in button at button/& : target is empty");
}

TEST(DiagnosticsTest, ClearEmptiesEvents) {
    DiagnosticEmitter emitter;
    emitter.error("a", "", "x");
    emitter.clear();
    EXPECT_EQ(emitter.size(), 0u);
    EXPECT_FALSE(emitter.has_errors());
}

// ---------------------------------------------------------------------------
// Formatting
// ---------------------------------------------------------------------------
TEST(DiagnosticsTest, FormatDiagnostic) {
    DiagnosticEvent event;
    event.severity = Severity::Warning;
    event.module = "authoring";
    event.stage = "parse";
    event.source = "card.css";
    event.message = "unknown at-rule @font-face skipped";
    EXPECT_EQ(format_diagnostic(event),
              "[warning] authoring/parse (card.css): unknown at-rule @font-face skipped");

    DiagnosticEvent bare;
    bare.message = "hello";
    EXPECT_EQ(format_diagnostic(bare), "[info]: hello");
}

TEST(DiagnosticsTest, FormatErrorWithoutSheet) {
    CompileError error{ErrorKind::IoError, "", "out/mod.rs", "permission denied"};
    EXPECT_EQ(format_error(error), "IoError at out/mod.rs: permission denied");
    EXPECT_STREQ(error_kind_name(ErrorKind::NameCollision), "NameCollision");
}

TEST(DiagnosticsTest, HasErrorKind) {
    std::vector<CompileError> errors = {{ErrorKind::InvalidIR, "a", "a", "x"}};
    EXPECT_TRUE(has_error_kind(errors, ErrorKind::InvalidIR));
    EXPECT_FALSE(has_error_kind(errors, ErrorKind::IoError));
}
