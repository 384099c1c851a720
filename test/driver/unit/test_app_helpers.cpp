/***
 * Name: test_app_helpers
 * Purpose: Driver helpers: config mapping, output delivery, metrics routing, diagnostics, color.
 */
#include <gtest/gtest.h>

#include <cstdlib>
#include <set>
#include <sstream>
#include <string>

#include "jflow/driver/app.h"
#include "jflow/driver/diagnostic.h"
#include "jflow/exceptions/config_error.h"
#include "jflow/metrics/metrics.h"

using namespace jflow;
using namespace jflow::driver;

static void set_env(const char* k, const char* v) {
  if (v) { setenv(k, v, 1); } else { unsetenv(k); }
}

TEST(BuildRenderConfig, DefaultsIgnoreConsole) {
  CliOptions o;
  const auto config = BuildRenderConfig(o);
  EXPECT_EQ(config.ignored_service_names, render::DefaultIgnoredServices());
  EXPECT_TRUE(config.ignored_variable_names.empty());
  EXPECT_FALSE(config.collapse_details);
  EXPECT_FALSE(config.show_source_reference);
}

TEST(BuildRenderConfig, MergesNamesAndSwitches) {
  CliOptions o;
  o.default_ignores = false;
  o.ignored_services = {"logger", "logger"};
  o.ignored_variables = {"ctx"};
  o.collapse = true;
  o.source_ref = true;
  const auto config = BuildRenderConfig(o);
  EXPECT_EQ(config.ignored_service_names, (std::set<std::string>{"logger"}));
  EXPECT_EQ(config.ignored_variable_names, (std::set<std::string>{"ctx"}));
  EXPECT_TRUE(config.collapse_details);
  EXPECT_TRUE(config.show_source_reference);
}

TEST(BuildRenderConfig, EmptyNameRejected) {
  CliOptions o;
  o.ignored_variables = {""};
  EXPECT_THROW(BuildRenderConfig(o), exceptions::ConfigError);
}

TEST(FormatServices, OnePerLine) {
  EXPECT_EQ(FormatServices({}), "");
  EXPECT_EQ(FormatServices({"repo", "System"}), "repo\nSystem\n");
}

TEST(PrintDiagnostic, HeaderLineAndCaret) {
  std::ostringstream err;
  PrintDiagnostic({"A.java", 2, 5, "unexpected '('"}, "class A {\n  void (\n}\n", false, err);
  EXPECT_EQ(err.str(), "A.java:2:5: error: unexpected '('\n    void (\n      ^\n");
}

TEST(PrintDiagnostic, ColorAddsAnsiSequences) {
  std::ostringstream err;
  PrintDiagnostic({"A.java", 1, 1, "oops"}, "x\n", true, err);
  EXPECT_NE(err.str().find("\x1b[31merror:"), std::string::npos);
  EXPECT_NE(err.str().find("\x1b[0m"), std::string::npos);
}

TEST(PrintDiagnostic, NoCaretPastEndOfSource) {
  std::ostringstream err;
  PrintDiagnostic({"A.java", 9, 1, "missing '}'"}, "class A {\n", false, err);
  EXPECT_EQ(err.str(), "A.java:9:1: error: missing '}'\n");
}

TEST(PrintDiagnostic, MissingFileUsesToolPrefix) {
  std::ostringstream err;
  PrintDiagnostic({"", 0, 0, "oops"}, "", false, err);
  EXPECT_EQ(err.str(), "jflow: error: oops\n");
}

TEST(UseEnvColor, DefaultsFalseWhenUnset) {
  set_env("JFLOW_COLOR", nullptr);
  EXPECT_FALSE(UseEnvColor());
}

TEST(UseEnvColor, RecognizesValues) {
  set_env("JFLOW_COLOR", "1"); EXPECT_TRUE(UseEnvColor());
  set_env("JFLOW_COLOR", "TRUE"); EXPECT_TRUE(UseEnvColor());
  set_env("JFLOW_COLOR", "yes"); EXPECT_TRUE(UseEnvColor());
  set_env("JFLOW_COLOR", "0"); EXPECT_FALSE(UseEnvColor());
  set_env("JFLOW_COLOR", "no"); EXPECT_FALSE(UseEnvColor());
  set_env("JFLOW_COLOR", nullptr);
}

TEST(ResolveColor, ExplicitModesWin) {
  EXPECT_TRUE(ResolveColor(CliOptions::ColorMode::Always));
  EXPECT_FALSE(ResolveColor(CliOptions::ColorMode::Never));
}

TEST(WriteFileOrReport, StdoutDashGoesToConsole) {
  std::ostringstream out;
  std::ostringstream diag;
  EXPECT_TRUE(WriteFileOrReport("-", "flowchart TD\n", out, diag));
  EXPECT_EQ(out.str(), "flowchart TD\n");
  EXPECT_TRUE(diag.str().empty());
}

TEST(WriteFileOrReport, FailureIsPrefixed) {
  std::ostringstream out;
  std::ostringstream diag;
  EXPECT_FALSE(WriteFileOrReport("/nonexistent/jflow/out.mmd", "x", out, diag));
  EXPECT_EQ(diag.str().rfind("jflow: error: failed to open file for write: /nonexistent/jflow/out.mmd", 0), 0U);
  EXPECT_TRUE(out.str().empty());
}

TEST(ReportMetricsIfRequested, SilentWhenDisabled) {
  CliOptions o;
  std::ostringstream out;
  std::ostringstream err;
  ReportMetricsIfRequested(o, out, err);
  EXPECT_TRUE(out.str().empty());
  EXPECT_TRUE(err.str().empty());
}

TEST(ReportMetricsIfRequested, StdoutArtifactSendsReportToStderr) {
  CliOptions o;
  o.metrics = true;
  o.metrics_format = CliOptions::MetricsFormat::Json;
  metrics::Metrics::Enable(true);
  metrics::Metrics::Reset();
  std::ostringstream out;
  std::ostringstream err;
  ReportMetricsIfRequested(o, out, err);
  EXPECT_TRUE(out.str().empty());
  EXPECT_NE(err.str().find("\"notes\""), std::string::npos);

  o.output = "flow.mmd";
  std::ostringstream out2;
  std::ostringstream err2;
  ReportMetricsIfRequested(o, out2, err2);
  EXPECT_NE(out2.str().find("\"notes\""), std::string::npos);
  EXPECT_TRUE(err2.str().empty());
  metrics::Metrics::Enable(false);
}
