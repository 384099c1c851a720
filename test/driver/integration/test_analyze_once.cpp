/***
 * Name: test_analyze_once
 * Purpose: End-to-end runs of the driver pipeline against files on disk.
 */
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "jflow/driver/app.h"
#include "jflow/driver/cli.h"
#include "jflow/exceptions/config_error.h"

using namespace jflow::driver;
namespace fs = std::filesystem;

namespace {

const char* const kService =
    "public class OrderService {\n"
    "  public void place(Order order) {\n"
    "    validate(order);\n"
    "    System.out.println(\"placing\");\n"
    "    if (order.isLarge()) {\n"
    "      notifyManager(order);\n"
    "    }\n"
    "    repo.save(order);\n"
    "  }\n"
    "  private void validate(Order order) {}\n"
    "  private void notifyManager(Order order) { mailer.send(order); }\n"
    "}\n";

class AnalyzeOnceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() / ("jflow_it_" + std::string(
        ::testing::UnitTest::GetInstance()->current_test_info()->name()));
    fs::remove_all(dir_);
    fs::create_directories(dir_);
    input_ = (dir_ / "OrderService.java").string();
    output_ = (dir_ / "out.txt").string();
    std::ofstream(input_) << kService;
  }
  void TearDown() override { fs::remove_all(dir_); }

  std::string Output() const {
    std::ifstream in(output_);
    std::stringstream buf;
    buf << in.rdbuf();
    return buf.str();
  }

  CliOptions Options() const {
    CliOptions opts;
    opts.inputs = {input_};
    opts.output = output_;
    opts.color = CliOptions::ColorMode::Never;
    return opts;
  }

  fs::path dir_;
  std::string input_;
  std::string output_;
};

}  // namespace

TEST_F(AnalyzeOnceTest, MermaidToFile) {
  ASSERT_EQ(AnalyzeOnce(Options(), input_), 0);
  const auto text = Output();
  EXPECT_EQ(text.rfind("flowchart TD\n", 0), 0U);
  EXPECT_NE(text.find("[\"place\"]\n"), std::string::npos);
  EXPECT_NE(text.find("External: repo.save(order)"), std::string::npos);
  EXPECT_NE(text.find("[\"notifyManager\"]:::internal"), std::string::npos);
  // console output is hidden by the default ignores
  EXPECT_EQ(text.find("System.out"), std::string::npos);
  // private helpers are not expanded by default
  EXPECT_EQ(text.find("[\"validate\"]\n"), std::string::npos);
}

TEST_F(AnalyzeOnceTest, NoDefaultIgnoresShowsConsole) {
  auto opts = Options();
  opts.default_ignores = false;
  ASSERT_EQ(AnalyzeOnce(opts, input_), 0);
  EXPECT_NE(Output().find("External: System.out.println('placing')"), std::string::npos);
}

TEST_F(AnalyzeOnceTest, TargetedMethod) {
  auto opts = Options();
  opts.method = "notifyManager";
  ASSERT_EQ(AnalyzeOnce(opts, input_), 0);
  const auto text = Output();
  EXPECT_NE(text.find("[\"notifyManager\"]\n"), std::string::npos);
  EXPECT_EQ(text.find("[\"place\"]\n"), std::string::npos);
}

TEST_F(AnalyzeOnceTest, ServicesList) {
  auto opts = Options();
  opts.emit = CliOptions::EmitKind::Services;
  ASSERT_EQ(AnalyzeOnce(opts, input_), 0);
  EXPECT_EQ(Output(), "System\norder\nrepo\n");
}

TEST_F(AnalyzeOnceTest, GraphJson) {
  auto opts = Options();
  opts.emit = CliOptions::EmitKind::Graph;
  ASSERT_EQ(AnalyzeOnce(opts, input_), 0);
  const auto js = Output();
  EXPECT_NE(js.find(R"("place": ["validate", "notifyManager"])"), std::string::npos);
  EXPECT_NE(js.find(R"("notifyManager": [])"), std::string::npos);
}

TEST_F(AnalyzeOnceTest, MissingInputFails) {
  EXPECT_EQ(AnalyzeOnce(Options(), (dir_ / "missing.java").string()), 2);
  EXPECT_FALSE(fs::exists(output_));
}

TEST_F(AnalyzeOnceTest, StrictRejectsBrokenSource) {
  const auto broken = (dir_ / "Broken.java").string();
  std::ofstream(broken) << "class Broken {\n  void f( {\n}\n";
  auto opts = Options();
  opts.strict = true;
  EXPECT_EQ(AnalyzeOnce(opts, broken), 2);
  EXPECT_FALSE(fs::exists(output_));

  opts.strict = false;
  EXPECT_EQ(AnalyzeOnce(opts, broken), 0);
}

TEST_F(AnalyzeOnceTest, UnwritableOutputFails) {
  auto opts = Options();
  opts.output = (dir_ / "no" / "such" / "dir" / "out.mmd").string();
  EXPECT_EQ(AnalyzeOnce(opts, input_), 2);
}

TEST_F(AnalyzeOnceTest, EmptyIgnoreNameIsConfigError) {
  auto opts = Options();
  opts.ignored_services = {""};
  EXPECT_THROW(AnalyzeOnce(opts, input_), jflow::exceptions::ConfigError);
}

TEST_F(AnalyzeOnceTest, FlowLogWritten) {
  auto opts = Options();
  opts.log_flow = true;
  opts.log_path = (dir_ / "logs").string();
  ASSERT_EQ(AnalyzeOnce(opts, input_), 0);
  int logs = 0;
  std::string contents;
  for (const auto& entry : fs::directory_iterator(opts.log_path)) {
    const auto name = entry.path().filename().string();
    if (name.size() > 9 && name.compare(name.size() - 9, 9, "-flow.log") == 0) {
      ++logs;
      std::ifstream in(entry.path());
      std::stringstream buf;
      buf << in.rdbuf();
      contents = buf.str();
    }
  }
  EXPECT_EQ(logs, 1);
  EXPECT_NE(contents.find("Method name=place, ret=void, modifiers=public"), std::string::npos);
}
