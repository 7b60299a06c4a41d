#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "ocrflow_cli/cli_handler.hpp"

using namespace ocrflow_cli;

class CliHandlerTest : public ::testing::Test {
 protected:
  CliOptions parse(std::vector<std::string> args) {
    args.insert(args.begin(), "ocrflow");
    storage_ = args;
    argv_.clear();
    for (auto& arg : storage_) {
      argv_.push_back(arg.data());
    }
    return handler_.parse_arguments(static_cast<int>(argv_.size()), argv_.data());
  }

  CliHandler handler_{"http://127.0.0.1:8001"};
  std::vector<std::string> storage_;
  std::vector<char*> argv_;
};

TEST_F(CliHandlerTest, NoArgumentsShowsHelp) {
  EXPECT_EQ(parse({}).command, Command::Help);
  EXPECT_EQ(parse({"--help"}).command, Command::Help);
}

TEST_F(CliHandlerTest, ParsesExtractWithDpi) {
  CliOptions options = parse({"extract", "--file", "scan.pdf", "--dpi", "300"});
  EXPECT_EQ(options.command, Command::Extract);
  EXPECT_EQ(options.file_path, "scan.pdf");
  EXPECT_EQ(options.dpi, 300);
}

TEST_F(CliHandlerTest, ParsesShortAliases) {
  CliOptions upload = parse({"u", "-f", "book.pdf"});
  EXPECT_EQ(upload.command, Command::Upload);
  EXPECT_EQ(upload.file_path, "book.pdf");

  CliOptions status = parse({"s", "-i", "job-1234"});
  EXPECT_EQ(status.command, Command::Status);
  EXPECT_EQ(status.job_id, "job-1234");
}

TEST_F(CliHandlerTest, ParsesResultAndProgressFlags) {
  CliOptions result = parse({"result", "--id", "abc-12345", "--partial"});
  EXPECT_EQ(result.command, Command::Result);
  EXPECT_TRUE(result.partial);

  CliOptions progress = parse({"progress", "--id", "abc-12345", "--follow"});
  EXPECT_EQ(progress.command, Command::Progress);
  EXPECT_TRUE(progress.follow);
}

TEST_F(CliHandlerTest, HealthAndMetricsNeedNoArguments) {
  EXPECT_EQ(parse({"health"}).command, Command::Health);
  EXPECT_EQ(parse({"metrics"}).command, Command::Metrics);
}

TEST_F(CliHandlerTest, RejectsUnknownCommandAndOption) {
  EXPECT_THROW(parse({"frobnicate"}), CliError);
  EXPECT_THROW(parse({"status", "--id", "x", "--verbose"}), CliError);
}

TEST_F(CliHandlerTest, RequiresFileOrJobId) {
  EXPECT_THROW(parse({"extract"}), CliError);
  EXPECT_THROW(parse({"upload", "--id", "abc"}), CliError);
  EXPECT_THROW(parse({"status"}), CliError);
  EXPECT_THROW(parse({"result", "--file", "a.pdf"}), CliError);
}

TEST_F(CliHandlerTest, RejectsMissingOrBadFlagValues) {
  EXPECT_THROW(parse({"extract", "--file"}), CliError);
  EXPECT_THROW(parse({"extract", "--file", "a.pdf", "--dpi", "high"}), CliError);
}

TEST(CliHandlerUrlTest, StripsTrailingSlashes) {
  CliHandler handler("http://localhost:8001//");
  EXPECT_EQ(handler.get_api_base_url(), "http://localhost:8001");
  EXPECT_EQ(handler.build_url("/status/abc"), "http://localhost:8001/status/abc");
}

TEST(CliHandlerUrlTest, MoveKeepsBaseUrl) {
  CliHandler original("http://localhost:9000");
  CliHandler moved(std::move(original));
  EXPECT_EQ(moved.get_api_base_url(), "http://localhost:9000");
}

TEST(CliHandlerExecuteTest, UnreachableServerRaisesCliError) {
  // Port 1 is reserved and nothing listens there.
  CliHandler handler("http://127.0.0.1:1");
  CliOptions options;
  options.command = Command::Health;
  EXPECT_THROW(handler.execute_command(options), CliError);
}

TEST(CliHandlerExecuteTest, MissingUploadFileRaisesCliError) {
  CliHandler handler("http://127.0.0.1:1");
  CliOptions options;
  options.command = Command::Upload;
  options.file_path = "/nonexistent/ocrflow/input.pdf";
  EXPECT_THROW(handler.execute_command(options), CliError);
}
