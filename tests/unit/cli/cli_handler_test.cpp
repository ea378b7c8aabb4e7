#include <gtest/gtest.h>

#include <vector>

#include "ragkit_cli/cli_handler.hpp"

namespace ragkit_cli {

namespace {

CliOptions parse(std::vector<std::string> args) {
  args.insert(args.begin(), "ragkit");
  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  return CliHandler::parse_arguments(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

TEST(CliHandlerTest, ParseArguments_NoCommandIsHelp) {
  EXPECT_EQ(parse({}).command, Command::Help);
  EXPECT_EQ(parse({"--help"}).command, Command::Help);
}

TEST(CliHandlerTest, ParseArguments_QueryWithOptions) {
  CliOptions options = parse({"query", "what", "is", "the", "refund", "window", "--top-k", "8",
                              "--doc-id", "doc-1", "--budget", "900", "--tenant", "acme",
                              "--no-rerank", "--plan"});

  EXPECT_EQ(options.command, Command::Query);
  EXPECT_EQ(options.query, "what is the refund window");
  EXPECT_EQ(options.top_k, 8);
  EXPECT_EQ(options.doc_id, "doc-1");
  EXPECT_EQ(options.budget, 900);
  EXPECT_EQ(options.tenant, "acme");
  EXPECT_FALSE(options.rerank);
  EXPECT_TRUE(options.plan);
}

TEST(CliHandlerTest, ParseArguments_RejectsBadUsage) {
  EXPECT_THROW(parse({"query"}), CliError);
  EXPECT_THROW(parse({"query", "q", "--top-k"}), CliError);
  EXPECT_THROW(parse({"query", "q", "--top-k", "many"}), CliError);
  EXPECT_THROW(parse({"query", "q", "--verbose"}), CliError);
  EXPECT_THROW(parse({"ingest"}), CliError);
  EXPECT_THROW(parse({"launch"}), CliError);
}

TEST(CliHandlerTest, ParseArguments_IngestDefaultsSourceToFileName) {
  CliOptions options = parse({"ingest", "--file", "/docs/handbook.md"});
  EXPECT_EQ(options.command, Command::Ingest);
  EXPECT_EQ(options.source, "handbook.md");

  CliOptions named = parse({"ingest", "-f", "/docs/handbook.md", "--source", "HR handbook"});
  EXPECT_EQ(named.source, "HR handbook");
}

TEST(CliHandlerTest, BuildQueryBody_OnlySendsSetOptions) {
  CliOptions options;
  options.query = "q";

  nlohmann::json body = CliHandler::build_query_body(options);

  EXPECT_EQ(body["query"], "q");
  EXPECT_EQ(body["k"], 5);
  EXPECT_EQ(body["rerank"], true);
  EXPECT_FALSE(body.contains("doc_id"));
  EXPECT_FALSE(body.contains("max_context_tokens"));
  EXPECT_FALSE(body.contains("enable_planning"));

  options.budget = 700;
  options.plan = true;
  body = CliHandler::build_query_body(options);
  EXPECT_EQ(body["max_context_tokens"], 700);
  EXPECT_EQ(body["enable_planning"], true);
}

}  // namespace ragkit_cli
