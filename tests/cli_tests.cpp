#include "test_util.hpp"
#include <zipnum/app.hpp>
#include <zipnum/cli.hpp>

using namespace zipnum;

static ParseResult parse(std::vector<std::string> args) {
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (auto& s : args) argv.push_back(const_cast<char*>(s.c_str()));
  argv.push_back(nullptr);
  return parse_cli(static_cast<int>(args.size()), argv.data());
}

static int run_app(std::vector<std::string> args) {
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (auto& s : args) argv.push_back(const_cast<char*>(s.c_str()));
  argv.push_back(nullptr);
  return App{}.run(static_cast<int>(args.size()), argv.data());
}

TEST_CASE("defaults match the documented ones") {
  auto pr = parse({"cdxj-to-zipnum", "-i", "in.cdxj", "-o", "out"});
  REQUIRE(pr.cmd);
  auto* b = std::get_if<CmdBuild>(&*pr.cmd);
  REQUIRE(b);
  REQUIRE(b->cfg.input == "in.cdxj");
  REQUIRE(b->cfg.output_dir == "out");
  REQUIRE(b->cfg.shard_size_mb == 100);
  REQUIRE(b->cfg.chunk_size == 3000);
  REQUIRE(b->cfg.compress_level == 6);
  REQUIRE_FALSE(b->cfg.single_shard);
  REQUIRE(b->cfg.base.empty());
}

TEST_CASE("all options are parsed") {
  auto pr = parse({"cdxj-to-zipnum", "--input", "-", "--output", "o", "-s", "200",
                   "-c", "500", "--compress-level", "9", "--single-shard",
                   "--base", "b", "--idx-file", "b.idx", "--loc-file", "b.loc",
                   "--log-level", "warn"});
  REQUIRE(pr.error.empty());
  auto& c = std::get<CmdBuild>(*pr.cmd).cfg;
  REQUIRE(c.input == "-");
  REQUIRE(c.shard_size_mb == 200);
  REQUIRE(c.chunk_size == 500);
  REQUIRE(c.compress_level == 9);
  REQUIRE(c.single_shard);
  REQUIRE(c.base == "b");
  REQUIRE(c.idx_file == "b.idx");
  REQUIRE(c.loc_file == "b.loc");
  REQUIRE(c.log_level == "warn");
}

TEST_CASE("help and version") {
  REQUIRE(std::holds_alternative<CmdHelp>(*parse({"x"}).cmd));
  REQUIRE(std::holds_alternative<CmdHelp>(*parse({"x", "-h"}).cmd));
  REQUIRE(std::holds_alternative<CmdVersion>(*parse({"x", "--version"}).cmd));
}

TEST_CASE("bad arguments produce an error") {
  REQUIRE_FALSE(parse({"x", "-o", "out"}).cmd);                        // нет -i
  REQUIRE_FALSE(parse({"x", "-i", "in"}).cmd);                         // нет -o
  REQUIRE_FALSE(parse({"x", "-i", "in", "-o", "o", "-c", "0"}).cmd);
  REQUIRE_FALSE(parse({"x", "-i", "in", "-o", "o", "-c", "12abc"}).cmd);
  REQUIRE_FALSE(parse({"x", "-i", "in", "-o", "o", "-c", "-5"}).cmd);
  REQUIRE_FALSE(parse({"x", "-i", "in", "-o", "o", "--compress-level", "0"}).cmd);
  REQUIRE_FALSE(parse({"x", "-i", "in", "-o", "o", "--compress-level", "10"}).cmd);
  REQUIRE_FALSE(parse({"x", "-i", "in", "-o", "o", "-s", "0"}).cmd);
  REQUIRE_FALSE(parse({"x", "-i", "in", "-o", "o", "--log-level", "loud"}).cmd);
  REQUIRE_FALSE(parse({"x", "-i", "in", "-o", "o", "--bogus"}).cmd);
  REQUIRE_FALSE(parse({"x", "-i"}).cmd);

  auto pr = parse({"x", "-i", "in", "-o", "o", "--chunk-size"});
  REQUIRE(pr.error == "--chunk-size: value required");
}

TEST_CASE("shard size 0 is allowed with --single-shard") {
  auto pr = parse({"x", "-i", "in", "-o", "o", "-s", "0", "--single-shard"});
  REQUIRE(pr.cmd);
}

TEST_CASE("app exit codes") {
  auto d = mktmp("cli_app_");
  write_file(d / "in.cdxj", make_cdxj(9));

  REQUIRE(run_app({"cdxj-to-zipnum", "--help"}) == 0);
  REQUIRE(run_app({"cdxj-to-zipnum", "--version"}) == 0);
  REQUIRE(run_app({"cdxj-to-zipnum", "-o", (d / "o").string()}) == 2);
  REQUIRE(run_app({"cdxj-to-zipnum", "-i", (d / "nope.cdxj").string(), "-o",
                   (d / "o").string()}) == 1);

  REQUIRE(run_app({"cdxj-to-zipnum", "-i", (d / "in.cdxj").string(), "-o",
                   (d / "o").string(), "-c", "4", "--log-level", "error"}) == 0);
  REQUIRE(fs::exists(d / "o" / "o.cdx.gz"));
  REQUIRE(read_lines(d / "o" / "o.idx").size() == 3);
  REQUIRE(read_file(d / "o" / "o.loc") == "o\to.cdx.gz\n");
}
