#include <zipnum/app.hpp>
#include <zipnum/builder.hpp>
#include <zipnum/cli.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <stdexcept>
#include <type_traits>

#ifndef ZIPNUM_VERSION
#define ZIPNUM_VERSION "unknown"
#endif

namespace zipnum {

static void print_help() {
  std::cout <<
      R"(cdxj-to-zipnum - build ZipNum shards, .idx and .loc from one sorted CDX/CDXJ input

Usage:
  cdxj-to-zipnum -i <PATH|-> -o <DIR> [options]

Options:
  -i, --input PATH|-          input CDX/CDXJ file (plain or .gz), '-' for stdin
  -o, --output DIR            output directory for shards, idx and loc
  -s, --shard-size MB         target shard size in MB (default: 100)
      --single-shard          write one shard regardless of size
  -c, --chunk-size N          lines per chunk (default: 3000)
      --compress-level 1..9   gzip level (default: 6)
      --base NAME             base name (default: basename of output dir)
      --idx-file NAME         index file name inside output dir (default: <base>.idx)
      --loc-file NAME         loc file name inside output dir (default: <base>.loc)
      --log-level LEVEL       trace|debug|info|warn|error|off (default: info)
  -h, --help                  this help
      --version               print version

Examples:
  cdxj-to-zipnum -o outdir -i input.cdxj
  zcat many.cdxj.gz | cdxj-to-zipnum -o outdir -i - -s 50
  cdxj-to-zipnum -o outdir -i input.cdxj.gz --base myindex --single-shard
)";
}

int App::run(int argc, char** argv) {
  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    spdlog::error("{}", pr.error);
    print_help();
    return 2;
  }

  return std::visit(
      [&](auto&& c) -> int {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, CmdHelp>) {
          print_help();
          return 0;

        } else if constexpr (std::is_same_v<T, CmdVersion>) {
          std::cout << fmt::format("cdxj-to-zipnum {}\n", ZIPNUM_VERSION);
          return 0;

        } else {
          spdlog::set_level(spdlog::level::from_str(c.cfg.log_level));
          try {
            BuildResult res = build_zipnum(c.cfg);
            std::cout << fmt::format(
                "Finished. Wrote {} shard file(s), index: {}, loc: {}\n",
                res.shards.size(), res.index_path.string(), res.loc_path.string());
            return 0;
          } catch (const std::invalid_argument& e) {
            spdlog::error("config: {}", e.what());
            return 2;
          } catch (const std::exception& e) {
            spdlog::error("{}", e.what());
            return 1;
          }
        }
      },
      *pr.cmd);
}

} // namespace zipnum
