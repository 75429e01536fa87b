#include <zipnum/cli.hpp>
#include <zipnum/util.hpp>

#include <limits>
#include <utility>
#include <string_view>

namespace zipnum {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

ParseResult parse_cli(int argc, char** argv) {
  ParseResult r{};
  if (argc < 2) {
    r.cmd = CmdHelp{};
    return r;
  }

  Config c;
  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];

    if (a == "-h" || a == "--help") {
      r.cmd = CmdHelp{};
      return r;
    }
    if (a == "--version") {
      r.cmd = CmdVersion{};
      return r;
    }
    if (a == "--single-shard") {
      c.single_shard = true;
      continue;
    }

    // дальше только флаги со значением
    const bool known =
        a == "-i" || a == "--input" || a == "-o" || a == "--output" ||
        a == "-s" || a == "--shard-size" || a == "-c" || a == "--chunk-size" ||
        a == "--compress-level" || a == "--base" || a == "--idx-file" ||
        a == "--loc-file" || a == "--log-level";
    if (!known) {
      r.error = "unknown argument: " + std::string(a);
      return r;
    }
    if (!has_arg(i, argc)) {
      r.error = std::string(a) + ": value required";
      return r;
    }
    std::string v = argv[++i];

    if (a == "-i" || a == "--input") {
      c.input = v;
    } else if (a == "-o" || a == "--output") {
      c.output_dir = v;
    } else if (a == "--base") {
      c.base = v;
    } else if (a == "--idx-file") {
      c.idx_file = v;
    } else if (a == "--loc-file") {
      c.loc_file = v;
    } else if (a == "--log-level") {
      c.log_level = v;
    } else {
      auto n = parse_uint(v);
      if (!n) {
        r.error = std::string(a) + ": expected a non-negative integer, got '" + v + "'";
        return r;
      }
      if (a == "-s" || a == "--shard-size") {
        c.shard_size_mb = *n;
      } else if (a == "-c" || a == "--chunk-size") {
        c.chunk_size = static_cast<size_t>(*n);
      } else {
        if (*n > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
          r.error = "--compress-level: out of range";
          return r;
        }
        c.compress_level = static_cast<int>(*n);
      }
    }
  }

  if (auto err = validate_config(c); !err.empty()) {
    r.error = err;
    return r;
  }
  r.cmd = CmdBuild{std::move(c)};
  return r;
}

} // namespace zipnum
