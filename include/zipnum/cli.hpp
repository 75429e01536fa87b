#pragma once
#include <optional>
#include <string>
#include <variant>

#include <zipnum/config.hpp>

namespace zipnum {

struct CmdBuild {
  Config cfg;
};
struct CmdHelp {};
struct CmdVersion {};

using Command = std::variant<CmdBuild, CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;
};

ParseResult parse_cli(int argc, char** argv);

} // namespace zipnum
