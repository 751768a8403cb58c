#include "cBuild/environment.h"

#include <iostream>
#include <stdexcept>

using namespace cBuild;
namespace opt = boost::program_options;

ValueKind cBuild::parseValueKind(std::string_view Name) {
  if (Name == "u32")
    return ValueKind::U32;
  if (Name == "u64")
    return ValueKind::U64;
  throw std::invalid_argument{"unsupported type '" + std::string{Name} +
                              "', expected u32 or u64"};
}

std::string_view cBuild::getKindName(ValueKind Kind) {
  switch (Kind) {
  case ValueKind::U32:
    return "u32";
  case ValueKind::U64:
    return "u64";
  }
  throw std::logic_error{"unknown value kind"};
}

SysEnv::SysEnv(int argc, char const *const argv[]) {
  Desc.add_options()("help", "produce help message")(
      "type", opt::value<std::string>()->default_value("u32"),
      "type of the value to produce: u32 or u64.");

  opt::store(opt::parse_command_line(argc, argv, Desc), Opts);
  opt::notify(Opts);
}

bool SysEnv::getHelp() const {
  if (Opts.count("help")) {
    std::cout << Desc << "\n";
    return true;
  }
  return false;
}

ValueKind SysEnv::getKind() const {
  return parseValueKind(Opts["type"].as<std::string>());
}
