#pragma once

#include <boost/program_options.hpp>

#include <string>
#include <string_view>

namespace cBuild {

// Types which driver is able to produce.
enum class ValueKind { U32, U64 };

ValueKind parseValueKind(std::string_view Name);
std::string_view getKindName(ValueKind Kind);

// Command line of the driver.
struct SysEnv {
  SysEnv(int argc, char const *const argv[]);

  bool getHelp() const;
  // Throws std::invalid_argument on unknown --type.
  ValueKind getKind() const;

private:
  boost::program_options::options_description Desc{"Allowed options"};
  boost::program_options::variables_map Opts;
};

} // namespace cBuild
