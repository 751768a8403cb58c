#include "cBuild/environment.h"
#include "cBuild/produce.h"

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>

// Prints value of the type selected by --type.
// Default one is bound through the declared type of the local.
static void report(cBuild::ValueKind Kind) {
  std::cout << cBuild::getKindName(Kind) << ": ";
  switch (Kind) {
  case cBuild::ValueKind::U32: {
    uint32_t const Value = cBuild::produce();
    std::cout << Value << '\n';
    return;
  }
  case cBuild::ValueKind::U64:
    std::cout << cBuild::produce<uint64_t>() << '\n';
    return;
  }
}

int main(int argc, char *argv[]) {
#ifndef NDEBUG
  std::cout << "Debug\n";
#endif // Debug

  try {
    cBuild::SysEnv EH{argc, argv};
    if (EH.getHelp())
      return EXIT_SUCCESS;

    report(EH.getKind());
  } catch (const std::exception &e) {
    std::cerr << std::filesystem::path{argv[0]}.filename().string() << ": "
              << e.what() << std::endl;
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
