// Inferred form does not fall back to a close type either.
#include "cBuild/produce.h"

int main() {
  int const Value = cBuild::produce();
  return Value;
}
