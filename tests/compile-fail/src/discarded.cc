// Nothing to infer the type from.
#include "cBuild/produce.h"

int main() {
  cBuild::produce();
  return 0;
}
