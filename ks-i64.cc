#include <iostream>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "driver.h"
#include "ks-flags.h"

// Runs a two-sample Kolmogorov-Smirnov test on two files of signed
// 64-bit integer samples, one value per line.
int main(int argc, char** argv) {
  std::vector<char*> args = absl::ParseCommandLine(argc, argv);
  if (args.size() != 3) {
    std::cerr << "Usage: " << args[0]
              << " [--confidence=0.95] <file1> <file2>\n";
    return 1;
  }

  return CompareIntegerSampleFiles(args[1], args[2],
                                   absl::GetFlag(FLAGS_confidence), std::cout);
}
