#include <iostream>
#include <string>
#include <vector>

#include <llvm/Support/raw_ostream.h>

#include "driver.hpp"

int main(int argc, char* argv[]) {
  std::vector<std::string> args(argv + 1, argv + argc);
  auto result = eli::parse_options(args);
  if (!result.ok()) {
    llvm::errs() << "eli: " << result.error << "\n";
    eli::print_usage(llvm::errs());
    return 1;
  }
  return eli::run_driver(result.options, std::cin, llvm::outs(), llvm::errs());
}
