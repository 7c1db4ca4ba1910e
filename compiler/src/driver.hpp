#ifndef ELI_DRIVER_HPP
#define ELI_DRIVER_HPP

#include "lexer.hpp"
#include <istream>
#include <string>
#include <vector>

namespace llvm {
class raw_ostream;
}

namespace eli {

struct Options {
  bool repl = false;
  bool print_ir = false;
  bool show_help = false;
  bool show_version = false;
  std::string input_path;
};

struct OptionsResult {
  Options options;
  std::string error;
  bool ok() const { return error.empty(); }
};

/* Parses the arguments following argv[0]. */
OptionsResult parse_options(const std::vector<std::string>& args);

void print_usage(llvm::raw_ostream& os);
void print_version(llvm::raw_ostream& os);
void print_options(llvm::raw_ostream& os, const Options& options);

/* One line per token: "line:column  Token". */
void dump_token(llvm::raw_ostream& os, const PositionedToken& tok);
void report_lex_error(llvm::raw_ostream& os, const LexError& error);

/** Lexes options.input_path. Tokens are dumped when print_ir is set.
 *  Returns the process exit code. */
int lex_file(const Options& options, llvm::raw_ostream& out, llvm::raw_ostream& err);

/* Reads lines from `in` until EOF, lexing and dumping each one. A lex error only ends its line. */
int run_repl(std::istream& in, llvm::raw_ostream& out, llvm::raw_ostream& err);

int run_driver(const Options& options, std::istream& in, llvm::raw_ostream& out,
               llvm::raw_ostream& err);

}  // namespace eli

#endif
