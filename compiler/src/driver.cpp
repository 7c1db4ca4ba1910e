#include "driver.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <llvm/Config/llvm-config.h>
#include <llvm/Support/Format.h>
#include <llvm/Support/raw_ostream.h>

namespace eli {

OptionsResult parse_options(const std::vector<std::string>& args) {
  OptionsResult r;
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--help" || arg == "-h") {
      r.options.show_help = true;
    } else if (arg == "--version" || arg == "-v") {
      r.options.show_version = true;
    } else if (arg == "--repl" || arg == "--repL") {
      r.options.repl = true;
    } else if (arg == "--print-ir") {
      r.options.print_ir = true;
    } else if (arg == "run") {
      if (i + 1 >= args.size()) {
        r.error = "'run' expects a file";
        return r;
      }
      r.options.input_path = args[++i];
    } else if (!arg.empty() && arg[0] == '-') {
      r.error = "unknown option '" + arg + "'";
      return r;
    } else if (r.options.input_path.empty()) {
      r.options.input_path = arg;
    } else {
      r.error = "more than one input file ('" + r.options.input_path + "', '" + arg + "')";
      return r;
    }
  }
  return r;
}

void print_usage(llvm::raw_ostream& os) {
  os << "ELi lexer - usage: eli [options] <input.eli>\n";
  os << "  --help, -h       Show this help\n";
  os << "  --version, -v    Show lexer and LLVM version\n";
  os << "  --repl           Lex lines read from standard input\n";
  os << "  --print-ir       Dump the token stream of the input\n";
  os << "  run <file>       Lex a file\n";
}

void print_version(llvm::raw_ostream& os) {
  os << "ELi lexer (LLVM " << LLVM_VERSION_STRING << ")\n";
}

void print_options(llvm::raw_ostream& os, const Options& options) {
  os << "repl: " << (options.repl ? "true" : "false") << "\n";
  os << "print-ir: " << (options.print_ir ? "true" : "false") << "\n";
}

void dump_token(llvm::raw_ostream& os, const PositionedToken& tok) {
  os << llvm::format("%4zu:%-4zu ", tok.line, tok.column) << format_token(tok.token) << "\n";
}

void report_lex_error(llvm::raw_ostream& os, const LexError& error) {
  os << "eli: lex error at " << error.line << ":" << error.column << " " << error.message << "\n";
}

int lex_file(const Options& options, llvm::raw_ostream& out, llvm::raw_ostream& err) {
  const std::string& path = options.input_path;
  std::ifstream f(path);
  if (!f) {
    err << "eli: cannot open '" << path << "'\n";
    return 1;
  }
  std::stringstream buf;
  buf << f.rdbuf();
  std::string source = buf.str();
  if (getenv("ELI_DEBUG")) {
    err << "eli: lexing " << path << " (" << source.size() << " bytes)\n";
  }

  auto result = lex_all(source);
  if (options.print_ir) {
    for (const auto& tok : result.tokens) dump_token(out, tok);
  }
  if (!result.ok()) {
    report_lex_error(err, *result.error);
    return 1;
  }
  return 0;
}

int run_repl(std::istream& in, llvm::raw_ostream& out, llvm::raw_ostream& err) {
  std::string line;
  for (;;) {
    out << "eli> ";
    out.flush();
    if (!std::getline(in, line)) break;
    Lexer lexer(line);
    TokenStream tokens(lexer, [&err](const LexError& e) { report_lex_error(err, e); });
    for (const auto& tok : tokens) dump_token(out, tok);
    err.flush();
  }
  out << "\n";
  return 0;
}

int run_driver(const Options& options, std::istream& in, llvm::raw_ostream& out,
               llvm::raw_ostream& err) {
  if (options.show_help) {
    print_usage(out);
    return 0;
  }
  if (options.show_version) {
    print_version(out);
    return 0;
  }
  if (options.repl) return run_repl(in, out, err);
  if (!options.input_path.empty()) return lex_file(options, out, err);

  print_options(out, options);
  print_usage(out);
  return 0;
}

}  // namespace eli
