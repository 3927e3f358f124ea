#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <optional>

#include "colors.hpp"
#include "lexer.hpp"
#include "parser.hpp"
#include "print_debug.hpp"
#include "repl.hpp"
#include "runner.hpp"

#include <filesystem>

namespace fs = std::filesystem;

// sysexits.h codes
static const int EXIT_USAGE = 64;
static const int EXIT_DATAERR = 65;
static const int EXIT_NOINPUT = 66;

enum class DumpMode {
  NONE,
  TOKENS,
  AST
};

struct Options {
  DumpMode dump = DumpMode::NONE;
  bool color = true;
  bool repl = false;
  std::optional < std::string > inline_source;
  std::string file;
};

static std::optional < std::string > read_file(const fs::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) return std::nullopt;
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

// --tokens / --ast: show what the front end makes of the source, run nothing
static int dump_source(const std::string &source, const std::string &filename, const Options &opts) {
  SourceManager mgr(filename, source);
  Lexer lexer(source, filename, &mgr);
  std::vector < Token > tokens = lexer.tokenize();

  if (opts.dump == DumpMode::TOKENS) {
    print_tokens(tokens, std::cout);
    if (lexer.had_error()) {
      print_diagnostics(lexer.errors(), std::cerr, opts.color);
      return EXIT_DATAERR;
    }
    return 0;
  }

  NodeIdAllocator ids;
  Parser parser(tokens, ids);
  std::unique_ptr < Program > program = parser.parse();

  if (lexer.had_error() || parser.had_error()) {
    print_diagnostics(lexer.errors(), std::cerr, opts.color);
    print_diagnostics(parser.errors(), std::cerr, opts.color);
    return EXIT_DATAERR;
  }
  print_program_debug(*program, std::cout);
  return 0;
}

static int run_source_mode(const std::string &source, const std::string &filename, const Options &opts) {
  if (opts.dump != DumpMode::NONE) return dump_source(source, filename, opts);

  Runner runner(std::cout);
  RunResult result = runner.run_source(source, filename);
  if (!result.ok()) {
    std::cout.flush();
    print_diagnostics(result.diagnostics, std::cerr, opts.color);
  }
  return result.exit_code();
}

// A path without an extension may name a script saved as <path>.ql
static std::optional < fs::path > resolve_script(const std::string &potential) {
  fs::path p(potential);
  if (fs::exists(p)) return p;
  if (!p.has_extension()) {
    fs::path candidate = p;
    candidate += ".ql";
    if (fs::exists(candidate)) return candidate;
  }
  return std::nullopt;
}

int main(int argc, char* argv[]) {
  auto print_usage = []() {
    std::cout << "Usage: quill [options] [file]\n"
    << "Options:\n"
    << "  -c <source>      Run the given source text\n"
    << "  -i               Start REPL (interactive)\n"
    << "  --tokens         Print the token stream instead of running\n"
    << "  --ast            Print the parsed program instead of running\n"
    << "  --no-color       Do not colour diagnostics\n"
    << "  -v, --version    Print version and exit\n"
    << "  -h, --help       Show this help message\n"
    << "\n"
    << "If a filename starts with '-', either use `--` to end options\n"
    << "or prefix the filename with a path (for example `./-weird.ql`):\n"
    << "  quill -- -weird.ql\n";
  };

  Options opts;

  // Simple options parser: scan argv until we hit a non-option or `--`.
  bool seen_double_dash = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (seen_double_dash) {
      // After `--` everything is a filename argument; take first one
      opts.file = arg;
      break;
    }

    if (arg == "--") {
      seen_double_dash = true;
      continue;
    }

    // If it looks like an option (starts with '-') handle/validate it
    if (!arg.empty() && arg[0] == '-') {
      if (arg == "-v" || arg == "--version") {
        std::cout << "quill v" << QUILL_VERSION << std::endl;
        return 0;
      } else if (arg == "-h" || arg == "--help") {
        print_usage();
        return 0;
      } else if (arg == "-i") {
        opts.repl = true;
      } else if (arg == "-c") {
        if (i + 1 >= argc) {
          std::cerr << "quill: option '-c' needs an argument\n";
          return EXIT_USAGE;
        }
        opts.inline_source = std::string(argv[++i]);
      } else if (arg == "--tokens") {
        opts.dump = DumpMode::TOKENS;
      } else if (arg == "--ast") {
        opts.dump = DumpMode::AST;
      } else if (arg == "--no-color") {
        opts.color = false;
      } else {
        std::cerr << "quill: unknown option '" << arg << "'\n";
        std::cerr << "Try 'quill --help' for more information.\n";
        return EXIT_USAGE;
      }
      continue;
    }

    // First non-option argument is treated as filename
    opts.file = arg;
    break;
  }

  opts.color = opts.color && Color::supports_color();

  if (opts.inline_source.has_value()) {
    return run_source_mode(opts.inline_source.value(), "<cmdline>", opts);
  }

  if (opts.repl || opts.file.empty()) {
    return run_repl_mode(opts.color);
  }

  auto script = resolve_script(opts.file);
  if (!script.has_value()) {
    std::cerr << "Error: File not found: " << opts.file << std::endl;
    return EXIT_NOINPUT;
  }

  auto source = read_file(script.value());
  if (!source.has_value()) {
    std::cerr << "Error: Could not open file " << script.value().string() << std::endl;
    return EXIT_NOINPUT;
  }

  return run_source_mode(source.value(), script.value().string(), opts);
}
