//===- dagc_main.cpp - dagc: expression DAG → Julia procedure --------------===//
//
// Standalone compiler driver. Reads a msgpack-encoded expression DAG from
// stdin or a file, lowers it, and writes the generated Julia procedure to
// stdout or the -o path.
//
// The driver never executes the generated code.
//
//===----------------------------------------------------------------------===//

#include "dagc/dag_reader.h"
#include "dagc/emitter.h"

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#ifdef _WIN32
#include <fcntl.h>
#include <io.h>
#endif

namespace {

struct Options {
  std::string input_file;
  std::string output_path;
  bool input_json = false;
  bool print_stats = false;
  dagc::EmitOptions emit;
};

void printUsage() {
  std::cerr << "Usage: dagc [options] [input.msgpack]\n"
            << "  (no input file = read msgpack DAG from stdin)\n"
            << "\n"
            << "Options:\n"
            << "  --input-json        Read JSON input instead of msgpack\n"
            << "  --name=<fn>         Name of the generated function (default: f)\n"
            << "  --inputs=<a,b,...>  Order in which input parameters are read from p\n"
            << "  --len-rhs=<n>       DAE mode: the first n entries are differential\n"
            << "  --no-preallocate    Allocate cache buffers at first use\n"
            << "  --no-round          Do not round constants\n"
            << "  --stats             Print lowering statistics to stderr\n"
            << "  -o <path>           Output file path (default: stdout)\n"
            << "  --help              Show this help\n";
}

[[noreturn]] void usageError(const std::string &msg) {
  std::cerr << msg << "\n";
  printUsage();
  std::exit(1);
}

auto parse_args(int argc, char *argv[]) -> Options {
  Options opts;
  std::vector<std::string> args(argv + 1, argv + argc);

  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--help" || args[i] == "-h") {
      printUsage();
      std::exit(0);
    } else if (args[i] == "--input-json") {
      opts.input_json = true;
    } else if (args[i] == "--no-preallocate") {
      opts.emit.preallocate = false;
    } else if (args[i] == "--no-round") {
      opts.emit.round_constants = false;
    } else if (args[i] == "--stats") {
      opts.print_stats = true;
    } else if (args[i].starts_with("--name=")) {
      opts.emit.function_name = args[i].substr(std::string("--name=").size());
      if (opts.emit.function_name.empty())
        usageError("Empty function name");
    } else if (args[i].starts_with("--inputs=")) {
      llvm::SmallVector<llvm::StringRef, 8> names;
      llvm::StringRef(args[i]).drop_front(std::string("--inputs=").size()).split(names, ',', -1,
                                                                                  false);
      std::vector<std::string> order;
      for (auto name : names)
        order.push_back(name.trim().str());
      opts.emit.input_order = std::move(order);
    } else if (args[i].starts_with("--len-rhs=")) {
      long long n = 0;
      if (llvm::StringRef(args[i]).drop_front(std::string("--len-rhs=").size()).getAsInteger(10, n) ||
          n < 0)
        usageError("Invalid --len-rhs value: " + args[i]);
      opts.emit.differential_count = n;
    } else if (args[i] == "-o" && i + 1 < args.size()) {
      opts.output_path = args[++i];
    } else if (args[i][0] != '-') {
      opts.input_file = args[i];
    } else {
      usageError("Unknown option: " + args[i]);
    }
  }

  return opts;
}

} // namespace

auto main(int argc, char *argv[]) -> int {
  auto opts = parse_args(argc, argv);

  // Read input from stdin or file
  std::vector<uint8_t> inputData;
  if (!opts.input_file.empty()) {
    std::ifstream f(opts.input_file, std::ios::binary);
    if (!f) {
      llvm::errs() << "Error: could not open file: " << opts.input_file << "\n";
      return 1;
    }
    inputData = std::vector<uint8_t>(std::istreambuf_iterator<char>(f), {});
  } else {
#ifdef _WIN32
    // Binary msgpack must not go through text-mode translation.
    _setmode(_fileno(stdin), _O_BINARY);
#endif
    inputData = std::vector<uint8_t>(std::istreambuf_iterator<char>(std::cin), {});
  }

  if (inputData.empty()) {
    llvm::errs() << "Error: no input data\n";
    return 1;
  }

  dagc::dag::Document doc;
  std::string julia;
  try {
    doc = opts.input_json ? dagc::parseJsonDAG(inputData.data(), inputData.size())
                          : dagc::parseMsgpackDAG(inputData.data(), inputData.size());

    dagc::Emitter emitter(doc.graph, opts.emit);
    julia = emitter.emit(doc.root);

    if (opts.print_stats) {
      const auto &s = emitter.stats();
      llvm::errs() << "dagc: " << doc.graph.size() << " nodes\n"
                   << "dagc: " << s.constants << " constants\n"
                   << "dagc: " << s.instructions << " instructions, " << s.inlined << " inlined\n"
                   << "dagc: " << s.caches << " cache buffers\n";
    }
  } catch (const std::exception &e) {
    llvm::errs() << "Error: " << e.what() << "\n";
    return 1;
  }

  if (opts.output_path.empty()) {
    llvm::outs() << julia << "\n";
    return 0;
  }

  std::error_code ec;
  llvm::raw_fd_ostream out(opts.output_path, ec, llvm::sys::fs::OF_Text);
  if (ec) {
    llvm::errs() << "Error opening output file " << opts.output_path << ": " << ec.message()
                 << "\n";
    return 1;
  }
  out << julia << "\n";
  return 0;
}
