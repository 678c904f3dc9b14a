//===- emitter.h - Julia procedure emission and optimization ----*- C++ -*-===//
//
// Public API for turning an expression DAG into the text of a Julia
// procedure that evaluates it into a caller-supplied buffer:
//
//   ODE  f!(dy, y, p, t)        dy .= expr(y, p, t)
//   DAE  f!(out, dy, y, p, t)   out .= residual(dy, y, p, t)
//
//===----------------------------------------------------------------------===//

#ifndef DAGC_EMITTER_H
#define DAGC_EMITTER_H

#include "dagc/dag_types.h"
#include "dagc/lowering.h"

#include "llvm/ADT/StringMap.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dagc {

struct EmitOptions {
  std::string function_name = "f";                     // --name
  std::optional<std::vector<std::string>> input_order; // --inputs: order of p
  std::optional<int64_t> differential_count;           // --len-rhs: DAE mode
  bool preallocate = true;                             // caches captured once in a let block
  bool round_constants = true;                         // round to kConstantDecimals places
};

/// Counters describing the last emission, for diagnostics.
struct EmitStats {
  size_t constants = 0;    // entries in the constant table
  size_t instructions = 0; // entries in the variable table
  size_t inlined = 0;      // instructions substituted into their consumers
  size_t caches = 0;       // cache buffers that survived
};

class Emitter {
public:
  /// The DAE rewrite adds residual nodes to `graph`; existing nodes are
  /// never modified.
  Emitter(dag::Graph &graph, EmitOptions options);

  /// Compile `root` into a complete `begin ... end` block.
  /// Throws UnsupportedNodeKind or UnsupportedInput; nothing is returned on
  /// failure.
  std::string emit(dag::NodeId root);

  const EmitStats &stats() const { return stats_; }

private:
  /// Subtract the matching derivative slice from every differential child
  /// of the root. Returns the new root.
  dag::NodeId residualRoot(dag::NodeId root);

  /// Drain the variable queue into body statements.
  std::vector<std::string> generateBody(LoweredTables &tables, dag::NodeId root);

  void emitConcat(const Instruction &instr, const std::string &dest, bool isRoot,
                  std::vector<std::string> &body);
  void emitMatMul(const Instruction &instr, const std::string &dest, bool isRoot,
                  std::vector<std::string> &body);

  /// Substitute `instr` into every later consumer. Returns false if it has
  /// to be materialized instead.
  bool tryInline(const Instruction &instr, std::deque<Instruction> &pending);

  dag::Graph &graph;
  EmitOptions options;
  EmitStats stats_;
  llvm::StringMap<std::string> inputParameters; // buffer -> parameter name
};

/// Convenience wrapper: Emitter(graph, options).emit(root).
std::string emitJuliaFunction(dag::Graph &graph, dag::NodeId root,
                              const EmitOptions &options = EmitOptions());

} // namespace dagc

#endif // DAGC_EMITTER_H
