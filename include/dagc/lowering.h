//===- lowering.h - Expression DAG to ordered instruction tables -*- C++ -*-===//
//
// Lowers an expression DAG into three tables keyed by node identity:
//
//   constants  compile-time values, rendered as Julia literals
//   variables  one instruction per run-time node, in topological order
//   sizes      first-dimension extent of every lowered node
//
// Shared subtrees are lowered once: a node whose identity is already in
// either table is skipped.
//
//===----------------------------------------------------------------------===//

#ifndef DAGC_LOWERING_H
#define DAGC_LOWERING_H

#include "dagc/dag_types.h"

#include "llvm/ADT/DenseSet.h"
#include "llvm/ADT/MapVector.h"
#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace dagc {

// ── Constants ─────────────────────────────────────────────────────────────

enum class ConstantKind {
  Number,  // scalar, referenced by its literal
  Element, // 1x1 array
  Vector,  // dense column vector, flattened
  Matrix,  // any other dense array
  Sparse,  // sparse(rows, cols, values, nrows, ncols)
};

struct LoweredConstant {
  ConstantKind kind = ConstantKind::Number;
  std::string text; // Julia literal
};

// ── Instructions ──────────────────────────────────────────────────────────

/// Shape of an instruction, used by the emitter to pick an assignment rule.
enum class Form {
  View,      // y[i] or @view y[a:b]
  Slice,     // x[a:b]
  Add,
  Subtract,
  Multiply,
  Divide,
  Negate,
  Time,      // t
  MatMul,    // A @ B
  Reduction, // min/max, minimum/maximum
  Power,
  Call,
  Unary,
  Operator,  // other infix operators (comparisons, ...)
  Concat,
  Param,     // input parameter placeholder
};

const char *formName(Form form);

/// One member of a concatenation: `size` entries taken from `ref`.
struct ConcatPart {
  int64_t size = 0;
  std::string ref;
};

struct Instruction {
  dag::NodeId id = 0;
  Form form = Form::Call;
  std::string text;                  // rendered expression (not Concat/MatMul)
  std::vector<std::string> operands; // MatMul: lhs, rhs
  std::vector<ConcatPart> parts;     // Concat
  std::string param;                 // Param: parameter name

  /// Whether `buffer` is read anywhere in this instruction.
  bool references(llvm::StringRef buffer) const;

  /// Replace every read of `buffer` with `replacement`.
  void substitute(llvm::StringRef buffer, llvm::StringRef replacement);
};

// ── Tables ────────────────────────────────────────────────────────────────

struct LoweredTables {
  llvm::MapVector<dag::NodeId, LoweredConstant> constants;
  std::deque<Instruction> variables; // FIFO, topological order
  llvm::MapVector<dag::NodeId, int64_t> sizes;
  llvm::DenseSet<dag::NodeId> variableIds;

  bool isLowered(dag::NodeId id) const {
    return constants.count(id) != 0 || variableIds.count(id) != 0;
  }
};

/// Recursive, memoized lowering of one DAG root.
class Lowering {
public:
  explicit Lowering(const dag::Graph &graph, bool roundConstants = true);

  /// Lower `root` and everything below it. May be called once per instance.
  /// Throws UnsupportedNodeKind or UnsupportedInput.
  LoweredTables lower(dag::NodeId root);

private:
  void visit(dag::NodeId root);
  void lowerConstant(const dag::Node &node);

  /// Literal for a scalar constant child (parenthesized when negative),
  /// else its buffer name.
  std::string reference(dag::NodeId child) const;

  Instruction render(const dag::Node &node, const std::vector<std::string> &refs);
  Instruction renderBinary(const dag::NodeBinary &bin, const std::vector<std::string> &refs);
  Instruction renderUnary(const dag::NodeUnary &un, const std::vector<std::string> &refs);
  Instruction renderConcatenation(const dag::Node &node, const std::vector<std::string> &refs);
  Instruction renderDomainConcatenation(const dag::Node &node,
                                        const dag::NodeDomainConcatenation &concat,
                                        const std::vector<std::string> &refs);
  Instruction renderStateVector(const dag::NodeStateVector &sv);

  const dag::Graph &graph;
  bool roundConstants;
  LoweredTables tables;
};

/// Convenience wrapper: Lowering(graph, roundConstants).lower(root).
LoweredTables lower(const dag::Graph &graph, dag::NodeId root, bool roundConstants = true);

} // namespace dagc

#endif // DAGC_LOWERING_H
