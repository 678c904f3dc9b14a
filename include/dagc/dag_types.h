//===- dag_types.h - Expression DAG arena and node kinds --------*- C++ -*-===//
//
// C++ model of the expression DAG handed over by the symbolic-algebra layer.
//
// Nodes live in an arena (dag::Graph) keyed by their integer identity. Two
// structurally identical subexpressions share one identity, so common
// subexpressions are detected by comparing identities only. Node kinds form a
// closed std::variant; every pass visits it exhaustively.
//
// Nodes that the symbolic layer could evaluate at compile time carry their
// concrete value (scalar, dense array or sparse triple) in Node::value.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace dagc {
namespace dag {

using NodeId = int64_t;

// ── Constant values ───────────────────────────────────────────────────────

struct ScalarValue {
  double value = 0.0;
};

/// Dense array, row-major.
struct DenseValue {
  int64_t rows = 0;
  int64_t cols = 0;
  std::vector<double> data;

  double at(int64_t row, int64_t col) const { return data[row * cols + col]; }
};

/// One stored entry of a sparse matrix (0-based coordinates).
struct SparseEntry {
  int64_t row = 0;
  int64_t col = 0;
  double value = 0.0;
};

struct SparseValue {
  int64_t nrows = 0;
  int64_t ncols = 0;
  std::vector<SparseEntry> entries;
};

using ConstantValue = std::variant<ScalarValue, DenseValue, SparseValue>;

// ── Node kinds ────────────────────────────────────────────────────────────

/// Half-open slice [start, stop).
struct Slice {
  int64_t start = 0;
  int64_t stop = 0;
};

struct NodeConstant {};

enum class BinaryOp {
  Add,
  Subtract,
  Multiply,
  Divide,
  MatrixMultiply,
  Inner,
  Minimum,
  Maximum,
  Power,
  Named, // any other infix operator, spelled by NodeBinary::symbol
};

struct NodeBinary {
  BinaryOp op = BinaryOp::Add;
  std::string symbol; // only for BinaryOp::Named
};

enum class UnaryOp {
  Negate,
  Index,
  Named, // spelled by NodeUnary::symbol
};

struct NodeUnary {
  UnaryOp op = UnaryOp::Negate;
  std::string symbol; // only for UnaryOp::Named
  Slice slice;        // only for UnaryOp::Index
};

struct NodeFunction {
  std::string name; // Julia spelling of the function
};

struct NodeConcatenation {};

/// Slices of one subdomain, one per secondary-dimension repetition.
struct SubdomainSlices {
  std::string domain;
  std::vector<Slice> slices;
};

/// Concatenation that interleaves its children by subdomain.
///
/// `childrenSlices[k]` lists, in declaration order, which parts of child k
/// belong to which subdomain; `slices` gives where each subdomain lands in
/// the concatenated output for every repetition.
struct NodeDomainConcatenation {
  int64_t secondaryPoints = 1;
  std::vector<std::vector<SubdomainSlices>> childrenSlices;
  std::map<std::string, std::vector<Slice>> slices;
};

/// Reference into the state vector `y`, or its time derivative `dy`.
struct NodeStateVector {
  bool derivative = false;
  std::vector<int64_t> indices; // selected positions, 0-based, ascending
};

struct NodeTime {};

struct NodeInputParameter {
  std::string name;
};

/// A node kind the symbolic layer exported but for which no code generation
/// rule exists. Lowering rejects it.
struct NodeOpaque {
  std::string kind;
};

using NodeKind =
    std::variant<NodeConstant, NodeBinary, NodeUnary, NodeFunction, NodeConcatenation,
                 NodeDomainConcatenation, NodeStateVector, NodeTime, NodeInputParameter,
                 NodeOpaque>;

/// Human-readable name of a node kind ("BinaryOp", "TimeRef", ...). For
/// opaque nodes this is the exported kind name.
std::string kindName(const NodeKind &kind);

// ── Node ──────────────────────────────────────────────────────────────────

struct Node {
  NodeId id = 0;
  std::vector<int64_t> shape; // empty for scalars
  std::vector<NodeId> children;
  NodeKind kind;
  std::optional<ConstantValue> value; // set when evaluable at compile time

  bool isScalar() const { return shape.empty(); }

  /// Extent of the first dimension (1 for scalars).
  int64_t rows() const { return shape.empty() ? 1 : shape.front(); }

  /// Total number of entries.
  int64_t size() const {
    int64_t n = 1;
    for (int64_t d : shape)
      n *= d;
    return n;
  }
};

// ── Graph ─────────────────────────────────────────────────────────────────

/// Arena of immutable nodes addressed by identity.
///
/// Nodes must be added children-first. Non-constant nodes are hash-consed:
/// intern() returns the identity of an existing structurally identical node
/// instead of creating a duplicate.
class Graph {
public:
  /// Add a node with a caller-chosen identity.
  /// Throws std::invalid_argument on a duplicate identity or unknown child.
  const Node &insert(Node node);

  /// Add a compile-time constant under a fresh identity.
  NodeId addConstant(ConstantValue value, std::vector<int64_t> shape = {});

  /// Find or create the non-constant node with this structure.
  NodeId intern(NodeKind kind, std::vector<NodeId> children, std::vector<int64_t> shape = {});

  bool contains(NodeId id) const { return nodes.count(id) != 0; }
  const Node &node(NodeId id) const;

  /// Whether the node is fully determined at compile time.
  bool isConstant(NodeId id) const { return node(id).value.has_value(); }

  /// Concrete value of a constant node. Throws std::invalid_argument if the
  /// node depends on run-time state.
  const ConstantValue &evaluate(NodeId id) const;

  size_t size() const { return nodes.size(); }

private:
  void checkChildren(const std::vector<NodeId> &children) const;

  std::unordered_map<NodeId, Node> nodes;
  std::unordered_map<std::string, NodeId> structuralIds;
  NodeId nextId = 0;
};

/// A graph together with the root of the expression to compile.
struct Document {
  Graph graph;
  NodeId root = 0;
};

} // namespace dag
} // namespace dagc
