//===- dag_types.cpp - Expression DAG arena --------------------------------===//
//
// Node kind naming, arena insertion and hash-consing for dag::Graph.
//
//===----------------------------------------------------------------------===//

#include "dagc/dag_types.h"

#include "llvm/Support/raw_ostream.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace dagc {
namespace dag {

std::string kindName(const NodeKind &kind) {
  return std::visit(
      [](const auto &k) -> std::string {
        using T = std::decay_t<decltype(k)>;
        if constexpr (std::is_same_v<T, NodeConstant>)
          return "Constant";
        else if constexpr (std::is_same_v<T, NodeBinary>)
          return "BinaryOp";
        else if constexpr (std::is_same_v<T, NodeUnary>)
          return "UnaryOp";
        else if constexpr (std::is_same_v<T, NodeFunction>)
          return "FunctionCall";
        else if constexpr (std::is_same_v<T, NodeConcatenation>)
          return "Concatenation";
        else if constexpr (std::is_same_v<T, NodeDomainConcatenation>)
          return "DomainConcatenation";
        else if constexpr (std::is_same_v<T, NodeStateVector>)
          return "StateVectorRef";
        else if constexpr (std::is_same_v<T, NodeTime>)
          return "TimeRef";
        else if constexpr (std::is_same_v<T, NodeInputParameter>)
          return "InputParameterRef";
        else
          return k.kind;
      },
      kind);
}

// ── Structural keys ─────────────────────────────────────────────────────────

static void printSlice(llvm::raw_ostream &os, const Slice &s) {
  os << s.start << ':' << s.stop << ';';
}

static void printPayload(llvm::raw_ostream &os, const NodeKind &kind) {
  os << kindName(kind) << '{';
  if (auto *bin = std::get_if<NodeBinary>(&kind)) {
    os << static_cast<int>(bin->op) << ',' << bin->symbol;
  } else if (auto *un = std::get_if<NodeUnary>(&kind)) {
    os << static_cast<int>(un->op) << ',' << un->symbol << ',';
    printSlice(os, un->slice);
  } else if (auto *fn = std::get_if<NodeFunction>(&kind)) {
    os << fn->name;
  } else if (auto *dc = std::get_if<NodeDomainConcatenation>(&kind)) {
    os << dc->secondaryPoints << '|';
    for (const auto &child : dc->childrenSlices) {
      for (const auto &sub : child) {
        os << sub.domain << '=';
        for (const auto &s : sub.slices)
          printSlice(os, s);
      }
      os << '|';
    }
    for (const auto &[domain, slices] : dc->slices) {
      os << domain << '=';
      for (const auto &s : slices)
        printSlice(os, s);
    }
  } else if (auto *sv = std::get_if<NodeStateVector>(&kind)) {
    os << (sv->derivative ? "dy" : "y") << ':';
    for (int64_t i : sv->indices)
      os << i << ',';
  } else if (auto *param = std::get_if<NodeInputParameter>(&kind)) {
    os << param->name;
  }
  os << '}';
}

/// Key under which two non-constant nodes compare structurally equal.
static std::string structuralKey(const NodeKind &kind, const std::vector<NodeId> &children,
                                 const std::vector<int64_t> &shape) {
  std::string key;
  llvm::raw_string_ostream os(key);
  printPayload(os, kind);
  os << '(';
  for (NodeId c : children)
    os << c << ',';
  os << ")[";
  for (int64_t d : shape)
    os << d << ',';
  os << ']';
  os.flush();
  return key;
}

// ── Graph ───────────────────────────────────────────────────────────────────

void Graph::checkChildren(const std::vector<NodeId> &children) const {
  for (NodeId c : children) {
    if (!contains(c))
      throw std::invalid_argument("child node " + std::to_string(c) +
                                  " is not part of the graph");
  }
}

const Node &Graph::insert(Node node) {
  if (contains(node.id))
    throw std::invalid_argument("duplicate node identity " + std::to_string(node.id));
  checkChildren(node.children);
  if (!node.value && std::holds_alternative<NodeConstant>(node.kind))
    throw std::invalid_argument("constant node " + std::to_string(node.id) +
                                " carries no value");

  nextId = std::max(nextId, node.id + 1);
  if (!node.value)
    structuralIds.emplace(structuralKey(node.kind, node.children, node.shape), node.id);
  NodeId id = node.id;
  return nodes.emplace(id, std::move(node)).first->second;
}

NodeId Graph::addConstant(ConstantValue value, std::vector<int64_t> shape) {
  Node node;
  node.id = nextId;
  node.shape = std::move(shape);
  node.kind = NodeConstant{};
  node.value = std::move(value);
  return insert(std::move(node)).id;
}

NodeId Graph::intern(NodeKind kind, std::vector<NodeId> children, std::vector<int64_t> shape) {
  if (std::holds_alternative<NodeConstant>(kind))
    throw std::invalid_argument("constants are added with addConstant, not interned");
  checkChildren(children);

  auto key = structuralKey(kind, children, shape);
  auto it = structuralIds.find(key);
  if (it != structuralIds.end())
    return it->second;

  Node node;
  node.id = nextId;
  node.shape = std::move(shape);
  node.children = std::move(children);
  node.kind = std::move(kind);
  return insert(std::move(node)).id;
}

const Node &Graph::node(NodeId id) const {
  auto it = nodes.find(id);
  if (it == nodes.end())
    throw std::invalid_argument("unknown node identity " + std::to_string(id));
  return it->second;
}

const ConstantValue &Graph::evaluate(NodeId id) const {
  const Node &n = node(id);
  if (!n.value)
    throw std::invalid_argument("node " + std::to_string(id) +
                                " depends on run-time state and cannot be evaluated");
  return *n.value;
}

} // namespace dag
} // namespace dagc
