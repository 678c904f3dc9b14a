//===- lowering.cpp - Expression DAG to ordered instruction tables ---------===//
//
// Post-order walk of the DAG. Constant subtrees are evaluated and rendered
// as literals; every other node becomes one Instruction whose operands are
// literals or the buffer names of its children.
//
//===----------------------------------------------------------------------===//

#include "dagc/lowering.h"
#include "dagc/errors.h"
#include "dagc/julia_syntax.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringExtras.h"

#include <algorithm>
#include <string>
#include <utility>

namespace dagc {

const char *formName(Form form) {
  switch (form) {
  case Form::View:
    return "view";
  case Form::Slice:
    return "slice";
  case Form::Add:
    return "add";
  case Form::Subtract:
    return "subtract";
  case Form::Multiply:
    return "multiply";
  case Form::Divide:
    return "divide";
  case Form::Negate:
    return "negate";
  case Form::Time:
    return "time";
  case Form::MatMul:
    return "matmul";
  case Form::Reduction:
    return "reduction";
  case Form::Power:
    return "power";
  case Form::Call:
    return "call";
  case Form::Unary:
    return "unary";
  case Form::Operator:
    return "operator";
  case Form::Concat:
    return "concat";
  case Form::Param:
    return "param";
  }
  return "unknown";
}

// ============================================================================
// Instruction
// ============================================================================

bool Instruction::references(llvm::StringRef buffer) const {
  if (containsIdentifier(text, buffer))
    return true;
  for (const auto &op : operands)
    if (containsIdentifier(op, buffer))
      return true;
  for (const auto &part : parts)
    if (containsIdentifier(part.ref, buffer))
      return true;
  return false;
}

void Instruction::substitute(llvm::StringRef buffer, llvm::StringRef replacement) {
  replaceIdentifier(text, buffer, replacement);
  for (auto &op : operands)
    replaceIdentifier(op, buffer, replacement);
  for (auto &part : parts)
    replaceIdentifier(part.ref, buffer, replacement);
}

// ============================================================================
// Lowering
// ============================================================================

Lowering::Lowering(const dag::Graph &graph, bool roundConstants)
    : graph(graph), roundConstants(roundConstants) {}

LoweredTables lower(const dag::Graph &graph, dag::NodeId root, bool roundConstants) {
  return Lowering(graph, roundConstants).lower(root);
}

LoweredTables Lowering::lower(dag::NodeId root) {
  visit(root);
  return std::move(tables);
}

void Lowering::visit(dag::NodeId root) {
  // Post-order over an explicit stack; DAG depth is not bounded by the
  // native stack. The flag marks nodes whose children are already queued.
  llvm::SmallVector<std::pair<dag::NodeId, bool>, 64> stack;
  stack.push_back({root, false});

  while (!stack.empty()) {
    auto [id, expanded] = stack.pop_back_val();
    if (tables.isLowered(id))
      continue;

    const dag::Node &node = graph.node(id);
    if (node.value) {
      lowerConstant(node);
      continue;
    }

    if (!expanded) {
      stack.push_back({id, true});
      // reversed, so the first child is lowered first
      for (auto it = node.children.rbegin(); it != node.children.rend(); ++it)
        if (!tables.isLowered(*it))
          stack.push_back({*it, false});
      continue;
    }

    std::vector<std::string> refs;
    refs.reserve(node.children.size());
    for (dag::NodeId child : node.children)
      refs.push_back(reference(child));

    Instruction instr = render(node, refs);
    instr.id = id;
    tables.variables.push_back(std::move(instr));
    tables.variableIds.insert(id);
    tables.sizes[id] = node.rows();
  }
}

// ── Constants ───────────────────────────────────────────────────────────────

void Lowering::lowerConstant(const dag::Node &node) {
  auto round = [&](double v) { return roundConstants ? roundConstant(v) : v; };

  LoweredConstant lowered;
  int64_t size = node.rows();

  if (auto *scalar = std::get_if<dag::ScalarValue>(&*node.value)) {
    lowered.kind = ConstantKind::Number;
    lowered.text = formatNumber(round(scalar->value));
    size = 1;
  } else if (auto *sparse = std::get_if<dag::SparseValue>(&*node.value)) {
    // Explicit zeros (also those created by rounding) are not stored.
    std::vector<int64_t> rows, cols;
    std::vector<double> data;
    for (const auto &e : sparse->entries) {
      double v = round(e.value);
      if (v == 0.0)
        continue;
      rows.push_back(e.row + 1);
      cols.push_back(e.col + 1);
      data.push_back(v);
    }
    lowered.kind = ConstantKind::Sparse;
    lowered.text = "sparse(" + formatIndexVector(rows) + ", " + formatIndexVector(cols) + ", " +
                   formatVector(data) + ", " + std::to_string(sparse->nrows) + ", " +
                   std::to_string(sparse->ncols) + ")";
  } else {
    const auto &dense = std::get<dag::DenseValue>(*node.value);
    if (static_cast<int64_t>(dense.data.size()) != dense.rows * dense.cols)
      throw UnsupportedInput("constant node " + std::to_string(node.id) + " has " +
                             std::to_string(dense.data.size()) + " values for a " +
                             std::to_string(dense.rows) + "x" + std::to_string(dense.cols) +
                             " array");
    if (dense.rows == 1 && dense.cols == 1) {
      lowered.kind = ConstantKind::Element;
      lowered.text = formatNumber(round(dense.data.front()));
      size = 1;
    } else if (dense.cols == 1) {
      std::vector<double> flat;
      flat.reserve(dense.data.size());
      for (double v : dense.data)
        flat.push_back(round(v));
      lowered.kind = ConstantKind::Vector;
      lowered.text = formatVector(flat);
    } else {
      std::string text = "[";
      for (int64_t r = 0; r < dense.rows; ++r) {
        if (r)
          text += "; ";
        for (int64_t c = 0; c < dense.cols; ++c) {
          if (c)
            text += ' ';
          text += formatNumber(round(dense.at(r, c)));
        }
      }
      lowered.kind = ConstantKind::Matrix;
      lowered.text = text + "]";
    }
  }

  tables.constants[node.id] = std::move(lowered);
  tables.sizes[node.id] = size;
}

std::string Lowering::reference(dag::NodeId child) const {
  auto it = tables.constants.find(child);
  if (it != tables.constants.end()) {
    if (it->second.kind == ConstantKind::Number) {
      // -2.0 .^ x parses as -(2.0 .^ x)
      const std::string &text = it->second.text;
      return text.starts_with("-") ? "(" + text + ")" : text;
    }
    return bufferName(child, "const");
  }
  return bufferName(child, "cache");
}

// ── Rendering ───────────────────────────────────────────────────────────────

Instruction Lowering::render(const dag::Node &node, const std::vector<std::string> &refs) {
  struct Visitor {
    Lowering &self;
    const dag::Node &node;
    const std::vector<std::string> &refs;

    Instruction operator()(const dag::NodeConstant &) {
      // Constant nodes always carry a value and never reach rendering.
      throw UnsupportedInput("constant node " + std::to_string(node.id) + " has no value");
    }
    Instruction operator()(const dag::NodeBinary &bin) { return self.renderBinary(bin, refs); }
    Instruction operator()(const dag::NodeUnary &un) { return self.renderUnary(un, refs); }
    Instruction operator()(const dag::NodeFunction &fn) {
      Instruction instr;
      instr.form = (fn.name == "minimum" || fn.name == "maximum") ? Form::Reduction : Form::Call;
      instr.text = fn.name + "(" + llvm::join(refs, ", ") + ")";
      return instr;
    }
    Instruction operator()(const dag::NodeConcatenation &) {
      return self.renderConcatenation(node, refs);
    }
    Instruction operator()(const dag::NodeDomainConcatenation &concat) {
      return self.renderDomainConcatenation(node, concat, refs);
    }
    Instruction operator()(const dag::NodeStateVector &sv) { return self.renderStateVector(sv); }
    Instruction operator()(const dag::NodeTime &) {
      Instruction instr;
      instr.form = Form::Time;
      instr.text = "t";
      return instr;
    }
    Instruction operator()(const dag::NodeInputParameter &param) {
      Instruction instr;
      instr.form = Form::Param;
      instr.text = "inputs['" + param.name + "']";
      instr.param = param.name;
      return instr;
    }
    Instruction operator()(const dag::NodeOpaque &opaque) {
      throw UnsupportedNodeKind(opaque.kind);
    }
  };

  return std::visit(Visitor{*this, node, refs}, node.kind);
}

static void requireOperands(const std::vector<std::string> &refs, size_t n, const char *what) {
  if (refs.size() != n)
    throw UnsupportedInput(std::string(what) + " expects " + std::to_string(n) +
                           " operands, got " + std::to_string(refs.size()));
}

Instruction Lowering::renderBinary(const dag::NodeBinary &bin,
                                   const std::vector<std::string> &refs) {
  requireOperands(refs, 2, "binary operator");
  const std::string &lhs = refs[0];
  const std::string &rhs = refs[1];

  Instruction instr;
  auto infix = [&](Form form, llvm::StringRef symbol) {
    instr.form = form;
    instr.text = lhs + " " + symbol.str() + " " + rhs;
  };

  switch (bin.op) {
  case dag::BinaryOp::Add:
    infix(Form::Add, "+");
    break;
  case dag::BinaryOp::Subtract:
    infix(Form::Subtract, "-");
    break;
  case dag::BinaryOp::Multiply:
  case dag::BinaryOp::Inner:
    infix(Form::Multiply, "*");
    break;
  case dag::BinaryOp::Divide:
    infix(Form::Divide, "/");
    break;
  case dag::BinaryOp::MatrixMultiply:
    instr.form = Form::MatMul;
    instr.operands = {lhs, rhs};
    break;
  case dag::BinaryOp::Minimum:
    instr.form = Form::Reduction;
    instr.text = "min(" + lhs + ", " + rhs + ")";
    break;
  case dag::BinaryOp::Maximum:
    instr.form = Form::Reduction;
    instr.text = "max(" + lhs + ", " + rhs + ")";
    break;
  case dag::BinaryOp::Power:
    infix(Form::Power, ".^");
    break;
  case dag::BinaryOp::Named:
    if (bin.symbol.empty())
      throw UnsupportedInput("named binary operator without a symbol");
    infix(Form::Operator, bin.symbol);
    break;
  }
  return instr;
}

/// Julia identifiers (abs, sign, ...) are applied as calls; symbolic
/// operators (!, ...) are prefixed.
static bool isIdentifierName(llvm::StringRef name) {
  if (name.empty() || !(llvm::isAlpha(name.front()) || name.front() == '_'))
    return false;
  return llvm::all_of(name, [](char c) { return llvm::isAlnum(c) || c == '_'; });
}

Instruction Lowering::renderUnary(const dag::NodeUnary &un, const std::vector<std::string> &refs) {
  requireOperands(refs, 1, "unary operator");
  const std::string &child = refs[0];

  Instruction instr;
  switch (un.op) {
  case dag::UnaryOp::Negate:
    instr.form = Form::Negate;
    instr.text = "-" + child;
    break;
  case dag::UnaryOp::Index:
    if (un.slice.start < 0 || un.slice.stop <= un.slice.start)
      throw UnsupportedInput("empty or negative index slice [" + std::to_string(un.slice.start) +
                             ", " + std::to_string(un.slice.stop) + ")");
    // [start, stop) becomes the inclusive 1-based range start+1:stop
    instr.form = Form::Slice;
    instr.text =
        child + "[" + std::to_string(un.slice.start + 1) + ":" + std::to_string(un.slice.stop) + "]";
    break;
  case dag::UnaryOp::Named:
    if (un.symbol.empty())
      throw UnsupportedInput("named unary operator without a symbol");
    if (isIdentifierName(un.symbol)) {
      instr.form = Form::Call;
      instr.text = un.symbol + "(" + child + ")";
    } else {
      instr.form = Form::Unary;
      instr.text = un.symbol + child;
    }
    break;
  }
  return instr;
}

Instruction Lowering::renderConcatenation(const dag::Node &node,
                                          const std::vector<std::string> &refs) {
  Instruction instr;
  instr.form = Form::Concat;
  for (size_t i = 0; i < refs.size(); ++i)
    instr.parts.push_back({tables.sizes.lookup(node.children[i]), refs[i]});
  return instr;
}

Instruction Lowering::renderDomainConcatenation(const dag::Node &node,
                                                const dag::NodeDomainConcatenation &concat,
                                                const std::vector<std::string> &refs) {
  if (concat.secondaryPoints <= 1)
    return renderConcatenation(node, refs);

  if (concat.childrenSlices.size() != refs.size())
    throw UnsupportedInput("domain concatenation " + std::to_string(node.id) + " has " +
                           std::to_string(refs.size()) + " children but slice metadata for " +
                           std::to_string(concat.childrenSlices.size()));

  Instruction instr;
  instr.form = Form::Concat;
  for (int64_t rep = 0; rep < concat.secondaryPoints; ++rep) {
    std::vector<std::pair<int64_t, ConcatPart>> ordered;
    for (size_t k = 0; k < refs.size(); ++k) {
      for (const auto &sub : concat.childrenSlices[k]) {
        auto it = concat.slices.find(sub.domain);
        if (it == concat.slices.end() || static_cast<int64_t>(it->second.size()) <= rep ||
            static_cast<int64_t>(sub.slices.size()) <= rep)
          throw UnsupportedInput("domain concatenation " + std::to_string(node.id) +
                                 " has no slice for subdomain '" + sub.domain +
                                 "' at repetition " + std::to_string(rep));
        const dag::Slice &local = sub.slices[rep];
        ConcatPart part;
        part.size = local.stop - local.start;
        part.ref = "@view " + refs[k] + "[" + std::to_string(local.start + 1) + ":" +
                   std::to_string(local.stop) + "]";
        ordered.emplace_back(it->second[rep].start, std::move(part));
      }
    }
    // Spatial order of the output, independent of child declaration order
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const auto &a, const auto &b) { return a.first < b.first; });
    for (auto &entry : ordered)
      instr.parts.push_back(std::move(entry.second));
  }
  return instr;
}

Instruction Lowering::renderStateVector(const dag::NodeStateVector &sv) {
  const char *name = sv.derivative ? "dy" : "y";
  if (sv.indices.empty())
    throw UnsupportedInput(std::string("empty selection of state vector ") + name);
  for (size_t i = 1; i < sv.indices.size(); ++i) {
    if (sv.indices[i] != sv.indices[0] + static_cast<int64_t>(i))
      throw UnsupportedInput(std::string("non-contiguous selection of state vector ") + name +
                             " at position " + std::to_string(sv.indices[i]));
  }

  Instruction instr;
  instr.form = Form::View;
  int64_t first = sv.indices.front() + 1;
  int64_t last = sv.indices.back() + 1;
  if (sv.indices.size() == 1)
    instr.text = std::string(name) + "[" + std::to_string(first) + "]";
  else
    instr.text = std::string("@view ") + name + "[" + std::to_string(first) + ":" +
                 std::to_string(last) + "]";
  return instr;
}

} // namespace dagc
