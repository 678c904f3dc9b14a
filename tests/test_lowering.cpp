//===- test_lowering.cpp - Tests for DAG lowering --------------------------===//
//
// Verifies that Lowering splits a DAG into constant, variable and size
// tables: shared nodes lowered once, topological order, constant
// classification and rounding, slice and state-vector index conversion,
// domain concatenation ordering and rejection of unsupported input.
//
//===----------------------------------------------------------------------===//

#include "dagc/dag_types.h"
#include "dagc/errors.h"
#include "dagc/julia_syntax.h"
#include "dagc/lowering.h"

#include <cstdio>
#include <string>
#include <vector>

using namespace dagc;

static int tests_run = 0;
static int tests_passed = 0;

#define TEST(name)                                                                                 \
  do {                                                                                             \
    tests_run++;                                                                                   \
    printf("  test %s ... ", #name);                                                               \
  } while (0)

#define PASS()                                                                                     \
  do {                                                                                             \
    tests_passed++;                                                                                \
    printf("ok\n");                                                                                \
  } while (0)

#define FAIL(msg)                                                                                  \
  do {                                                                                             \
    printf("FAILED: %s\n", msg);                                                                   \
  } while (0)

// ---------------------------------------------------------------------------
// Graph building helpers
// ---------------------------------------------------------------------------

static dag::NodeId stateVector(dag::Graph &g, int64_t first, int64_t count,
                               bool derivative = false) {
  dag::NodeStateVector sv;
  sv.derivative = derivative;
  for (int64_t i = 0; i < count; ++i)
    sv.indices.push_back(first + i);
  return g.intern(sv, {}, {count, 1});
}

static dag::NodeId binary(dag::Graph &g, dag::BinaryOp op, dag::NodeId lhs, dag::NodeId rhs,
                          std::vector<int64_t> shape) {
  dag::NodeBinary bin;
  bin.op = op;
  return g.intern(bin, {lhs, rhs}, shape);
}

static dag::NodeId scalar(dag::Graph &g, double v) {
  return g.addConstant(dag::ScalarValue{v});
}

static const Instruction *findInstruction(const LoweredTables &t, dag::NodeId id) {
  for (const auto &instr : t.variables)
    if (instr.id == id)
      return &instr;
  return nullptr;
}

// ============================================================================
// Test: a node shared by two parents is lowered once
// ============================================================================
static void test_shared_node_lowered_once() {
  TEST(shared_node_lowered_once);

  dag::Graph g;
  auto x = stateVector(g, 0, 2);
  auto shared = binary(g, dag::BinaryOp::Add, x, scalar(g, 2.0), {2, 1});
  auto p1 = binary(g, dag::BinaryOp::Multiply, shared, x, {2, 1});
  auto p2 = binary(g, dag::BinaryOp::Divide, shared, scalar(g, 3.0), {2, 1});
  auto root = g.intern(dag::NodeConcatenation{}, {p1, p2}, {4, 1});

  auto t = lower(g, root);

  int sharedCount = 0;
  for (const auto &instr : t.variables)
    if (instr.id == shared)
      ++sharedCount;
  if (sharedCount != 1) {
    FAIL("shared node should have exactly one instruction");
    return;
  }
  if (t.variables.size() != 5) {
    FAIL("expected x, shared, p1, p2 and the concatenation");
    return;
  }
  const Instruction *p1Instr = findInstruction(t, p1);
  if (!p1Instr || p1Instr->text != bufferName(shared, "cache") + " * " + bufferName(x, "cache")) {
    FAIL("p1 should read the shared buffer");
    return;
  }
  PASS();
}

// ============================================================================
// Test: every buffer an instruction reads was produced before it
// ============================================================================
static void test_topological_order() {
  TEST(topological_order);

  dag::Graph g;
  auto x = stateVector(g, 0, 3);
  auto s = g.intern(dag::NodeFunction{"sin"}, {x}, {3, 1});
  auto e = g.intern(dag::NodeFunction{"exp"}, {s}, {3, 1});
  auto sum = binary(g, dag::BinaryOp::Add, e, s, {3, 1});
  auto prod = binary(g, dag::BinaryOp::Multiply, sum, x, {3, 1});
  auto root = g.intern(dag::NodeConcatenation{}, {prod, e}, {6, 1});

  auto t = lower(g, root);

  std::vector<dag::NodeId> order;
  for (const auto &instr : t.variables)
    order.push_back(instr.id);

  for (size_t i = 0; i < order.size(); ++i) {
    const Instruction &instr = t.variables[i];
    for (size_t j = i; j < order.size(); ++j) {
      if (instr.references(bufferName(order[j], "cache"))) {
        FAIL("instruction reads a buffer produced at or after its own position");
        return;
      }
    }
  }
  if (order.back() != root) {
    FAIL("root should be the last instruction");
    return;
  }
  PASS();
}

// ============================================================================
// Test: every node ends in exactly one table and always has a size
// ============================================================================
static void test_tables_partition_nodes() {
  TEST(tables_partition_nodes);

  dag::Graph g;
  auto x = stateVector(g, 0, 3);
  auto v = g.addConstant(dag::DenseValue{3, 1, {1.0, 2.0, 3.0}}, {3, 1});
  auto k = scalar(g, 4.0);
  auto a = binary(g, dag::BinaryOp::Add, x, v, {3, 1});
  auto root = binary(g, dag::BinaryOp::Multiply, a, k, {3, 1});

  auto t = lower(g, root);

  for (dag::NodeId id : {x, v, k, a, root}) {
    bool isConst = t.constants.count(id) != 0;
    bool isVar = t.variableIds.count(id) != 0;
    if (isConst == isVar) {
      FAIL("node must be in exactly one of the constant and variable tables");
      return;
    }
    if (!t.sizes.count(id)) {
      FAIL("node missing from the size table");
      return;
    }
  }
  if (t.sizes.lookup(k) != 1 || t.sizes.lookup(v) != 3 || t.sizes.lookup(root) != 3) {
    FAIL("unexpected sizes");
    return;
  }
  if (t.constants.size() != 2 || t.variables.size() != 3) {
    FAIL("unexpected table sizes");
    return;
  }
  PASS();
}

// ============================================================================
// Test: constant values are classified and rendered as Julia literals
// ============================================================================
static void test_constant_classification() {
  TEST(constant_classification);

  dag::Graph g;
  auto x = stateVector(g, 0, 2);
  auto number = scalar(g, 5.0);
  auto element = g.addConstant(dag::DenseValue{1, 1, {2.5}}, {1, 1});
  auto vec = g.addConstant(dag::DenseValue{2, 1, {1.0, -2.0}}, {2, 1});
  auto mat = g.addConstant(dag::DenseValue{2, 2, {1.0, 2.0, 3.0, 4.0}}, {2, 2});
  dag::SparseValue sp;
  sp.nrows = 2;
  sp.ncols = 2;
  sp.entries = {{0, 1, 0.5}, {1, 0, -1.0}};
  auto sparse = g.addConstant(sp, {2, 2});

  auto a = binary(g, dag::BinaryOp::Add, x, number, {2, 1});
  auto b = binary(g, dag::BinaryOp::Multiply, a, element, {2, 1});
  auto c = binary(g, dag::BinaryOp::Add, b, vec, {2, 1});
  auto d = binary(g, dag::BinaryOp::MatrixMultiply, mat, c, {2, 1});
  auto root = binary(g, dag::BinaryOp::MatrixMultiply, sparse, d, {2, 1});

  auto t = lower(g, root);

  struct Expected {
    dag::NodeId id;
    ConstantKind kind;
    const char *text;
  };
  const Expected expected[] = {
      {number, ConstantKind::Number, "5.0"},
      {element, ConstantKind::Element, "2.5"},
      {vec, ConstantKind::Vector, "[1.0,-2.0]"},
      {mat, ConstantKind::Matrix, "[1.0 2.0; 3.0 4.0]"},
      {sparse, ConstantKind::Sparse, "sparse([1,2], [2,1], [0.5,-1.0], 2, 2)"},
  };
  for (const auto &e : expected) {
    auto it = t.constants.find(e.id);
    if (it == t.constants.end()) {
      FAIL("constant missing from the constant table");
      return;
    }
    if (it->second.kind != e.kind || it->second.text != e.text) {
      printf("[%s] ", it->second.text.c_str());
      FAIL("unexpected constant rendering");
      return;
    }
  }

  // Scalars are referenced by value, other constants by name.
  const Instruction *aInstr = findInstruction(t, a);
  const Instruction *bInstr = findInstruction(t, b);
  if (!aInstr || aInstr->text != bufferName(x, "cache") + " + 5.0") {
    FAIL("scalar constant should be inlined as a literal");
    return;
  }
  if (!bInstr || bInstr->text != bufferName(a, "cache") + " * " + bufferName(element, "const")) {
    FAIL("1x1 constant should be referenced by name");
    return;
  }
  const Instruction *dInstr = findInstruction(t, d);
  if (!dInstr || dInstr->form != Form::MatMul || dInstr->operands.size() != 2 ||
      dInstr->operands[0] != bufferName(mat, "const")) {
    FAIL("matrix multiply should keep its operands");
    return;
  }
  PASS();
}

// ============================================================================
// Test: rounding to 11 decimals, and idempotence on rounded values
// ============================================================================
static void test_constant_rounding() {
  TEST(constant_rounding);

  auto lowerScalar = [](double v, bool rounding) {
    dag::Graph g;
    auto x = stateVector(g, 0, 1);
    auto c = scalar(g, v);
    auto root = binary(g, dag::BinaryOp::Add, x, c, {1, 1});
    return lower(g, root, rounding).constants.find(c)->second.text;
  };

  if (lowerScalar(0.1234567890123456, true) != "0.12345678901") {
    FAIL("value should be rounded to 11 decimals");
    return;
  }
  if (lowerScalar(0.1234567890123456, false) != "0.1234567890123456") {
    FAIL("value should be kept when rounding is off");
    return;
  }
  if (lowerScalar(0.25, true) != lowerScalar(0.25, false)) {
    FAIL("an already rounded value should not change");
    return;
  }
  double once = roundConstant(0.1234567890123456);
  if (roundConstant(once) != once) {
    FAIL("rounding should be idempotent");
    return;
  }
  PASS();
}

// ============================================================================
// Test: half-open slices become inclusive 1-based ranges
// ============================================================================
static void test_index_conversion() {
  TEST(index_conversion);

  dag::Graph g;
  auto x = stateVector(g, 0, 10);
  auto f = g.intern(dag::NodeFunction{"sin"}, {x}, {10, 1});
  dag::NodeUnary index;
  index.op = dag::UnaryOp::Index;
  index.slice = {2, 5};
  auto root = g.intern(index, {f}, {3, 1});

  auto t = lower(g, root);
  const Instruction *instr = findInstruction(t, root);
  if (!instr || instr->form != Form::Slice || instr->text != bufferName(f, "cache") + "[3:5]") {
    FAIL("slice [2, 5) should render as [3:5]");
    return;
  }
  PASS();
}

// ============================================================================
// Test: state vector selections
// ============================================================================
static void test_state_vector_selection() {
  TEST(state_vector_selection);

  dag::Graph g;
  auto single = stateVector(g, 0, 1);
  auto range = stateVector(g, 2, 3);
  auto dot = stateVector(g, 4, 2, /*derivative=*/true);
  auto root = g.intern(dag::NodeConcatenation{}, {single, range, dot}, {6, 1});

  auto t = lower(g, root);
  const Instruction *s = findInstruction(t, single);
  const Instruction *r = findInstruction(t, range);
  const Instruction *d = findInstruction(t, dot);
  if (!s || s->text != "y[1]" || s->form != Form::View) {
    FAIL("single selection should render as a scalar index");
    return;
  }
  if (!r || r->text != "@view y[3:5]") {
    FAIL("contiguous selection should render as a view range");
    return;
  }
  if (!d || d->text != "@view dy[5:6]") {
    FAIL("derivative selection should read dy");
    return;
  }
  const Instruction *cat = findInstruction(t, root);
  if (!cat || cat->parts.size() != 3 || cat->parts[0].size != 1 || cat->parts[1].size != 3 ||
      cat->parts[2].ref != bufferName(dot, "cache")) {
    FAIL("concatenation parts should carry sizes and references");
    return;
  }
  PASS();
}

// ============================================================================
// Test: non-contiguous and empty selections are rejected
// ============================================================================
static void test_non_contiguous_selection_rejected() {
  TEST(non_contiguous_selection_rejected);

  dag::Graph g;
  dag::NodeStateVector sv;
  sv.indices = {0, 1, 3};
  auto gap = g.intern(sv, {}, {3, 1});
  try {
    lower(g, gap);
    FAIL("expected UnsupportedInput");
    return;
  } catch (const UnsupportedInput &) {
  }

  auto empty = g.intern(dag::NodeStateVector{}, {}, {0, 1});
  try {
    lower(g, empty);
    FAIL("expected UnsupportedInput for an empty selection");
    return;
  } catch (const UnsupportedInput &) {
  }
  PASS();
}

// ============================================================================
// Test: kinds without a code generation rule are reported by name
// ============================================================================
static void test_unsupported_kind() {
  TEST(unsupported_kind);

  dag::Graph g;
  auto x = stateVector(g, 0, 2);
  auto opaque = g.intern(dag::NodeOpaque{"SpatialVariable"}, {}, {2, 1});
  auto root = binary(g, dag::BinaryOp::Add, x, opaque, {2, 1});
  try {
    lower(g, root);
  } catch (const UnsupportedNodeKind &e) {
    if (e.kind() != "SpatialVariable") {
      FAIL("error should name the offending kind");
      return;
    }
    PASS();
    return;
  }
  FAIL("expected UnsupportedNodeKind");
}

// ============================================================================
// Test: operator rendering
// ============================================================================
static void test_operator_rendering() {
  TEST(operator_rendering);

  dag::Graph g;
  auto x = stateVector(g, 0, 2);
  auto y = stateVector(g, 2, 2);
  auto mn = binary(g, dag::BinaryOp::Minimum, x, y, {2, 1});
  auto pw = binary(g, dag::BinaryOp::Power, mn, scalar(g, 2.0), {2, 1});
  dag::NodeBinary le;
  le.op = dag::BinaryOp::Named;
  le.symbol = "<=";
  auto cmp = g.intern(le, {pw, x}, {2, 1});
  auto neg = g.intern(dag::NodeUnary{dag::UnaryOp::Negate, "", {}}, {cmp}, {2, 1});
  auto absNode = g.intern(dag::NodeUnary{dag::UnaryOp::Named, "abs", {}}, {neg}, {2, 1});
  auto mx = g.intern(dag::NodeFunction{"maximum"}, {absNode}, {});

  auto t = lower(g, mx);
  auto text = [&](dag::NodeId id) { return findInstruction(t, id)->text; };
  auto cx = bufferName(x, "cache");
  auto cy = bufferName(y, "cache");

  if (text(mn) != "min(" + cx + ", " + cy + ")" || findInstruction(t, mn)->form != Form::Reduction) {
    FAIL("minimum should render as a min call");
    return;
  }
  if (text(pw) != bufferName(mn, "cache") + " .^ 2.0") {
    FAIL("power should use elementwise ^");
    return;
  }
  if (text(cmp) != bufferName(pw, "cache") + " <= " + cx) {
    FAIL("named operator should render infix");
    return;
  }
  if (text(neg) != "-" + bufferName(cmp, "cache")) {
    FAIL("negation should prefix a minus");
    return;
  }
  if (text(absNode) != "abs(" + bufferName(neg, "cache") + ")") {
    FAIL("identifier operators should render as calls");
    return;
  }
  if (findInstruction(t, mx)->form != Form::Reduction) {
    FAIL("maximum() should be a reduction");
    return;
  }
  PASS();
}

// ============================================================================
// Test: domain concatenation orders parts by output position
// ============================================================================
static void test_domain_concatenation_ordering() {
  TEST(domain_concatenation_ordering);

  dag::Graph g;
  auto c0 = g.intern(dag::NodeFunction{"sin"}, {stateVector(g, 0, 10)}, {10, 1});
  auto c1 = g.intern(dag::NodeFunction{"sin"}, {stateVector(g, 10, 10)}, {10, 1});
  auto c2 = g.intern(dag::NodeFunction{"sin"}, {stateVector(g, 20, 10)}, {10, 1});

  dag::NodeDomainConcatenation concat;
  concat.secondaryPoints = 2;
  concat.childrenSlices = {
      {{"a", {{0, 5}, {5, 10}}}},
      {{"b", {{0, 5}, {5, 10}}}},
      {{"c", {{0, 5}, {5, 10}}}},
  };
  // Declared order a, b, c starts at 5, 0, 10 in every repetition.
  concat.slices = {
      {"a", {{5, 10}, {20, 25}}},
      {"b", {{0, 5}, {15, 20}}},
      {"c", {{10, 15}, {25, 30}}},
  };
  auto root = g.intern(concat, {c0, c1, c2}, {30, 1});

  auto t = lower(g, root);
  const Instruction *instr = findInstruction(t, root);
  if (!instr || instr->form != Form::Concat || instr->parts.size() != 6) {
    FAIL("expected six concatenation parts");
    return;
  }
  const dag::NodeId expectedOrder[] = {c1, c0, c2, c1, c0, c2};
  for (size_t i = 0; i < 6; ++i) {
    if (!containsIdentifier(instr->parts[i].ref, bufferName(expectedOrder[i], "cache")) ||
        instr->parts[i].size != 5) {
      FAIL("parts should follow ascending output start");
      return;
    }
  }
  if (instr->parts[0].ref != "@view " + bufferName(c1, "cache") + "[1:5]" ||
      instr->parts[3].ref != "@view " + bufferName(c1, "cache") + "[6:10]") {
    FAIL("parts should view the child slice of their repetition");
    return;
  }
  PASS();
}

// ============================================================================
// Test: a single repetition keeps children whole and in order
// ============================================================================
static void test_domain_concatenation_single_repetition() {
  TEST(domain_concatenation_single_repetition);

  dag::Graph g;
  auto c0 = stateVector(g, 0, 4);
  auto c1 = stateVector(g, 4, 2);
  dag::NodeDomainConcatenation concat;
  concat.secondaryPoints = 1;
  concat.slices = {{"a", {{2, 6}}}, {"b", {{0, 2}}}};
  concat.childrenSlices = {{{"a", {{0, 4}}}}, {{"b", {{0, 2}}}}};
  auto root = g.intern(concat, {c0, c1}, {6, 1});

  auto t = lower(g, root);
  const Instruction *instr = findInstruction(t, root);
  if (!instr || instr->parts.size() != 2 || instr->parts[0].ref != bufferName(c0, "cache") ||
      instr->parts[0].size != 4 || instr->parts[1].size != 2) {
    FAIL("children should be used as-is");
    return;
  }
  PASS();
}

// ============================================================================
// Test: hash-consing gives structurally identical nodes one identity
// ============================================================================
static void test_interning_shares_identity() {
  TEST(interning_shares_identity);

  dag::Graph g;
  auto a = stateVector(g, 0, 2);
  auto b = stateVector(g, 0, 2);
  auto c = stateVector(g, 0, 2, /*derivative=*/true);
  if (a != b) {
    FAIL("identical state vectors should share an identity");
    return;
  }
  if (a == c) {
    FAIL("state and derivative must differ");
    return;
  }
  auto s1 = binary(g, dag::BinaryOp::Add, a, c, {2, 1});
  auto s2 = binary(g, dag::BinaryOp::Add, b, c, {2, 1});
  if (s1 != s2 || g.size() != 3) {
    FAIL("identical sums should share an identity");
    return;
  }
  PASS();
}

// ============================================================================
// Test: buffer names pad to five digits and avoid '-'
// ============================================================================
static void test_buffer_names() {
  TEST(buffer_names);

  if (bufferName(42, "cache") != "cache_00042" || bufferName(-7, "const") != "const_m0007" ||
      bufferName(1234567, "cache") != "cache_1234567") {
    FAIL("unexpected buffer name");
    return;
  }
  std::string text = "cache_00042 + cache_000421";
  replaceIdentifier(text, "cache_00042", "x");
  if (text != "x + cache_000421") {
    FAIL("only whole identifiers should be replaced");
    return;
  }
  if (formatNumber(5.0) != "5.0" || formatNumber(1e-05) != "1e-05" || formatNumber(-0.5) != "-0.5") {
    FAIL("unexpected number literal");
    return;
  }
  PASS();
}

// ============================================================================
// Test: negative scalar literals keep their sign under ^
// ============================================================================
static void test_negative_literal_parenthesized() {
  TEST(negative_literal_parenthesized);

  dag::Graph g;
  auto x = stateVector(g, 0, 1);
  auto base = scalar(g, -2.0);
  auto pw = binary(g, dag::BinaryOp::Power, base, x, {1, 1});
  auto root = binary(g, dag::BinaryOp::Power, pw, scalar(g, -0.5), {1, 1});

  auto t = lower(g, root);
  if (findInstruction(t, pw)->text != "(-2.0) .^ " + bufferName(x, "cache")) {
    FAIL("negative base should be parenthesized");
    return;
  }
  if (findInstruction(t, root)->text != bufferName(pw, "cache") + " .^ (-0.5)") {
    FAIL("negative exponent should be parenthesized");
    return;
  }
  if (t.constants.find(base)->second.text != "-2.0") {
    FAIL("the constant table keeps the bare literal");
    return;
  }
  PASS();
}

// ============================================================================
// Test: very deep chains do not exhaust the native stack
// ============================================================================
static void test_deep_chain() {
  TEST(deep_chain);

  const int depth = 200000;
  dag::Graph g;
  dag::NodeId prev = stateVector(g, 0, 1);
  dag::NodeId first = prev;
  for (int i = 0; i < depth; ++i)
    prev = g.intern(dag::NodeFunction{"sin"}, {prev}, {1, 1});
  dag::NodeId last = prev;

  auto t = lower(g, last);
  if (t.variables.size() != static_cast<size_t>(depth) + 1) {
    FAIL("every link of the chain should be lowered");
    return;
  }
  if (t.variables.front().id != first || t.variables.back().id != last) {
    FAIL("chain should be lowered leaf first");
    return;
  }
  const auto &parent = t.variables[t.variables.size() - 2];
  if (t.variables.back().text != "sin(" + bufferName(parent.id, "cache") + ")") {
    FAIL("each link should read the one below it");
    return;
  }
  PASS();
}

int main() {
  printf("=== dagc Lowering Tests ===\n");

  test_shared_node_lowered_once();
  test_topological_order();
  test_tables_partition_nodes();
  test_constant_classification();
  test_constant_rounding();
  test_index_conversion();
  test_state_vector_selection();
  test_non_contiguous_selection_rejected();
  test_unsupported_kind();
  test_operator_rendering();
  test_domain_concatenation_ordering();
  test_domain_concatenation_single_repetition();
  test_interning_shares_identity();
  test_buffer_names();
  test_negative_literal_parenthesized();
  test_deep_chain();

  printf("\n%d/%d tests passed.\n", tests_passed, tests_run);
  return (tests_passed == tests_run) ? 0 : 1;
}
