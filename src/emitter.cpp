//===- emitter.cpp - Julia procedure emission and optimization -------------===//
//
// Consumes the lowered tables and assembles the final procedure text:
//
//   1. constants move into a preamble named tuple (cs.const_0, ...)
//   2. the variable queue is drained in topological order; cheap lines are
//      inlined into their consumers, the rest are assigned to cache buffers
//   3. surviving caches are renamed cs.cache_0, ... and either preallocated
//      in the preamble or declared at first use
//   4. the body is wrapped in a function, and in a let block capturing the
//      preamble when buffers are preallocated
//
//===----------------------------------------------------------------------===//

#include "dagc/emitter.h"
#include "dagc/errors.h"
#include "dagc/julia_syntax.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringExtras.h"

#include <string>
#include <utility>

namespace dagc {

Emitter::Emitter(dag::Graph &graph, EmitOptions options)
    : graph(graph), options(std::move(options)) {}

std::string emitJuliaFunction(dag::Graph &graph, dag::NodeId root, const EmitOptions &options) {
  return Emitter(graph, options).emit(root);
}

// ── Helpers ─────────────────────────────────────────────────────────────────

/// Forms cheap enough to be recomputed wherever they are used.
static bool isInlineable(Form form) {
  switch (form) {
  case Form::View:
  case Form::Slice:
  case Form::Add:
  case Form::Subtract:
  case Form::Multiply:
  case Form::Divide:
  case Form::Negate:
  case Form::Time:
    return true;
  default:
    return false;
  }
}

/// Consumers that need their operands in a buffer: mul! cannot take a
/// broadcast expression and min/max must not be fused into a broadcast.
static bool needsMaterializedOperands(Form form) {
  return form == Form::MatMul || form == Form::Reduction;
}

/// Text that stays a single operand without parentheses (t, y[2], x[3:5]).
static bool isAtomic(llvm::StringRef text) {
  if (text.empty() || !(llvm::isAlpha(text.front()) || text.front() == '_'))
    return false;
  return text.find_first_of(" \t") == llvm::StringRef::npos;
}

static std::string materialize(const std::string &dest, const Instruction &instr) {
  if (instr.form == Form::View)
    return dest + " .= " + instr.text;
  return "@. " + dest + " = " + instr.text;
}

/// Without preallocation a cache buffer does not exist before its first
/// assignment, so in-place forms become allocating ones:
///   @. cache_0 = e   ->  cache_0 = @. e
///   cache_0 .= e     ->  cache_0 = e
static void allocateAtFirstUse(std::string &line) {
  const std::string broadcastPrefix = "@. ";
  bool broadcast = line.starts_with(broadcastPrefix);
  size_t nameStart = broadcast ? broadcastPrefix.size() : 0;
  if (line.compare(nameStart, 6, "cache_") != 0)
    return;

  size_t nameEnd = nameStart;
  while (nameEnd < line.size() && (llvm::isAlnum(line[nameEnd]) || line[nameEnd] == '_'))
    ++nameEnd;
  std::string name = line.substr(nameStart, nameEnd - nameStart);

  if (broadcast && line.compare(nameEnd, 3, " = ") == 0)
    line = name + " = @. " + line.substr(nameEnd + 3);
  else if (!broadcast && line.compare(nameEnd, 4, " .= ") == 0)
    line = name + " = " + line.substr(nameEnd + 4);
}

// ── DAE residual ────────────────────────────────────────────────────────────

dag::NodeId Emitter::residualRoot(dag::NodeId root) {
  const int64_t lenRhs = *options.differential_count;

  std::vector<dag::NodeId> children;
  {
    const dag::Node &node = graph.node(root);
    if (!node.value && std::holds_alternative<dag::NodeConcatenation>(node.kind))
      children = node.children;
    else
      children = {root};
  }

  std::vector<dag::NodeId> residuals;
  int64_t end = 0;
  for (dag::NodeId child : children) {
    std::vector<int64_t> shape = graph.node(child).shape;
    int64_t start = end;
    end += graph.node(child).size();
    if (end > lenRhs) {
      // algebraic equation
      residuals.push_back(child);
      continue;
    }

    dag::NodeStateVector dot;
    dot.derivative = true;
    for (int64_t i = start; i < end; ++i)
      dot.indices.push_back(i);
    dag::NodeId dotId = graph.intern(std::move(dot), {}, {end - start, 1});

    dag::NodeBinary minus;
    minus.op = dag::BinaryOp::Subtract;
    residuals.push_back(graph.intern(std::move(minus), {child, dotId}, std::move(shape)));
  }
  return graph.intern(dag::NodeConcatenation{}, std::move(residuals), {end, 1});
}

// ── Body generation ─────────────────────────────────────────────────────────

bool Emitter::tryInline(const Instruction &instr, std::deque<Instruction> &pending) {
  if (!isInlineable(instr.form))
    return false;

  const std::string buffer = bufferName(instr.id, "cache");
  // Views are passed to mul!/min/max as they are; anything else is
  // materialized first.
  if (instr.form != Form::View &&
      llvm::any_of(pending, [&](const Instruction &next) {
        return needsMaterializedOperands(next.form) && next.references(buffer);
      }))
    return false;

  std::string replacement = isAtomic(instr.text) ? instr.text : "(" + instr.text + ")";
  bool found = false;
  for (auto &next : pending) {
    if (next.references(buffer)) {
      next.substitute(buffer, replacement);
      found = true;
    }
  }
  return found;
}

void Emitter::emitConcat(const Instruction &instr, const std::string &dest, bool isRoot,
                         std::vector<std::string> &body) {
  if (options.preallocate || isRoot) {
    int64_t start = 0;
    for (const auto &part : instr.parts) {
      int64_t end = start + part.size;
      body.push_back("@. " + dest + "[" + std::to_string(start + 1) + ":" + std::to_string(end) +
                     "] = " + part.ref);
      start = end;
    }
    return;
  }

  std::vector<std::string> temps;
  for (size_t i = 0; i < instr.parts.size(); ++i) {
    temps.push_back("x" + std::to_string(i + 1));
    body.push_back(temps.back() + " = @. " + instr.parts[i].ref);
  }
  body.push_back(dest + " = vcat(" + llvm::join(temps, ", ") + ")");
}

void Emitter::emitMatMul(const Instruction &instr, const std::string &dest, bool isRoot,
                         std::vector<std::string> &body) {
  if (instr.operands.size() != 2)
    throw UnsupportedInput("matrix multiplication needs two operands");
  const std::string &lhs = instr.operands[0];
  const std::string &rhs = instr.operands[1];
  if (options.preallocate)
    body.push_back("mul!(" + dest + ", " + lhs + ", " + rhs + ")");
  else
    body.push_back(dest + (isRoot ? " .= " : " = ") + lhs + " * " + rhs);
}

std::vector<std::string> Emitter::generateBody(LoweredTables &tables, dag::NodeId root) {
  const std::string out = options.differential_count ? "out" : "dy";
  std::vector<std::string> body;
  auto &pending = tables.variables;

  while (!pending.empty()) {
    Instruction instr = std::move(pending.front());
    pending.pop_front();

    const bool isRoot = instr.id == root;
    const std::string buffer = bufferName(instr.id, "cache");
    const std::string dest = isRoot ? out : buffer;

    switch (instr.form) {
    case Form::Concat:
      emitConcat(instr, dest, isRoot, body);
      break;
    case Form::MatMul:
      emitMatMul(instr, dest, isRoot, body);
      break;
    case Form::Param:
      // Resolved to the parameter name once the body is complete.
      inputParameters[buffer] = instr.param;
      if (isRoot)
        body.push_back(dest + " .= " + buffer);
      break;
    case Form::Reduction:
      body.push_back(dest + " .= " + instr.text);
      break;
    default:
      if (!isRoot && tryInline(instr, pending)) {
        ++stats_.inlined;
        break;
      }
      body.push_back(materialize(dest, instr));
      break;
    }
  }
  return body;
}

// ── Assembly ────────────────────────────────────────────────────────────────

std::string Emitter::emit(dag::NodeId root) {
  stats_ = EmitStats();
  inputParameters.clear();

  const bool dae = options.differential_count.has_value();
  if (dae)
    root = residualRoot(root);

  LoweredTables tables = lower(graph, root, options.round_constants);
  stats_.constants = tables.constants.size();
  stats_.instructions = tables.variables.size();

  // Preamble entries, without the trailing comma.
  std::vector<std::string> preamble;
  llvm::StringMap<std::string> renames;

  unsigned numConsts = 0;
  for (const auto &[id, constant] : tables.constants) {
    if (constant.kind == ConstantKind::Number)
      continue;
    std::string shortName = "const_" + std::to_string(numConsts++);
    preamble.push_back(shortName + " = " + constant.text);
    renames[bufferName(id, "const")] = "cs." + shortName;
  }

  std::vector<std::string> body;
  const std::string out = dae ? "out" : "dy";
  if (graph.isConstant(root)) {
    const LoweredConstant &value = tables.constants.find(root)->second;
    body.push_back(out + " .= " +
                   (value.kind == ConstantKind::Number ? value.text : bufferName(root, "const")));
  } else {
    body = generateBody(tables, root);
  }

  for (auto &line : body)
    renameIdentifiers(line, inputParameters);

  // Caches still read or written after inlining, in lowering order.
  unsigned numCaches = 0;
  for (const auto &[id, size] : tables.sizes) {
    if (id == root || !tables.variableIds.count(id))
      continue;
    std::string name = bufferName(id, "cache");
    if (llvm::none_of(body, [&](const std::string &line) { return containsIdentifier(line, name); }))
      continue;
    std::string shortName = "cache_" + std::to_string(numCaches++);
    if (options.preallocate) {
      preamble.push_back(shortName + " = zeros(" + std::to_string(size) + ")");
      renames[name] = "cs." + shortName;
    } else {
      renames[name] = shortName;
    }
  }
  stats_.caches = numCaches;

  for (auto &line : body) {
    renameIdentifiers(line, renames);
    if (!options.preallocate)
      allocateAtFirstUse(line);
  }

  const bool captured = options.preallocate && !preamble.empty();
  const std::string fnName = options.function_name + (captured ? "_with_consts!" : "!");
  const std::string signature = dae ? "(out, dy, y, p, t)" : "(dy, y, p, t)";

  std::string unpack;
  if (options.input_order && !options.input_order->empty()) {
    const auto &order = *options.input_order;
    if (order.size() == 1)
      unpack = "   " + order.front() + " = p[1]\n";
    else
      unpack = "   " + llvm::join(order, ", ") + " = p\n";
  }

  std::string julia = "begin\n";
  if (!preamble.empty()) {
    if (captured)
      julia += options.function_name + "! = let ";
    julia += "cs = (\n";
    for (const auto &entry : preamble)
      julia += "   " + entry + ",\n";
    julia += ")\n";
  }
  julia += "\nfunction " + fnName + signature + "\n";
  julia += unpack;
  for (const auto &line : body)
    julia += "   " + line + "\n";
  // returning nothing avoids allocating a return value
  julia += "   nothing\nend\n\n";
  if (captured)
    julia += "end\n";
  julia += "end";
  return julia;
}

} // namespace dagc
