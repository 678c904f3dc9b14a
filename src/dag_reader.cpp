//===- dag_reader.cpp - Deserialize an exported expression DAG -------------===//
//
// Deserializes the expression DAG from msgpack bytes. Structs are maps with
// string keys; node kinds and constant values use the externally-tagged
// representation ({"Variant": payload}, or a bare string for unit variants).
//
//===----------------------------------------------------------------------===//

#include "dagc/dag_reader.h"

#include <msgpack.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace dagc {

// ── Error helper ────────────────────────────────────────────────────────────

[[noreturn]] static void fail(const std::string &msg) {
  throw std::runtime_error("DAG parse error: " + msg);
}

// ── msgpack object helpers ──────────────────────────────────────────────────

/// Get a string from a msgpack object.
static std::string getString(const msgpack::object &obj) {
  if (obj.type != msgpack::type::STR)
    fail("expected string, got type " + std::to_string(obj.type));
  return std::string(obj.via.str.ptr, obj.via.str.size);
}

/// Get integer from msgpack object.
static int64_t getInt(const msgpack::object &obj) {
  if (obj.type == msgpack::type::POSITIVE_INTEGER) {
    if (obj.via.u64 > static_cast<uint64_t>(INT64_MAX))
      fail("unsigned value " + std::to_string(obj.via.u64) + " overflows int64_t");
    return static_cast<int64_t>(obj.via.u64);
  }
  if (obj.type == msgpack::type::NEGATIVE_INTEGER)
    return obj.via.i64;
  fail("expected integer, got type " + std::to_string(obj.type));
}

/// Get float from msgpack object.
static double getFloat(const msgpack::object &obj) {
  if (obj.type == msgpack::type::FLOAT32 || obj.type == msgpack::type::FLOAT64)
    return obj.via.f64;
  if (obj.type == msgpack::type::POSITIVE_INTEGER)
    return static_cast<double>(obj.via.u64);
  if (obj.type == msgpack::type::NEGATIVE_INTEGER)
    return static_cast<double>(obj.via.i64);
  fail("expected float, got type " + std::to_string(obj.type));
}

/// Get bool from msgpack object.
static bool getBool(const msgpack::object &obj) {
  if (obj.type == msgpack::type::BOOLEAN)
    return obj.via.boolean;
  fail("expected bool, got type " + std::to_string(obj.type));
}

/// Check if msgpack object is nil.
static bool isNil(const msgpack::object &obj) {
  return obj.type == msgpack::type::NIL;
}

/// Interpret a msgpack object as a map and find a key.
/// Returns nullptr if not found.
static const msgpack::object *mapGet(const msgpack::object &obj, std::string_view key) {
  if (obj.type != msgpack::type::MAP)
    fail("expected map, got type " + std::to_string(obj.type));
  for (uint32_t i = 0; i < obj.via.map.size; ++i) {
    const auto &kv = obj.via.map.ptr[i];
    if (kv.key.type == msgpack::type::STR &&
        std::string_view(kv.key.via.str.ptr, kv.key.via.str.size) == key)
      return &kv.val;
  }
  return nullptr;
}

/// Interpret a msgpack object as a map and get a required key.
static const msgpack::object &mapReq(const msgpack::object &obj, std::string_view key) {
  const auto *v = mapGet(obj, key);
  if (!v)
    fail("missing required key: " + std::string(key));
  return *v;
}

/// Get an array from a msgpack object.
static const msgpack::object *arrayData(const msgpack::object &obj, uint32_t &size) {
  if (obj.type != msgpack::type::ARRAY)
    fail("expected array, got type " + std::to_string(obj.type));
  size = obj.via.array.size;
  return obj.via.array.ptr;
}

/// Get the variant name from an externally-tagged enum.
/// Returns the variant name and a pointer to the payload.
/// For unit variants (encoded as bare string), payload is nullptr.
static std::pair<std::string, const msgpack::object *> getEnumVariant(const msgpack::object &obj) {
  if (obj.type == msgpack::type::STR)
    return {getString(obj), nullptr};
  if (obj.type == msgpack::type::MAP && obj.via.map.size == 1) {
    const auto &kv = obj.via.map.ptr[0];
    return {getString(kv.key), &kv.val};
  }
  fail("expected enum variant (string or single-entry map), got type " + std::to_string(obj.type));
}

template <typename T, typename ParseFn>
static std::vector<T> parseVec(const msgpack::object &obj, ParseFn parseFn) {
  uint32_t size;
  const auto *arr = arrayData(obj, size);
  std::vector<T> result;
  result.reserve(size);
  for (uint32_t i = 0; i < size; ++i)
    result.push_back(parseFn(arr[i]));
  return result;
}

template <typename T, typename ParseFn>
static std::vector<T> parseOptVec(const msgpack::object *obj, ParseFn parseFn) {
  if (!obj || isNil(*obj))
    return {};
  return parseVec<T>(*obj, parseFn);
}

/// Payload of a variant that requires one.
static const msgpack::object &payloadOf(const std::string &variant, const msgpack::object *payload) {
  if (!payload)
    fail(variant + " requires a payload");
  return *payload;
}

// ── Constant values ─────────────────────────────────────────────────────────

static dag::ConstantValue parseValue(const msgpack::object &obj) {
  if (obj.type != msgpack::type::MAP)
    return dag::ScalarValue{getFloat(obj)};

  auto [variant, payload] = getEnumVariant(obj);
  const auto &body = payloadOf(variant, payload);
  if (variant == "dense") {
    dag::DenseValue dense;
    dense.rows = getInt(mapReq(body, "rows"));
    dense.cols = getInt(mapReq(body, "cols"));
    dense.data = parseVec<double>(mapReq(body, "data"), getFloat);
    if (dense.rows < 0 || dense.cols < 0 ||
        static_cast<int64_t>(dense.data.size()) != dense.rows * dense.cols)
      fail("dense value has " + std::to_string(dense.data.size()) + " entries for shape " +
           std::to_string(dense.rows) + "x" + std::to_string(dense.cols));
    return dense;
  }
  if (variant == "sparse") {
    dag::SparseValue sparse;
    sparse.nrows = getInt(mapReq(body, "nrows"));
    sparse.ncols = getInt(mapReq(body, "ncols"));
    auto rows = parseVec<int64_t>(mapReq(body, "rows"), getInt);
    auto cols = parseVec<int64_t>(mapReq(body, "cols"), getInt);
    auto data = parseVec<double>(mapReq(body, "data"), getFloat);
    if (rows.size() != cols.size() || rows.size() != data.size())
      fail("sparse value has mismatched rows/cols/data lengths");
    for (size_t i = 0; i < rows.size(); ++i) {
      if (rows[i] < 0 || rows[i] >= sparse.nrows || cols[i] < 0 || cols[i] >= sparse.ncols)
        fail("sparse entry (" + std::to_string(rows[i]) + ", " + std::to_string(cols[i]) +
             ") outside " + std::to_string(sparse.nrows) + "x" + std::to_string(sparse.ncols));
      sparse.entries.push_back({rows[i], cols[i], data[i]});
    }
    return sparse;
  }
  fail("unknown constant value variant: " + variant);
}

// ── Node kinds ──────────────────────────────────────────────────────────────

static dag::Slice parseSlice(const msgpack::object &obj) {
  uint32_t size;
  const auto *arr = arrayData(obj, size);
  if (size != 2)
    fail("slice should have 2 elements");
  return {getInt(arr[0]), getInt(arr[1])};
}

static dag::BinaryOp parseBinaryOp(const std::string &name) {
  if (name == "Add")
    return dag::BinaryOp::Add;
  if (name == "Subtract")
    return dag::BinaryOp::Subtract;
  if (name == "Multiply")
    return dag::BinaryOp::Multiply;
  if (name == "Divide")
    return dag::BinaryOp::Divide;
  if (name == "MatrixMultiply")
    return dag::BinaryOp::MatrixMultiply;
  if (name == "Inner")
    return dag::BinaryOp::Inner;
  if (name == "Minimum")
    return dag::BinaryOp::Minimum;
  if (name == "Maximum")
    return dag::BinaryOp::Maximum;
  if (name == "Power")
    return dag::BinaryOp::Power;
  if (name == "Named")
    return dag::BinaryOp::Named;
  fail("unknown binary operator: " + name);
}

static std::string optString(const msgpack::object &obj, std::string_view key) {
  const auto *v = mapGet(obj, key);
  return (v && !isNil(*v)) ? getString(*v) : std::string();
}

static std::vector<dag::SubdomainSlices> parseSubdomainMap(const msgpack::object &obj) {
  if (obj.type != msgpack::type::MAP)
    fail("expected map of subdomain slices, got type " + std::to_string(obj.type));
  std::vector<dag::SubdomainSlices> result;
  for (uint32_t i = 0; i < obj.via.map.size; ++i) {
    const auto &kv = obj.via.map.ptr[i];
    result.push_back({getString(kv.key), parseVec<dag::Slice>(kv.val, parseSlice)});
  }
  return result;
}

static dag::NodeStateVector parseStateVector(const msgpack::object &body) {
  dag::NodeStateVector sv;
  if (const auto *d = mapGet(body, "derivative"); d && !isNil(*d))
    sv.derivative = getBool(*d);

  if (const auto *mask = mapGet(body, "mask"); mask && !isNil(*mask)) {
    auto bits = parseVec<bool>(*mask, getBool);
    for (size_t i = 0; i < bits.size(); ++i)
      if (bits[i])
        sv.indices.push_back(static_cast<int64_t>(i));
  } else {
    sv.indices = parseVec<int64_t>(mapReq(body, "indices"), getInt);
    std::sort(sv.indices.begin(), sv.indices.end());
  }
  return sv;
}

static dag::NodeKind parseKind(const msgpack::object &obj) {
  auto [variant, payload] = getEnumVariant(obj);

  if (variant == "Constant")
    return dag::NodeConstant{};
  if (variant == "Concatenation")
    return dag::NodeConcatenation{};
  if (variant == "TimeRef")
    return dag::NodeTime{};

  if (variant == "BinaryOp") {
    const auto &body = payloadOf(variant, payload);
    dag::NodeBinary bin;
    bin.op = parseBinaryOp(getString(mapReq(body, "op")));
    bin.symbol = optString(body, "symbol");
    return bin;
  }
  if (variant == "UnaryOp") {
    const auto &body = payloadOf(variant, payload);
    dag::NodeUnary un;
    auto op = getString(mapReq(body, "op"));
    if (op == "Negate") {
      un.op = dag::UnaryOp::Negate;
    } else if (op == "Index") {
      un.op = dag::UnaryOp::Index;
      un.slice = parseSlice(mapReq(body, "slice"));
    } else if (op == "Named") {
      un.op = dag::UnaryOp::Named;
    } else {
      fail("unknown unary operator: " + op);
    }
    un.symbol = optString(body, "symbol");
    return un;
  }
  if (variant == "FunctionCall") {
    const auto &body = payloadOf(variant, payload);
    return dag::NodeFunction{getString(mapReq(body, "name"))};
  }
  if (variant == "DomainConcatenation") {
    const auto &body = payloadOf(variant, payload);
    dag::NodeDomainConcatenation concat;
    concat.secondaryPoints = getInt(mapReq(body, "secondary_points"));
    for (auto &sub : parseSubdomainMap(mapReq(body, "slices")))
      concat.slices.emplace(std::move(sub.domain), std::move(sub.slices));
    concat.childrenSlices = parseVec<std::vector<dag::SubdomainSlices>>(
        mapReq(body, "children_slices"), parseSubdomainMap);
    return concat;
  }
  if (variant == "StateVectorRef")
    return parseStateVector(payloadOf(variant, payload));
  if (variant == "InputParameterRef") {
    const auto &body = payloadOf(variant, payload);
    return dag::NodeInputParameter{getString(mapReq(body, "name"))};
  }

  // Exported, but without a code generation rule; lowering reports it.
  return dag::NodeOpaque{variant};
}

static dag::Node parseNode(const msgpack::object &obj) {
  dag::Node node;
  node.id = getInt(mapReq(obj, "id"));
  node.shape = parseOptVec<int64_t>(mapGet(obj, "shape"), getInt);
  node.children = parseOptVec<dag::NodeId>(mapGet(obj, "children"), getInt);
  node.kind = parseKind(mapReq(obj, "kind"));
  if (const auto *v = mapGet(obj, "value"); v && !isNil(*v))
    node.value = parseValue(*v);
  return node;
}

static dag::Document parseDocument(const msgpack::object &obj) {
  dag::Document doc;
  uint32_t count;
  const auto *nodes = arrayData(mapReq(obj, "nodes"), count);
  for (uint32_t i = 0; i < count; ++i) {
    dag::Node node = parseNode(nodes[i]);
    try {
      doc.graph.insert(std::move(node));
    } catch (const std::invalid_argument &e) {
      fail(e.what());
    }
  }
  doc.root = getInt(mapReq(obj, "root"));
  if (!doc.graph.contains(doc.root))
    fail("root node " + std::to_string(doc.root) + " is not defined");
  return doc;
}

// ── Public API ──────────────────────────────────────────────────────────────

dag::Document parseMsgpackDAG(const uint8_t *data, size_t size) {
  msgpack::object_handle oh = msgpack::unpack(reinterpret_cast<const char *>(data), size);
  return parseDocument(oh.get());
}

dag::Document parseJsonDAG(const uint8_t *data, size_t size) {
  // Parse JSON, convert to msgpack bytes, then reuse the msgpack parser.
  auto j = nlohmann::json::parse(data, data + size);
  auto msgpackBytes = nlohmann::json::to_msgpack(j);
  return parseMsgpackDAG(msgpackBytes.data(), msgpackBytes.size());
}

} // namespace dagc
