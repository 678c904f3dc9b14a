//===- dag_reader.h - Deserialize an exported expression DAG ----*- C++ -*-===//
//
// Reads the expression DAG exported by the symbolic-algebra layer into a
// dag::Document. The document is a map
//
//   { "root": id, "nodes": [node, ...] }
//
// with nodes listed children-first. Node kinds use the externally-tagged
// enum encoding: unit kinds are a bare string ("TimeRef"), kinds with a
// payload are a single-entry map ({"BinaryOp": {"op": "Add"}}).
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dagc/dag_types.h"

#include <cstddef>
#include <cstdint>

namespace dagc {

/// Parse a msgpack-encoded DAG document.
///
/// Throws std::runtime_error on malformed input.
dag::Document parseMsgpackDAG(const uint8_t *data, size_t size);

/// Parse a JSON-encoded DAG document.
///
/// The JSON is converted to msgpack bytes and fed through the msgpack
/// parser, so both encodings accept exactly the same documents.
///
/// Throws std::runtime_error on malformed input.
dag::Document parseJsonDAG(const uint8_t *data, size_t size);

} // namespace dagc
