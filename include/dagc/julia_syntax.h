//===- julia_syntax.h - Julia literal and identifier helpers ----*- C++ -*-===//
//
// Formatting of numeric literals and buffer names, and identifier-exact
// rewriting of generated Julia text.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "dagc/dag_types.h"

#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <string>
#include <vector>

namespace dagc {

/// Decimal places kept when constants are rounded.
constexpr int kConstantDecimals = 11;

/// Round half-to-even at kConstantDecimals decimal places.
double roundConstant(double value);

/// Shortest literal that reads back as the same double; always contains a
/// '.' or an exponent so Julia parses it as Float64 ("5.0", "1e-05", "Inf").
std::string formatNumber(double value);

/// "[1.0,2.5,3.0]"
std::string formatVector(const std::vector<double> &values);

/// "[1,2,3]"
std::string formatIndexVector(const std::vector<int64_t> &values);

/// Name of the buffer holding a node's value, e.g. cache_00042 or const_m0007.
std::string bufferName(dag::NodeId id, llvm::StringRef prefix);

/// True if `name` occurs in `text` as a whole identifier.
bool containsIdentifier(llvm::StringRef text, llvm::StringRef name);

/// Replace whole identifiers of `text` found in `renames`.
/// Returns the number of replacements.
unsigned renameIdentifiers(std::string &text, const llvm::StringMap<std::string> &renames);

/// Replace whole occurrences of one identifier. Returns true if any matched.
bool replaceIdentifier(std::string &text, llvm::StringRef name, llvm::StringRef replacement);

} // namespace dagc
