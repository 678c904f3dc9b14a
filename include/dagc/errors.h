//===- errors.h - Compile errors raised by lowering and emission -*- C++ -*-===//
//
// All compile errors derive from CompileError. They are raised synchronously
// and no partial output is produced once one is thrown.
//
//===----------------------------------------------------------------------===//

#ifndef DAGC_ERRORS_H
#define DAGC_ERRORS_H

#include <stdexcept>
#include <string>

namespace dagc {

class CompileError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Lowering met a node kind with no code generation rule.
class UnsupportedNodeKind : public CompileError {
public:
  explicit UnsupportedNodeKind(const std::string &kind)
      : CompileError("Conversion to Julia not implemented for a node of kind '" + kind + "'"),
        kind_(kind) {}

  const std::string &kind() const noexcept { return kind_; }

private:
  std::string kind_;
};

/// The DAG is well-formed but uses a shape the generator cannot express,
/// e.g. a non-contiguous state-vector selection.
class UnsupportedInput : public CompileError {
public:
  explicit UnsupportedInput(const std::string &reason)
      : CompileError("Unsupported input: " + reason), reason_(reason) {}

  const std::string &reason() const noexcept { return reason_; }

private:
  std::string reason_;
};

} // namespace dagc

#endif // DAGC_ERRORS_H
