//===- julia_syntax.cpp - Julia literal and identifier helpers -------------===//

#include "dagc/julia_syntax.h"

#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/raw_ostream.h"

#include <charconv>
#include <cmath>
#include <cstdio>

namespace dagc {

double roundConstant(double value) {
  const double scale = std::pow(10.0, kConstantDecimals);
  double scaled = value * scale;
  if (!std::isfinite(scaled))
    return value;
  // nearbyint honours the default round-to-nearest-even mode.
  return std::nearbyint(scaled) / scale;
}

std::string formatNumber(double value) {
  if (std::isnan(value))
    return "NaN";
  if (std::isinf(value))
    return value < 0 ? "-Inf" : "Inf";

  char buf[64];
  auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
  if (ec != std::errc())
    return std::to_string(value);

  std::string text(buf, end);
  if (text.find_first_of(".e") == std::string::npos)
    text += ".0";
  return text;
}

std::string formatVector(const std::vector<double> &values) {
  std::string text = "[";
  for (size_t i = 0; i < values.size(); ++i) {
    if (i)
      text += ',';
    text += formatNumber(values[i]);
  }
  return text + "]";
}

std::string formatIndexVector(const std::vector<int64_t> &values) {
  std::string text = "[";
  for (size_t i = 0; i < values.size(); ++i) {
    if (i)
      text += ',';
    text += std::to_string(values[i]);
  }
  return text + "]";
}

std::string bufferName(dag::NodeId id, llvm::StringRef prefix) {
  char digits[32];
  std::snprintf(digits, sizeof(digits), "%05lld", static_cast<long long>(id));
  std::string name = prefix.str() + "_" + digits;
  // '-' is not valid inside a Julia identifier
  for (char &c : name)
    if (c == '-')
      c = 'm';
  return name;
}

// ── Identifier scanning ─────────────────────────────────────────────────────

static bool isIdentChar(char c) {
  return llvm::isAlnum(c) || c == '_';
}

/// Calls `fn(start, length)` for every identifier in `text`, left to right.
/// Runs that start with a digit are numeric literals and are skipped.
template <typename Fn> static void forEachIdentifier(llvm::StringRef text, Fn fn) {
  size_t i = 0;
  while (i < text.size()) {
    if (!isIdentChar(text[i])) {
      ++i;
      continue;
    }
    size_t start = i;
    while (i < text.size() && isIdentChar(text[i]))
      ++i;
    if (!llvm::isDigit(text[start]))
      fn(start, i - start);
  }
}

bool containsIdentifier(llvm::StringRef text, llvm::StringRef name) {
  bool found = false;
  forEachIdentifier(text, [&](size_t start, size_t len) {
    if (!found && text.substr(start, len) == name)
      found = true;
  });
  return found;
}

unsigned renameIdentifiers(std::string &text, const llvm::StringMap<std::string> &renames) {
  if (renames.empty())
    return 0;
  std::string result;
  result.reserve(text.size());
  unsigned count = 0;
  size_t copied = 0;
  llvm::StringRef ref(text);
  forEachIdentifier(ref, [&](size_t start, size_t len) {
    auto it = renames.find(ref.substr(start, len));
    if (it == renames.end())
      return;
    result.append(text, copied, start - copied);
    result += it->second;
    copied = start + len;
    ++count;
  });
  if (count == 0)
    return 0;
  result.append(text, copied, std::string::npos);
  text = std::move(result);
  return count;
}

bool replaceIdentifier(std::string &text, llvm::StringRef name, llvm::StringRef replacement) {
  llvm::StringMap<std::string> renames;
  renames[name] = replacement.str();
  return renameIdentifiers(text, renames) != 0;
}

} // namespace dagc
