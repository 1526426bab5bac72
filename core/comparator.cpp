#include "core/comparator.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <vector>

namespace core {

namespace {

using Reader = capnp::JsonValue::Reader;

bool NumbersMatch(double a, double b, const ComparisonOptions& options) {
  if (a == b) return true;
  if (std::isnan(a) || std::isnan(b)) return false;
  double diff = std::fabs(a - b);
  if (diff <= options.absolute_tolerance) return true;
  return diff <=
         options.relative_tolerance * std::max(std::fabs(a), std::fabs(b));
}

bool Match(Reader actual, Reader expected, const ComparisonOptions& options);

bool ArraysMatch(capnp::List<capnp::JsonValue>::Reader actual,
                 capnp::List<capnp::JsonValue>::Reader expected,
                 const ComparisonOptions& options) {
  if (actual.size() != expected.size()) return false;
  for (unsigned i = 0; i < actual.size(); i++) {
    if (!Match(actual[i], expected[i], options)) return false;
  }
  return true;
}

// Every element of actual must be paired with a distinct equivalent element of
// expected. Tolerances make equivalence non-transitive, so the pairing is
// searched with augmenting paths instead of greedily.
bool MultisetsMatch(capnp::List<capnp::JsonValue>::Reader actual,
                    capnp::List<capnp::JsonValue>::Reader expected,
                    const ComparisonOptions& options) {
  if (actual.size() != expected.size()) return false;
  const size_t n = actual.size();
  std::vector<std::vector<size_t>> edges(n);
  for (size_t i = 0; i < n; i++) {
    for (size_t j = 0; j < n; j++) {
      if (Match(actual[i], expected[j], options)) edges[i].push_back(j);
    }
    if (edges[i].empty()) return false;
  }
  std::vector<int64_t> owner(n, -1);
  std::vector<bool> visited;
  std::function<bool(size_t)> augment = [&](size_t i) {
    for (size_t j : edges[i]) {
      if (visited[j]) continue;
      visited[j] = true;
      if (owner[j] < 0 || augment(static_cast<size_t>(owner[j]))) {
        owner[j] = static_cast<int64_t>(i);
        return true;
      }
    }
    return false;
  };
  for (size_t i = 0; i < n; i++) {
    visited.assign(n, false);
    if (!augment(i)) return false;
  }
  return true;
}

bool ObjectsMatch(capnp::List<capnp::JsonValue::Field>::Reader actual,
                  capnp::List<capnp::JsonValue::Field>::Reader expected,
                  const ComparisonOptions& options) {
  if (actual.size() != expected.size()) return false;
  for (auto field : expected) {
    bool found = false;
    for (auto candidate : actual) {
      if (candidate.getName() != field.getName()) continue;
      if (!Match(candidate.getValue(), field.getValue(), options)) {
        return false;
      }
      found = true;
      break;
    }
    if (!found) return false;
  }
  return true;
}

bool Match(Reader actual, Reader expected, const ComparisonOptions& options) {
  if (actual.which() != expected.which()) return false;
  switch (expected.which()) {
    case capnp::JsonValue::NULL_:
      return true;
    case capnp::JsonValue::BOOLEAN:
      return actual.getBoolean() == expected.getBoolean();
    case capnp::JsonValue::NUMBER:
      return NumbersMatch(actual.getNumber(), expected.getNumber(), options);
    case capnp::JsonValue::STRING:
      return actual.getString() == expected.getString();
    case capnp::JsonValue::ARRAY:
      return ArraysMatch(actual.getArray(), expected.getArray(), options);
    case capnp::JsonValue::OBJECT:
      return ObjectsMatch(actual.getObject(), expected.getObject(), options);
    default:
      return false;
  }
}

}  // namespace

bool Equivalent(const Value& actual, const Value& expected,
                const ComparisonOptions& options) {
  Reader a = actual.Get();
  Reader e = expected.Get();
  if (options.order_independent && a.isArray() && e.isArray()) {
    return MultisetsMatch(a.getArray(), e.getArray(), options);
  }
  return Match(a, e, options);
}

}  // namespace core
