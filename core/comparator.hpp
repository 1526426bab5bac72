#ifndef CORE_COMPARATOR_HPP
#define CORE_COMPARATOR_HPP

#include "core/value.hpp"

namespace core {

struct ComparisonOptions {
  static const constexpr double kDefaultTolerance = 1e-6;

  double absolute_tolerance = kDefaultTolerance;
  double relative_tolerance = kDefaultTolerance;
  // Compare the top-level array as a multiset.
  bool order_independent = false;
};

// Decides whether actual is an acceptable answer when expected is the
// reference one. Numbers match when they are within the absolute or the
// relative tolerance; arrays are compared element by element (or as a multiset
// at the top level, if requested); objects need the same keys with equivalent
// values. null only matches null and booleans never match numbers.
bool Equivalent(const Value& actual, const Value& expected,
                const ComparisonOptions& options = ComparisonOptions());

}  // namespace core

#endif
