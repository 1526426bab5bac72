#ifndef CORE_HARNESS_HPP
#define CORE_HARNESS_HPP

#include <string>

#include "core/capability_gate.hpp"

namespace core {

// Names of the files the harness expects in the box.
static const constexpr char* kSolutionFile = "solution.py";
static const constexpr char* kHarnessFile = "harness.py";

// Returns the source of the Python driver that runs inside the sandbox. The
// driver reads a HarnessRequest (JSON) from stdin and forks a worker that
// checks kSolutionFile against the attribute rules of caps, loads it into a
// namespace whose builtins are exactly the ones allowed by caps, calls the
// entry point and sends the result back through a pipe. Only the driver
// writes the HarnessReport (JSON) to stdout, and only if the worker exited
// normally; otherwise it terminates the same way the worker did.
std::string HarnessSource(const Capabilities& caps);

}  // namespace core

#endif
