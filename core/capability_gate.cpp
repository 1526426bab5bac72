#include "core/capability_gate.hpp"

#include <kj/debug.h>

namespace core {

namespace {

Capabilities MakeCapabilities() {
  Capabilities caps;
  caps.builtins = {
      // Constants and class machinery.
      "None", "True", "False", "NotImplemented", "Ellipsis", "__build_class__",
      "object", "property", "staticmethod", "classmethod", "super",
      // Numbers and arithmetic.
      "abs", "bool", "complex", "divmod", "float", "int", "pow", "round",
      "bin", "hex", "oct",
      // Strings.
      "ascii", "chr", "format", "ord", "repr", "str", "bytes", "bytearray",
      // Containers and iteration.
      "all", "any", "dict", "enumerate", "filter", "frozenset", "iter", "len",
      "list", "map", "max", "min", "next", "range", "reversed", "set", "slice",
      "sorted", "sum", "tuple", "zip", "callable", "hash", "id", "isinstance",
      "issubclass",
      // Output is captured and discarded.
      "print",
      // Exceptions that solutions commonly raise or catch.
      "ArithmeticError", "AssertionError", "AttributeError", "BaseException",
      "Exception", "IndexError", "KeyError", "LookupError", "NameError",
      "NotImplementedError", "OverflowError", "RecursionError",
      "RuntimeError", "StopIteration", "TypeError", "ValueError",
      "ZeroDivisionError"};
  caps.modules = {"bisect",    "collections", "functools", "heapq",
                  "itertools", "math",        "operator",  "re",
                  "string",    "typing"};
  // They look attributes up, or evaluate annotations, from strings.
  caps.hidden_attributes = {"functools.singledispatch",
                            "functools.singledispatchmethod",
                            "operator.attrgetter",
                            "operator.methodcaller",
                            "string.Formatter",
                            "typing.get_type_hints"};
  // Frames and code objects lead back to the harness.
  caps.denied_attributes = {
      "ag_await", "ag_code",   "ag_frame", "co_code", "co_consts",
      "cr_await", "cr_code",   "cr_frame", "f_back",  "f_builtins",
      "f_code",   "f_globals", "f_locals", "gi_code", "gi_frame",
      "gi_yieldfrom", "tb_frame", "tb_next"};
  caps.public_dunders = {"__init__", "__name__"};
  for (const std::string& name : DeniedBuiltins()) {
    KJ_ASSERT(!caps.IsBuiltinAllowed(name), name);
  }
  return caps;
}

}  // namespace

bool Capabilities::IsModuleAllowed(const std::string& name) const {
  return modules.count(name.substr(0, name.find('.'))) != 0;
}

bool Capabilities::IsAttributeAllowed(const std::string& name) const {
  if (denied_attributes.count(name) != 0) return false;
  if (public_dunders.count(name) != 0) return true;
  if (name.find_first_not_of('_') == std::string::npos) return true;
  return name[0] != '_';
}

const Capabilities& BuildRestrictedEnvironment() {
  static const Capabilities caps = MakeCapabilities();
  return caps;
}

const std::set<std::string>& DeniedBuiltins() {
  static const std::set<std::string> denied = {
      // Files and terminal.
      "open", "input",
      // Dynamic code.
      "eval", "exec", "compile", "__import__",
      // Process control.
      "exit", "quit",
      // Interpreter introspection.
      "globals", "locals", "vars", "dir", "getattr", "setattr", "delattr",
      "hasattr", "type", "breakpoint", "help", "memoryview", "__loader__",
      "__spec__"};
  return denied;
}

}  // namespace core
