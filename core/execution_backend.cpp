#include "core/execution_backend.hpp"

namespace core {

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NONE:
      return "none";
    case ErrorKind::DEFINITION:
      return "definition";
    case ErrorKind::NAME:
      return "name";
    case ErrorKind::TYPE:
      return "type";
    case ErrorKind::ZERO_DIVISION:
      return "zero_division";
    case ErrorKind::RUNTIME:
      return "runtime";
    case ErrorKind::INTERNAL:
      return "internal";
  }
  return "unknown";
}

}  // namespace core
