#include "catalog/core/types.hpp"

namespace catalog {

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidIdentifier:
      return "invalid_identifier";
    case ErrorKind::NotFound:
      return "not_found";
    case ErrorKind::CorruptData:
      return "corrupt_data";
    case ErrorKind::IOFailure:
      return "io_failure";
  }
  return "io_failure";
}

}  // namespace catalog
