#include "inkwell/error.hpp"

namespace inkwell::core {

auto to_string(error_code code) noexcept -> std::string_view {
  switch (code) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::not_found: return "not_found";
    case error_code::corrupt_log: return "corrupt_log";
    case error_code::allocation_exhausted: return "allocation_exhausted";
    case error_code::staging_busy: return "staging_busy";
    case error_code::no_pending_entry: return "no_pending_entry";
    case error_code::placeholder_unresolved: return "placeholder_unresolved";
    case error_code::source_not_found: return "source_not_found";
    case error_code::destination_exists: return "destination_exists";
    case error_code::nothing_to_delete: return "nothing_to_delete";
    case error_code::external_commit_failed: return "external_commit_failed";
    case error_code::integrity_violation: return "integrity_violation";
    case error_code::internal: return "internal";
  }
  return "internal";
}

} // namespace inkwell::core
