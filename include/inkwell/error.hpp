#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling (the CLI maps any non-ok code to exit status 1).
 * - Human-readable message naming the file, field, or id involved, plus the originating component.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace inkwell::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  invalid_argument = 2001,
  not_found = 2002,
  corrupt_log = 3001,
  allocation_exhausted = 4001,
  staging_busy = 4002,
  no_pending_entry = 4003,
  placeholder_unresolved = 4004,
  source_not_found = 5001,
  destination_exists = 5002,
  nothing_to_delete = 6001,
  external_commit_failed = 7001,
  integrity_violation = 8001,
  internal = 9001,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "store.log" */
};

/** \brief Stable lowercase name of an error code, e.g. "staging_busy". */
auto to_string(error_code code) noexcept -> std::string_view;

} // namespace inkwell::core
