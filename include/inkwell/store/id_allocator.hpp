#pragma once

/** \file id_allocator.hpp
 *  \brief Timestamp-based entry id allocation with deterministic collision suffixes.
 */

#include <ctime>
#include <expected>
#include <string>

#include "inkwell/error.hpp"
#include "inkwell/store/log_store.hpp"

namespace inkwell::store {

inline constexpr int kFirstCollisionSuffix = 2;
inline constexpr int kLastCollisionSuffix = 99;

/** \brief Id for an entry created at local time `when`.
 *
 * Returns "YYYY-MM-DD-HH-MM" when no entry of that date uses it, otherwise the smallest unused
 * "-NN" suffix in [02, 99]. Reads the daily log only; no side effects.
 * Errors: allocation_exhausted when every suffix is taken, plus LogStore read errors.
 */
auto allocate_entry_id(const LogStore& log, const std::tm& when)
    -> std::expected<std::string, core::error>;

} // namespace inkwell::store
