#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy for data errors returned through std::expected.
 *
 * Only the serialization boundary reports errors this way. Domain outcomes are
 * modelled by verdict::failure, and contract violations are thrown.
 */

#include <cstdint>
#include <string>

namespace verdict::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  data_integrity = 3001,
  internal = 9001,
  invalid_argument = 9002,
  out_of_range = 9004,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "verdict.json" */
};

} // namespace verdict::core
