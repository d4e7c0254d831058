#pragma once

/**
 * @file from_http.hpp
 * @brief Conversion of HTTP status values into StackError
 */

#include <stackerror/error.hpp>

#include <cstdint>
#include <string>

namespace stackerror::adapters {

/**
 * @brief Canonical rendering of a status, e.g. "404 Not Found"
 *
 * Statuses without a known reason phrase render as
 * "<status> <unknown status code>".
 */
STACKERROR_API std::string format_http_status(uint16_t status);

/**
 * @brief Root chain from an HTTP status value
 *
 * Message is format_http_status(status). Only 4xx/5xx statuses of the
 * HTTP table receive a code.
 */
STACKERROR_API StackError from_http_status(uint16_t status);

}  // namespace stackerror::adapters
