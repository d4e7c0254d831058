#pragma once

/**
 * @file from_io.hpp
 * @brief Conversion of platform I/O failures into StackError
 *
 * The failure's description becomes the root message. Its condition is
 * classified through the I/O subset of ErrorCode; conditions outside that
 * subset produce a chain without a code.
 */

#include <stackerror/error.hpp>

#include <system_error>

namespace stackerror::adapters {

/**
 * @brief Root chain from a std::error_code
 *
 * Message is ec.message(). System category errors are classified through
 * their generic (errno) condition.
 */
STACKERROR_API StackError from_error_code(const std::error_code& ec);

/**
 * @brief Root chain from a std::system_error
 *
 * Message is e.what(), code comes from e.code().
 */
STACKERROR_API StackError from_system_error(const std::system_error& e);

}  // namespace stackerror::adapters
