/// @file
/// @brief Declaration of error handling functions for cryptography.

#pragma once
#include <system_error>

namespace mqcert::crypto
{

/// @brief Translates an OpenSSL error code to a std::error_code.
/// @param error The packed OpenSSL error code.
/// @return The corresponding std::error_code.
std::error_code TranslateError(unsigned long error);

/// @brief Pops the earliest error from the OpenSSL error queue and drops the rest.
/// @return The error as a std::error_code, or a generic failure if the queue was empty.
std::error_code GetLastError();

} // namespace mqcert::crypto
