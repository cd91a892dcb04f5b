/// @file
/// @brief Exception type for failures inside the cryptographic library.

#pragma once

#include <string>
#include <string_view>
#include <system_error>

#include <mqcert/crypto/error_code.hpp>

namespace mqcert::crypto
{

/// @brief Raised when key generation, encoding, decoding, signing or
/// signature verification fails.
class CryptoError final : public std::system_error
{
public:
    /// @brief Constructor.
    ///
    /// @param[in] ec Error code.
    ///
    explicit CryptoError(std::error_code ec)
        : std::system_error(ec)
    {
    }

    /// @brief Constructor.
    ///
    /// @param[in] ec Error code.
    /// @param[in] what Error message.
    ///
    CryptoError(std::error_code ec, std::string_view what)
        : std::system_error(ec, std::string(what))
    {
    }
};

/// @brief Throws an exception if @p expression is true.
///
/// @param[in] expression Result of the expression to check.
///
inline void ThrowIfTrue(bool expression)
{
    if (expression)
    {
        throw CryptoError(GetLastError());
    }
}

/// @brief Throws an exception if @p expression is true.
///
/// @param[in] expression Result of the expression to check.
/// @param[in] message Additional message.
///
inline void ThrowIfTrue(bool expression, std::string_view message)
{
    if (expression)
    {
        throw CryptoError(GetLastError(), message);
    }
}

/// @brief Throws an exception if @p expression is false.
///
/// @param[in] expression Result of the expression to check.
///
inline void ThrowIfFalse(bool expression)
{
    if (!expression)
    {
        throw CryptoError(GetLastError());
    }
}

/// @brief Throws an exception if @p expression is false.
///
/// @param[in] expression Result of the expression to check.
/// @param[in] message Additional message.
///
inline void ThrowIfFalse(bool expression, std::string_view message)
{
    if (!expression)
    {
        throw CryptoError(GetLastError(), message);
    }
}

} // namespace mqcert::crypto
