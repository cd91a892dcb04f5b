/// @file
/// @brief Errors raised by the issuance layer.

#pragma once
#include <chrono>
#include <exception>
#include <string>
#include <string_view>
#include <system_error>

#include <mqcert/crypto/exception.hpp>

namespace mqcert::pki
{

enum class Error
{
    MissingField = 1,
    InvalidValue,
    MalformedInput,
    UnsupportedRole,
};

class ErrorCategory final : public std::error_category
{
public:
    const char* name() const noexcept override;

    std::string message(int value) const override;

    static ErrorCategory& getInstance();

private:
    ErrorCategory() = default;
    ~ErrorCategory() = default;
};

std::error_code MakeErrorCode(Error e);

/// @brief Missing or malformed caller input. Raised before any cryptographic or storage work.
class ValidationError final : public std::system_error
{
public:
    ValidationError(Error e, std::string_view what)
        : std::system_error(MakeErrorCode(e), std::string(what))
    {
    }
};

/// @brief Failure of staging storage or serial-number state.
class ResourceError final : public std::system_error
{
public:
    ResourceError(std::error_code ec, std::string_view what)
        : std::system_error(ec, std::string(what))
    {
    }
};

using crypto::CryptoError;

/// @brief Kind name reported to the caller: "ValidationError", "CryptoError", "ResourceError" or "InternalError".
std::string_view errorKind(const std::exception& e) noexcept;

/// @brief Throws ValidationError(Error::MissingField) when @p value is empty.
void RequireField(std::string_view value, std::string_view field);

/// @brief Throws ValidationError(Error::InvalidValue) unless @p validityDays is positive and the
/// resulting notAfter, counted from now, stays within year 9999.
void RequireValidityDays(int validityDays);

/// @brief Certificate lifetime of @p validityDays days, computed without int overflow.
inline std::chrono::seconds ValidityPeriod(int validityDays)
{
    return std::chrono::seconds(86400LL * validityDays);
}

} // namespace mqcert::pki
