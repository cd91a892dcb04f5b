#pragma once
#include <string>
#include <system_error>

namespace mqcert::crypto
{

/// @brief Error category for errors reported by the OpenSSL error queue.
class ErrorCategory final : public std::error_category
{
public:
    /// @brief Gets the name of the error category.
    /// @return The name of the error category.
    const char* name() const noexcept override;

    /// @brief Gets the error message corresponding to an error value.
    /// @param value The packed OpenSSL error value.
    /// @return The error message.
    std::string message(int value) const override;

    static ErrorCategory& getInstance();

private:
    ErrorCategory() = default;
    ~ErrorCategory() = default;
};

} // namespace mqcert::crypto
