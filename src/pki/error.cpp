#include <mqcert/pki/error.hpp>

namespace
{

// 9999-12-31T23:59:59Z, the last instant a GeneralizedTime can carry.
constexpr long long kLastEncodableTime = 253402300799LL;

} // namespace

namespace mqcert::pki
{

const char* ErrorCategory::name() const noexcept
{
    return "mqcert";
}

std::string ErrorCategory::message(int value) const
{
    switch (static_cast<Error>(value))
    {
    case Error::MissingField:
        return "missing required field";
    case Error::InvalidValue:
        return "invalid value";
    case Error::MalformedInput:
        return "malformed input";
    case Error::UnsupportedRole:
        return "unsupported certificate role";
    }
    return "unknown error";
}

ErrorCategory& ErrorCategory::getInstance()
{
    static ErrorCategory instance;
    return instance;
}

std::error_code MakeErrorCode(Error e)
{
    return std::error_code(static_cast<int>(e), ErrorCategory::getInstance());
}

std::string_view errorKind(const std::exception& e) noexcept
{
    if (dynamic_cast<const ValidationError*>(&e))
    {
        return "ValidationError";
    }
    if (dynamic_cast<const CryptoError*>(&e))
    {
        return "CryptoError";
    }
    if (dynamic_cast<const ResourceError*>(&e))
    {
        return "ResourceError";
    }
    return "InternalError";
}

void RequireField(std::string_view value, std::string_view field)
{
    if (value.empty())
    {
        throw ValidationError(Error::MissingField, std::string(field) + " is required");
    }
}

void RequireValidityDays(int validityDays)
{
    if (validityDays <= 0)
    {
        throw ValidationError(Error::InvalidValue,
                              "validity days must be positive, got " + std::to_string(validityDays));
    }

    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
    if (now + ValidityPeriod(validityDays).count() > kLastEncodableTime)
    {
        throw ValidationError(Error::InvalidValue,
                              "validity of " + std::to_string(validityDays) + " days ends after year 9999");
    }
}

} // namespace mqcert::pki
