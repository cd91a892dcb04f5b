#include <openssl/err.h>
#include <mqcert/crypto/error_category.hpp>

namespace mqcert::crypto
{

const char* ErrorCategory::name() const noexcept
{
    return "OpenSSL";
}

std::string ErrorCategory::message(int value) const
{
    const auto packed = static_cast<unsigned long>(value);
    const char* reason = ::ERR_reason_error_string(packed);
    if (reason)
    {
        const char* lib = ::ERR_lib_error_string(packed);
        std::string result(reason);
        if (lib)
        {
            result += " (";
            result += lib;
            result += ")";
        }
        return result;
    }

    return "OpenSSL error";
}

ErrorCategory& ErrorCategory::getInstance()
{
    static ErrorCategory instance;
    return instance;
}

} // namespace mqcert::crypto
