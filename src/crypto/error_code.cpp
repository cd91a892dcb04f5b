#include <openssl/err.h>
#include <mqcert/crypto/error_code.hpp>
#include <mqcert/crypto/error_category.hpp>

namespace mqcert::crypto
{

std::error_code TranslateError(unsigned long error)
{
#if (OPENSSL_VERSION_NUMBER >= 0x30000000L)
    if (ERR_SYSTEM_ERROR(error))
    {
        return std::error_code{static_cast<int>(ERR_GET_REASON(error)), std::system_category()};
    }
#endif // (OPENSSL_VERSION_NUMBER >= 0x30000000L)

    return std::error_code{static_cast<int>(error), ErrorCategory::getInstance()};
}

std::error_code GetLastError()
{
    const auto err = ::ERR_get_error();
    // Later entries describe the same failure from outer call frames.
    ::ERR_clear_error();
    if (err)
        return TranslateError(err);
    return TranslateError(ERR_R_OPERATION_FAIL);
}

} // namespace mqcert::crypto
