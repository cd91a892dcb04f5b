#pragma once
#include <string>
#include <string_view>
#include <casket/utils/string.hpp>

namespace mqcert::pki
{

inline std::string Trimmed(std::string_view value)
{
    std::string result(value);
    casket::ltrim(result);
    casket::rtrim(result);
    return result;
}

} // namespace mqcert::pki
