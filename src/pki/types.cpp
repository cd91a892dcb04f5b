#include <mqcert/pki/types.hpp>

namespace mqcert::pki
{

std::string_view toString(Role role) noexcept
{
    switch (role)
    {
    case Role::Client:
        return "client";
    case Role::Broker:
        return "broker";
    case Role::CA:
        return "ca";
    }
    return "unknown";
}

} // namespace mqcert::pki
