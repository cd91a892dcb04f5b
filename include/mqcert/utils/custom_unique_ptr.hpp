#pragma once
#include <memory>

namespace mqcert::utils
{

template <typename T, void (*f)(T*)> struct StaticFunctionDeleter
{
    void operator()(T* t) const noexcept
    {
        f(t);
    }
};

} // namespace mqcert::utils

/// Declares a unique_ptr alias with an implicit conversion to the raw pointer,
/// so owned OpenSSL objects can be passed straight into the C API.
#define MQCERT_DEFINE_UNIQUE_PTR_WITH_DELETER(alias, object, deleter)                                                  \
    struct alias : public std::unique_ptr<object, deleter>                                                             \
    {                                                                                                                  \
        using unique_ptr::unique_ptr;                                                                                  \
                                                                                                                       \
        operator object*() const                                                                                       \
        {                                                                                                              \
            return this->get();                                                                                        \
        }                                                                                                              \
    }

#define MQCERT_DEFINE_UNIQUE_PTR(alias, object, deleter)                                                               \
    using alias##Deleter = ::mqcert::utils::StaticFunctionDeleter<object, &deleter>;                                   \
    MQCERT_DEFINE_UNIQUE_PTR_WITH_DELETER(alias, object, alias##Deleter)
