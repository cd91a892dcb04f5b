#pragma once
#include <limits>
#include <string>
#include <string_view>
#include <openssl/bio.h>

#include <mqcert/crypto/pointers.hpp>
#include <mqcert/crypto/exception.hpp>

namespace mqcert::crypto
{

class BioTraits
{
public:
    static inline BioPtr createMemoryBuffer()
    {
        BioPtr result{BIO_new(BIO_s_mem())};
        ThrowIfTrue(result == nullptr);
        return result;
    }

    /// @brief Creates a read-only BIO over @p text. The text must outlive the BIO.
    static inline BioPtr createMemoryReader(std::string_view text)
    {
        constexpr auto limit = static_cast<size_t>(std::numeric_limits<int>::max());
        const auto size = text.size() > limit ? limit : text.size();
        BioPtr bio{BIO_new_mem_buf(text.data(), static_cast<int>(size))};
        ThrowIfTrue(bio == nullptr);
        return bio;
    }

    static inline std::string getMemoryDataAsString(Bio* bio)
    {
        char* data{nullptr};
        auto length = BIO_get_mem_data(bio, &data);
        ThrowIfTrue(length < 0, "invalid memory BIO");
        return data ? std::string(data, static_cast<size_t>(length)) : std::string();
    }
};

} // namespace mqcert::crypto
