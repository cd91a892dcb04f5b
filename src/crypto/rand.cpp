#include <climits>
#include <vector>
#include <openssl/rand.h>
#include <mqcert/crypto/rand.hpp>
#include <mqcert/crypto/exception.hpp>

namespace mqcert::crypto
{

void Rand::generate(uint8_t* random, const size_t randomSize)
{
    ThrowIfFalse(0 < RAND_bytes(random, randomSize < INT_MAX ? static_cast<int>(randomSize) : INT_MAX));
}

std::string Rand::hex(const size_t size)
{
    static const char kDigits[] = "0123456789abcdef";

    std::vector<uint8_t> buffer(size);
    generate(buffer);

    std::string result;
    result.reserve(size * 2);
    for (auto byte : buffer)
    {
        result.push_back(kDigits[byte >> 4]);
        result.push_back(kDigits[byte & 0x0F]);
    }
    return result;
}

} // namespace mqcert::crypto
