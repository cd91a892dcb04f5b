#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <casket/nonstd/span.hpp>

namespace mqcert::crypto
{

class Rand final
{
public:
    static void generate(uint8_t* random, const size_t randomSize);

    static inline void generate(nonstd::span<uint8_t> buffer)
    {
        generate(buffer.data(), buffer.size());
    }

    /// @brief @p size random bytes as lower-case hex.
    static std::string hex(const size_t size);
};

} // namespace mqcert::crypto
