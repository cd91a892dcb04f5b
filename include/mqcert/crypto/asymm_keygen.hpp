#pragma once
#include <string_view>
#include <mqcert/crypto/pointers.hpp>

namespace mqcert::crypto::akey
{

namespace ec
{

/// @brief Default named curve (NIST P-256).
inline constexpr std::string_view kDefaultGroup = "prime256v1";

/// @brief Generates a fresh key pair on the named curve @p groupName.
///
/// @throws CryptoError if the curve is unknown or generation fails.
KeyPtr generate(std::string_view groupName, LibContext* libctx = nullptr, const char* propq = nullptr);

} // namespace ec

} // namespace mqcert::crypto::akey
