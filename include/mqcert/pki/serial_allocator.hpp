#pragma once
#include <filesystem>
#include <mutex>
#include <string>

#include <casket/utils/noncopyable.hpp>

#include <mqcert/crypto/pointers.hpp>

namespace mqcert::pki
{

/// @brief Source of certificate serial numbers for the certificates a CA issues.
class SerialAllocator : public casket::NonCopyable
{
public:
    SerialAllocator() = default;

    virtual ~SerialAllocator() = default;

    /// @brief Next serial number for a certificate signed by @p caCert. Always positive.
    virtual crypto::BigNumPtr next(crypto::X509Cert* caCert) = 0;
};

/// @brief 159-bit random serials, no state.
class RandomSerialAllocator final : public SerialAllocator
{
public:
    static constexpr int kSerialBits = 159;

    crypto::BigNumPtr next(crypto::X509Cert* caCert) override;
};

/// @brief Persistent per-CA counters kept as `<CA fingerprint>.srl` hex files in a directory.
///
/// Safe to share between threads and between processes using the same directory.
class FileSerialAllocator final : public SerialAllocator
{
public:
    explicit FileSerialAllocator(std::filesystem::path directory);

    /// @throws ResourceError when the counter cannot be locked, read or written.
    crypto::BigNumPtr next(crypto::X509Cert* caCert) override;

    /// @brief Counter file used for @p caCert.
    std::filesystem::path counterPath(crypto::X509Cert* caCert) const;

private:
    std::filesystem::path directory_;
    std::mutex mutex_;
};

/// @brief Upper-case hex rendering of a serial, as OpenSSL writes it to .srl files.
std::string SerialToHex(const crypto::BigNum* serial);

} // namespace mqcert::pki
