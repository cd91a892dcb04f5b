#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <mqcert/crypto/extension.hpp>
#include <mqcert/crypto/pointers.hpp>
#include <mqcert/pki/types.hpp>

namespace mqcert::pki
{

enum class SanType
{
    DNS,
    IP,
};

std::string_view toString(SanType type) noexcept;

/// @brief Accepted SAN entry with its 1-based position among entries of the same type.
struct IndexedSan
{
    SanType type;
    std::size_t index;
    std::string value;

    /// @brief "DNS.1", "IP.2", ...
    std::string label() const;
};

/// @brief "DNS:broker.local,IP:10.0.0.5" to SAN entries. Entries without a type keep an empty type.
std::vector<SanEntry> ParseSanList(const std::string& text);

/// @brief Normalizes caller SANs: values are trimmed, blank values and unknown types are dropped,
/// indices are assigned per type in input order.
///
/// @throws ValidationError if an IP entry is not an IPv4 or IPv6 literal.
std::vector<IndexedSan> NormalizeSans(const std::vector<SanEntry>& entries);

/// @brief Fixed X.509v3 extension set of a certificate role.
class ExtensionProfile final
{
public:
    static ExtensionProfile client();

    /// @brief SANs are attached only when at least one entry survives normalization.
    static ExtensionProfile broker(const std::vector<SanEntry>& sans);

    static ExtensionProfile ca();

    static ExtensionProfile forRole(Role role, const std::vector<SanEntry>& sans = {});

    const std::vector<crypto::KeyUsageBit>& keyUsage() const noexcept
    {
        return keyUsage_;
    }

    const std::vector<int>& extendedKeyUsage() const noexcept
    {
        return extendedKeyUsage_;
    }

    bool isCA() const noexcept
    {
        return isCA_;
    }

    const std::vector<IndexedSan>& subjectAltNames() const noexcept
    {
        return subjectAltNames_;
    }

    /// @brief Encodes the profile as basicConstraints, keyUsage, extendedKeyUsage and
    /// subjectAltName extensions, skipping the empty ones.
    crypto::CertExtOwningStackPtr toExtensions() const;

private:
    ExtensionProfile() = default;

    std::vector<crypto::KeyUsageBit> keyUsage_;
    std::vector<int> extendedKeyUsage_;
    bool isCA_{false};
    std::vector<IndexedSan> subjectAltNames_;
};

} // namespace mqcert::pki
