#pragma once
#include <filesystem>
#include <string>
#include <vector>

namespace mqcert::pki
{

/// @brief One PEM file produced by an operation.
struct Artifact
{
    std::string fileName;
    std::string content;
    /// Private key material, written with owner-only permissions.
    bool secret{false};
};

/// @brief Stores a set of artifacts into a directory all at once.
///
/// Files are first written into a uniquely named scratch directory inside the
/// output directory, then renamed into place. If any rename fails, the files
/// already moved are withdrawn and replaced targets are restored, so the output
/// directory holds either the whole set or what it held before. The scratch
/// directory is removed on every path.
class ArtifactWriter final
{
public:
    explicit ArtifactWriter(std::filesystem::path outDir, bool overwrite = false);

    /// @brief Returns the final paths in the order of @p artifacts.
    ///
    /// @throws ResourceError when a target exists and overwriting is off, or on any I/O failure.
    std::vector<std::filesystem::path> write(const std::vector<Artifact>& artifacts) const;

    const std::filesystem::path& outDir() const noexcept
    {
        return outDir_;
    }

private:
    std::filesystem::path outDir_;
    bool overwrite_;
};

} // namespace mqcert::pki
