#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

#include <casket/log/log_manager.hpp>

#include <mqcert/crypto/rand.hpp>
#include <mqcert/utils/finally.hpp>

#include <mqcert/pki/artifact_writer.hpp>
#include <mqcert/pki/error.hpp>

namespace fs = std::filesystem;

namespace mqcert::pki
{

namespace
{

constexpr std::string_view kScratchPrefix = ".mqcert-";
constexpr std::string_view kBackupDir = "replaced";

void WriteFile(const fs::path& path, const std::string& content, bool secret)
{
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, secret ? 0600 : 0644);
    if (fd == -1)
    {
        throw ResourceError(std::error_code(errno, std::system_category()), "failed to create " + path.string());
    }

    const char* data = content.data();
    size_t left = content.size();
    while (left > 0)
    {
        auto n = ::write(fd, data, left);
        if (n < 0 && errno == EINTR)
        {
            continue;
        }
        if (n < 0)
        {
            auto ec = std::error_code(errno, std::system_category());
            ::close(fd);
            throw ResourceError(ec, "failed to write " + path.string());
        }
        data += n;
        left -= static_cast<size_t>(n);
    }

    int syncErrno = (::fsync(fd) != 0) ? errno : 0;
    int closeErrno = (::close(fd) != 0) ? errno : 0;
    if (syncErrno != 0 || closeErrno != 0)
    {
        throw ResourceError(std::error_code(syncErrno ? syncErrno : closeErrno, std::system_category()),
                            "failed to flush " + path.string());
    }
}

} // namespace

ArtifactWriter::ArtifactWriter(fs::path outDir, bool overwrite)
    : outDir_(std::move(outDir))
    , overwrite_(overwrite)
{
}

std::vector<fs::path> ArtifactWriter::write(const std::vector<Artifact>& artifacts) const
{
    std::vector<fs::path> targets;
    targets.reserve(artifacts.size());

    for (const auto& artifact : artifacts)
    {
        auto target = outDir_ / artifact.fileName;

        std::error_code ec;
        const bool exists = fs::exists(fs::symlink_status(target, ec));
        if (ec)
        {
            throw ResourceError(ec, "failed to access " + target.string());
        }
        if (exists && !overwrite_)
        {
            throw ResourceError(std::make_error_code(std::errc::file_exists),
                                target.string() + " already exists");
        }
        targets.push_back(std::move(target));
    }

    std::error_code ec;
    fs::create_directories(outDir_, ec);
    if (ec)
    {
        throw ResourceError(ec, "failed to create output directory " + outDir_.string());
    }

    const auto scratch = outDir_ / (std::string(kScratchPrefix) + crypto::Rand::hex(8));
    if (!fs::create_directory(scratch, ec))
    {
        throw ResourceError(ec ? ec : std::make_error_code(std::errc::file_exists),
                            "failed to create scratch directory " + scratch.string());
    }

    utils::Finally cleanup([&scratch]() {
        std::error_code removeEc;
        fs::remove_all(scratch, removeEc);
        if (removeEc)
        {
            casket::warning("Failed to remove scratch directory {}: {}", scratch.string(), removeEc.message());
        }
    });

    for (const auto& artifact : artifacts)
    {
        WriteFile(scratch / artifact.fileName, artifact.content, artifact.secret);
    }

    // Targets being replaced are parked in the scratch directory until every rename succeeds.
    const auto backup = scratch / kBackupDir;
    std::vector<bool> replaced(targets.size(), false);
    if (overwrite_)
    {
        fs::create_directory(backup, ec);
        if (ec)
        {
            throw ResourceError(ec, "failed to create backup directory " + backup.string());
        }
    }

    size_t committed = 0;
    auto rollback = [&]() {
        for (size_t i = committed; i-- > 0;)
        {
            std::error_code undoEc;
            fs::rename(targets[i], scratch / artifacts[i].fileName, undoEc);
            if (undoEc)
            {
                casket::warning("Failed to withdraw {}: {}", targets[i].string(), undoEc.message());
            }
        }
        for (size_t i = 0; i < targets.size(); ++i)
        {
            if (!replaced[i])
            {
                continue;
            }
            std::error_code undoEc;
            fs::rename(backup / artifacts[i].fileName, targets[i], undoEc);
            if (undoEc)
            {
                casket::warning("Failed to restore {}: {}", targets[i].string(), undoEc.message());
            }
        }
    };

    for (size_t i = 0; i < targets.size(); ++i)
    {
        if (!overwrite_)
        {
            continue;
        }
        // Directories are never replaced, renaming onto one fails below.
        const auto status = fs::symlink_status(targets[i], ec);
        const bool replaceable = !ec && fs::exists(status) && !fs::is_directory(status);
        if (replaceable)
        {
            fs::rename(targets[i], backup / artifacts[i].fileName, ec);
        }
        if (ec)
        {
            rollback();
            throw ResourceError(ec, "failed to set aside existing " + targets[i].string());
        }
        replaced[i] = replaceable;
    }

    for (; committed < targets.size(); ++committed)
    {
        fs::rename(scratch / artifacts[committed].fileName, targets[committed], ec);
        if (ec)
        {
            rollback();
            throw ResourceError(ec, "failed to move " + artifacts[committed].fileName + " into " + outDir_.string());
        }
    }

    for (const auto& target : targets)
    {
        casket::debug("Wrote {}", target.string());
    }
    return targets;
}

} // namespace mqcert::pki
