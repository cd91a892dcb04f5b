#include <cerrno>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>
#include <sys/file.h>

#include <casket/log/log_manager.hpp>

#include <mqcert/crypto/cert.hpp>
#include <mqcert/crypto/exception.hpp>
#include <mqcert/crypto/rand.hpp>

#include <mqcert/pki/error.hpp>
#include <mqcert/pki/serial_allocator.hpp>

#include "text_utils.hpp"

namespace fs = std::filesystem;
using namespace mqcert::crypto;

namespace mqcert::pki
{

namespace
{

std::error_code LastSystemError()
{
    return std::error_code(errno, std::system_category());
}

/// Exclusive advisory lock held for the lifetime of the object.
class FileLock final
{
public:
    explicit FileLock(const fs::path& path)
        : path_(path)
    {
        fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
        if (fd_ == -1)
        {
            throw ResourceError(LastSystemError(), "failed to open lock file " + path_.string());
        }

        if (::flock(fd_, LOCK_EX) != 0)
        {
            auto ec = LastSystemError();
            ::close(fd_);
            throw ResourceError(ec, "failed to lock " + path_.string());
        }
    }

    ~FileLock() noexcept
    {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    fs::path path_;
    int fd_{-1};
};

BigNumPtr ReadCounter(const fs::path& path)
{
    BigNumPtr value(BN_new());
    crypto::ThrowIfTrue(value == nullptr);

    std::error_code ec;
    if (!fs::exists(path, ec))
    {
        if (ec)
        {
            throw ResourceError(ec, "failed to access serial file " + path.string());
        }
        BN_zero(value);
        return value;
    }

    std::ifstream in(path);
    if (!in)
    {
        throw ResourceError(std::make_error_code(std::errc::io_error), "failed to read serial file " + path.string());
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    const auto text = Trimmed(buffer.str());

    BIGNUM* parsed = value.get();
    if (text.empty() || BN_hex2bn(&parsed, text.c_str()) != static_cast<int>(text.size()))
    {
        throw ResourceError(std::make_error_code(std::errc::illegal_byte_sequence),
                            "corrupted serial file " + path.string());
    }
    return value;
}

void WriteCounter(const fs::path& path, const std::string& hex)
{
    const auto tmpPath = fs::path(path.string() + "." + Rand::hex(8) + ".tmp");

    int fd = ::open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd == -1)
    {
        throw ResourceError(LastSystemError(), "failed to create " + tmpPath.string());
    }

    const std::string content = hex + "\n";
    const bool written = ::write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size()) &&
                         ::fsync(fd) == 0;
    auto ec = LastSystemError();
    ::close(fd);

    if (!written || ::rename(tmpPath.c_str(), path.c_str()) != 0)
    {
        if (written)
        {
            ec = LastSystemError();
        }
        ::unlink(tmpPath.c_str());
        throw ResourceError(ec, "failed to update serial file " + path.string());
    }
}

} // namespace

std::string SerialToHex(const BigNum* serial)
{
    char* hex = BN_bn2hex(serial);
    crypto::ThrowIfTrue(hex == nullptr);

    std::string result(hex);
    OPENSSL_free(hex);
    return result;
}

BigNumPtr RandomSerialAllocator::next(X509Cert*)
{
    BigNumPtr serial(BN_new());
    crypto::ThrowIfTrue(serial == nullptr);

    do
    {
        crypto::ThrowIfFalse(BN_rand(serial, kSerialBits, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY));
    } while (BN_is_zero(serial));

    return serial;
}

FileSerialAllocator::FileSerialAllocator(fs::path directory)
    : directory_(std::move(directory))
{
}

fs::path FileSerialAllocator::counterPath(X509Cert* caCert) const
{
    return directory_ / (Cert::fingerprint(caCert) + ".srl");
}

BigNumPtr FileSerialAllocator::next(X509Cert* caCert)
{
    const auto path = counterPath(caCert);

    std::lock_guard<std::mutex> guard(mutex_);

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec)
    {
        throw ResourceError(ec, "failed to create serial directory " + directory_.string());
    }

    FileLock lock(fs::path(path.string() + ".lock"));

    auto serial = ReadCounter(path);
    crypto::ThrowIfFalse(BN_add_word(serial, 1));

    const auto hex = SerialToHex(serial);
    WriteCounter(path, hex);

    casket::debug("Allocated serial {} from {}", hex, path.string());
    return serial;
}

} // namespace mqcert::pki
