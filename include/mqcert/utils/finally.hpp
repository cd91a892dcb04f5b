#pragma once
#include <functional>

namespace mqcert::utils
{

/// @brief Runs a cleanup action when leaving the scope, on every path.
///
/// The action must not throw: it runs from a destructor.
class Finally final
{
public:
    explicit Finally(std::function<void()> cleanup)
        : cleanup_(std::move(cleanup))
    {
    }

    ~Finally() noexcept
    {
        if (cleanup_)
        {
            cleanup_();
        }
    }

    Finally(const Finally&) = delete;
    Finally& operator=(const Finally&) = delete;

    Finally(Finally&& other) noexcept
        : cleanup_(std::move(other.cleanup_))
    {
        other.cleanup_ = nullptr;
    }

    Finally& operator=(Finally&& other) = delete;

private:
    std::function<void()> cleanup_;
};

} // namespace mqcert::utils
