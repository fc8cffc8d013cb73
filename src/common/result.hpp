#ifndef SURFDOC_RESULT_HPP
#define SURFDOC_RESULT_HPP

#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace surfdoc {

struct Bad_Result_Access : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// @brief The outcome of an operation which either produces a `T` or fails with an `Error`,
/// typically an `IO_Error_Code`.
/// `T` and `Error` shall be distinct so that construction from either is unambiguous.
template <typename T, typename Error>
struct Result {
    static_assert(!std::is_same_v<T, Error>);

private:
    std::variant<T, Error> m_storage;

public:
    [[nodiscard]] Result(T value)
        : m_storage(std::in_place_index<0>, std::move(value))
    {
    }

    [[nodiscard]] Result(Error error)
        : m_storage(std::in_place_index<1>, std::move(error))
    {
    }

    [[nodiscard]] bool has_value() const noexcept
    {
        return m_storage.index() == 0;
    }

    [[nodiscard]] explicit operator bool() const noexcept
    {
        return has_value();
    }

    [[nodiscard]] const T& value() const
    {
        if (const T* const result = std::get_if<0>(&m_storage)) {
            return *result;
        }
        throw Bad_Result_Access { "value() called on a failed result" };
    }

    [[nodiscard]] const T& operator*() const
    {
        return value();
    }

    [[nodiscard]] const T* operator->() const
    {
        return &value();
    }

    [[nodiscard]] const Error& error() const
    {
        if (const Error* const result = std::get_if<1>(&m_storage)) {
            return *result;
        }
        throw Bad_Result_Access { "error() called on a successful result" };
    }
};

/// @brief A `Result` of an operation that produces nothing on success.
template <typename Error>
struct Result<void, Error> {
private:
    std::optional<Error> m_error;

public:
    [[nodiscard]] Result() noexcept = default;

    [[nodiscard]] Result(Error error)
        : m_error(std::move(error))
    {
    }

    [[nodiscard]] bool has_value() const noexcept
    {
        return !m_error;
    }

    [[nodiscard]] explicit operator bool() const noexcept
    {
        return has_value();
    }

    [[nodiscard]] const Error& error() const
    {
        if (!m_error) {
            throw Bad_Result_Access { "error() called on a successful result" };
        }
        return *m_error;
    }
};

} // namespace surfdoc

#endif
