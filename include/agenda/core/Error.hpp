#pragma once

#include <QString>

#include <utility>
#include <variant>

namespace agenda {
namespace core {

enum class ErrorCode
{
    TimeParse,
    InvalidTimeZone,
    InvalidLocalTime,
    Validation,
    Recurrence,
    Ics,
    Json,
    Io,
};

struct Error
{
    ErrorCode code = ErrorCode::Validation;
    QString message;
};

QString errorCodeName(ErrorCode code);
QString describe(const Error &error);

// Value-or-error return used by every fallible operation.
template<typename T>
class Result
{
public:
    Result(T value)
        : m_data(std::move(value))
    {
    }

    Result(Error error)
        : m_data(std::move(error))
    {
    }

    bool isOk() const { return std::holds_alternative<T>(m_data); }
    explicit operator bool() const { return isOk(); }

    const T &value() const & { return std::get<T>(m_data); }
    T &value() & { return std::get<T>(m_data); }
    T &&value() && { return std::get<T>(std::move(m_data)); }

    const Error &error() const { return std::get<Error>(m_data); }

    const T *operator->() const { return &value(); }
    T *operator->() { return &value(); }
    const T &operator*() const & { return value(); }
    T &operator*() & { return value(); }

private:
    std::variant<T, Error> m_data;
};

template<>
class Result<void>
{
public:
    Result() = default;

    Result(Error error)
        : m_error(std::move(error))
        , m_failed(true)
    {
    }

    bool isOk() const { return !m_failed; }
    explicit operator bool() const { return isOk(); }

    const Error &error() const { return m_error; }

private:
    Error m_error;
    bool m_failed = false;
};

inline Error makeError(ErrorCode code, QString message)
{
    return Error{code, std::move(message)};
}

} // namespace core
} // namespace agenda
