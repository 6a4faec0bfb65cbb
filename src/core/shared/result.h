#pragma once

#include <QString>

#include <utility>
#include <variant>

namespace sift {

// Failure taxonomy shared by every module.
enum class ErrorKind {
    Validation,     // Bad caller input, rejected before any external call
    Connectivity,   // Embedding/inference/store unreachable or timed out
    PartialItem,    // One item of a batch failed; the batch continues
    DataIntegrity,  // Wrong embedding dimension or malformed stored data
    Storage,        // SQLite statement or transaction failure
    Unavailable,    // Optional component (model, fuzzy matcher) not usable
};

QString errorKindToString(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::Storage;
    QString message;

    QString toString() const;
};

inline Error makeError(ErrorKind kind, const QString& message)
{
    return Error{kind, message};
}

// Result<T> -- either a value or an Error.
template <typename T>
class Result {
public:
    Result(const T& value) : m_state(value) {}
    Result(T&& value) : m_state(std::move(value)) {}
    Result(const Error& error) : m_state(error) {}
    Result(Error&& error) : m_state(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(m_state); }
    explicit operator bool() const { return ok(); }

    T& value() & { return std::get<T>(m_state); }
    const T& value() const& { return std::get<T>(m_state); }
    T&& value() && { return std::get<T>(std::move(m_state)); }

    const Error& error() const { return std::get<Error>(m_state); }

    T valueOr(T fallback) const
    {
        return ok() ? std::get<T>(m_state) : std::move(fallback);
    }

private:
    std::variant<T, Error> m_state;
};

// Result<void> equivalent for operations without a payload.
class Status {
public:
    Status() = default;
    Status(const Error& error) : m_error(error), m_ok(false) {}

    static Status success() { return Status(); }

    bool ok() const { return m_ok; }
    explicit operator bool() const { return m_ok; }
    const Error& error() const { return m_error; }

private:
    Error m_error;
    bool m_ok = true;
};

} // namespace sift
