#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace triage {

enum class ErrorKind {
    InvalidInput,
    NotFound,
    CollaboratorUnavailable,
    Cancelled,
    Internal
};

struct TriageError {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
};

inline std::string errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::InvalidInput:
        return "invalid_input";
    case ErrorKind::NotFound:
        return "not_found";
    case ErrorKind::CollaboratorUnavailable:
        return "collaborator_unavailable";
    case ErrorKind::Cancelled:
        return "cancelled";
    case ErrorKind::Internal:
        return "internal";
    }
    return "internal";
}

inline TriageError makeError(ErrorKind kind, std::string message)
{
    return TriageError{kind, std::move(message)};
}

// Value-or-error result returned across every collaborator seam.
template <typename T>
class Outcome {
public:
    Outcome(T value)
        : m_value(std::move(value))
    {
    }

    Outcome(TriageError error)
        : m_error(std::move(error))
    {
    }

    bool ok() const
    {
        return m_value.has_value();
    }

    explicit operator bool() const
    {
        return ok();
    }

    const T &value() const
    {
        if (!m_value) {
            throw std::logic_error("Outcome has no value: " + m_error->message);
        }
        return *m_value;
    }

    T &value()
    {
        if (!m_value) {
            throw std::logic_error("Outcome has no value: " + m_error->message);
        }
        return *m_value;
    }

    const TriageError &error() const
    {
        if (!m_error) {
            throw std::logic_error("Outcome has no error");
        }
        return *m_error;
    }

    T valueOr(T fallback) const
    {
        return m_value ? *m_value : std::move(fallback);
    }

private:
    std::optional<T> m_value;
    std::optional<TriageError> m_error;
};

// Outcome for operations that only report success.
using Status = Outcome<bool>;

} // namespace triage
