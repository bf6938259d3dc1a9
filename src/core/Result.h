#pragma once

#include <QString>
#include <QDebug>

// ── Error taxonomy ──────────────────────────────────────────────────
enum class ErrorCategory {
    Storage,        // open/read/write failure in a library store
    Serialization,  // malformed persisted record
    NotFound,       // playlist / track / position absent
    DuplicateName,  // playlist name already taken
    Player,         // external player command failed
    Concurrency,    // session state could not be applied
    Unknown
};

struct Error {
    ErrorCategory category = ErrorCategory::Unknown;
    QString message;
};

QString errorCategoryName(ErrorCategory category);

// Carries either a value or a categorised error.
template <typename T>
struct Result {
    bool ok = false;
    T value{};
    Error error;

    static Result<T> success(const T& v)
    {
        Result<T> r;
        r.ok = true;
        r.value = v;
        return r;
    }

    static Result<T> failure(const Error& e)
    {
        Result<T> r;
        r.ok = false;
        r.error = e;
        return r;
    }

    static Result<T> failure(ErrorCategory category, const QString& message)
    {
        return failure(Error{category, message});
    }

    explicit operator bool() const { return ok; }
};

template <>
struct Result<void> {
    bool ok = false;
    Error error;

    static Result<void> success()
    {
        Result<void> r;
        r.ok = true;
        return r;
    }

    static Result<void> failure(const Error& e)
    {
        Result<void> r;
        r.error = e;
        return r;
    }

    static Result<void> failure(ErrorCategory category, const QString& message)
    {
        return failure(Error{category, message});
    }

    explicit operator bool() const { return ok; }
};

inline QDebug operator<<(QDebug dbg, const Error& e)
{
    QDebugStateSaver saver(dbg);
    dbg.nospace() << errorCategoryName(e.category) << ": " << e.message;
    return dbg;
}
