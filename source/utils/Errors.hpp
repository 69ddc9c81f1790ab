#ifndef DAYTRACK_UTILS_ERRORS_HPP
#define DAYTRACK_UTILS_ERRORS_HPP

#include <QString>
#include <stdexcept>

// Malformed or missing client input. Answered with 400.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const QString &message)
        : std::runtime_error(message.toStdString()) {}
};

// Referenced row does not exist. Answered with 404.
class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const QString &message)
        : std::runtime_error(message.toStdString()) {}
};

// Any failure reported by the database driver; carries the driver text as is.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const QString &message)
        : std::runtime_error(message.toStdString()) {}
};

#endif // DAYTRACK_UTILS_ERRORS_HPP
