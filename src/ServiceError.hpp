#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
    NotFound,
    BadRequest,
    Internal
};

// Terminal failure of a single request. The HTTP front maps the kind to a status code.
class ServiceError : public std::runtime_error {
public:
    ServiceError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    int httpStatus() const {
        switch (kind_) {
        case ErrorKind::NotFound:
            return 404;
        case ErrorKind::BadRequest:
            return 400;
        case ErrorKind::Internal:
            return 500;
        }
        return 500;
    }

    std::string code() const {
        switch (kind_) {
        case ErrorKind::NotFound:
            return "not_found";
        case ErrorKind::BadRequest:
            return "bad_request";
        case ErrorKind::Internal:
            return "internal_error";
        }
        return "internal_error";
    }

private:
    ErrorKind kind_;
};
