#pragma once
#include <exception>
#include <string>

namespace wraplife {
// Thrown when a caller breaks a precondition (bad coordinate, zero dimension).
class Error : public std::exception {
public:
    explicit Error(const std::string& message);

    const char* what() const noexcept override;

private:
    std::string message_;
};
}
