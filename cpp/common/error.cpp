#include "wraplife/error.hpp"

namespace wraplife {

Error::Error(const std::string& message) :
    std::exception(),
    message_(message)
{ }

const char* Error::what() const noexcept {
    return message_.c_str();
}

}
