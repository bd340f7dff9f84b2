#include "tactus/error.hpp"

#include <utility>

namespace tactus {

Error::Error(std::string message) : message(std::move(message)) {}

} // namespace tactus
