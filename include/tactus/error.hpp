#pragma once

#include <exception>
#include <string>
#include <utility>

namespace tactus {

/*
 * Base class for all Tactus errors.
 *
 * Invalid input is rejected by throwing one of these before any timeline or native parameter is touched, so a call
 * which throws has no effect.
 * */
class Error : public std::exception {
public:
  explicit Error(std::string message);

  const std::string &getMessage() const { return this->message; }
  const char *what() const noexcept override { return this->message.c_str(); }

private:
  std::string message;
};

#define ERRDEF(type, default_msg)                                                                                      \
  class type : public Error {                                                                                          \
  public:                                                                                                              \
    explicit type(std::string msg = default_msg) : Error(std::move(msg)) {}                                            \
  }

/* Bad arguments: wrong kind of value, or a missing callback. */
ERRDEF(EValidation, "Validation error");
/* Numbers outside what the operation accepts. */
ERRDEF(ERange, "Value out of range");
/* The call would break the object's invariants, e.g. syncing a signal twice. */
ERRDEF(EInvariant, "Invariant would be violated");
/* The engine failed underneath us. */
ERRDEF(EInternal, "Internal library error");

} // namespace tactus
