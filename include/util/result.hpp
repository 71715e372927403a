#pragma once

#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace carrierctrl {

struct Error {
  int code{0};
  std::string what;
};

inline Error make_error(int code, std::string what) {
  return Error{code, std::move(what)};
}

inline std::ostream &operator<<(std::ostream &os, const Error &err) {
  os << "[" << err.code << "] " << err.what;
  return os;
}

/**
 * Value-or-error holder for operations that produce something.
 * Operations that only succeed or fail return std::optional<Error> instead.
 */
template <typename T> class Result {
  std::variant<T, Error> data_;

  explicit Result(std::variant<T, Error> data) : data_(std::move(data)) {}

public:
  static Result Ok(T value) {
    return Result(std::variant<T, Error>(std::in_place_index<0>,
                                         std::move(value)));
  }
  static Result Err(Error err) {
    return Result(std::variant<T, Error>(std::in_place_index<1>,
                                         std::move(err)));
  }

  bool is_ok() const { return data_.index() == 0; }
  bool is_err() const { return data_.index() == 1; }

  T &value() { return std::get<0>(data_); }
  const T &value() const { return std::get<0>(data_); }
  const Error &error() const { return std::get<1>(data_); }
};

} // namespace carrierctrl
