#pragma once

#include <exception>
#include <optional>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

namespace toolbox::core {

// Drives one awaitable to completion on a private io_context and hands back its
// value, rethrowing whatever escaped it. Lets blocking callers share coroutine code.
template <typename T>
T run_blocking(boost::asio::awaitable<T> task) {
  boost::asio::io_context context;
  std::exception_ptr failure;
  std::optional<T> value;

  boost::asio::co_spawn(context, std::move(task), [&failure, &value](std::exception_ptr error, T result) {
    failure = error;
    if (!error) {
      value.emplace(std::move(result));
    }
  });
  context.run();

  if (failure) {
    std::rethrow_exception(failure);
  }
  return std::move(*value);
}

}  // namespace toolbox::core
