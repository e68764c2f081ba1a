#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "oaicompat/events.hpp"
#include "oaicompat/executor.hpp"
#include "oaicompat/logging.hpp"

namespace oaicompat {

/// "stop", "error", the frame's finish reason, or nothing.
using StatusTag = std::optional<std::string>;

/**
 * Result callback taking either (event) or (event, status). The shape is fixed
 * when the callback is constructed; a callable accepting both shapes is
 * treated as binary.
 */
class EventCallback {
public:
  using Unary = std::function<void(const QueryEvent&)>;
  using Binary = std::function<void(const QueryEvent&, const StatusTag&)>;

  EventCallback() = default;
  EventCallback(std::nullptr_t) {}

  template <typename F,
            typename = std::enable_if_t<!std::is_same_v<std::decay_t<F>, EventCallback> &&
                                        !std::is_same_v<std::decay_t<F>, std::nullptr_t>>>
  EventCallback(F&& fn) {
    if constexpr (std::is_invocable_v<F&, const QueryEvent&, const StatusTag&>) {
      Binary binary(std::forward<F>(fn));
      if (binary) handler_ = std::move(binary);
    } else {
      static_assert(std::is_invocable_v<F&, const QueryEvent&>,
                    "EventCallback needs a callable taking (const QueryEvent&) or (const QueryEvent&, const StatusTag&)");
      Unary unary(std::forward<F>(fn));
      if (unary) handler_ = std::move(unary);
    }
  }

  explicit operator bool() const { return !std::holds_alternative<std::monostate>(handler_); }
  bool is_binary() const { return std::holds_alternative<Binary>(handler_); }

  void operator()(const QueryEvent& event, const StatusTag& status) const;

private:
  std::variant<std::monostate, Unary, Binary> handler_;
};

/**
 * Hands events to their callback on the configured executor. Exceptions
 * thrown by the callback are logged and never reach the query's thread.
 */
class Dispatcher {
public:
  explicit Dispatcher(std::shared_ptr<Executor> executor = nullptr, Logger logger = {});

  void deliver(const EventCallback& callback, QueryEvent event) const;

  static StatusTag status_tag(const QueryEvent& event);

  const std::shared_ptr<Executor>& executor() const { return executor_; }

private:
  std::shared_ptr<Executor> executor_;
  Logger logger_;
};

}  // namespace oaicompat
