#include "oaicompat/dispatcher.hpp"

#include <exception>
#include <utility>

namespace oaicompat {
namespace {

const char* event_name(const QueryEvent& event) {
  switch (event.index()) {
    case 0: return "response";
    case 1: return "delta";
    case 2: return "stop";
    case 3: return "error";
  }
  return "unknown";
}

}  // namespace

void EventCallback::operator()(const QueryEvent& event, const StatusTag& status) const {
  if (const auto* binary = std::get_if<Binary>(&handler_)) {
    (*binary)(event, status);
  } else if (const auto* unary = std::get_if<Unary>(&handler_)) {
    (*unary)(event);
  }
}

Dispatcher::Dispatcher(std::shared_ptr<Executor> executor, Logger logger)
    : executor_(executor ? std::move(executor) : std::make_shared<InlineExecutor>()),
      logger_(std::move(logger)) {}

StatusTag Dispatcher::status_tag(const QueryEvent& event) {
  if (const auto* delta = std::get_if<DeltaEvent>(&event)) {
    return delta->finish_reason;
  }
  if (std::holds_alternative<StopEvent>(event)) {
    return std::string("stop");
  }
  if (std::holds_alternative<ErrorEvent>(event)) {
    return std::string("error");
  }
  return std::nullopt;
}

void Dispatcher::deliver(const EventCallback& callback, QueryEvent event) const {
  if (!callback) {
    return;
  }

  StatusTag status = status_tag(event);
  Logger logger = logger_;
  auto task = [callback, event = std::move(event), status = std::move(status), logger]() {
    try {
      callback(event, status);
    } catch (const std::exception& ex) {
      logger.log(LogLevel::Error, "result callback threw", {{"event", event_name(event)}, {"what", ex.what()}});
    }
  };

  try {
    executor_->execute(std::move(task));
  } catch (const std::exception& ex) {
    logger_.log(LogLevel::Error, "failed to schedule result callback", {{"what", ex.what()}});
  }
}

}  // namespace oaicompat
