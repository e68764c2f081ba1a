#include "oaicompat/streaming.hpp"

#include "oaicompat/chat.hpp"
#include "oaicompat/utils/text.hpp"
#include "oaicompat/utils/values.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace oaicompat {
namespace {

using json = nlohmann::json;

constexpr std::string_view kDataPrefix = "data: ";
constexpr std::string_view kDoneSentinel = "[DONE]";
constexpr std::size_t kLogPreviewBytes = 200;

void trim_carriage_return(std::string& line) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
}

}  // namespace

std::vector<std::string> LineSplitter::feed(const char* data, std::size_t size) {
  buffer_.append(data, size);

  std::vector<std::string> lines;
  std::size_t start = 0;
  while (true) {
    auto newline_pos = buffer_.find('\n', start);
    if (newline_pos == std::string::npos) {
      break;
    }
    std::string line = buffer_.substr(start, newline_pos - start);
    trim_carriage_return(line);
    lines.push_back(std::move(line));
    start = newline_pos + 1;
  }
  buffer_.erase(0, start);
  return lines;
}

std::optional<std::string> LineSplitter::finalize() {
  if (buffer_.empty()) {
    return std::nullopt;
  }
  std::string line = std::move(buffer_);
  buffer_.clear();
  trim_carriage_return(line);
  return line;
}

ChatStreamDecoder::ChatStreamDecoder(EventHandler handler, Logger logger)
    : handler_(std::move(handler)), logger_(std::move(logger)) {}

bool ChatStreamDecoder::feed_line(std::string_view raw_line) {
  if (finished_) {
    return false;
  }

  if (!utils::is_valid_utf8(raw_line)) {
    ++skipped_frames_;
    logger_.log(LogLevel::Debug, "skipping stream line with invalid UTF-8", {{"bytes", raw_line.size()}});
    return true;
  }

  const std::string_view line = utils::trim_trailing(raw_line);
  if (!utils::starts_with(line, kDataPrefix)) {
    return true;
  }

  const std::string_view payload = line.substr(kDataPrefix.size());
  if (payload == kDoneSentinel) {
    emit(StopEvent{});
    return false;
  }

  json chunk = json::parse(payload.begin(), payload.end(), nullptr, false);
  if (chunk.is_discarded()) {
    ++skipped_frames_;
    logger_.log(LogLevel::Debug, "skipping malformed stream frame",
                {{"payload", utils::preview(payload, kLogPreviewBytes)}});
    return true;
  }

  if (!chunk.is_object()) {
    ++skipped_frames_;
    logger_.log(LogLevel::Debug, "skipping non-object stream frame",
                {{"payload", utils::preview(payload, kLogPreviewBytes)}});
    return true;
  }

  if (chunk.contains("error")) {
    emit(ErrorEvent{utils::error_message(chunk.at("error"))});
    return false;
  }

  DeltaEvent event;
  auto choices = chunk.find("choices");
  if (choices != chunk.end() && choices->is_array() && !choices->empty() && choices->front().is_object()) {
    const json& choice = choices->front();
    auto delta = choice.find("delta");
    if (delta != choice.end() && delta->is_object()) {
      event.delta = *delta;
    }
    event.finish_reason = utils::optional_string(choice, "finish_reason");
  }
  event.content = utils::optional_string(event.delta, "content").value_or("");
  event.usage = parse_usage(chunk);
  emit(std::move(event));
  return true;
}

void ChatStreamDecoder::emit(QueryEvent event) {
  if (is_terminal(event)) {
    finished_ = true;
  }
  if (handler_) {
    handler_(std::move(event));
  }
}

}  // namespace oaicompat
