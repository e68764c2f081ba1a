#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "oaicompat/events.hpp"
#include "oaicompat/logging.hpp"

namespace oaicompat {

/// Reassembles arbitrary transport chunks into complete lines (without "\n" or "\r").
class LineSplitter {
public:
  std::vector<std::string> feed(const char* data, std::size_t size);
  // Remaining partial line at end of input, if any.
  std::optional<std::string> finalize();

private:
  std::string buffer_;
};

/**
 * Line-by-line transducer for a chat completion event stream.
 *
 * Only `data: ` lines are considered. `data: [DONE]` emits StopEvent; a frame
 * with an `error` member emits ErrorEvent. Either one finishes the decoder and
 * every later line is ignored. Frames that are not valid UTF-8 or JSON are
 * skipped without an event. Every other frame emits a DeltaEvent, even when
 * its content is empty. Usage is reported per frame and never summed here.
 */
class ChatStreamDecoder {
public:
  using EventHandler = std::function<void(QueryEvent event)>;

  explicit ChatStreamDecoder(EventHandler handler, Logger logger = {});

  // Returns false once the stream has finished.
  bool feed_line(std::string_view raw_line);

  [[nodiscard]] bool finished() const { return finished_; }
  [[nodiscard]] std::size_t skipped_frames() const { return skipped_frames_; }

private:
  void emit(QueryEvent event);

  EventHandler handler_;
  Logger logger_;
  std::size_t skipped_frames_ = 0;
  bool finished_ = false;
};

}  // namespace oaicompat
