#pragma once

#include <atomic>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "mcp/protocol.hpp"

namespace toolbox::transport {

enum class PipeState { kIdle, kReading, kDispatching, kWriting, kClosed };

enum class Framing { kNewline, kContentLength };

const char* to_string(PipeState state);

struct Frame {
  std::string body;
  Framing framing{Framing::kNewline};
};

class FramingError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Splits an input stream into documents. A line is one document unless it is a
// "Content-Length: N" header, in which case the header block runs to the next
// empty line and exactly N body bytes follow.
class FrameReader {
 public:
  explicit FrameReader(std::istream& in);

  // std::nullopt at end of stream. Throws FramingError on a bad header block.
  std::optional<Frame> next();

 private:
  std::istream& in_;
};

std::string encode_frame(const std::string& document, Framing framing);

// One JSON-RPC session over a single ordered stream pair. Requests are handled
// one at a time and every reply is written in the framing its request used.
class StdioTransport {
 public:
  StdioTransport(const mcp::ProtocolHandler& handler, std::ostream& log, bool verbose = false);

  // Returns once the input ends or stop() was requested.
  int run(std::istream& in, std::ostream& out);

  // Safe to call from a signal handler.
  void stop() noexcept { stop_requested_.store(true); }

  PipeState state() const noexcept { return state_.load(); }

 private:
  mcp::ProtocolReply dispatch(std::string document) const;
  bool write(std::ostream& out, const nlohmann::json& response, Framing framing);

  const mcp::ProtocolHandler& handler_;
  std::ostream& log_;
  bool verbose_{false};
  std::atomic<bool> stop_requested_{false};
  std::atomic<PipeState> state_{PipeState::kIdle};
};

}  // namespace toolbox::transport
