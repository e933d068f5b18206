#include "transport/stdio_transport.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <istream>
#include <ostream>
#include <string_view>
#include <utility>

#include "core/run_blocking.hpp"

namespace toolbox::transport {

namespace {

constexpr std::string_view kContentLengthHeader = "content-length:";
constexpr std::size_t kMaxContentLength = 64UL * 1024UL * 1024UL;

void strip_carriage_return(std::string& line) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
}

bool is_blank(const std::string& line) {
  return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

bool starts_with_content_length(const std::string& line) {
  if (line.size() < kContentLengthHeader.size()) {
    return false;
  }
  for (std::size_t i = 0; i < kContentLengthHeader.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(line[i])) != kContentLengthHeader[i]) {
      return false;
    }
  }
  return true;
}

std::size_t parse_content_length(const std::string& line) {
  std::string_view value(line);
  value.remove_prefix(kContentLengthHeader.size());
  while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
    value.remove_prefix(1);
  }
  while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
    value.remove_suffix(1);
  }

  std::size_t length = 0;
  const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
  if (value.empty() || ec != std::errc{} || end != value.data() + value.size()) {
    throw FramingError("invalid Content-Length header: " + line);
  }
  if (length > kMaxContentLength) {
    throw FramingError("Content-Length exceeds limit: " + std::to_string(length));
  }
  return length;
}

}  // namespace

const char* to_string(const PipeState state) {
  switch (state) {
    case PipeState::kIdle:
      return "idle";
    case PipeState::kReading:
      return "reading";
    case PipeState::kDispatching:
      return "dispatching";
    case PipeState::kWriting:
      return "writing";
    case PipeState::kClosed:
      return "closed";
  }
  return "unknown";
}

FrameReader::FrameReader(std::istream& in) : in_(in) {}

std::optional<Frame> FrameReader::next() {
  std::string line;
  while (std::getline(in_, line)) {
    strip_carriage_return(line);
    if (is_blank(line)) {
      continue;
    }

    if (!starts_with_content_length(line)) {
      return Frame{.body = std::move(line), .framing = Framing::kNewline};
    }

    const auto length = parse_content_length(line);
    bool terminated = false;
    std::string header;
    while (std::getline(in_, header)) {
      strip_carriage_return(header);
      if (header.empty()) {
        terminated = true;
        break;
      }
    }
    if (!terminated) {
      throw FramingError("header block not terminated before end of input");
    }

    std::string body(length, '\0');
    in_.read(body.data(), static_cast<std::streamsize>(length));
    if (static_cast<std::size_t>(in_.gcount()) != length) {
      throw FramingError("truncated body: expected " + std::to_string(length) + " bytes, got " +
                         std::to_string(in_.gcount()));
    }
    return Frame{.body = std::move(body), .framing = Framing::kContentLength};
  }
  return std::nullopt;
}

std::string encode_frame(const std::string& document, const Framing framing) {
  if (framing == Framing::kContentLength) {
    return "Content-Length: " + std::to_string(document.size()) + "\r\n\r\n" + document;
  }
  return document + '\n';
}

StdioTransport::StdioTransport(const mcp::ProtocolHandler& handler, std::ostream& log, const bool verbose)
    : handler_(handler), log_(log), verbose_(verbose) {}

int StdioTransport::run(std::istream& in, std::ostream& out) {
  FrameReader reader(in);
  log_ << "[stdio] session started\n";

  while (!stop_requested_.load()) {
    state_.store(PipeState::kReading);

    std::optional<Frame> frame;
    try {
      frame = reader.next();
    } catch (const FramingError& ex) {
      // The stream position is unknown after a bad header, so the session ends.
      log_ << "[stdio] framing error: " << ex.what() << '\n';
      write(out, mcp::ProtocolHandler::parse_error_reply().response, Framing::kNewline);
      break;
    }
    if (!frame.has_value() || stop_requested_.load()) {
      break;
    }

    state_.store(PipeState::kDispatching);
    const auto reply = dispatch(std::move(frame->body));

    if (!reply.correlated || reply.response.is_null()) {
      if (verbose_) {
        log_ << "[stdio] no reply for uncorrelated request\n";
      }
      state_.store(PipeState::kIdle);
      continue;
    }

    state_.store(PipeState::kWriting);
    if (!write(out, reply.response, frame->framing)) {
      log_ << "[stdio] output stream failed; closing session\n";
      break;
    }
    state_.store(PipeState::kIdle);
  }

  state_.store(PipeState::kClosed);
  log_ << "[stdio] session closed" << (stop_requested_.load() ? " (stop requested)" : "") << '\n';
  return 0;
}

mcp::ProtocolReply StdioTransport::dispatch(std::string document) const {
  try {
    return core::run_blocking(handler_.handle_document(std::move(document)));
  } catch (const std::exception& ex) {
    log_ << "[stdio] failed to process request: " << ex.what() << '\n';
    return mcp::ProtocolReply{
        .response = mcp::make_error_response(
            nullptr, mcp::Failure{mcp::kInternalError, std::string("Internal error: ") + ex.what()})};
  }
}

bool StdioTransport::write(std::ostream& out, const nlohmann::json& response, const Framing framing) {
  out << encode_frame(mcp::to_wire(response), framing);
  out.flush();
  return static_cast<bool>(out);
}

}  // namespace toolbox::transport
