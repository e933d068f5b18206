#include "transport/request_surface.hpp"

#include <ostream>
#include <utility>

namespace toolbox::transport {

RequestSurface::RequestSurface(const mcp::ProtocolHandler& handler, ConnectionRegistry& connections,
                               std::ostream& log, const bool verbose)
    : handler_(handler), connections_(connections), log_(log), verbose_(verbose) {}

net::awaitable<HttpReply> RequestSurface::handle(std::string body) const {
  auto reply = co_await handler_.handle_document(std::move(body));

  if (reply.response.is_null()) {
    co_return HttpReply{.status = 202, .body = {}, .content_type = {}};
  }

  if (reply.completed_call.has_value()) {
    auto& call = *reply.completed_call;
    const auto delivered =
        connections_.broadcast(NotificationEvent::tool_result(std::move(call.tool), std::move(call.result)));
    if (verbose_) {
      log_ << "[http] tool_result broadcast to " << delivered << " observer(s)\n";
    }
  }

  co_return HttpReply{.status = 200, .body = mcp::to_wire(reply.response)};
}

}  // namespace toolbox::transport
