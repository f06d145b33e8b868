#include "http_session.hpp"
#include "context/http_context.hpp"
#include "exception/faults.hpp"
#include "logging/logger.hpp"
#include <fmt/core.h>

using namespace faultline::framework;

std::exception_ptr faultline::framework::read_fault(const beast::error_code& ec, const std::uint64_t body_limit)
{
  if (!ec || ec.category() != http::make_error_code(http::error::bad_target).category())
  {
    return nullptr;
  }
  if (ec == http::error::end_of_stream || ec == http::error::partial_message)
  {
    return nullptr;
  }
  if (ec == http::error::body_limit)
  {
    return std::make_exception_ptr(
      PayloadTooLarge(fmt::format("Request body exceeds the limit of {} bytes", body_limit)));
  }
  if (ec == http::error::header_limit)
  {
    return std::make_exception_ptr(BadRequest("Request header exceeds the size limit"));
  }
  return std::make_exception_ptr(BadRequest(fmt::format("Malformed request: {}", ec.message())));
}

HttpSession::HttpSession(tcp::socket&& socket, const HttpRouter& router, ErrorHandler& error_handler,
                         const AppConfig& config)
  : stream_(std::move(socket)),
    router_(router),
    error_handler_(error_handler),
    config_(config)
{
}

void HttpSession::run()
{
  net::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
}

void HttpSession::do_read()
{
  parser_.emplace();
  parser_->body_limit(config_.body_limit);
  http::async_read(stream_, buffer_, *parser_,
                   beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
}

void HttpSession::on_read(beast::error_code ec, std::size_t bytes_transferred)
{
  boost::ignore_unused(bytes_transferred);

  if (ec == http::error::end_of_stream)
  {
    return do_close();
  }
  if (ec)
  {
    if (auto fault = read_fault(ec, config_.body_limit))
    {
      logging::server_logger()->debug("HttpSession rejecting request: {}", ec.message());
      return handle_read_fault(std::move(fault));
    }
    logging::server_logger()->error("HttpSession on_read error: {}", ec.message());
    return;
  }

  req_ = parser_->release();
  handle_request();
}

void HttpSession::handle_request()
{
  HttpContext::Response res;
  HttpContext ctx(req_, res, &config_);

  auto response = error_handler_.finish(ctx, router_.dispatch(ctx));
  response.version(req_.version());
  response.keep_alive(req_.keep_alive());

  send_response(std::move(response), req_.keep_alive());
}

void HttpSession::handle_read_fault(std::exception_ptr fault)
{
  auto response = error_handler_.respond(nullptr, std::move(fault));
  response.keep_alive(false);
  send_response(std::move(response), false);
}

void HttpSession::send_response(HttpContext::Response response, const bool keep_alive)
{
  // the response must outlive the asynchronous write
  res_ = std::make_shared<HttpContext::Response>(std::move(response));
  http::async_write(stream_, *res_,
                    beast::bind_front_handler(&HttpSession::on_write, shared_from_this(), keep_alive));
}

void HttpSession::on_write(bool keep_alive, beast::error_code ec, std::size_t bytes_transferred)
{
  boost::ignore_unused(bytes_transferred);

  if (ec)
  {
    logging::server_logger()->error("HttpSession on_write error: {}", ec.message());
    return;
  }

  res_.reset();
  if (!keep_alive)
  {
    return do_close();
  }

  do_read();
}

void HttpSession::do_close()
{
  beast::error_code ec;
  stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  if (ec)
  {
    logging::server_logger()->warn("HttpSession shutdown error: {}", ec.message());
  }
}
