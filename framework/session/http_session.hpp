#ifndef FAULTLINE_FRAMEWORK_SESSION_HTTP_SESSION_HPP
#define FAULTLINE_FRAMEWORK_SESSION_HTTP_SESSION_HPP

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include "config/app_config.hpp"
#include "exception/error_handler.hpp"
#include "router/http_router.hpp"

namespace faultline::framework
{
  namespace beast = boost::beast;
  namespace http = beast::http;
  namespace net = boost::asio;
  using tcp = boost::asio::ip::tcp;

  /**
   * @brief Fault to answer a failed read with.
   *
   * Parse errors become BadRequest, a body over `body_limit` PayloadTooLarge.
   * @return null when the connection is simply dropped: end of stream, a peer
   *         that left mid-message, or a transport error.
   */
  std::exception_ptr read_fault(const beast::error_code& ec, std::uint64_t body_limit);

  // One HTTP connection: read, route, answer faults through the error handler, write.
  class HttpSession : public std::enable_shared_from_this<HttpSession>
  {
  public:
    HttpSession(tcp::socket&& socket, const HttpRouter& router, ErrorHandler& error_handler,
                const AppConfig& config);

    void run();

  private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    HttpContext::Request req_;
    std::shared_ptr<HttpContext::Response> res_;
    const HttpRouter& router_;
    ErrorHandler& error_handler_;
    const AppConfig& config_;

    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);

    void handle_request();
    // Faults raised while reading, before any request context exists.
    void handle_read_fault(std::exception_ptr fault);

    void send_response(HttpContext::Response response, bool keep_alive);
    void on_write(bool keep_alive, beast::error_code ec, std::size_t bytes_transferred);

    void do_close();
  };
}
#endif // FAULTLINE_FRAMEWORK_SESSION_HTTP_SESSION_HPP
