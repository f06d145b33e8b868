// framework/server.hpp
#ifndef FAULTLINE_FRAMEWORK_SERVER_HPP
#define FAULTLINE_FRAMEWORK_SERVER_HPP

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/beast/core/error.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "config/app_config.hpp"
#include "exception/error_handler.hpp"
#include "router/http_router.hpp"

namespace faultline::framework
{
  namespace net = boost::asio;
  using tcp = boost::asio::ip::tcp;

  enum class ListenerEvent
  {
    BeforeServerStart,
    AfterServerStart,
    BeforeServerStop,
    AfterServerStop
  };

  const char* to_string(ListenerEvent event);

  class Server : public std::enable_shared_from_this<Server>
  {
  public:
    using Listener = std::function<void(Server&)>;

    /**
     * @param error_handler Guard for faults raised while serving; a plain
     *        ErrorHandler built from `config` when null.
     * @throws std::runtime_error when the endpoint cannot be bound.
     */
    Server(const tcp::endpoint& endpoint, AppConfig config, std::shared_ptr<ErrorHandler> error_handler = nullptr,
           int num_threads = 1);

    HttpRouter& get_http_router();
    const HttpRouter& get_http_router() const;

    ErrorHandler& get_error_handler();
    const AppConfig& config() const { return config_; }

    // Listeners run in registration order on the thread calling run() or stop().
    void listener(ListenerEvent event, Listener listener);

    tcp::endpoint local_endpoint() const;

    void run();

    void stop();

  private:
    const AppConfig config_;
    const int num_threads_;
    net::io_context ioc_;
    net::signal_set signals_;
    tcp::acceptor acceptor_;
    std::vector<std::thread> threads_;
    std::once_flag stop_flag_;

    HttpRouter http_router_;
    std::shared_ptr<ErrorHandler> error_handler_;
    std::map<ListenerEvent, std::vector<Listener>> listeners_;

    void emit(ListenerEvent event);
    void do_accept();
    void on_accept(boost::beast::error_code ec, tcp::socket socket);
    void handle_signal(const boost::beast::error_code& error, int signal_number);
  };
}
#endif // FAULTLINE_FRAMEWORK_SERVER_HPP
