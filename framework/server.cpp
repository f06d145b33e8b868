// framework/server.cpp
#include "server.hpp"
#include "logging/logger.hpp"
#include "session/http_session.hpp"
#include <boost/asio/strand.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <fmt/core.h>
#include <utility>

namespace faultline::framework
{
  const char* to_string(const ListenerEvent event)
  {
    switch (event)
    {
    case ListenerEvent::BeforeServerStart:
      return "server.init.before";
    case ListenerEvent::AfterServerStart:
      return "server.init.after";
    case ListenerEvent::BeforeServerStop:
      return "server.shutdown.before";
    case ListenerEvent::AfterServerStop:
      return "server.shutdown.after";
    default:
      return "unknown";
    }
  }

  Server::Server(const tcp::endpoint& endpoint, AppConfig config, std::shared_ptr<ErrorHandler> error_handler,
                 const int num_threads)
    : config_(std::move(config)),
      num_threads_(num_threads > 0 ? num_threads : 1),
      ioc_(num_threads_),
      signals_(ioc_, SIGINT, SIGTERM),
      acceptor_(net::make_strand(ioc_)),
      error_handler_(error_handler ? std::move(error_handler) : std::make_shared<ErrorHandler>(config_))
  {
    const auto logger = logging::server_logger();
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec)
    {
      logger->error("Server open error: {}", ec.message());
      throw std::runtime_error(fmt::format("Failed to open acceptor: {}", ec.message()));
    }

    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec)
    {
      logger->error("Server set_option reuse_address error: {}", ec.message());
      throw std::runtime_error(fmt::format("Failed to set reuse_address: {}", ec.message()));
    }

    acceptor_.bind(endpoint, ec);
    if (ec)
    {
      logger->error("Server bind error: {}", ec.message());
      throw std::runtime_error(fmt::format("Failed to bind acceptor: {}", ec.message()));
    }

    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec)
    {
      logger->error("Server listen error: {}", ec.message());
      throw std::runtime_error(fmt::format("Failed to listen: {}", ec.message()));
    }
  }

  HttpRouter& Server::get_http_router()
  {
    return http_router_;
  }

  const HttpRouter& Server::get_http_router() const
  {
    return http_router_;
  }

  ErrorHandler& Server::get_error_handler()
  {
    return *error_handler_;
  }

  void Server::listener(const ListenerEvent event, Listener listener)
  {
    listeners_[event].push_back(std::move(listener));
  }

  tcp::endpoint Server::local_endpoint() const
  {
    return acceptor_.local_endpoint();
  }

  void Server::emit(const ListenerEvent event)
  {
    const auto it = listeners_.find(event);
    if (it == listeners_.end())
    {
      return;
    }
    logging::server_logger()->debug("Running {} {} listener(s)", it->second.size(), to_string(event));
    for (const auto& listener : it->second)
    {
      listener(*this);
    }
  }

  void Server::run()
  {
    error_handler_->finalize(config_.fallback_error_format);
    emit(ListenerEvent::BeforeServerStart);

    logging::server_logger()->info("Server listening on {}:{}", acceptor_.local_endpoint().address().to_string(),
                                   acceptor_.local_endpoint().port());

    signals_.async_wait(boost::beast::bind_front_handler(&Server::handle_signal, shared_from_this()));
    do_accept();

    threads_.reserve(num_threads_ - 1);
    for (int i = 1; i < num_threads_; ++i)
    {
      threads_.emplace_back([this]() { ioc_.run(); });
    }

    emit(ListenerEvent::AfterServerStart);
    ioc_.run();

    for (auto& t : threads_)
    {
      if (t.joinable())
      {
        t.join();
      }
    }
    threads_.clear();

    emit(ListenerEvent::AfterServerStop);
    logging::server_logger()->info("Server workers stopped.");
  }

  void Server::stop()
  {
    std::call_once(stop_flag_, [this]()
    {
      emit(ListenerEvent::BeforeServerStop);

      boost::beast::error_code ec;
      acceptor_.close(ec);
      if (ec)
      {
        logging::server_logger()->error("Server acceptor close error: {}", ec.message());
      }
      signals_.cancel(ec);

      ioc_.stop();
      logging::server_logger()->info("Server stopped.");
    });
  }

  void Server::do_accept()
  {
    acceptor_.async_accept(
      net::make_strand(ioc_),
      boost::beast::bind_front_handler(&Server::on_accept, shared_from_this()));
  }

  void Server::on_accept(boost::beast::error_code ec, tcp::socket socket)
  {
    if (ec)
    {
      if (ec != boost::system::errc::operation_canceled)
      {
        logging::server_logger()->error("Server on_accept error: {}", ec.message());
      }
    }
    else
    {
      std::make_shared<HttpSession>(std::move(socket), http_router_, *error_handler_, config_)->run();
    }

    if (acceptor_.is_open())
    {
      do_accept();
    }
  }

  void Server::handle_signal(const boost::beast::error_code& error, int signal_number)
  {
    if (!error)
    {
      logging::server_logger()->info("Received signal {}, shutting down gracefully...", signal_number);
      stop();
    }
  }
} // namespace faultline::framework
