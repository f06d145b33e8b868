#include "server.hpp"
#include "logging/logger.hpp"
#include "ValidationController.hpp"
#include <boost/asio/ip/address.hpp>
#include <boost/json.hpp>
#include <cstdlib>

using namespace faultline::framework;

int main(int argc, char* argv[])
{
  const unsigned short port = argc > 1 ? static_cast<unsigned short>(std::atoi(argv[1])) : 8080;

  try
  {
    auto config = AppConfig::from_env();
    logging::set_level(config.log_level);

    auto server = std::make_shared<Server>(tcp::endpoint{net::ip::make_address("0.0.0.0"), port}, config, nullptr, 4);
    auto& router = server->get_http_router();
    auto& errors = server->get_error_handler();

    errors.add<ValidationError>(FaultHandler([](HttpContext*, const std::exception& e) -> FaultHandler::Result
    {
      return json(boost::json::serialize(boost::json::object{{"error", e.what()}}),
                  boost::beast::http::status::unprocessable_entity);
    }, "renderJSON"));

    router.post("/web/profile", [](HttpContext& ctx)
    {
      throw ValidationError("Profile name is required");
    }, "web");

    router.get("/slow", [](HttpContext&)
    {
      throw RequestTimeout("Upstream did not answer in time");
    });

    ValidationController::create()->install(router, errors);

    server->listener(ListenerEvent::AfterServerStart, [](Server& s)
    {
      logging::server_logger()->info("Ready on port {}", s.local_endpoint().port());
    });

    server->run();
  }
  catch (const std::exception& e)
  {
    logging::server_logger()->critical("Fatal: {}", e.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
