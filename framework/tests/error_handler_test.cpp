#include "framework/exception/error_handler.hpp"
#include "framework/exception/faults.hpp"
#include "framework/render/responses.hpp"
#include "log_capture.hpp"
#include <spdlog/sinks/base_sink.h>
#include <gtest/gtest.h>
#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace http = boost::beast::http;
using namespace faultline::framework;

namespace
{
  struct TimeoutError : std::runtime_error
  {
    TimeoutError() : std::runtime_error("timed out")
    {
    }
  };

  FAULTLINE_DEFINE_FAULT(ValidationError, BadRequest, http::status::unprocessable_entity, "Validation failed");
  FAULTLINE_DEFINE_FAULT(EmailInvalid, ValidationError, http::status::unprocessable_entity, "Email is invalid");

  class ErrorHandlerTest : public ::testing::Test
  {
  protected:
    void SetUp() override
    {
      req.version(11);
      req.method(http::verb::get);
      req.target("/boom?x=1");
      req.set(http::field::host, "localhost");
      req.set(http::field::accept, "text/plain");
    }

    HttpContext make_context(const AppConfig* config = nullptr)
    {
      return HttpContext(req, res, config);
    }

    static FaultHandler throwing(const std::string& name)
    {
      return FaultHandler([](HttpContext*, const std::exception&) -> FaultHandler::Result
      {
        throw std::logic_error("handler is broken");
      }, name);
    }

    HttpContext::Request req;
    HttpContext::Response res;
  };

  class ThrowingSink : public spdlog::sinks::base_sink<std::mutex>
  {
  protected:
    void sink_it_(const spdlog::details::log_msg&) override
    {
      throw std::runtime_error("log device gone");
    }

    void flush_() override
    {
    }
  };

  // Every write to the error logger throws while in scope.
  class FailingErrorLog
  {
  public:
    FailingErrorLog()
      : logger_(logging::error_logger()), sink_(std::make_shared<ThrowingSink>())
    {
      logger_->sinks().push_back(sink_);
      logger_->set_error_handler([](const std::string& message)
      {
        throw std::runtime_error(message);
      });
    }

    ~FailingErrorLog()
    {
      auto& sinks = logger_->sinks();
      sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
      logger_->set_error_handler(nullptr);
    }

    FailingErrorLog(const FailingErrorLog&) = delete;
    FailingErrorLog& operator=(const FailingErrorLog&) = delete;

  private:
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<spdlog::sinks::sink> sink_;
  };

  AppConfig debug_config()
  {
    AppConfig config;
    config.debug = true;
    return config;
  }
}

TEST_F(ErrorHandlerTest, ResolvedHandlerProducesTheResponse)
{
  ErrorHandler handler;
  handler.add<TimeoutError>(FaultHandler([](HttpContext*, const std::exception& e) -> FaultHandler::Result
  {
    return text(e.what(), http::status::gateway_timeout);
  }, "timeouts"));

  auto ctx = make_context();
  const auto response = handler.respond(&ctx, TimeoutError());

  EXPECT_EQ(response.result(), http::status::gateway_timeout);
  EXPECT_EQ(response.body(), "timed out");
}

TEST_F(ErrorHandlerTest, UnregisteredSubclassUsesItsParentsHandler)
{
  ErrorHandler handler;
  handler.add<ValidationError>(FaultHandler([](HttpContext*, const std::exception& e) -> FaultHandler::Result
  {
    return text(std::string("validation: ") + e.what(), http::status::unprocessable_entity);
  }, "validation"));
  handler.add<BadRequest>(FaultHandler([](HttpContext*, const std::exception&) -> FaultHandler::Result
  {
    return text("bad request", http::status::bad_request);
  }, "badRequest"));

  auto ctx = make_context();
  const auto response = handler.respond(&ctx, EmailInvalid("no @ in address"));

  EXPECT_EQ(response.result(), http::status::unprocessable_entity);
  EXPECT_EQ(response.body(), "validation: no @ in address");
}

TEST_F(ErrorHandlerTest, RouteScopeComesFromTheContext)
{
  ErrorHandler handler;
  handler.add<TimeoutError>(FaultHandler([](HttpContext*, const std::exception&) -> FaultHandler::Result
  {
    return text("scoped");
  }, "scoped"), {"reports"});
  handler.add<TimeoutError>(FaultHandler([](HttpContext*, const std::exception&) -> FaultHandler::Result
  {
    return text("global");
  }, "global"));

  auto ctx = make_context();
  EXPECT_EQ(handler.respond(&ctx, TimeoutError()).body(), "global");

  ctx.set_route_name("reports");
  EXPECT_EQ(handler.respond(&ctx, TimeoutError()).body(), "scoped");

  EXPECT_EQ(handler.respond(nullptr, TimeoutError()).body().find("scoped"), std::string::npos);
}

TEST_F(ErrorHandlerTest, DecliningHandlerFallsBackToDefault)
{
  ErrorHandler handler;
  bool consulted = false;
  handler.add<NotFound>(FaultHandler([&consulted](HttpContext*, const std::exception&) -> FaultHandler::Result
  {
    consulted = true;
    return std::nullopt;
  }, "observer"));

  auto ctx = make_context();
  const auto response = handler.respond(&ctx, NotFound("no such page"));

  EXPECT_TRUE(consulted);
  EXPECT_EQ(response.result(), http::status::not_found);
  EXPECT_NE(response.body().find("no such page"), std::string::npos);
}

TEST_F(ErrorHandlerTest, UnresolvedFaultUsesTheDefaultRenderer)
{
  ErrorHandler handler;
  auto ctx = make_context();

  const auto response = handler.respond(&ctx, std::runtime_error("database password is hunter2"));

  EXPECT_EQ(response.result(), http::status::internal_server_error);
  EXPECT_EQ(response.body().find("hunter2"), std::string::npos);
  EXPECT_NE(response[http::field::content_type].find("text/plain"), boost::beast::string_view::npos);
}

TEST_F(ErrorHandlerTest, DoubleFaultInDebugNamesHandlerAndUrl)
{
  ErrorHandler handler(debug_config());
  handler.add<TimeoutError>(throwing("renderTimeout"));
  auto ctx = make_context();

  http::response<http::string_body> response;
  EXPECT_NO_THROW(response = handler.respond(&ctx, TimeoutError()));

  EXPECT_EQ(response.result(), http::status::internal_server_error);
  EXPECT_EQ(response.body(),
            "Exception raised in exception handler \"renderTimeout\" for uri: http://localhost/boom?x=1");
}

TEST_F(ErrorHandlerTest, DoubleFaultInProductionIsGeneric)
{
  ErrorHandler handler;
  handler.add<TimeoutError>(throwing("renderTimeout"));
  auto ctx = make_context();

  const auto response = handler.respond(&ctx, TimeoutError());

  EXPECT_EQ(response.result(), http::status::internal_server_error);
  EXPECT_EQ(response.body(), "An error occurred while handling an error");
  EXPECT_EQ(response.body().find("renderTimeout"), std::string::npos);
}

TEST_F(ErrorHandlerTest, DoubleFaultWithoutUrlReportsUnknown)
{
  ErrorHandler handler(debug_config());
  handler.add<TimeoutError>(throwing("renderTimeout"));

  const auto without_request = handler.respond(nullptr, TimeoutError());
  EXPECT_EQ(without_request.body(), "Exception raised in exception handler \"renderTimeout\" for uri: unknown");

  req.target("");
  auto ctx = make_context();
  const auto without_target = handler.respond(&ctx, TimeoutError());
  EXPECT_EQ(without_target.body(), "Exception raised in exception handler \"renderTimeout\" for uri: unknown");
}

TEST_F(ErrorHandlerTest, DoubleFaultIsLogged)
{
  LogCapture capture;
  ErrorHandler handler;
  handler.add<TimeoutError>(throwing("renderTimeout"));
  auto ctx = make_context();

  handler.respond(&ctx, TimeoutError());

  EXPECT_TRUE(capture.contains("renderTimeout"));
  EXPECT_TRUE(capture.contains("http://localhost/boom?x=1"));
  EXPECT_TRUE(capture.contains("handler is broken"));
}

TEST_F(ErrorHandlerTest, DoubleFaultSurvivesAFailingLogger)
{
  FailingErrorLog failing_log;
  ErrorHandler debug_handler(debug_config());
  debug_handler.add<TimeoutError>(throwing("renderTimeout"));
  ErrorHandler production_handler;
  production_handler.add<TimeoutError>(throwing("renderTimeout"));
  auto ctx = make_context();

  http::response<http::string_body> debug_response;
  EXPECT_NO_THROW(debug_response = debug_handler.respond(&ctx, TimeoutError()));
  EXPECT_EQ(debug_response.result(), http::status::internal_server_error);
  EXPECT_EQ(debug_response.body(),
            "Exception raised in exception handler \"renderTimeout\" for uri: http://localhost/boom?x=1");

  http::response<http::string_body> production_response;
  EXPECT_NO_THROW(production_response = production_handler.respond(&ctx, TimeoutError()));
  EXPECT_EQ(production_response.result(), http::status::internal_server_error);
  EXPECT_EQ(production_response.body(), "An error occurred while handling an error");
}

TEST_F(ErrorHandlerTest, NonStandardThrowFromHandlerIsContained)
{
  ErrorHandler handler(debug_config());
  handler.add<TimeoutError>(FaultHandler([](HttpContext*, const std::exception&) -> FaultHandler::Result
  {
    throw 42;
  }, "throwsInt"));
  auto ctx = make_context();

  const auto response = handler.respond(&ctx, TimeoutError());

  EXPECT_EQ(response.result(), http::status::internal_server_error);
  EXPECT_NE(response.body().find("throwsInt"), std::string::npos);
}

TEST_F(ErrorHandlerTest, QuietFaultsAreNotLogged)
{
  LogCapture capture;
  ErrorHandler handler;
  auto ctx = make_context();

  handler.respond(&ctx, NotFound());

  EXPECT_TRUE(capture.empty());
}

TEST_F(ErrorHandlerTest, NoisyExceptionsForceLogging)
{
  LogCapture capture;
  AppConfig config;
  config.noisy_exceptions = true;
  ErrorHandler handler;
  auto ctx = make_context(&config);

  handler.respond(&ctx, NotFound("nothing here"));

  EXPECT_TRUE(capture.contains("Exception occurred while handling uri: http://localhost/boom?x=1"));
  EXPECT_TRUE(capture.contains("nothing here"));
}

TEST_F(ErrorHandlerTest, HandlerConfigDecidesNoisinessWithoutARequest)
{
  LogCapture capture;
  AppConfig config;
  config.noisy_exceptions = true;
  ErrorHandler handler(config);

  handler.respond(nullptr, NotFound("nothing here"));

  EXPECT_TRUE(capture.contains("Exception occurred while handling uri: unknown"));
}

TEST_F(ErrorHandlerTest, LoudFaultsAreLogged)
{
  LogCapture capture;
  ErrorHandler handler;
  auto ctx = make_context();

  handler.respond(&ctx, std::runtime_error("disk full"));
  EXPECT_TRUE(capture.contains("disk full"));
}

TEST_F(ErrorHandlerTest, ExplicitQuietOverridesStatus)
{
  LogCapture capture;
  ErrorHandler handler;
  auto ctx = make_context();

  handler.respond(&ctx, ServerError("expected outage", true));
  EXPECT_TRUE(capture.empty());
}

TEST_F(ErrorHandlerTest, NonStandardPayloadBecomesServerError)
{
  ErrorHandler handler;
  bool seen = false;
  handler.add<ServerError>(FaultHandler([&seen](HttpContext*, const std::exception& e) -> FaultHandler::Result
  {
    seen = std::string(e.what()) == "Unknown exception";
    return std::nullopt;
  }, "observer"));
  auto ctx = make_context();

  const auto response = handler.respond(&ctx, std::make_exception_ptr(42));

  EXPECT_TRUE(seen);
  EXPECT_EQ(response.result(), http::status::internal_server_error);
}

TEST_F(ErrorHandlerTest, FinishPassesSuccessfulOutcomesThrough)
{
  ErrorHandler handler;
  auto ctx = make_context();

  const auto response = handler.finish(ctx, Outcome::success(text("fine")));
  EXPECT_EQ(response.result(), http::status::ok);
  EXPECT_EQ(response.body(), "fine");

  const auto failed = handler.finish(ctx, Outcome::failure(std::make_exception_ptr(Forbidden())));
  EXPECT_EQ(failed.result(), http::status::forbidden);
}

TEST_F(ErrorHandlerTest, SubclassCanObserveUnresolvedFaults)
{
  class ReportingErrorHandler : public ErrorHandler
  {
  public:
    std::vector<std::string> reported;

    HttpContext::Response default_response(HttpContext* ctx, const std::exception& e) override
    {
      reported.emplace_back(e.what());
      return ErrorHandler::default_response(ctx, e);
    }
  };

  ReportingErrorHandler handler;
  handler.add<NotFound>(FaultHandler([](HttpContext*, const std::exception&) -> FaultHandler::Result
  {
    return text("handled");
  }, "handled"));
  auto ctx = make_context();

  handler.respond(&ctx, NotFound());
  handler.respond(&ctx, TimeoutError());

  ASSERT_EQ(handler.reported.size(), 1u);
  EXPECT_EQ(handler.reported.front(), "timed out");
}

TEST_F(ErrorHandlerTest, FailingDefaultPathIsContained)
{
  class BrokenRenderer : public ErrorRenderer
  {
  public:
    HttpContext::Response render(const HttpContext*, const std::exception&, bool, ErrorFormat) const override
    {
      throw std::runtime_error("template missing");
    }
  };

  ErrorHandler handler(debug_config(), std::make_shared<BrokenRenderer>());
  auto ctx = make_context();

  const auto response = handler.respond(&ctx, TimeoutError());
  EXPECT_EQ(response.result(), http::status::internal_server_error);
  EXPECT_NE(response.body().find("\"default\""), std::string::npos);
}

TEST_F(ErrorHandlerTest, DefaultPathFailureAfterDecliningHandlerIsReportedAsDefault)
{
  class BrokenRenderer : public ErrorRenderer
  {
  public:
    HttpContext::Response render(const HttpContext*, const std::exception&, bool, ErrorFormat) const override
    {
      throw std::runtime_error("template missing");
    }
  };

  ErrorHandler handler(debug_config(), std::make_shared<BrokenRenderer>());
  handler.add<TimeoutError>(FaultHandler([](HttpContext*, const std::exception&) -> FaultHandler::Result
  {
    return std::nullopt;
  }, "declines"));
  auto ctx = make_context();

  const auto response = handler.respond(&ctx, TimeoutError());
  EXPECT_EQ(response.body(), "Exception raised in exception handler \"default\" for uri: http://localhost/boom?x=1");
}

TEST(ErrorHandlerFinalizeTest, ExplicitFallbackReplacesAuto)
{
  ErrorHandler handler;
  handler.finalize(ErrorFormat::Json);
  EXPECT_EQ(handler.fallback(), ErrorFormat::Json);

  handler.finalize(ErrorFormat::Html);
  EXPECT_EQ(handler.fallback(), ErrorFormat::Json);
}

TEST(ErrorHandlerFinalizeTest, ConfiguredFallbackIsKept)
{
  AppConfig config;
  config.fallback_error_format = ErrorFormat::Text;
  ErrorHandler handler(config);

  handler.finalize(ErrorFormat::Json);
  handler.finalize(std::nullopt);
  EXPECT_EQ(handler.fallback(), ErrorFormat::Text);
}
