#include "framework/render/error_renderer.hpp"
#include "framework/exception/faults.hpp"
#include <gtest/gtest.h>
#include <boost/json.hpp>
#include <stdexcept>

namespace http = boost::beast::http;
namespace json = boost::json;
using namespace faultline::framework;

namespace
{
  class ErrorRendererTest : public ::testing::Test
  {
  protected:
    void SetUp() override
    {
      req.version(11);
      req.method(http::verb::get);
      req.target("/reports/7");
      req.set(http::field::host, "example.test");
    }

    HttpContext::Request req;
    HttpContext::Response res;
    ExceptionRenderer renderer;
  };
}

TEST_F(ErrorRendererTest, ForcedJsonCarriesStatusAndMessage)
{
  HttpContext ctx(req, res);
  const auto response = renderer.render(&ctx, NotFound("report 7 does not exist"), false, ErrorFormat::Json);

  EXPECT_EQ(response.result(), http::status::not_found);
  EXPECT_EQ(response[http::field::content_type], "application/json");

  const auto body = json::parse(response.body()).as_object();
  EXPECT_EQ(body.at("status").to_number<int>(), 404);
  EXPECT_EQ(body.at("message").as_string(), "report 7 does not exist");
  EXPECT_EQ(body.at("description").as_string(), "404 Not Found");
  EXPECT_FALSE(body.contains("exceptions"));
}

TEST_F(ErrorRendererTest, ProductionHidesInternalMessages)
{
  HttpContext ctx(req, res);
  const auto response = renderer.render(&ctx, std::runtime_error("secret connection string"), false,
                                        ErrorFormat::Text);

  EXPECT_EQ(response.result(), http::status::internal_server_error);
  EXPECT_EQ(response.body().find("secret"), std::string::npos);
  EXPECT_NE(response.body().find("500 Internal Server Error"), std::string::npos);
}

TEST_F(ErrorRendererTest, DebugExposesTheNestedExceptionChain)
{
  HttpContext ctx(req, res);
  try
  {
    try
    {
      throw std::out_of_range("row 12");
    }
    catch (...)
    {
      std::throw_with_nested(std::runtime_error("report failed"));
    }
  }
  catch (const std::exception& e)
  {
    const auto response = renderer.render(&ctx, e, true, ErrorFormat::Json);
    const auto body = json::parse(response.body()).as_object();

    EXPECT_EQ(body.at("message").as_string(), "report failed");
    EXPECT_EQ(body.at("path").as_string(), "/reports/7");
    const auto& exceptions = body.at("exceptions").as_array();
    ASSERT_EQ(exceptions.size(), 2u);
    EXPECT_EQ(exceptions[1].as_object().at("message").as_string(), "row 12");
    EXPECT_NE(std::string(exceptions[1].as_object().at("type").as_string()).find("out_of_range"),
              std::string::npos);
  }
}

TEST_F(ErrorRendererTest, AutoNegotiatesFromHeaders)
{
  EXPECT_EQ(ExceptionRenderer::negotiate(nullptr), ErrorFormat::Text);

  {
    HttpContext ctx(req, res);
    EXPECT_EQ(ExceptionRenderer::negotiate(&ctx), ErrorFormat::Html);
  }

  req.set(http::field::accept, "application/json");
  {
    HttpContext ctx(req, res);
    EXPECT_EQ(ExceptionRenderer::negotiate(&ctx), ErrorFormat::Json);
  }

  req.set(http::field::accept, "text/plain");
  {
    HttpContext ctx(req, res);
    EXPECT_EQ(ExceptionRenderer::negotiate(&ctx), ErrorFormat::Text);
  }

  req.set(http::field::accept, "text/html,application/xhtml+xml,text/plain;q=0.8");
  {
    HttpContext ctx(req, res);
    EXPECT_EQ(ExceptionRenderer::negotiate(&ctx), ErrorFormat::Html);
  }

  req.erase(http::field::accept);
  req.set(http::field::content_type, "application/json");
  {
    HttpContext ctx(req, res);
    EXPECT_EQ(ExceptionRenderer::negotiate(&ctx), ErrorFormat::Json);
  }
}

TEST_F(ErrorRendererTest, FaultHeadersAreCopied)
{
  HttpContext ctx(req, res);
  MethodNotAllowed fault("PATCH is not supported");
  fault.set_header("Allow", "GET, POST");

  const auto response = renderer.render(&ctx, fault, false, ErrorFormat::Html);

  EXPECT_EQ(response.result(), http::status::method_not_allowed);
  EXPECT_EQ(response["Allow"], "GET, POST");
}

TEST_F(ErrorRendererTest, HtmlEscapesMessages)
{
  HttpContext ctx(req, res);
  const auto response = renderer.render(&ctx, BadRequest("<script>alert(1)</script>"), false, ErrorFormat::Html);

  EXPECT_EQ(response.body().find("<script>"), std::string::npos);
  EXPECT_NE(response.body().find("&lt;script&gt;"), std::string::npos);
}

TEST(ErrorFormatTest, ParseAndPrint)
{
  EXPECT_EQ(parse_error_format("auto"), ErrorFormat::Auto);
  EXPECT_EQ(parse_error_format("json"), ErrorFormat::Json);
  EXPECT_STREQ(to_string(ErrorFormat::Html), "html");
  EXPECT_THROW(parse_error_format("xml"), std::invalid_argument);
}
