#ifndef FAULTLINE_FRAMEWORK_RENDER_RESPONSES_HPP_
#define FAULTLINE_FRAMEWORK_RENDER_RESPONSES_HPP_

#include "context/http_context.hpp"
#include <boost/beast/http/status.hpp>
#include <string>

namespace faultline::framework
{
  inline HttpContext::Response make_response(boost::beast::http::status status, std::string body,
                                             boost::beast::string_view content_type)
  {
    HttpContext::Response res{status, 11};
    res.set(boost::beast::http::field::content_type, content_type);
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
  }

  inline HttpContext::Response text(std::string body,
                                    boost::beast::http::status status = boost::beast::http::status::ok)
  {
    return make_response(status, std::move(body), "text/plain; charset=utf-8");
  }

  inline HttpContext::Response html(std::string body,
                                    boost::beast::http::status status = boost::beast::http::status::ok)
  {
    return make_response(status, std::move(body), "text/html; charset=utf-8");
  }

  // body must already be serialized JSON
  inline HttpContext::Response json(std::string body,
                                    boost::beast::http::status status = boost::beast::http::status::ok)
  {
    return make_response(status, std::move(body), "application/json");
  }
}

#endif // FAULTLINE_FRAMEWORK_RENDER_RESPONSES_HPP_
