// framework/context/http_context.cpp
#include "http_context.hpp"
#include "logging/logger.hpp"
#include <boost/url/parse.hpp>

namespace faultline::framework
{
  HttpContext::HttpContext(Request& req, Response& res, const AppConfig* config)
    : req_(req), res_(res), config_(config)
  {
    res_.version(req_.version());
    res_.keep_alive(req_.keep_alive());
    res_.set(boost::beast::http::field::content_type, "text/plain");
  }

  void HttpContext::parse_url_components() const
  {
    if (url_parsed_)
    {
      return;
    }
    if (boost::system::result<boost::urls::url_view> url_result = boost::urls::parse_relative_ref(req_.target());
      url_result.has_value())
    {
      parsed_url_ = url_result.value();
      cached_path_ = parsed_url_.path();
    }
    else
    {
      cached_path_ = std::string(req_.target());
      logging::router_logger()->warn("Failed to parse request target '{}' as relative-ref: {}",
                                     std::string(req_.target()), url_result.error().message());
    }
    url_parsed_ = true;
  }

  const std::string& HttpContext::path() const
  {
    parse_url_components();
    return cached_path_;
  }

  boost::beast::http::verb HttpContext::method() const
  {
    return req_.method();
  }

  std::string HttpContext::body() const
  {
    return req_.body();
  }

  std::optional<std::string> HttpContext::url() const
  {
    if (req_.target().empty())
    {
      return std::nullopt;
    }
    const std::string target(req_.target());
    if (const auto host = get_header(boost::beast::http::field::host); host && !host->empty())
    {
      return "http://" + *host + target;
    }
    return target;
  }

  std::optional<std::string> HttpContext::get_query_param(const std::string& key) const
  {
    parse_url_components();
    for (auto param : parsed_url_.params())
    {
      if (param.key == key) return std::string(param.value);
    }
    return std::nullopt;
  }

  std::optional<std::string> HttpContext::get_path_param(const std::string& key) const
  {
    if (const auto it = path_params_.find(key); it != path_params_.end())
    {
      return it->second;
    }
    return std::nullopt;
  }

  std::optional<std::string> HttpContext::get_header(const boost::beast::string_view name) const
  {
    if (const auto it = req_.find(name); it != req_.end())
    {
      return std::string(it->value());
    }
    return std::nullopt;
  }

  std::optional<std::string> HttpContext::get_header(const boost::beast::http::field name) const
  {
    return get_header(boost::beast::http::to_string(name));
  }

  void HttpContext::set_status(const boost::beast::http::status status) const
  {
    res_.result(status);
  }

  void HttpContext::set_body(std::string body) const
  {
    res_.body() = std::move(body);
    res_.prepare_payload();
  }

  void HttpContext::set_header(const boost::beast::string_view name, const boost::beast::string_view value) const
  {
    res_.set(name, value);
  }

  void HttpContext::set_header(const boost::beast::http::field name, const boost::beast::string_view value) const
  {
    res_.set(name, value);
  }

  void HttpContext::set_content_type(const boost::beast::string_view type) const
  {
    res_.set(boost::beast::http::field::content_type, type);
  }

  void HttpContext::set_path_params(std::map<std::string, std::string> params) const
  {
    path_params_ = std::move(params);
  }
}
