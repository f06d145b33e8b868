#ifndef FAULTLINE_FRAMEWORK_CONTEXT_HTTP_CONTEXT_HPP_
#define FAULTLINE_FRAMEWORK_CONTEXT_HTTP_CONTEXT_HPP_

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/url/url_view.hpp>
#include <string>
#include <map>
#include <optional>
#include <any>

namespace faultline::framework
{
  struct AppConfig;

  class HttpContext
  {
  public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    HttpContext(Request& req, Response& res, const AppConfig* config = nullptr);

    const std::string& path() const;
    boost::beast::http::verb method() const;
    std::string body() const;

    /**
     * @brief Best-effort absolute URL of the request.
     * @return "http://<host><target>" when a Host header is present, the bare
     *         target otherwise, std::nullopt when the request has no target.
     */
    std::optional<std::string> url() const;

    std::optional<std::string> get_query_param(const std::string& key) const;
    std::optional<std::string> get_path_param(const std::string& key) const;
    std::optional<std::string> get_header(boost::beast::string_view name) const;
    std::optional<std::string> get_header(boost::beast::http::field name) const;

    // Name of the matched route, unset until routing completes.
    const std::optional<std::string>& route_name() const { return route_name_; }
    void set_route_name(std::string name) const { route_name_ = std::move(name); }

    // Application configuration the request is served under, may be null.
    const AppConfig* config() const { return config_; }

    void set_status(boost::beast::http::status status) const;
    void set_body(std::string body) const;
    void set_header(boost::beast::string_view name, boost::beast::string_view value) const;
    void set_header(boost::beast::http::field name, boost::beast::string_view value) const;
    void set_content_type(boost::beast::string_view type) const;

    Request& get_request() const { return req_; }
    Response& get_response() const { return res_; }

    void set_path_params(std::map<std::string, std::string> params) const;

    void set_attribute(const std::string& key, std::any value) const
    {
      extended_data_[key] = std::move(value);
    }

    template <typename T>
    std::optional<T> get_attribute_as(const std::string& key) const
    {
      auto it = extended_data_.find(key);
      if (it != extended_data_.end())
      {
        if (const auto* value = std::any_cast<T>(&it->second))
        {
          return *value;
        }
      }
      return std::nullopt;
    }

  private:
    Request& req_;
    Response& res_;
    const AppConfig* config_;

    mutable std::string cached_path_;
    mutable boost::urls::url_view parsed_url_;
    mutable bool url_parsed_ = false;

    mutable std::map<std::string, std::string> path_params_;
    mutable std::optional<std::string> route_name_;
    mutable std::map<std::string, std::any> extended_data_;

    void parse_url_components() const;
  };
}
#endif // FAULTLINE_FRAMEWORK_CONTEXT_HTTP_CONTEXT_HPP_
