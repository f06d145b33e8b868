// framework/router/http_router.hpp
#ifndef FAULTLINE_FRAMEWORK_ROUTER_HTTP_ROUTER_HPP_
#define FAULTLINE_FRAMEWORK_ROUTER_HTTP_ROUTER_HPP_

#include "context/http_context.hpp"
#include "exception/outcome.hpp"
#include <boost/beast/http/verb.hpp>
#include <functional>
#include <string>
#include <map>
#include <vector>
#include <regex>
#include <tuple>

namespace faultline::framework
{
  using HttpHandler = std::function<void(HttpContext&)>;

  struct NamedHandler
  {
    std::string name;
    HttpHandler handler;
  };

  struct RouteEntry
  {
    std::string original_path;
    std::regex path_regex;
    std::vector<std::string> param_names;
    std::map<boost::beast::http::verb, NamedHandler> handlers;
    int literal_segments_count = 0;
    int dynamic_segments_count = 0;

    // true when a is more specific than b: more literal segments first, then fewer dynamic ones
    static bool compare_specificity(const RouteEntry& a, const RouteEntry& b)
    {
      if (a.literal_segments_count != b.literal_segments_count)
      {
        return a.literal_segments_count > b.literal_segments_count;
      }
      return a.dynamic_segments_count < b.dynamic_segments_count;
    }
  };

  /**
   * @brief Route table. Every route has a name, used as the route scope of the
   * faults it raises; unnamed routes are called "<VERB> <path>".
   */
  class HttpRouter
  {
  public:
    HttpRouter();

    void get(const std::string& path, HttpHandler handler, const std::string& name = "");
    void post(const std::string& path, HttpHandler handler, const std::string& name = "");
    void put(const std::string& path, HttpHandler handler, const std::string& name = "");
    void del(const std::string& path, HttpHandler handler, const std::string& name = "");
    void options(const std::string& path, HttpHandler handler, const std::string& name = "");

    // Returns the name the route was registered under.
    std::string add_route(const std::string& path_pattern, boost::beast::http::verb method, HttpHandler handler,
                          const std::string& name = "");

    /**
     * @brief Runs the matching route.
     *
     * An unknown path raises NotFound and a known path under another verb raises
     * MethodNotAllowed, both before routing completes so the context has no
     * route name. Whatever the route handler throws becomes the fault payload.
     */
    Outcome dispatch(HttpContext& ctx) const;

    std::size_t route_count() const { return routes_.size(); }

  private:
    std::vector<RouteEntry> routes_;

    void route(HttpContext& ctx) const;

    static std::tuple<std::regex, std::vector<std::string>, int, int> parse_path_pattern(
      const std::string& path_pattern);
    static int count_literal_segments(const std::string& literal_part);

    [[noreturn]] static void raise_method_not_allowed(const HttpContext& ctx,
                                                      const std::map<boost::beast::http::verb, NamedHandler>&
                                                      allowed_methods);
  };
}
#endif // FAULTLINE_FRAMEWORK_ROUTER_HTTP_ROUTER_HPP_
