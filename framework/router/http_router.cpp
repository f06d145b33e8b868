// framework/router/http_router.cpp
#include "http_router.hpp"
#include "exception/faults.hpp"
#include "logging/logger.hpp"
#include <fmt/core.h>
#include <algorithm>

namespace faultline::framework
{
  HttpRouter::HttpRouter() = default;

  int HttpRouter::count_literal_segments(const std::string& literal_part)
  {
    int literal_segments = 0;
    size_t start = 0;
    size_t found = literal_part.find('/');
    while (found != std::string::npos)
    {
      if (found > start)
      {
        literal_segments++;
      }
      start = found + 1;
      found = literal_part.find('/', start);
    }
    if (literal_part.length() > start)
    {
      literal_segments++;
    }
    return literal_segments;
  }

  std::tuple<std::regex, std::vector<std::string>, int, int> HttpRouter::parse_path_pattern(
    const std::string& path_pattern)
  {
    static const std::regex param_regex(":([a-zA-Z_][a-zA-Z0-9_]*)");
    static const std::regex special_chars(R"([\.\+\*\?\|\(\)\[\]\{\}\^\$])");

    std::string regex_str = "^";
    std::vector<std::string> param_names;
    int literal_segments = 0;
    int dynamic_segments = 0;

    const std::sregex_iterator end;
    const auto param_count = std::distance(std::sregex_iterator(path_pattern.begin(), path_pattern.end(),
                                                                param_regex), end);
    auto current_pos = path_pattern.begin();

    for (auto it = std::sregex_iterator(path_pattern.begin(), path_pattern.end(), param_regex); it != end; ++it)
    {
      const auto literal_part = std::string(current_pos, it->prefix().second);
      literal_segments += count_literal_segments(literal_part);
      regex_str += std::regex_replace(literal_part, special_chars, "\\$&");

      param_names.push_back(it->str().substr(1));
      dynamic_segments++;

      // the last parameter swallows the rest of the path
      regex_str += dynamic_segments == param_count ? "(.*)" : "([^/]+)";
      current_pos = it->suffix().first;
    }

    const auto tail_literal_part = std::string(current_pos, path_pattern.end());
    literal_segments += count_literal_segments(tail_literal_part);
    regex_str += std::regex_replace(tail_literal_part, special_chars, "\\$&");
    regex_str += "$";

    return {std::regex(regex_str), param_names, literal_segments, dynamic_segments};
  }

  std::string HttpRouter::add_route(const std::string& path_pattern, const boost::beast::http::verb method,
                                    HttpHandler handler, const std::string& name)
  {
    const auto logger = logging::router_logger();
    std::string route_name = name.empty()
                               ? fmt::format("{} {}", std::string(boost::beast::http::to_string(method)), path_pattern)
                               : name;

    for (auto& entry : routes_)
    {
      if (entry.original_path == path_pattern)
      {
        entry.handlers[method] = NamedHandler{route_name, std::move(handler)};
        logger->info("Updated handler for route: {} {} ({})", std::string(boost::beast::http::to_string(method)),
                     path_pattern, route_name);
        return route_name;
      }
    }

    RouteEntry new_entry;
    new_entry.original_path = path_pattern;
    auto [regex, params, literal_count, dynamic_count] = parse_path_pattern(path_pattern);
    new_entry.path_regex = std::move(regex);
    new_entry.param_names = std::move(params);
    new_entry.literal_segments_count = literal_count;
    new_entry.dynamic_segments_count = dynamic_count;
    new_entry.handlers[method] = NamedHandler{route_name, std::move(handler)};

    routes_.push_back(std::move(new_entry));
    std::stable_sort(routes_.begin(), routes_.end(), RouteEntry::compare_specificity);
    logger->info("Registered route: {} {} as {} (literal:{}, dynamic:{})",
                 std::string(boost::beast::http::to_string(method)), path_pattern, route_name, literal_count,
                 dynamic_count);
    return route_name;
  }

  void HttpRouter::get(const std::string& path, HttpHandler handler, const std::string& name)
  {
    add_route(path, boost::beast::http::verb::get, std::move(handler), name);
  }

  void HttpRouter::post(const std::string& path, HttpHandler handler, const std::string& name)
  {
    add_route(path, boost::beast::http::verb::post, std::move(handler), name);
  }

  void HttpRouter::put(const std::string& path, HttpHandler handler, const std::string& name)
  {
    add_route(path, boost::beast::http::verb::put, std::move(handler), name);
  }

  void HttpRouter::del(const std::string& path, HttpHandler handler, const std::string& name)
  {
    add_route(path, boost::beast::http::verb::delete_, std::move(handler), name);
  }

  void HttpRouter::options(const std::string& path, HttpHandler handler, const std::string& name)
  {
    add_route(path, boost::beast::http::verb::options, std::move(handler), name);
  }

  Outcome HttpRouter::dispatch(HttpContext& ctx) const
  {
    try
    {
      route(ctx);
    }
    catch (...)
    {
      return Outcome::failure(std::current_exception());
    }
    return Outcome::success(std::move(ctx.get_response()));
  }

  void HttpRouter::route(HttpContext& ctx) const
  {
    const std::string& request_path = ctx.path();
    const boost::beast::http::verb request_method = ctx.method();

    for (const auto& entry : routes_)
    {
      if (std::smatch matches; std::regex_match(request_path, matches, entry.path_regex))
      {
        const auto method_it = entry.handlers.find(request_method);
        if (method_it == entry.handlers.end())
        {
          raise_method_not_allowed(ctx, entry.handlers);
        }

        std::map<std::string, std::string> path_params;
        for (size_t i = 0; i < entry.param_names.size(); ++i)
        {
          if (i + 1 < matches.size())
          {
            path_params[entry.param_names[i]] = matches[i + 1].str();
          }
        }
        ctx.set_path_params(std::move(path_params));
        ctx.set_route_name(method_it->second.name);

        method_it->second.handler(ctx);
        return;
      }
    }

    throw NotFound(fmt::format("Requested URL {} not found", request_path));
  }

  void HttpRouter::raise_method_not_allowed(const HttpContext& ctx,
                                            const std::map<boost::beast::http::verb, NamedHandler>& allowed_methods)
  {
    std::string allowed_methods_str;
    bool first = true;
    for (const auto& pair : allowed_methods)
    {
      if (!first) allowed_methods_str += ", ";
      allowed_methods_str += std::string(boost::beast::http::to_string(pair.first));
      first = false;
    }

    MethodNotAllowed fault(fmt::format("Method {} not allowed for URL {}",
                                       std::string(boost::beast::http::to_string(ctx.method())), ctx.path()));
    fault.set_header("Allow", allowed_methods_str);
    throw fault;
  }
}
