// framework/render/error_renderer.cpp
#include "error_renderer.hpp"
#include "exception/faults.hpp"
#include "render/responses.hpp"
#include <boost/core/demangle.hpp>
#include <boost/json.hpp>
#include <fmt/core.h>
#include <stdexcept>
#include <typeinfo>

namespace faultline::framework
{
  namespace
  {
    constexpr const char* kGenericMessage =
      "The server encountered an internal error and cannot complete your request.";

    std::string escape_html(const std::string& input)
    {
      std::string out;
      out.reserve(input.size());
      for (const char c : input)
      {
        switch (c)
        {
        case '&': out += "&amp;";
          break;
        case '<': out += "&lt;";
          break;
        case '>': out += "&gt;";
          break;
        case '"': out += "&quot;";
          break;
        case '\'': out += "&#39;";
          break;
        default: out += c;
        }
      }
      return out;
    }

    bool contains(const std::optional<std::string>& header, const char* token)
    {
      return header && header->find(token) != std::string::npos;
    }
  }

  ErrorFormat parse_error_format(const std::string& value)
  {
    if (value == "auto") return ErrorFormat::Auto;
    if (value == "html") return ErrorFormat::Html;
    if (value == "text") return ErrorFormat::Text;
    if (value == "json") return ErrorFormat::Json;
    throw std::invalid_argument(fmt::format("Unknown error format '{}', expected auto, html, text or json", value));
  }

  const char* to_string(const ErrorFormat format)
  {
    switch (format)
    {
    case ErrorFormat::Html:
      return "html";
    case ErrorFormat::Text:
      return "text";
    case ErrorFormat::Json:
      return "json";
    case ErrorFormat::Auto:
    default:
      return "auto";
    }
  }

  ErrorFormat ExceptionRenderer::negotiate(const HttpContext* ctx)
  {
    if (ctx == nullptr)
    {
      return ErrorFormat::Text;
    }
    const auto accept = ctx->get_header(boost::beast::http::field::accept);
    if (contains(accept, "application/json")
      || contains(ctx->get_header(boost::beast::http::field::content_type), "application/json"))
    {
      return ErrorFormat::Json;
    }
    if (contains(accept, "text/plain") && !contains(accept, "text/html"))
    {
      return ErrorFormat::Text;
    }
    return ErrorFormat::Html;
  }

  HttpContext::Response ExceptionRenderer::render(const HttpContext* ctx, const std::exception& e, const bool debug,
                                                  const ErrorFormat fallback) const
  {
    const auto report = make_report(ctx, e, debug);
    const auto status = status_of(e);

    HttpContext::Response res;
    switch (fallback == ErrorFormat::Auto ? negotiate(ctx) : fallback)
    {
    case ErrorFormat::Json:
      res = json(render_json(report, debug), status);
      break;
    case ErrorFormat::Text:
      res = text(render_text(report, debug), status);
      break;
    case ErrorFormat::Html:
    case ErrorFormat::Auto:
    default:
      res = html(render_html(report, debug), status);
      break;
    }

    if (const auto* fault = dynamic_cast<const Fault*>(&e))
    {
      for (const auto& [name, value] : fault->headers())
      {
        res.set(name, value);
      }
    }
    return res;
  }

  ExceptionRenderer::Report ExceptionRenderer::make_report(const HttpContext* ctx, const std::exception& e,
                                                          const bool debug)
  {
    const auto status = status_of(e);
    Report report;
    report.status = static_cast<unsigned>(status);
    report.title = fmt::format("{} {}", report.status, std::string(boost::beast::http::obsolete_reason(status)));

    std::string message = e.what();
    if (!debug && status == boost::beast::http::status::internal_server_error)
    {
      message = kGenericMessage;
    }
    report.message = message.empty() ? std::string(boost::beast::http::obsolete_reason(status)) : message;

    if (ctx != nullptr)
    {
      report.path = ctx->path();
    }
    if (debug)
    {
      collect_chain(e, report.chain);
    }
    return report;
  }

  void ExceptionRenderer::collect_chain(const std::exception& e, std::vector<ChainEntry>& chain)
  {
    chain.push_back({boost::core::demangle(typeid(e).name()), e.what()});
    try
    {
      std::rethrow_if_nested(e);
    }
    catch (const std::exception& nested)
    {
      collect_chain(nested, chain);
    }
    catch (...)
    {
      chain.push_back({"unknown", "non-standard exception"});
    }
  }

  std::string ExceptionRenderer::render_html(const Report& report, const bool debug)
  {
    std::string body = fmt::format(
      "<!DOCTYPE html><html lang=\"en\"><head><meta charset=\"utf-8\"><title>{0}</title></head>"
      "<body><h1>{0}</h1><p>{1}</p>",
      escape_html(report.title), escape_html(report.message));

    if (debug && !report.chain.empty())
    {
      body += fmt::format("<h2>Exception chain for {}</h2><ul>", escape_html(report.path));
      for (const auto& entry : report.chain)
      {
        body += fmt::format("<li><code>{}</code>: {}</li>", escape_html(entry.type), escape_html(entry.message));
      }
      body += "</ul>";
    }
    body += "</body></html>";
    return body;
  }

  std::string ExceptionRenderer::render_text(const Report& report, const bool debug)
  {
    std::string body = fmt::format("{}\n{}\n\n{}\n", report.title, std::string(report.title.size(), '='),
                                   report.message);
    if (debug && !report.chain.empty())
    {
      body += fmt::format("\nException chain for {}:\n", report.path.empty() ? "unknown" : report.path);
      for (const auto& entry : report.chain)
      {
        body += fmt::format("  {}: {}\n", entry.type, entry.message);
      }
    }
    return body;
  }

  std::string ExceptionRenderer::render_json(const Report& report, const bool debug)
  {
    boost::json::object body;
    body["description"] = report.title;
    body["status"] = report.status;
    body["message"] = report.message;

    if (debug)
    {
      body["path"] = report.path;
      boost::json::array exceptions;
      for (const auto& entry : report.chain)
      {
        exceptions.push_back(boost::json::object{{"type", entry.type}, {"message", entry.message}});
      }
      body["exceptions"] = std::move(exceptions);
    }
    return boost::json::serialize(body);
  }
}
