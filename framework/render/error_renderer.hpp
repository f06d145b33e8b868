#ifndef FAULTLINE_FRAMEWORK_RENDER_ERROR_RENDERER_HPP_
#define FAULTLINE_FRAMEWORK_RENDER_ERROR_RENDERER_HPP_

#include "context/http_context.hpp"
#include <exception>
#include <string>
#include <vector>

namespace faultline::framework
{
  enum class ErrorFormat
  {
    Auto, // negotiated per request
    Html,
    Text,
    Json
  };

  // "auto", "html", "text" or "json", throws std::invalid_argument otherwise
  ErrorFormat parse_error_format(const std::string& value);
  const char* to_string(ErrorFormat format);

  /**
   * @brief Turns a fault into a formatted response for the built-in default path.
   */
  class ErrorRenderer
  {
  public:
    virtual ~ErrorRenderer() = default;

    /**
     * @param ctx The request context, null when the fault happened before one existed.
     * @param e The fault.
     * @param debug Expose exception types, messages and the nested exception chain.
     * @param fallback The configured format, ErrorFormat::Auto to negotiate.
     */
    virtual HttpContext::Response render(const HttpContext* ctx, const std::exception& e, bool debug,
                                         ErrorFormat fallback) const = 0;
  };

  class ExceptionRenderer : public ErrorRenderer
  {
  public:
    HttpContext::Response render(const HttpContext* ctx, const std::exception& e, bool debug,
                                 ErrorFormat fallback) const override;

    // Format picked for `ctx` when the fallback is ErrorFormat::Auto.
    static ErrorFormat negotiate(const HttpContext* ctx);

  private:
    struct ChainEntry
    {
      std::string type;
      std::string message;
    };

    struct Report
    {
      unsigned status;
      std::string title;
      std::string message;
      std::string path;
      std::vector<ChainEntry> chain;
    };

    static Report make_report(const HttpContext* ctx, const std::exception& e, bool debug);
    static void collect_chain(const std::exception& e, std::vector<ChainEntry>& chain);

    static std::string render_html(const Report& report, bool debug);
    static std::string render_text(const Report& report, bool debug);
    static std::string render_json(const Report& report, bool debug);
  };
}

#endif // FAULTLINE_FRAMEWORK_RENDER_ERROR_RENDERER_HPP_
