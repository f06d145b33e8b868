//
// Accounts API: faults raised by its routes are rendered as HTML by a
// controller-scoped handler, the rest of the application renders them as JSON.
//

#ifndef VALIDATIONCONTROLLER_HPP
#define VALIDATIONCONTROLLER_HPP
#include "controller/http_controller.hpp"
#include "exception/faults.hpp"
#include "render/responses.hpp"

FAULTLINE_DEFINE_FAULT(ValidationError, faultline::framework::BadRequest,
                       boost::beast::http::status::unprocessable_entity, "Validation failed");

class ValidationController : public faultline::framework::BaseController<ValidationController>
{
public:
  ValidationController() : BaseController("api")
  {
  }

  static std::shared_ptr<ValidationController> create() { return std::make_shared<ValidationController>(); }

  void register_routes(faultline::framework::HttpRouter& router) override
  {
    FAULTLINE_ROUTE(post, "/api/accounts/:id", handle_update);
  }

  void register_fault_handlers(faultline::framework::ErrorHandler& handler) override
  {
    exception<ValidationError>(handler, faultline::framework::FaultHandler(
                                                       &ValidationController::render_html, "renderHTML"));
  }

private:
  void handle_update(faultline::framework::HttpContext& ctx)
  {
    if (ctx.body().empty())
    {
      throw ValidationError(
        fmt::format("Account {} update has no body", ctx.get_path_param("id").value_or("?")));
    }
    ctx.set_status(boost::beast::http::status::ok);
    ctx.set_content_type("application/json");
    ctx.set_body(ctx.body());
  }

  static faultline::framework::FaultHandler::Result render_html(faultline::framework::HttpContext* ctx,
                                                                const std::exception& e)
  {
    return faultline::framework::html(fmt::format("<h1>Invalid request</h1><p>{}</p>", e.what()),
                                      boost::beast::http::status::unprocessable_entity);
  }
};

#endif //VALIDATIONCONTROLLER_HPP
