#include "ludo/catalog_api.hpp"
#include "ludo/http_result.hpp"
#include "ludo/product_json.hpp"

namespace ludo {

namespace {
const char statusText[] = "API is up and running";
const char productNotFound[] = "Product Not Found";
}  // namespace

CatalogApi::CatalogApi(const Catalog& catalog) : CatalogApi(catalog, Options()) {}

CatalogApi::CatalogApi(const Catalog& catalog, Options options)
    : catalog_(catalog), options_(options) {
    setupRoutes();
}

void CatalogApi::setupRoutes() {
    router_.addRoute(
        "GET", "/status", [this](const Request& req, Reply& rep, const Router::Params& params) {
            this->statusGet(req, rep, params);
        });

    router_.addRoute(
        "GET", "/products", [this](const Request& req, Reply& rep, const Router::Params& params) {
            this->productsGet(req, rep, params);
        });

    router_.addRoute("POST",
                     "/products/{slug}/feedback",
                     [this](const Request& req, Reply& rep, const Router::Params& params) {
                         this->productFeedbackPost(req, rep, params);
                     });
}

void CatalogApi::handleRequest(const Request& req, Reply& rep) {
    // On NoMatch the request goes on to the static files, unless the router
    // already answered 405.
    router_.handle(req, rep);
}

void CatalogApi::statusGet(const Request& /*req*/,
                           Reply& rep,
                           const Router::Params& /*params*/) {
    HttpResult result(rep.content_);
    result << statusText;
    rep.send(Reply::status_type::ok, "text/plain; charset=utf-8");
}

void CatalogApi::productsGet(const Request& /*req*/,
                             Reply& rep,
                             const Router::Params& /*params*/) {
    HttpResult result(rep.content_);
    result.buildJsonResponse([&]() -> cJSON* { return toJson(catalog_); });
    rep.send(Reply::status_type::ok, "application/json");
}

// The feedback body is read but not kept.
void CatalogApi::productFeedbackPost(const Request& /*req*/,
                                     Reply& rep,
                                     const Router::Params& params) {
    HttpResult result(rep.content_);
    const Product* product = catalog_.findBySlug(params.at("slug"));

    if (product == nullptr) {
        if (options_.strictFeedbackErrors) {
            result.jsonError(Reply::status_type::not_found, productNotFound);
            rep.send(result.statusCode_, "application/json");
        } else {
            result << productNotFound;
            rep.send(Reply::status_type::ok, "application/json");
        }
        return;
    }

    result.setJsonResponse(toJson(*product));
    rep.send(Reply::status_type::ok, "application/json");
}

}  // namespace ludo
