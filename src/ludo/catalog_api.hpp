#pragma once

#include "ludo/catalog.hpp"
#include "ludo/reply.hpp"
#include "ludo/request.hpp"
#include "ludo/router.hpp"

namespace ludo {

// REST API over a Catalog:
//   GET  /status
//   GET  /products
//   POST /products/{slug}/feedback
// Add handleRequest to the server with Server::addRequestHandler.
class CatalogApi {
   public:
    struct Options {
        // Answer feedback for an unknown slug with 404 and a JSON error object
        // instead of 200 and the bare text "Product Not Found".
        bool strictFeedbackErrors = false;
    };

    // The catalog must outlive the api.
    explicit CatalogApi(const Catalog& catalog);
    CatalogApi(const Catalog& catalog, Options options);
    CatalogApi(const CatalogApi&) = delete;
    CatalogApi& operator=(const CatalogApi&) = delete;
    virtual ~CatalogApi() = default;

    void handleRequest(const Request& req, Reply& rep);

   private:
    void setupRoutes();

    void statusGet(const Request& req, Reply& rep, const Router::Params& params);
    void productsGet(const Request& req, Reply& rep, const Router::Params& params);
    void productFeedbackPost(const Request& req, Reply& rep, const Router::Params& params);

    const Catalog& catalog_;
    const Options options_;
    Router router_;
};

}  // namespace ludo
