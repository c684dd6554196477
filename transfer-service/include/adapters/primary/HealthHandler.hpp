#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/output/ITransferStore.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace transfer::adapters::primary {

/**
 * @brief GET /health, заодно проверяет доступность хранилища
 */
class HealthHandler : public IHttpHandler {
public:
    explicit HealthHandler(std::shared_ptr<ports::output::ITransferStore> store)
        : store_(std::move(store)) {}

    void handle(IRequest& req, IResponse& res) override {
        bool storeUp = store_->ping();

        nlohmann::json response;
        response["status"] = storeUp ? "healthy" : "degraded";
        response["service"] = "transfer-service";
        response["version"] = "1.0.0";
        response["database"] = storeUp ? "up" : "down";

        res.setResult(storeUp ? 200 : 503, "application/json", response.dump());
    }

private:
    std::shared_ptr<ports::output::ITransferStore> store_;
};

} // namespace transfer::adapters::primary
