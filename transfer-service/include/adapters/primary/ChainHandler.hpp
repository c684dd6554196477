// adapters/primary/ChainHandler.hpp
#pragma once
#include <IHttpHandler.hpp>
#include <memory>
#include <vector>
#include <iostream>
#include <nlohmann/json.hpp>

namespace transfer::adapters::primary
{

    /**
     * @brief Цепочка middleware + обработчик
     *
     * Звенья вызываются по порядку, пока одно из них не выставит ненулевой статус.
     * Middleware при успехе оставляет статус 0.
     */
    class ChainHandler : public IHttpHandler
    {
    public:
        template <typename... Handlers>
        explicit ChainHandler(Handlers &&...handlers)
        {
            (handlers_.push_back(std::forward<Handlers>(handlers)), ...);
        }

        void handle(IRequest &req, IResponse &res) override
        {
            for (auto &h : handlers_)
            {
                h->handle(req, res);
                if (res.getStatus() != 0)
                    return;
            }

            std::cerr << "[ChainHandler] Error: chain finished with zero status" << std::endl;
            sendError(res, 500, "Internal server error");
        }

    private:
        std::vector<std::shared_ptr<IHttpHandler>> handlers_;

        void sendError(IResponse &res, int status, const std::string &message)
        {
            nlohmann::json error;
            error["error"] = message;
            res.setResult(status, "application/json", error.dump());
        }
    };

} // namespace transfer::adapters::primary
