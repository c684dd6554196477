#pragma once

#include "domain/Transfer.hpp"
#include "domain/RequestMetadata.hpp"
#include "domain/enums/Decision.hpp"
#include <string>
#include <optional>

namespace transfer::ports::input {

struct DecideApprovalCommand {
    std::string transferId;
    std::string approverId;
    domain::Decision decision = domain::Decision::APPROVED;
    std::optional<std::string> notes;
    domain::RequestMetadata metadata;
};

/**
 * @brief Входной порт одобрения крупных переводов
 */
class IApprovalService {
public:
    virtual ~IApprovalService() = default;

    /**
     * @brief Одобрить или отклонить перевод, ожидающий решения
     * @throws domain::WorkflowError перевод не найден, уже решён или свой
     * @throws domain::ValidationError баланс на момент одобрения не позволяет исполнить
     * @throws domain::ExecutionError исполнение не удалось, перевод записан как FAILED
     */
    virtual domain::Transfer decide(const DecideApprovalCommand& command) = 0;
};

} // namespace transfer::ports::input
