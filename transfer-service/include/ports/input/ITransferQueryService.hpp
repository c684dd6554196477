#pragma once

#include "domain/Transfer.hpp"
#include "domain/TransferDetails.hpp"
#include "domain/TransferFilter.hpp"
#include "domain/AuditRecord.hpp"
#include "domain/Page.hpp"
#include <string>
#include <optional>
#include <vector>

namespace transfer::ports::input {

/**
 * @brief Чтение переводов
 */
class ITransferQueryService {
public:
    virtual ~ITransferQueryService() = default;

    virtual std::optional<domain::TransferDetails> getTransferById(const std::string& transferId) = 0;
    virtual domain::Page<domain::Transfer> listTransfers(const domain::TransferFilter& filter) = 0;
    virtual std::vector<domain::Transfer> listPendingApprovals(const std::string& excludingActor) = 0;
    virtual std::vector<domain::AuditRecord> listAuditTrail(const std::string& transferId) = 0;
};

} // namespace transfer::ports::input
