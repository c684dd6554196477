#pragma once

#include "domain/Approval.hpp"
#include <string>
#include <optional>

namespace transfer::ports::output {

class IApprovalRepository {
public:
    virtual ~IApprovalRepository() = default;

    virtual void insert(const domain::Approval& approval) = 0;
    virtual void update(const domain::Approval& approval) = 0;
    virtual std::optional<domain::Approval> findByTransferId(const std::string& transferId) = 0;
};

} // namespace transfer::ports::output
