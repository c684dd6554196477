#pragma once

#include "Timestamp.hpp"
#include "enums/AuditAction.hpp"
#include <optional>
#include <string>
#include <vector>

namespace transfer::domain {

struct AuditRecordFilter {
    std::optional<std::string> actorId;
    std::optional<std::string> transferId;
    std::optional<std::string> accountId;
    std::vector<AuditAction> actions;
    std::optional<Timestamp> from;
    std::optional<Timestamp> to;
    int limit = 50;
    int offset = 0;
};

} // namespace transfer::domain
