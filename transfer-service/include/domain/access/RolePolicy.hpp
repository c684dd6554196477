#pragma once

#include "domain/enums/Role.hpp"
#include <memory>
#include <string>

namespace transfer::domain {

/**
 * @brief Действие, на которое проверяются права роли
 */
enum class Capability {
    INITIATE_TRANSFERS,
    APPROVE_TRANSFERS,
    VIEW_AUDIT_LOG,
    VIEW_TRANSFERS
};

inline std::string toString(Capability capability) {
    switch (capability) {
        case Capability::INITIATE_TRANSFERS: return "INITIATE_TRANSFERS";
        case Capability::APPROVE_TRANSFERS: return "APPROVE_TRANSFERS";
        case Capability::VIEW_AUDIT_LOG: return "VIEW_AUDIT_LOG";
        case Capability::VIEW_TRANSFERS: return "VIEW_TRANSFERS";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Права роли
 *
 * | Role       | initiate | approve | audit | view |
 * | CONTROLLER |   yes    |   no    |  no   | yes  |
 * | ADMIN      |   yes    |   yes   |  yes  | yes  |
 * | AUDIT      |   no     |   no    |  yes  | yes  |
 * | NONE       |   no     |   no    |  no   | no   |
 */
class RolePolicy {
public:
    virtual ~RolePolicy() = default;

    virtual Role role() const = 0;
    virtual bool canInitiateTransfers() const = 0;
    virtual bool canApproveTransfers() const = 0;
    virtual bool canViewAuditLog() const = 0;
    virtual bool canViewTransfers() const = 0;

    bool allows(Capability capability) const {
        switch (capability) {
            case Capability::INITIATE_TRANSFERS: return canInitiateTransfers();
            case Capability::APPROVE_TRANSFERS: return canApproveTransfers();
            case Capability::VIEW_AUDIT_LOG: return canViewAuditLog();
            case Capability::VIEW_TRANSFERS: return canViewTransfers();
            default: return false;
        }
    }
};

class ControllerPolicy : public RolePolicy {
public:
    Role role() const override { return Role::CONTROLLER; }
    bool canInitiateTransfers() const override { return true; }
    bool canApproveTransfers() const override { return false; }
    bool canViewAuditLog() const override { return false; }
    bool canViewTransfers() const override { return true; }
};

class AdminPolicy : public RolePolicy {
public:
    Role role() const override { return Role::ADMIN; }
    bool canInitiateTransfers() const override { return true; }
    bool canApproveTransfers() const override { return true; }
    bool canViewAuditLog() const override { return true; }
    bool canViewTransfers() const override { return true; }
};

class AuditPolicy : public RolePolicy {
public:
    Role role() const override { return Role::AUDIT; }
    bool canInitiateTransfers() const override { return false; }
    bool canApproveTransfers() const override { return false; }
    bool canViewAuditLog() const override { return true; }
    bool canViewTransfers() const override { return true; }
};

class NoAccessPolicy : public RolePolicy {
public:
    Role role() const override { return Role::NONE; }
    bool canInitiateTransfers() const override { return false; }
    bool canApproveTransfers() const override { return false; }
    bool canViewAuditLog() const override { return false; }
    bool canViewTransfers() const override { return false; }
};

inline std::unique_ptr<RolePolicy> makeRolePolicy(Role role) {
    switch (role) {
        case Role::CONTROLLER: return std::make_unique<ControllerPolicy>();
        case Role::ADMIN: return std::make_unique<AdminPolicy>();
        case Role::AUDIT: return std::make_unique<AuditPolicy>();
        default: return std::make_unique<NoAccessPolicy>();
    }
}

} // namespace transfer::domain
