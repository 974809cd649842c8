#include "kt/access/permission_matrix.h"

#include <algorithm>

#include "kt/error.h"
#include "kt/errors.h"

namespace kt::access {

const std::array<Permission, kPermissionCount> kAllPermissions = {
    Permission::kEntriesCreate,     Permission::kEntriesRead,       Permission::kEntriesUpdate,
    Permission::kEntriesDelete,     Permission::kTasksCreate,       Permission::kTasksRead,
    Permission::kTasksUpdate,       Permission::kTasksDelete,       Permission::kDocumentsCreate,
    Permission::kDocumentsRead,     Permission::kDocumentsDelete,   Permission::kSettingsRead,
    Permission::kSettingsUpdate,    Permission::kFamilyInvite,      Permission::kFamilyManage,
    Permission::kMedicationsCreate, Permission::kMedicationsRead,   Permission::kMedicationsUpdate,
    Permission::kMedicationsDelete, Permission::kHelpTasksCreate,   Permission::kHelpTasksRead,
    Permission::kHelpTasksClaim,    Permission::kHelpTasksComplete, Permission::kSecurityLogsRead,
    Permission::kDataExport,        Permission::kDataImport,        Permission::kDataReset,
};

namespace {

bool ContributorGrant(Permission permission) noexcept {
  switch (permission) {
    case Permission::kEntriesCreate:
    case Permission::kEntriesRead:
    case Permission::kEntriesUpdate:
    case Permission::kTasksCreate:
    case Permission::kTasksRead:
    case Permission::kTasksUpdate:
    case Permission::kDocumentsCreate:
    case Permission::kDocumentsRead:
    case Permission::kSettingsRead:
    case Permission::kMedicationsRead:
    case Permission::kMedicationsUpdate:
    case Permission::kHelpTasksCreate:
    case Permission::kHelpTasksRead:
    case Permission::kHelpTasksClaim:
    case Permission::kHelpTasksComplete:
    case Permission::kDataExport:
      return true;
    case Permission::kEntriesDelete:
    case Permission::kTasksDelete:
    case Permission::kDocumentsDelete:
    case Permission::kSettingsUpdate:
    case Permission::kFamilyInvite:
    case Permission::kFamilyManage:
    case Permission::kMedicationsCreate:
    case Permission::kMedicationsDelete:
    case Permission::kSecurityLogsRead:
    case Permission::kDataImport:
    case Permission::kDataReset:
      return false;
  }
  return false;
}

bool ViewerGrant(Permission permission) noexcept {
  switch (permission) {
    case Permission::kEntriesRead:
    case Permission::kTasksRead:
    case Permission::kDocumentsRead:
    case Permission::kSettingsRead:
    case Permission::kMedicationsRead:
    case Permission::kHelpTasksRead:
      return true;
    case Permission::kEntriesCreate:
    case Permission::kEntriesUpdate:
    case Permission::kEntriesDelete:
    case Permission::kTasksCreate:
    case Permission::kTasksUpdate:
    case Permission::kTasksDelete:
    case Permission::kDocumentsCreate:
    case Permission::kDocumentsDelete:
    case Permission::kSettingsUpdate:
    case Permission::kFamilyInvite:
    case Permission::kFamilyManage:
    case Permission::kMedicationsCreate:
    case Permission::kMedicationsUpdate:
    case Permission::kMedicationsDelete:
    case Permission::kHelpTasksCreate:
    case Permission::kHelpTasksClaim:
    case Permission::kHelpTasksComplete:
    case Permission::kSecurityLogsRead:
    case Permission::kDataExport:
    case Permission::kDataImport:
    case Permission::kDataReset:
      return false;
  }
  return false;
}

}  // namespace

const char* ToString(Permission permission) {
  switch (permission) {
    case Permission::kEntriesCreate:
      return "entries:create";
    case Permission::kEntriesRead:
      return "entries:read";
    case Permission::kEntriesUpdate:
      return "entries:update";
    case Permission::kEntriesDelete:
      return "entries:delete";
    case Permission::kTasksCreate:
      return "tasks:create";
    case Permission::kTasksRead:
      return "tasks:read";
    case Permission::kTasksUpdate:
      return "tasks:update";
    case Permission::kTasksDelete:
      return "tasks:delete";
    case Permission::kDocumentsCreate:
      return "documents:create";
    case Permission::kDocumentsRead:
      return "documents:read";
    case Permission::kDocumentsDelete:
      return "documents:delete";
    case Permission::kSettingsRead:
      return "settings:read";
    case Permission::kSettingsUpdate:
      return "settings:update";
    case Permission::kFamilyInvite:
      return "family:invite";
    case Permission::kFamilyManage:
      return "family:manage";
    case Permission::kMedicationsCreate:
      return "medications:create";
    case Permission::kMedicationsRead:
      return "medications:read";
    case Permission::kMedicationsUpdate:
      return "medications:update";
    case Permission::kMedicationsDelete:
      return "medications:delete";
    case Permission::kHelpTasksCreate:
      return "help_tasks:create";
    case Permission::kHelpTasksRead:
      return "help_tasks:read";
    case Permission::kHelpTasksClaim:
      return "help_tasks:claim";
    case Permission::kHelpTasksComplete:
      return "help_tasks:complete";
    case Permission::kSecurityLogsRead:
      return "security_logs:read";
    case Permission::kDataExport:
      return "data:export";
    case Permission::kDataImport:
      return "data:import";
    case Permission::kDataReset:
      return "data:reset";
  }
  return "unknown";
}

const char* ToString(Role role) {
  switch (role) {
    case Role::kAdmin:
      return "ADMIN";
    case Role::kContributor:
      return "CONTRIBUTOR";
    case Role::kViewer:
      return "VIEWER";
  }
  return "VIEWER";
}

std::optional<Permission> ParsePermission(std::string_view name) {
  for (auto permission : kAllPermissions) {
    if (name == ToString(permission)) {
      return permission;
    }
  }
  return std::nullopt;
}

std::optional<Role> ParseRole(std::string_view name) {
  for (auto role : {Role::kAdmin, Role::kContributor, Role::kViewer}) {
    if (name == ToString(role)) {
      return role;
    }
  }
  return std::nullopt;
}

Permission RequireKnownPermission(std::string_view name) {
  auto permission = ParsePermission(name);
  if (!permission) {
    throw kt::ValidationError(std::string(kt::errors::msg::kUnknownPermission) + ": " +
                                  std::string(name),
                              kt::errors::validation::kUnknownPermission);
  }
  return *permission;
}

Role RequireKnownRole(std::string_view name) {
  auto role = ParseRole(name);
  if (!role) {
    throw kt::ValidationError(std::string(kt::errors::msg::kUnknownRole) + ": " + std::string(name),
                              kt::errors::validation::kUnknownRole);
  }
  return *role;
}

bool PermissionMatrix::HasPermission(Role role, Permission permission) noexcept {
  switch (role) {
    case Role::kAdmin:
      return true;
    case Role::kContributor:
      return ContributorGrant(permission);
    case Role::kViewer:
      return ViewerGrant(permission);
  }
  return false;
}

bool PermissionMatrix::HasAnyPermission(const Principal& principal,
                                        std::span<const Permission> permissions) noexcept {
  return std::any_of(permissions.begin(), permissions.end(),
                     [&](Permission p) { return HasPermission(principal.role, p); });
}

bool PermissionMatrix::HasAllPermissions(const Principal& principal,
                                         std::span<const Permission> permissions) noexcept {
  return std::all_of(permissions.begin(), permissions.end(),
                     [&](Permission p) { return HasPermission(principal.role, p); });
}

void PermissionMatrix::RequirePermission(const Principal& principal, Permission permission,
                                         std::string_view action) {
  if (HasPermission(principal.role, permission)) {
    return;
  }
  const std::string name = ToString(permission);
  std::string message(kt::errors::msg::kPermissionDenied);
  message += action.empty() ? name : std::string(action);
  message += " requires ";
  message += name;
  message += " permission";
  throw kt::PermissionDeniedError(std::move(message), principal.id, name);
}

std::vector<Permission> PermissionMatrix::PermissionsFor(Role role) {
  std::vector<Permission> granted;
  for (auto permission : kAllPermissions) {
    if (HasPermission(role, permission)) {
      granted.push_back(permission);
    }
  }
  return granted;
}

bool PermissionMatrix::CanModify(const Principal& principal) noexcept {
  return principal.role != Role::kViewer;
}

}  // namespace kt::access
