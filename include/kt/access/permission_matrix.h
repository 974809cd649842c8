#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kt::access {

enum class Role : uint8_t { kAdmin, kContributor, kViewer };

enum class Permission : uint8_t {
  kEntriesCreate,
  kEntriesRead,
  kEntriesUpdate,
  kEntriesDelete,
  kTasksCreate,
  kTasksRead,
  kTasksUpdate,
  kTasksDelete,
  kDocumentsCreate,
  kDocumentsRead,
  kDocumentsDelete,
  kSettingsRead,
  kSettingsUpdate,
  kFamilyInvite,
  kFamilyManage,
  kMedicationsCreate,
  kMedicationsRead,
  kMedicationsUpdate,
  kMedicationsDelete,
  kHelpTasksCreate,
  kHelpTasksRead,
  kHelpTasksClaim,
  kHelpTasksComplete,
  kSecurityLogsRead,
  kDataExport,
  kDataImport,
  kDataReset,
};

inline constexpr std::size_t kPermissionCount = static_cast<std::size_t>(Permission::kDataReset) + 1;

extern const std::array<Permission, kPermissionCount> kAllPermissions;

struct Principal {
  std::string id;
  Role role{Role::kViewer};
};

// "entries:create", "ADMIN", ...
const char* ToString(Permission permission);
const char* ToString(Role role);
std::optional<Permission> ParsePermission(std::string_view name);
std::optional<Role> ParseRole(std::string_view name);

// Throwing forms for string-keyed call sites; kt::ValidationError on unknown names.
Permission RequireKnownPermission(std::string_view name);
Role RequireKnownRole(std::string_view name);

// Static role grants. Pure; never consults or mutates state.
class PermissionMatrix {
 public:
  [[nodiscard]] static bool HasPermission(Role role, Permission permission) noexcept;
  [[nodiscard]] static bool HasPermission(const Principal& principal, Permission permission) noexcept {
    return HasPermission(principal.role, permission);
  }

  // Presentation helpers. Mutation boundaries must call RequirePermission.
  [[nodiscard]] static bool HasAnyPermission(const Principal& principal,
                                             std::span<const Permission> permissions) noexcept;
  [[nodiscard]] static bool HasAllPermissions(const Principal& principal,
                                              std::span<const Permission> permissions) noexcept;

  // Throws kt::PermissionDeniedError naming the action and the missing grant.
  static void RequirePermission(const Principal& principal, Permission permission,
                                std::string_view action = {});

  [[nodiscard]] static std::vector<Permission> PermissionsFor(Role role);
  [[nodiscard]] static bool IsAdmin(const Principal& principal) noexcept {
    return principal.role == Role::kAdmin;
  }
  // Every role except viewer writes domain data.
  [[nodiscard]] static bool CanModify(const Principal& principal) noexcept;
};

}  // namespace kt::access
