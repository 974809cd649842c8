#include "kt/access/permission_matrix.h"

#include <array>
#include <cassert>
#include <iostream>
#include <set>
#include <string>

#include "kt/error.h"

int main() {
  using kt::access::Permission;
  using kt::access::PermissionMatrix;
  using kt::access::Principal;
  using kt::access::Role;

  // Every permission has a distinct wire name that parses back.
  std::set<std::string> names;
  for (auto permission : kt::access::kAllPermissions) {
    const std::string name = kt::access::ToString(permission);
    assert(names.insert(name).second);
    assert(kt::access::ParsePermission(name) == permission);
  }
  assert(names.size() == 27);
  assert(kt::access::ParsePermission("help_tasks:claim") == Permission::kHelpTasksClaim);
  assert(!kt::access::ParsePermission("entries:destroy").has_value());
  assert(kt::access::ParseRole("CONTRIBUTOR") == Role::kContributor);
  assert(!kt::access::ParseRole("admin").has_value());

  bool unknown = false;
  try {
    (void)kt::access::RequireKnownPermission("vault:open");
  } catch (const kt::ValidationError& err) {
    unknown = err.code == kt::errors::validation::kUnknownPermission;
  }
  assert(unknown);

  // Admin holds everything.
  assert(PermissionMatrix::PermissionsFor(Role::kAdmin).size() == kt::access::kPermissionCount);

  // Contributor grants.
  const std::set<Permission> contributor = {
      Permission::kEntriesCreate,     Permission::kEntriesRead,       Permission::kEntriesUpdate,
      Permission::kTasksCreate,       Permission::kTasksRead,         Permission::kTasksUpdate,
      Permission::kDocumentsCreate,   Permission::kDocumentsRead,     Permission::kSettingsRead,
      Permission::kMedicationsRead,   Permission::kMedicationsUpdate, Permission::kHelpTasksCreate,
      Permission::kHelpTasksRead,     Permission::kHelpTasksClaim,    Permission::kHelpTasksComplete,
      Permission::kDataExport,
  };
  const std::set<Permission> viewer = {
      Permission::kEntriesRead,  Permission::kTasksRead,       Permission::kDocumentsRead,
      Permission::kSettingsRead, Permission::kMedicationsRead, Permission::kHelpTasksRead,
  };
  for (auto permission : kt::access::kAllPermissions) {
    assert(PermissionMatrix::HasPermission(Role::kAdmin, permission));
    assert(PermissionMatrix::HasPermission(Role::kContributor, permission) ==
           (contributor.count(permission) == 1));
    assert(PermissionMatrix::HasPermission(Role::kViewer, permission) == (viewer.count(permission) == 1));
    // Whatever a viewer can do, a contributor can do.
    if (PermissionMatrix::HasPermission(Role::kViewer, permission)) {
      assert(PermissionMatrix::HasPermission(Role::kContributor, permission));
    }
  }
  assert(!PermissionMatrix::HasPermission(Role::kContributor, Permission::kSecurityLogsRead));
  assert(!PermissionMatrix::HasPermission(Role::kViewer, Permission::kSecurityLogsRead));

  const Principal admin{"u-admin", Role::kAdmin};
  const Principal helper{"u-helper", Role::kContributor};
  const Principal observer{"u-viewer", Role::kViewer};

  assert(PermissionMatrix::IsAdmin(admin));
  assert(!PermissionMatrix::IsAdmin(helper));
  assert(PermissionMatrix::CanModify(admin));
  assert(PermissionMatrix::CanModify(helper));
  assert(!PermissionMatrix::CanModify(observer));

  const std::array<Permission, 2> reset_or_read = {Permission::kDataReset, Permission::kTasksRead};
  assert(PermissionMatrix::HasAnyPermission(observer, reset_or_read));
  assert(!PermissionMatrix::HasAllPermissions(observer, reset_or_read));
  assert(PermissionMatrix::HasAllPermissions(admin, reset_or_read));
  assert(PermissionMatrix::HasAllPermissions(observer, {}));
  assert(!PermissionMatrix::HasAnyPermission(observer, {}));

  PermissionMatrix::RequirePermission(helper, Permission::kTasksUpdate, "edit task");

  bool denied = false;
  try {
    PermissionMatrix::RequirePermission(observer, Permission::kEntriesDelete, "delete entry");
  } catch (const kt::PermissionDeniedError& err) {
    denied = true;
    assert(std::string(err.what()) == "Permission denied: delete entry requires entries:delete permission");
    assert(err.principal_id == "u-viewer");
    assert(err.permission == "entries:delete");
    assert(err.domain == kt::ErrorDomain::Security);
    assert(err.retryability == kt::Retryability::kFatal);
  }
  assert(denied);

  denied = false;
  try {
    PermissionMatrix::RequirePermission(helper, Permission::kDataReset);
  } catch (const kt::PermissionDeniedError& err) {
    denied = std::string(err.what()) == "Permission denied: data:reset requires data:reset permission";
  }
  assert(denied);

  std::cout << "permission matrix tests ok\n";
  return 0;
}
