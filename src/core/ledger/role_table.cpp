#include "core/ledger/role_table.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

#include "core/util/canonical.hpp"

namespace tokenvest {

RoleTable::RoleTable(std::string owner) : owner_(std::move(owner)) {}

bool RoleTable::has_role(std::string_view identity, Role role) const {
  if (identity.empty()) {
    return false;
  }
  std::shared_lock lock(mutex_);
  switch (role) {
    case Role::Owner:
      return identity == owner_;
    case Role::AuthorizedCreator:
      return creators_.contains(std::string{identity});
  }
  return false;
}

std::string RoleTable::owner() const {
  std::shared_lock lock(mutex_);
  return owner_;
}

Result RoleTable::set_owner(std::string_view new_owner) {
  if (!util::is_valid_identity(new_owner)) {
    return Result::failure(ErrorKind::InvalidIdentity, "New owner must be a non-empty identity.");
  }
  std::unique_lock lock(mutex_);
  std::string previous = std::exchange(owner_, std::string{new_owner});
  return Result::success("Owner updated.", previous);
}

Result RoleTable::grant_creator(std::string_view identity) {
  if (!util::is_valid_identity(identity)) {
    return Result::failure(ErrorKind::InvalidIdentity, "Creator must be a non-empty identity.");
  }
  std::unique_lock lock(mutex_);
  if (!creators_.insert(std::string{identity}).second) {
    return Result::success("Creator already authorized.");
  }
  return Result::success("Creator authorized.");
}

Result RoleTable::revoke_creator(std::string_view identity) {
  std::unique_lock lock(mutex_);
  if (creators_.erase(std::string{identity}) == 0) {
    return Result::failure(ErrorKind::InvalidIdentity, "Identity is not an authorized creator.");
  }
  return Result::success("Creator deauthorized.");
}

std::vector<std::string> RoleTable::creators() const {
  std::vector<std::string> out;
  {
    std::shared_lock lock(mutex_);
    out.assign(creators_.begin(), creators_.end());
  }
  std::ranges::sort(out);
  return out;
}

}  // namespace tokenvest
