#pragma once

#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "core/model/types.hpp"

namespace tokenvest {

class IAuthorityLookup {
public:
  virtual ~IAuthorityLookup() = default;

  [[nodiscard]] virtual bool has_role(std::string_view identity, Role role) const = 0;
  [[nodiscard]] virtual std::string owner() const = 0;
};

// Exactly one Owner at any time; any number of AuthorizedCreators.
class RoleTable final : public IAuthorityLookup {
public:
  explicit RoleTable(std::string owner);

  [[nodiscard]] bool has_role(std::string_view identity, Role role) const override;
  [[nodiscard]] std::string owner() const override;

  Result set_owner(std::string_view new_owner);
  Result grant_creator(std::string_view identity);
  Result revoke_creator(std::string_view identity);

  [[nodiscard]] std::vector<std::string> creators() const;

private:
  mutable std::shared_mutex mutex_;
  std::string owner_;
  std::unordered_set<std::string> creators_;
};

}  // namespace tokenvest
