// SPDX-License-Identifier: MIT
#include "vup/package.hh"

#include "vup/json_internal.hh"

namespace vup {

void from_json(const nlohmann::json& j, Package& p) {
  // clang-format off
  static const auto* kCallbacks = new CallbackMap<Package>({
    { "category",         MakeValueCallback(&Package::category) },
    { "version",          MakeValueCallback(&Package::version) },
    { "repo_url",         MakeValueCallback(&Package::repo_url) },
  });
  // clang-format on

  DeserializeJsonObject(j, *kCallbacks, p);
}

}  // namespace vup
