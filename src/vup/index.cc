// SPDX-License-Identifier: MIT
#include "vup/index.hh"

#include <array>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "vup/json_internal.hh"

namespace vup {

namespace {

constexpr std::array<std::string_view, 3> kRequiredFields = {
    "category",
    "version",
    "repo_url",
};

absl::Status ValidateEntry(const std::string& name,
                           const nlohmann::json& entry) {
  if (!entry.is_object()) {
    return absl::InvalidArgumentError(
        absl::StrCat("entry for '", name, "' is not an object"));
  }

  for (const auto field : kRequiredFields) {
    const auto iter = entry.find(std::string(field));
    if (iter == entry.end()) {
      return absl::InvalidArgumentError(
          absl::StrCat("entry for '", name, "' is missing '", field, "'"));
    }
    if (!iter->is_string()) {
      return absl::InvalidArgumentError(absl::StrCat(
          "entry for '", name, "' has non-string '", field, "'"));
    }
  }

  return absl::OkStatus();
}

}  // namespace

// static
absl::StatusOr<Index> Index::Parse(std::string_view bytes) {
  const auto json = nlohmann::json::parse(bytes, /*cb=*/nullptr,
                                          /*allow_exceptions=*/false);
  if (json.is_discarded()) {
    return absl::InvalidArgumentError("parse error: malformed JSON");
  }

  if (!json.is_object()) {
    return absl::InvalidArgumentError(
        "parse error: index is not a JSON object");
  }

  PackageMap packages;
  for (const auto& [name, entry] : json.items()) {
    if (auto status = ValidateEntry(name, entry); !status.ok()) {
      return absl::InvalidArgumentError(
          absl::StrCat("parse error: ", status.message()));
    }

    Package package;
    try {
      entry.get_to(package);
    } catch (const nlohmann::json::exception& e) {
      return absl::InvalidArgumentError(
          absl::StrCat("parse error: ", e.what()));
    }
    package.name = name;

    packages.emplace(name, std::move(package));
  }

  return Index(std::move(packages));
}

}  // namespace vup
