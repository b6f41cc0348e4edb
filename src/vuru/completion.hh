// SPDX-License-Identifier: MIT
#ifndef VURU_COMPLETION_HH_
#define VURU_COMPLETION_HH_

#include <string>
#include <string_view>

#include "absl/status/statusor.h"

namespace completion {

// Returns a completion script for |shell| ("bash", "zsh" or "fish"). Package
// names are completed at runtime by calling `vuru list-packages`.
absl::StatusOr<std::string> Script(std::string_view shell);

}  // namespace completion

#endif  // VURU_COMPLETION_HH_
