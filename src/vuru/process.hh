// SPDX-License-Identifier: MIT
#ifndef VURU_PROCESS_HH_
#define VURU_PROCESS_HH_

#include <string>
#include <vector>

#include "absl/status/statusor.h"

namespace vuru {

// Runs |argv| to completion, searching PATH for argv[0]. The child shares our
// terminal. Returns the exit status of the child. Fails if the program could
// not be started or was killed by a signal.
absl::StatusOr<int> RunProcess(const std::vector<std::string>& argv);

// As above, but the child's stdout is collected into |output|.
absl::StatusOr<int> RunProcess(const std::vector<std::string>& argv,
                               std::string* output);

}  // namespace vuru

#endif  // VURU_PROCESS_HH_
