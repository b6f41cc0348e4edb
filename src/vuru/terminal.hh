// SPDX-License-Identifier: MIT
#ifndef VURU_TERMINAL_HH_
#define VURU_TERMINAL_HH_

#include <string>

namespace terminal {

enum class WantColor : short {
  YES,
  NO,
  AUTO,
};

void Init(WantColor);

// True if output should be colorized, as decided by Init.
bool WantsColor();

std::string Bold(const std::string& s);
std::string BoldCyan(const std::string& s);
std::string BoldGreen(const std::string& s);
std::string BoldRed(const std::string& s);

}  // namespace terminal

#endif  // VURU_TERMINAL_HH_
