// SPDX-License-Identifier: MIT
#include "vuru/format.hh"

#include <iostream>
#include <string>

#include "fmt/format.h"
#include "vuru/terminal.hh"

namespace format {

namespace {

constexpr int kNameWidth = 20;
constexpr int kVersionWidth = 15;
constexpr int kCategoryWidth = 20;

}  // namespace

void NameOnly(const vup::Package& package) {
  std::cout << terminal::Bold(package.name) << "\n";
}

void Update(const vuru::PackageManager::Package& from, const vup::Package& to) {
  namespace t = terminal;

  std::cout << fmt::format("{} {} -> {}\n", t::Bold(from.pkgname),
                           t::BoldRed(from.pkgver), t::BoldGreen(to.version));
}

void SearchTable(const std::vector<const vup::Package*>& packages) {
  namespace t = terminal;

  // Pad before coloring, the escape sequences would throw off the widths.
  std::cout << t::Bold(fmt::format("{:<{}} {:<{}} {:<{}}", "PACKAGE",
                                   kNameWidth, "VERSION", kVersionWidth,
                                   "CATEGORY", kCategoryWidth))
            << "\n"
            << std::string(kNameWidth + kVersionWidth + kCategoryWidth, '-')
            << "\n";

  for (const auto* p : packages) {
    std::cout << fmt::format(
        "{} {} {}\n", t::Bold(fmt::format("{:<{}}", p->name, kNameWidth)),
        t::BoldGreen(fmt::format("{:<{}}", p->version, kVersionWidth)),
        t::BoldCyan(fmt::format("{:<{}}", p->category, kCategoryWidth)));
  }
}

}  // namespace format
