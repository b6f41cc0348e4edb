// SPDX-License-Identifier: MIT
#include "vuru/template_review.hh"

#include <cstring>
#include <optional>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "vuru/terminal.hh"

namespace vuru {

namespace {

constexpr std::string_view kRule =
    "--------------------------------------------------";

}  // namespace

TemplateReviewer::TemplateReviewer(Options options)
    : client_(options.client),
      store_(options.store),
      viewer_(options.viewer),
      input_(options.input),
      output_(options.output) {}

// static
bool TemplateReviewer::IsAffirmative(std::string_view answer) {
  answer = absl::StripAsciiWhitespace(answer);

  return answer.empty() || absl::EqualsIgnoreCase(answer, "y") ||
         absl::EqualsIgnoreCase(answer, "yes");
}

absl::StatusOr<std::string> TemplateReviewer::FetchTemplate(
    const std::string& pkgname, const std::string& category) {
  absl::StatusOr<vup::RawResponse> result =
      absl::UnknownError("template request did not complete");

  client_->QueueTemplateRequest(
      vup::TemplateRequest(category, pkgname),
      [&result](absl::StatusOr<vup::RawResponse> response) {
        result = std::move(response);
        return 0;
      });

  if (int r = client_->Wait(); r < 0 && result.ok()) {
    return absl::UnavailableError(
        absl::StrCat("template request failed: ", strerror(-r)));
  }

  if (!result.ok()) {
    return absl::Status(
        result.status().code(),
        absl::StrCat("failed to fetch template for ", pkgname, ": ",
                     result.status().message()));
  }

  return std::move(result->bytes);
}

bool TemplateReviewer::Confirm() {
  *output_ << "Proceed with installation? [Y/n] " << std::flush;

  std::string answer;
  if (!std::getline(*input_, answer)) {
    *output_ << "\n";
    return false;
  }

  return IsAffirmative(answer);
}

absl::StatusOr<ReviewResult> TemplateReviewer::Review(
    const std::string& pkgname, const std::string& category) {
  if (!LocalStore::IsValidKey(pkgname)) {
    return absl::InvalidArgumentError(
        absl::StrCat("invalid package name: ", pkgname));
  }
  if (!LocalStore::IsValidKey(category)) {
    return absl::InvalidArgumentError(
        absl::StrCat("invalid category for ", pkgname, ": ", category));
  }

  auto content = FetchTemplate(pkgname, category);
  if (!content.ok()) {
    return content.status();
  }

  std::optional<std::string> previous;
  if (auto cached = store_->ReadTemplate(pkgname); cached.ok()) {
    previous = *std::move(cached);
  } else if (!absl::IsNotFound(cached.status())) {
    std::cerr << "warning: ignoring recorded template for " << pkgname << ": "
              << cached.status().message() << "\n";
  }

  ReviewResult result;
  result.content = *std::move(content);

  if (!previous) {
    result.kind = ReviewKind::NEW;
    *output_ << "New package " << terminal::Bold(pkgname)
             << ". Review template:\n";
    if (auto status = viewer_->Page(pkgname, result.content); !status.ok()) {
      return absl::Status(
          status.code(), absl::StrCat("failed to show template for ", pkgname,
                                      ": ", status.message()));
    }
  } else if (*previous == result.content) {
    result.kind = ReviewKind::UNCHANGED;
    *output_ << "Template for " << terminal::Bold(pkgname)
             << " unchanged since last install.\n";
  } else {
    result.kind = ReviewKind::CHANGED;
    *output_ << "Template for " << terminal::Bold(pkgname)
             << " has changed:\n"
             << kRule << "\n"
             << std::flush;
    if (auto status = viewer_->Diff(pkgname, *previous, result.content);
        !status.ok()) {
      return absl::Status(
          status.code(), absl::StrCat("failed to show template changes for ",
                                      pkgname, ": ", status.message()));
    }
    *output_ << kRule << "\n";
  }

  result.approved = Confirm();
  return result;
}

}  // namespace vuru
