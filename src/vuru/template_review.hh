// SPDX-License-Identifier: MIT
#ifndef VURU_TEMPLATE_REVIEW_HH_
#define VURU_TEMPLATE_REVIEW_HH_

#include <iostream>
#include <string>
#include <string_view>

#include "absl/status/statusor.h"
#include "vup/client.hh"
#include "vuru/local_store.hh"
#include "vuru/viewer.hh"

namespace vuru {

enum class ReviewKind : short {
  // No template was recorded for the package.
  NEW,

  // The fetched template matches the recorded one byte for byte.
  UNCHANGED,

  // The fetched template differs from the recorded one.
  CHANGED,
};

struct ReviewResult {
  ReviewKind kind = ReviewKind::NEW;
  bool approved = false;

  // The fetched template. The caller records it once installation goes ahead.
  std::string content;
};

// Fetches a package's build template, shows it (or what changed since the
// recorded copy) and asks the user whether to go ahead. Never writes to the
// store itself.
class TemplateReviewer {
 public:
  struct Options {
    Options& set_client(vup::Client* client) {
      this->client = client;
      return *this;
    }

    Options& set_store(const LocalStore* store) {
      this->store = store;
      return *this;
    }

    Options& set_viewer(Viewer* viewer) {
      this->viewer = viewer;
      return *this;
    }

    Options& set_input(std::istream* input) {
      this->input = input;
      return *this;
    }

    Options& set_output(std::ostream* output) {
      this->output = output;
      return *this;
    }

    vup::Client* client = nullptr;
    const LocalStore* store = nullptr;
    Viewer* viewer = nullptr;
    std::istream* input = &std::cin;
    std::ostream* output = &std::cout;
  };

  explicit TemplateReviewer(Options options);

  TemplateReviewer(const TemplateReviewer&) = delete;
  TemplateReviewer& operator=(const TemplateReviewer&) = delete;

  TemplateReviewer(TemplateReviewer&&) = default;
  TemplateReviewer& operator=(TemplateReviewer&&) = default;

  // Fails without prompting if the template can't be fetched or shown.
  absl::StatusOr<ReviewResult> Review(const std::string& pkgname,
                                      const std::string& category);

  // An empty answer, "y" and "yes" mean yes, in any case and ignoring
  // surrounding whitespace.
  static bool IsAffirmative(std::string_view answer);

 private:
  absl::StatusOr<std::string> FetchTemplate(const std::string& pkgname,
                                            const std::string& category);

  bool Confirm();

  vup::Client* client_;
  const LocalStore* store_;
  Viewer* viewer_;
  std::istream* input_;
  std::ostream* output_;
};

}  // namespace vuru

#endif  // VURU_TEMPLATE_REVIEW_HH_
