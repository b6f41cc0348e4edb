// SPDX-License-Identifier: MIT
#ifndef VURU_VURU_HH_
#define VURU_VURU_HH_

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "vup/client.hh"
#include "vuru/local_store.hh"
#include "vuru/package_directory.hh"
#include "vuru/package_manager.hh"
#include "vuru/template_review.hh"
#include "vuru/viewer.hh"

namespace vuru {

class Vuru {
 public:
  struct Options {
    Options& set_index_url(std::string index_url) {
      this->index_url = std::move(index_url);
      return *this;
    }

    Options& set_template_url(std::string template_url) {
      this->template_url = std::move(template_url);
      return *this;
    }

    // Use |client| rather than creating one from the URLs above.
    Options& set_client(vup::Client* client) {
      this->client = client;
      return *this;
    }

    Options& set_store(LocalStore* store) {
      this->store = store;
      return *this;
    }

    Options& set_package_manager(PackageManager* package_manager) {
      this->package_manager = package_manager;
      return *this;
    }

    Options& set_viewer(Viewer* viewer) {
      this->viewer = viewer;
      return *this;
    }

    // Where answers to review prompts are read from.
    Options& set_input(std::istream* input) {
      this->input = input;
      return *this;
    }

    std::string index_url = std::string(vup::kDefaultIndexUrl);
    std::string template_url = std::string(vup::kDefaultTemplateUrl);
    vup::Client* client = nullptr;
    LocalStore* store = nullptr;
    PackageManager* package_manager = nullptr;
    Viewer* viewer = nullptr;
    std::istream* input = &std::cin;
  };

  explicit Vuru(Options options);

  ~Vuru() = default;

  Vuru(const Vuru&) = delete;
  Vuru& operator=(const Vuru&) = delete;

  Vuru(Vuru&&) = default;
  Vuru& operator=(Vuru&&) = default;

  struct CommandOptions {
    // Refresh the package index before doing anything else.
    bool force_sync = false;

    // Skip template review entirely and let xbps proceed without asking.
    bool assume_yes = false;

    bool quiet = false;
  };

  int Sync(const std::vector<std::string>& args, const CommandOptions& options);
  int Search(const std::vector<std::string>& args,
             const CommandOptions& options);
  int Install(const std::vector<std::string>& args,
              const CommandOptions& options);
  int Remove(const std::vector<std::string>& args,
             const CommandOptions& options);
  int Update(const std::vector<std::string>& args,
             const CommandOptions& options);

  // Prints every package name in the cached index. Never touches the network
  // and never prints errors.
  int ListPackages(const std::vector<std::string>& args,
                   const CommandOptions& options);

 private:
  struct Outdated {
    PackageManager::Package local;
    const vup::Package* package;
  };

  absl::StatusOr<PackageDirectory> LoadDirectory(bool force_refresh);

  int GetOutdatedPackages(const std::vector<std::string>& args,
                          const PackageDirectory& directory,
                          std::vector<Outdated>* outdated);

  // Returns the template to record once the package is installed, or nullopt
  // if the user declined.
  absl::StatusOr<std::optional<std::string>> ReviewTemplate(
      const vup::Package& package);

  void RecordTemplate(const std::string& pkgname, const std::string& content);

  std::unique_ptr<vup::Client> owned_client_;
  vup::Client* client_;
  LocalStore* store_;
  PackageManager* package_manager_;
  TemplateReviewer reviewer_;
};

}  // namespace vuru

#endif  // VURU_VURU_HH_
