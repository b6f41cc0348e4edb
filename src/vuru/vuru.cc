// SPDX-License-Identifier: MIT
#include "vuru/vuru.hh"

#include <cerrno>
#include <iostream>

#include "absl/algorithm/container.h"
#include "absl/status/status.h"
#include "vuru/format.hh"
#include "vuru/index_synchronizer.hh"
#include "vuru/terminal.hh"

namespace vuru {

namespace {

int ErrorNotEnoughArgs() {
  std::cerr << "error: not enough arguments.\n";
  return -EINVAL;
}

}  // namespace

Vuru::Vuru(Options options)
    : owned_client_(options.client != nullptr
                        ? nullptr
                        : vup::Client::New(
                              vup::Client::Options()
                                  .set_index_url(options.index_url)
                                  .set_template_url(options.template_url)
                                  .set_useragent("vuru/" PROJECT_VERSION))),
      client_(options.client != nullptr ? options.client
                                        : owned_client_.get()),
      store_(options.store),
      package_manager_(options.package_manager),
      reviewer_(TemplateReviewer::Options()
                    .set_client(client_)
                    .set_store(options.store)
                    .set_viewer(options.viewer)
                    .set_input(options.input)) {}

absl::StatusOr<PackageDirectory> Vuru::LoadDirectory(bool force_refresh) {
  IndexSynchronizer synchronizer(
      IndexSynchronizer::Options().set_client(client_).set_store(store_));

  return synchronizer.Sync(force_refresh);
}

int Vuru::Sync(const std::vector<std::string>&, const CommandOptions&) {
  IndexSynchronizer synchronizer(
      IndexSynchronizer::Options().set_client(client_).set_store(store_));

  SyncSource source;
  auto directory = synchronizer.Sync(/*force_refresh=*/true, &source);
  if (!directory.ok()) {
    std::cerr << "error: " << directory.status().message() << "\n";
    return -EIO;
  }

  switch (source) {
    case SyncSource::FETCHED:
      std::cout << "Index synchronized (" << directory->size()
                << " packages).\n";
      break;
    case SyncSource::NOT_MODIFIED:
    case SyncSource::CACHE:
      std::cout << "Index not modified.\n";
      break;
    case SyncSource::STALE_CACHE:
      // The synchronizer already warned. Still, what was asked for did not
      // happen.
      return -EIO;
  }

  return 0;
}

int Vuru::Search(const std::vector<std::string>& args,
                 const CommandOptions& options) {
  if (args.empty()) {
    return ErrorNotEnoughArgs();
  }

  auto directory = LoadDirectory(options.force_sync);
  if (!directory.ok()) {
    std::cerr << "error: " << directory.status().message() << "\n";
    return -EIO;
  }

  bool found = false;
  for (const auto& query : args) {
    const auto packages = directory->Search(query);
    if (packages.empty()) {
      if (!options.quiet) {
        std::cout << "No results found for '" << query << "'\n";
      }
      continue;
    }

    found = true;
    if (options.quiet) {
      for (const auto* p : packages) {
        format::NameOnly(*p);
      }
    } else {
      format::SearchTable(packages);
    }
  }

  return found ? 0 : -ENOENT;
}

absl::StatusOr<std::optional<std::string>> Vuru::ReviewTemplate(
    const vup::Package& package) {
  auto review = reviewer_.Review(package.name, package.category);
  if (!review.ok()) {
    return review.status();
  }

  if (!review->approved) {
    return std::optional<std::string>();
  }

  return std::optional<std::string>(std::move(review->content));
}

void Vuru::RecordTemplate(const std::string& pkgname,
                          const std::string& content) {
  if (auto status = store_->WriteTemplate(pkgname, content); !status.ok()) {
    std::cerr << "warning: failed to record template for " << pkgname << ": "
              << status.message() << "\n";
  }
}

int Vuru::Install(const std::vector<std::string>& args,
                  const CommandOptions& options) {
  if (args.empty()) {
    return ErrorNotEnoughArgs();
  }

  auto directory = LoadDirectory(options.force_sync);
  if (!directory.ok()) {
    std::cerr << "error: " << directory.status().message() << "\n";
    return -EIO;
  }

  int ret = 0;
  for (const auto& pkgname : args) {
    const auto* package = directory->Lookup(pkgname);
    if (package == nullptr) {
      std::cerr << "error: package " << pkgname << " not found in index\n";
      ret = -ENOENT;
      continue;
    }

    std::cout << "Found " << terminal::Bold(package->name) << " in category '"
              << package->category << "'\n";

    if (!options.assume_yes) {
      auto reviewed = ReviewTemplate(*package);
      if (!reviewed.ok()) {
        std::cerr << "error: " << reviewed.status().message() << "\n";
        ret = -EIO;
        continue;
      }

      if (!reviewed->has_value()) {
        std::cout << "Aborted by user.\n";
        continue;
      }

      RecordTemplate(package->name, **reviewed);
    }

    std::cout << "Installing from: " << package->repo_url << "\n";
    auto status = package_manager_->Install(package->name, package->repo_url,
                                            options.assume_yes);
    if (!status.ok()) {
      std::cerr << "error: failed to install " << package->name << ": "
                << status.message() << "\n";
      return -EIO;
    }
  }

  return ret;
}

int Vuru::Remove(const std::vector<std::string>& args,
                 const CommandOptions& options) {
  if (args.empty()) {
    return ErrorNotEnoughArgs();
  }

  for (const auto& pkgname : args) {
    std::cout << "Removing " << terminal::Bold(pkgname) << "...\n";
    auto status = package_manager_->Remove(pkgname, options.assume_yes);
    if (!status.ok()) {
      std::cerr << "error: failed to remove " << pkgname << ": "
                << status.message() << "\n";
      return -EIO;
    }
  }

  return 0;
}

int Vuru::GetOutdatedPackages(const std::vector<std::string>& args,
                              const PackageDirectory& directory,
                              std::vector<Outdated>* outdated) {
  auto installed = package_manager_->ListInstalled();
  if (!installed.ok()) {
    std::cerr << "error: failed to list installed packages: "
              << installed.status().message() << "\n";
    return -EIO;
  }

  for (auto& local : *installed) {
    if (!args.empty() && absl::c_find(args, local.pkgname) == args.end()) {
      continue;
    }

    const auto* package = directory.Lookup(local.pkgname);
    if (package == nullptr) {
      continue;
    }

    auto cmp = package_manager_->CompareVersions(package->version, local.pkgver);
    if (!cmp.ok()) {
      std::cerr << "warning: cannot compare versions of " << local.pkgname
                << ": " << cmp.status().message() << "\n";
      continue;
    }

    if (*cmp > 0) {
      outdated->push_back({std::move(local), package});
    }
  }

  return 0;
}

int Vuru::Update(const std::vector<std::string>& args,
                 const CommandOptions& options) {
  auto directory = LoadDirectory(options.force_sync);
  if (!directory.ok()) {
    std::cerr << "error: " << directory.status().message() << "\n";
    return -EIO;
  }

  std::vector<Outdated> outdated;
  if (int r = GetOutdatedPackages(args, *directory, &outdated); r < 0) {
    return r;
  }

  if (outdated.empty()) {
    std::cout << "All VUP packages are up to date.\n";
    return 0;
  }

  std::cout << "Found " << outdated.size() << " updates.\n";
  for (const auto& [local, package] : outdated) {
    if (options.quiet) {
      format::NameOnly(*package);
    } else {
      format::Update(local, *package);
    }
  }

  int ret = 0;
  for (const auto& [local, package] : outdated) {
    std::optional<std::string> content;
    if (!options.assume_yes) {
      auto reviewed = ReviewTemplate(*package);
      if (!reviewed.ok()) {
        std::cerr << "error: " << reviewed.status().message() << "\n";
        ret = -EIO;
        continue;
      }

      if (!reviewed->has_value()) {
        std::cout << "Skipping " << package->name << ".\n";
        continue;
      }

      content = *std::move(reviewed);
    }

    std::cout << "Updating " << terminal::Bold(package->name) << "...\n";
    auto status = package_manager_->Upgrade(package->name, package->repo_url,
                                            options.assume_yes);
    if (!status.ok()) {
      std::cerr << "error: failed to update " << package->name << ": "
                << status.message() << "\n";
      ret = -EIO;
      continue;
    }

    if (content) {
      RecordTemplate(package->name, *content);
    }
  }

  return ret;
}

int Vuru::ListPackages(const std::vector<std::string>&, const CommandOptions&) {
  IndexSynchronizer synchronizer(
      IndexSynchronizer::Options().set_client(client_).set_store(store_));

  auto index = synchronizer.LoadCached();
  if (!index.ok()) {
    return -ENOENT;
  }

  const PackageDirectory directory(*std::move(index));
  for (const auto& name : directory.Names()) {
    std::cout << name << "\n";
  }

  return 0;
}

}  // namespace vuru

/* vim: set et ts=2 sw=2: */
