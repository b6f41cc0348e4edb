// SPDX-License-Identifier: MIT
#include <getopt.h>

#include <clocale>
#include <cstdio>
#include <cstdlib>
#include <iostream>

#include "absl/container/flat_hash_map.h"
#include "vuru/completion.hh"
#include "vuru/local_store.hh"
#include "vuru/terminal.hh"
#include "vuru/viewer.hh"
#include "vuru/vuru.hh"
#include "vuru/xbps.hh"

namespace {

struct Flags {
  bool ParseFromArgv(int* argc, char*** argv);

  std::string index_url = std::string(vup::kDefaultIndexUrl);
  std::string template_url = std::string(vup::kDefaultTemplateUrl);
  std::string cache_dir;
  terminal::WantColor color = terminal::WantColor::AUTO;
  bool update = false;

  vuru::Vuru::CommandOptions command_options;
};

[[noreturn]] void usage() {
  fputs(
      "vuru [options] [command] [args...]\n"
      "\n"
      "Install packages from the Void User Packages repository, reviewing\n"
      "their build templates first.\n"
      "\n"
      "  -h, --help               Show this help\n"
      "      --version            Show software version\n"
      "\n"
      "  -S, --sync               Refresh the package index first\n"
      "  -u, --update             Upgrade installed packages\n"
      "  -y, --yes                Skip template review and confirmations\n"
      "  -q, --quiet              Output less, when possible\n"
      "      --color=WHEN         One of 'auto', 'never', or 'always'\n"
      "\n"
      "Commands:\n"
      "  sync                     Refresh the package index\n"
      "  search                   Search packages by name\n"
      "  install                  Review and install packages (default)\n"
      "  remove                   Remove installed packages\n"
      "  update                   Upgrade installed packages\n"
      "  list-packages            List all package names\n"
      "  completion               Print a shell completion script\n",
      stdout);
  exit(0);
}

[[noreturn]] void version() {
  std::cout << "vuru " << PROJECT_VERSION << "\n";
  exit(0);
}

bool Flags::ParseFromArgv(int* argc, char*** argv) {
  enum {
    ARG_COLOR = 1000,
    ARG_VERSION,
    ARG_INDEXURL,
    ARG_TEMPLATEURL,
    ARG_CACHEDIR,
  };

  static constexpr struct option opts[] = {
      // clang-format off
      { "help",            no_argument,       nullptr, 'h' },
      { "quiet",           no_argument,       nullptr, 'q' },
      { "sync",            no_argument,       nullptr, 'S' },
      { "update",          no_argument,       nullptr, 'u' },
      { "yes",             no_argument,       nullptr, 'y' },
      { "color",           required_argument, nullptr, ARG_COLOR },
      { "version",         no_argument,       nullptr, ARG_VERSION },

      // These are "private", and intentionally not documented in the manual or
      // usage.
      { "indexurl",        required_argument, nullptr, ARG_INDEXURL },
      { "templateurl",     required_argument, nullptr, ARG_TEMPLATEURL },
      { "cachedir",        required_argument, nullptr, ARG_CACHEDIR },
      {},
      // clang-format on
  };

  int opt;
  while ((opt = getopt_long(*argc, *argv, "hqSuy", opts, nullptr)) != -1) {
    std::string_view sv_optarg(optarg ? optarg : "");

    switch (opt) {
      case 'h':
        usage();
      case 'q':
        command_options.quiet = true;
        break;
      case 'S':
        command_options.force_sync = true;
        break;
      case 'u':
        update = true;
        break;
      case 'y':
        command_options.assume_yes = true;
        break;
      case ARG_COLOR:
        if (sv_optarg == "auto") {
          color = terminal::WantColor::AUTO;
        } else if (sv_optarg == "never") {
          color = terminal::WantColor::NO;
        } else if (sv_optarg == "always") {
          color = terminal::WantColor::YES;
        } else {
          std::cerr << "error: invalid arg to --color: " << sv_optarg << "\n";
          return false;
        }
        break;
      case ARG_INDEXURL:
        index_url = optarg;
        break;
      case ARG_TEMPLATEURL:
        template_url = optarg;
        break;
      case ARG_CACHEDIR:
        if (sv_optarg.empty()) {
          std::cerr << "error: meaningless option: --cachedir ''\n";
          return false;
        }
        cache_dir = optarg;
        break;
      case ARG_VERSION:
        version();
        break;
      default:
        return false;
    }
  }

  *argc -= optind - 1;
  *argv += optind - 1;

  return true;
}

absl::StatusOr<std::unique_ptr<vuru::LocalStore>> OpenStore(
    const std::string& cache_dir) {
  if (!cache_dir.empty()) {
    return vuru::LocalStore::Open(cache_dir);
  }

  auto root = vuru::LocalStore::DefaultRoot();
  if (!root.ok()) {
    return root.status();
  }

  return vuru::LocalStore::Open(*root);
}

using Command = int (vuru::Vuru::*)(const std::vector<std::string>&,
                                    const vuru::Vuru::CommandOptions&);

}  // namespace

int main(int argc, char** argv) {
  Flags flags;
  if (!flags.ParseFromArgv(&argc, &argv)) {
    return 1;
  }

  std::setlocale(LC_ALL, "");
  terminal::Init(flags.color);

  const std::string_view action(argc < 2 ? "" : argv[1]);

  // Needs neither the cache nor the network.
  if (action == "completion") {
    if (argc < 3) {
      std::cerr << "error: not enough arguments.\n";
      return 1;
    }

    auto script = completion::Script(argv[2]);
    if (!script.ok()) {
      std::cerr << "error: " << script.status().message() << "\n";
      return 1;
    }

    std::cout << *script;
    return 0;
  }

  auto store = OpenStore(flags.cache_dir);
  if (!store.ok()) {
    // Shell completion must stay quiet, whatever happens.
    if (action == "list-packages") {
      return 0;
    }

    std::cerr << "error: " << store.status().message() << "\n";
    return 1;
  }

  vuru::Xbps xbps;
  const auto viewer = vuru::Viewer::NewExternal();

  vuru::Vuru vuru(vuru::Vuru::Options()
                      .set_index_url(flags.index_url)
                      .set_template_url(flags.template_url)
                      .set_store(store->get())
                      .set_package_manager(&xbps)
                      .set_viewer(viewer.get()));

  const absl::flat_hash_map<std::string_view, Command> cmds{
      // clang-format off
      {"sync",          &vuru::Vuru::Sync},
      {"search",        &vuru::Vuru::Search},
      {"install",       &vuru::Vuru::Install},
      {"remove",        &vuru::Vuru::Remove},
      {"update",        &vuru::Vuru::Update},
      {"list-packages", &vuru::Vuru::ListPackages},
      // clang-format on
  };

  Command command;
  std::vector<std::string> args;
  if (const auto iter = cmds.find(action); iter != cmds.end()) {
    command = iter->second;
    args.assign(argv + 2, argv + argc);
  } else if (argc >= 2) {
    // Anything else names packages to install.
    command = &vuru::Vuru::Install;
    args.assign(argv + 1, argv + argc);
  } else if (flags.update) {
    command = &vuru::Vuru::Update;
  } else if (flags.command_options.force_sync) {
    command = &vuru::Vuru::Sync;
  } else {
    std::cerr << "error: no operation specified (use -h for help)\n";
    return 1;
  }

  const int r = (vuru.*command)(args, flags.command_options);
  if (command == &vuru::Vuru::ListPackages) {
    return 0;
  }

  return r < 0 ? 1 : 0;
}

/* vim: set et ts=2 sw=2: */
