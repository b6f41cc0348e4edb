// SPDX-License-Identifier: MIT
#include "vuru/completion.hh"

#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace completion {

namespace {

struct Command {
  std::string_view name;
  std::string_view description;
  bool takes_packages;
};

struct Flag {
  char short_name;  // 0 if none
  std::string_view long_name;
  std::string_view description;
};

constexpr Command kCommands[] = {
    {"sync", "Refresh the package index", false},
    {"search", "Search packages by name", false},
    {"install", "Review and install packages", true},
    {"remove", "Remove installed packages", true},
    {"update", "Upgrade installed packages", true},
    {"list-packages", "List all package names", false},
    {"completion", "Print a shell completion script", false},
};

constexpr Flag kFlags[] = {
    {'S', "sync", "Refresh the package index first"},
    {'u', "update", "Upgrade installed packages"},
    {'y', "yes", "Skip template review and confirmations"},
    {'q', "quiet", "Print package names only"},
    {'h', "help", "Show usage"},
    {0, "version", "Show version"},
};

constexpr std::string_view kShells = "bash zsh fish";
constexpr std::string_view kColorModes = "auto always never";

std::string CommandNames(bool packages_only = false) {
  std::vector<std::string_view> names;
  for (const auto& c : kCommands) {
    if (!packages_only || c.takes_packages) {
      names.push_back(c.name);
    }
  }
  return absl::StrJoin(names, " ");
}

std::string BashScript() {
  std::vector<std::string> flags;
  for (const auto& f : kFlags) {
    if (f.short_name != 0) {
      flags.push_back(std::string{'-', f.short_name});
    }
    flags.push_back(absl::StrCat("--", f.long_name));
  }
  flags.push_back("--color=");

  return absl::StrCat(
      "# bash completion for vuru\n"
      "_vuru() {\n"
      "  local cur prev i cmd\n"
      "  cur=\"${COMP_WORDS[COMP_CWORD]}\"\n"
      "  prev=\"${COMP_WORDS[COMP_CWORD-1]}\"\n"
      "\n"
      "  for ((i = 1; i < COMP_CWORD; i++)); do\n"
      "    if [[ ${COMP_WORDS[i]} != -* ]]; then\n"
      "      cmd=${COMP_WORDS[i]}\n"
      "      break\n"
      "    fi\n"
      "  done\n"
      "\n"
      "  if [[ $cur == --color=* ]]; then\n"
      "    COMPREPLY=($(compgen -W \"",
      kColorModes,
      "\" -- \"${cur#--color=}\"))\n"
      "    return\n"
      "  fi\n"
      "\n"
      "  if [[ $cur == -* ]]; then\n"
      "    COMPREPLY=($(compgen -W \"",
      absl::StrJoin(flags, " "),
      "\" -- \"$cur\"))\n"
      "    return\n"
      "  fi\n"
      "\n"
      "  if [[ -z $cmd ]]; then\n"
      "    COMPREPLY=($(compgen -W \"",
      CommandNames(),
      " $(vuru list-packages 2>/dev/null)\" -- \"$cur\"))\n"
      "    return\n"
      "  fi\n"
      "\n"
      "  case $cmd in\n"
      "    completion)\n"
      "      COMPREPLY=($(compgen -W \"",
      kShells,
      "\" -- \"$cur\"))\n"
      "      ;;\n"
      "    sync|search|list-packages)\n"
      "      ;;\n"
      "    *)\n"
      "      COMPREPLY=($(compgen -W \"$(vuru list-packages 2>/dev/null)\" -- "
      "\"$cur\"))\n"
      "      ;;\n"
      "  esac\n"
      "}\n"
      "complete -F _vuru vuru\n");
}

std::string ZshScript() {
  std::string out =
      "#compdef vuru\n"
      "\n"
      "_vuru() {\n"
      "  local -a commands\n"
      "  commands=(\n";
  for (const auto& c : kCommands) {
    absl::StrAppend(&out, "    '", c.name, ":", c.description, "'\n");
  }
  absl::StrAppend(&out, "  )\n\n  _arguments -C \\\n");

  for (const auto& f : kFlags) {
    if (f.short_name != 0) {
      absl::StrAppend(&out, "    '(-", std::string(1, f.short_name), " --",
                      f.long_name, ")'{-", std::string(1, f.short_name), ",--",
                      f.long_name, "}'[", f.description, "]' \\\n");
    } else {
      absl::StrAppend(&out, "    '--", f.long_name, "[", f.description,
                      "]' \\\n");
    }
  }

  absl::StrAppend(
      &out, "    '--color=[Colorize output]:when:(", kColorModes, ")' \\\n",
      "    '1: :->first' \\\n"
      "    '*:: :->args' && return\n"
      "\n"
      "  case $state in\n"
      "    first)\n"
      "      _describe -t commands 'vuru command' commands\n"
      "      compadd -- ${(f)\"$(vuru list-packages 2>/dev/null)\"}\n"
      "      ;;\n"
      "    args)\n"
      "      case $words[1] in\n"
      "        completion) compadd ",
      kShells,
      " ;;\n"
      "        sync|search|list-packages) ;;\n"
      "        *) compadd -- ${(f)\"$(vuru list-packages 2>/dev/null)\"} ;;\n"
      "      esac\n"
      "      ;;\n"
      "  esac\n"
      "}\n"
      "\n"
      "_vuru \"$@\"\n");

  return out;
}

std::string FishScript() {
  std::string out = "complete -c vuru -f\n";

  for (const auto& f : kFlags) {
    absl::StrAppend(&out, "complete -c vuru");
    if (f.short_name != 0) {
      absl::StrAppend(&out, " -s ", std::string(1, f.short_name));
    }
    absl::StrAppend(&out, " -l ", f.long_name, " -d '", f.description, "'\n");
  }
  absl::StrAppend(&out, "complete -c vuru -l color -x -a '", kColorModes,
                  "' -d 'Colorize output'\n");

  for (const auto& c : kCommands) {
    absl::StrAppend(&out, "complete -c vuru -n '__fish_use_subcommand' -a ",
                    c.name, " -d '", c.description, "'\n");
  }

  absl::StrAppend(
      &out, "complete -c vuru -n '__fish_seen_subcommand_from completion' -a '",
      kShells, "'\n",
      "\n# Dynamic package completion for vuru\n",
      "complete -c vuru -n '__fish_seen_subcommand_from ",
      CommandNames(/*packages_only=*/true), "' -a '(vuru list-packages)'\n",
      "complete -c vuru -n 'not __fish_seen_subcommand_from ", CommandNames(),
      "' -a '(vuru list-packages)'\n");

  return out;
}

}  // namespace

absl::StatusOr<std::string> Script(std::string_view shell) {
  if (shell == "bash") {
    return BashScript();
  }
  if (shell == "zsh") {
    return ZshScript();
  }
  if (shell == "fish") {
    return FishScript();
  }

  return absl::InvalidArgumentError(
      absl::StrCat("unsupported shell '", shell, "', expected one of: ",
                   kShells));
}

}  // namespace completion
