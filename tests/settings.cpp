#include <cassert>
#include <string>
#include <vector>
#include "pfverify/exceptions.hpp"
#include "pfverify/settings.hpp"

using namespace pfverify;

static bool usage_error(const std::vector<std::string>& args) {
  try { Settings::from_args(args); } catch (const UsageError&) { return true; }
  return false;
}

int main() {
  // Defaults
  auto s = Settings::from_args({"--receipt", "r.json"});
  assert(s.receipt_path == "r.json");
  assert(!s.policy_path);
  assert(s.format == OutputFormat::Markdown);
  assert(s.log_level == "WARN");
  assert(!s.show_help && !s.show_version);

  // All options, both spellings
  auto full = Settings::from_args({"--format=json", "--policy", "p.yml", "--receipt=r.json", "--log-level", "debug"});
  assert(full.receipt_path == "r.json");
  assert(full.policy_path && *full.policy_path == "p.yml");
  assert(full.format == OutputFormat::Json);
  assert(full.log_level == "debug");

  // Format aliases
  assert(Settings::from_args({"--receipt", "r", "--format", "markdown"}).format == OutputFormat::Markdown);
  assert(Settings::from_args({"--receipt", "r", "--format", "text"}).format == OutputFormat::Markdown);
  assert(Settings::from_args({"--receipt", "r", "--format", "structured"}).format == OutputFormat::Json);
  assert(to_string(OutputFormat::Json) == "json");

  // Empty policy value is the same as no policy
  assert(!Settings::from_args({"--receipt", "r", "--policy", ""}).policy_path);
  assert(!Settings::from_args({"--receipt", "r", "--policy="}).policy_path);

  // Last occurrence wins
  assert(Settings::from_args({"--receipt", "a", "--receipt", "b"}).receipt_path == "b");

  // Help / version skip the --receipt requirement
  assert(Settings::from_args({"--help"}).show_help);
  assert(Settings::from_args({"-h"}).show_help);
  assert(Settings::from_args({"--version"}).show_version);

  // Usage errors
  assert(usage_error({}));
  assert(usage_error({"--policy", "p.yml"}));
  assert(usage_error({"--receipt"}));
  assert(usage_error({"--receipt", "--format", "json"}));
  assert(usage_error({"--receipt", "r", "--format", "xml"}));
  assert(usage_error({"--receipt", "r", "--log-level", "loud"}));
  assert(usage_error({"--receipt", "r", "--bogus"}));
  assert(usage_error({"--receipt", "r", "extra"}));
  return 0;
}
