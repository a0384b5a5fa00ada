#pragma once

#include <optional>
#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto SettingsManager. Options are `--key value`, `--key=value`
// or `-alias value`; bool options take an optional literal. Bare words fill
// the positional keys in order.
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "adaptermesh",
                             std::vector<std::string> positional_keys = {
                               "listen_port", "listen_ip", "bootstrap_peers", "storage_root"
                             });

  // Exits the process with usage on malformed input.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  bool parse(const std::vector<std::string>& args, SettingsManager& settings, std::string& error) const;
  void usage() const;

private:
  struct OptionToken {
    std::string name;
    std::optional<std::string> inline_value;
    bool long_form = false;
  };

  static std::optional<OptionToken> as_option(const std::string& arg);
  static std::string argument_hint(const SettingDefinition& def);
  static std::string default_text(const SettingDefinition& def);

  std::string process_name_;
  std::vector<std::string> positional_keys_;
  SettingsManager defaults_;
};
