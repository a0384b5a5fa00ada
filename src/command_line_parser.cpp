#include "command_line_parser.hpp"

#include <cctype>
#include <cstdlib>
#include <stdexcept>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     std::vector<std::string> positional_keys)
  : process_name_(std::move(process_name)) {
  for(const auto& key : positional_keys) {
    auto resolved = defaults_.resolve_key(key);
    if(!resolved) {
      throw std::runtime_error("Positional argument refers to unknown setting '" + key + "'");
    }
    positional_keys_.push_back(*resolved);
  }
}

std::optional<CommandLineParser::OptionToken> CommandLineParser::as_option(const std::string& arg) {
  OptionToken token;
  if(arg.rfind("--", 0) == 0 && arg.size() > 2) {
    token.long_form = true;
    token.name = arg.substr(2);
  } else if(arg.size() >= 2 && arg[0] == '-' &&
            (std::isalpha(static_cast<unsigned char>(arg[1])) || arg[1] == '?')) {
    token.name = arg.substr(1);
  } else {
    return std::nullopt;
  }
  auto eq = token.name.find('=');
  if(eq != std::string::npos) {
    token.inline_value = token.name.substr(eq + 1);
    token.name.erase(eq);
  }
  return token;
}

bool CommandLineParser::parse(const std::vector<std::string>& args,
                              SettingsManager& settings,
                              std::string& error) const {
  error.clear();
  std::size_t next_positional = 0;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const auto& arg = args[i];
    auto option = as_option(arg);
    auto key = option ? settings.resolve_key(option->name) : std::nullopt;

    if(option && !key && option->long_form) {
      error = "Unknown option --" + option->name;
      return false;
    }

    if(key) {
      std::string value;
      if(option->inline_value) {
        value = *option->inline_value;
      } else if(settings.is_bool_setting(*key)) {
        // a following bool literal belongs to the flag, anything else does not
        bool takes_next = i + 1 < args.size() && parse_bool_literal(args[i + 1]).has_value();
        value = takes_next ? args[++i] : "true";
      } else if(i + 1 < args.size()) {
        value = args[++i];
      } else {
        error = "Missing value for option '" + option->name + "'";
        return false;
      }

      std::string set_error;
      if(!settings.set_from_string(*key, value, set_error)) {
        error = "Invalid value for option '" + option->name + "': " + set_error;
        return false;
      }
      continue;
    }

    // short options that match nothing are treated as values (e.g. "-1")
    if(next_positional >= positional_keys_.size()) {
      error = "Unexpected positional argument '" + arg + "'";
      return false;
    }
    const auto& target = positional_keys_[next_positional++];
    std::string set_error;
    if(!settings.set_from_string(target, arg, set_error)) {
      error = "Invalid value for " + target + " '" + arg + "': " + set_error;
      return false;
    }
  }
  return true;
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  std::string error;
  if(!parse(args, settings, error)) {
    print_err(nullptr, "{}", error);
    usage();
    std::exit(1);
  }
}

std::string CommandLineParser::argument_hint(const SettingDefinition& def) {
  switch(def.type) {
    case SettingType::Bool: return "[true|false]";
    case SettingType::List: return "<a,b,...>";
    default: return std::string("<") + to_string(def.type) + ">";
  }
}

std::string CommandLineParser::default_text(const SettingDefinition& def) {
  const auto& value = def.default_value;
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  if(value.is_string()) return value.get<std::string>().empty() ? "\"\"" : value.get<std::string>();
  if(value.is_array() && value.empty()) return "none";
  return value.dump();
}

void CommandLineParser::usage() const {
  std::string synopsis = process_name_;
  for(const auto& key : positional_keys_) synopsis += " [" + key + "]";

  print_out(nullptr, "{} - peer-to-peer adapter sharing node", process_name_);
  print_out(nullptr, "Usage:");
  print_out(nullptr, "  {} [options]", synopsis);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& def : defaults_.definitions()) {
    std::string aliases;
    for(const auto& alias : def.aliases) {
      aliases += aliases.empty() ? " (alias: -" : ", -";
      aliases += alias;
    }
    if(!aliases.empty()) aliases += ")";
    print_out(nullptr, "  --{:<24} {:<14} {}{} (default: {})",
              def.key, argument_hint(def), def.description, aliases, default_text(def));
  }
  print_out(nullptr, "");
}
