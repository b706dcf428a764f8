#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "settings_manager.hpp"

// Bad argv; main prints the message plus usage and exits non-zero.
class CommandLineError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "roomshare",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","mode"}},
                      {{"index",1},{"key","room_id"}},
                      {{"index",2},{"key","paths"},{"variadic",true}}
                    }));

  // Throws CommandLineError.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage() const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
    bool variadic = false; // swallows every remaining positional
  };

  std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec) const;
  static bool is_option_token(const std::string& candidate);
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
  nlohmann::json settings_spec_;
  nlohmann::json argv_spec_;
  std::vector<ArgvSpec> positional_specs_;
};
