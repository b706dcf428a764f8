#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","mode"},               {"aliases", {"m"}},              {"type","string"}, {"default","relay"},   {"choices", {"relay","send","receive"}}, {"description","relay, send or receive"}, {"persistent", true}},
  {{"key","room_id"},            {"aliases", {"room","r"}},       {"type","string"}, {"default",""},        {"description","Room to join (generated when empty)"}, {"persistent", false}},
  {{"key","paths"},              {"aliases", {"files"}},          {"type","list"},   {"default",nlohmann::json::array()}, {"description","Files or folders to send"}, {"persistent", false}},
  {{"key","listen_ip"},          {"aliases", {"li"}},             {"type","string"}, {"default","0.0.0.0"}, {"description","Interface/IP the relay binds"}, {"persistent", true}},
  {{"key","listen_port"},        {"aliases", {"lp"}},             {"type","int"},    {"default",3000},      {"description","TCP port the relay listens on (0 = any)"}, {"persistent", true}},
  {{"key","relay"},              {"aliases", {"endpoint","ip"}},  {"type","string"}, {"default","127.0.0.1:3000"}, {"description","Relay address host[:port] used by send/receive"}, {"persistent", true}},
  {{"key","download_dir"},       {"aliases", {"out","o"}},        {"type","string"}, {"default","received"},{"description","Where received files and folders are written"}, {"persistent", true}},
  {{"key","folder_save"},        {"aliases", {"fs"}},             {"type","string"}, {"default","directory"}, {"choices", {"directory","archive"}}, {"description","Save received folders as a directory tree or a zip archive"}, {"persistent", true}},
  {{"key","strict_assembly"},    {"aliases", {"strict"}},         {"type","bool"},   {"default",true},      {"description","Fail a received file when chunks are missing instead of truncating"}, {"persistent", true}},
  {{"key","connect_timeout_ms"}, {"aliases", {"timeout","ct"}},   {"type","int"},    {"default",10000},     {"description","Milliseconds to wait for the relay connection"}, {"persistent", true}},
  {{"key","verbose"},            {"aliases", {"v"}},              {"type","bool"},   {"default",false},     {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","transfer_debug"},     {"aliases", {"transfer","td"}},  {"type","bool"},   {"default",false},     {"description","Log chunk send/receive activity"}, {"persistent", true}},
  {{"key","help"},               {"aliases", {"h","?"}},          {"type","bool"},   {"default",false},     {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},               {"aliases", {"persist"}},        {"type","bool"},   {"default",false},     {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;
  // List settings grow by one entry per string assignment.
  bool is_list_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;

  nlohmann::json get_json(bool persistent_only = true) const;
  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string normalized_key;
    std::string type;
    nlohmann::json default_value;
    std::vector<std::string> choices; // empty = any value
    std::string description;
    bool persistent = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  const std::vector<SettingSpec>& setting_specs() const { return setting_specs_; }

  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;


  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
};

// ---- implementation -------------------------------------------------------

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    spec.normalized_key = SettingsManager::to_lower(spec.key);
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
      for(auto& alias : spec.aliases) {
        alias = SettingsManager::to_lower(alias);
      }
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    if(entry.contains("choices")) {
      spec.choices = entry.at("choices").get<std::vector<std::string>>();
    }
    spec.description = entry.value("description", "");
    spec.persistent = entry.value("persistent", true);
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : setting_specs_(build_setting_specs(specification)) {
  apply_defaults();
}

inline void SettingsManager::apply_defaults() {
  settings_ = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    settings_[spec.key] = spec.default_value;
  }
}

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  std::string lowered = to_lower(token);
  for(const auto& spec : setting_specs_) {
    if(lowered == spec.normalized_key) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

inline bool SettingsManager::has(const std::string& key) const {
  return settings_.contains(key);
}

inline std::filesystem::path SettingsManager::settings_path() const {
  return std::filesystem::current_path() / ".roomshare" / "settings.json";
}

inline bool SettingsManager::load() {
  return load_from_file(settings_path());
}

inline bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const std::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2);
  return true;
}

inline void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!convert_and_store(*spec, item.value(), error) && !error.empty()) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

inline nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : setting_specs()) {
    if(persistent_only && !spec.persistent) continue;
    if(settings_.contains(spec.key)) {
      doc[spec.key] = settings_.at(spec.key);
    }
  }
  return doc;
}

inline bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                                  const nlohmann::json& value,
                                                  std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      settings_[spec.key] = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      settings_[spec.key] = (value.get<int>() != 0);
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(value.is_number_integer()) {
      settings_[spec.key] = value.get<int>();
      return true;
    }
    error = "expected integer";
    return false;
  }
  if(spec.type == "string") {
    if(value.is_string()) {
      auto text = value.get<std::string>();
      if(!spec.choices.empty() &&
         std::find(spec.choices.begin(), spec.choices.end(), to_lower(text)) == spec.choices.end()) {
        error = "expected one of";
        for(const auto& choice : spec.choices) error += " " + choice;
        return false;
      }
      settings_[spec.key] = spec.choices.empty() ? text : to_lower(text);
      return true;
    }
    error = "expected string";
    return false;
  }
  if(spec.type == "list") {
    if(value.is_string()) {
      settings_[spec.key].push_back(value.get<std::string>());
      return true;
    }
    if(value.is_array() && std::all_of(value.begin(), value.end(),
                                       [](const nlohmann::json& v){ return v.is_string(); })) {
      settings_[spec.key] = value;
      return true;
    }
    error = "expected string or array of strings";
    return false;
  }
  error = "unknown type";
  return false;
}

inline nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                             const std::string& value,
                                                             std::string& error) const {
  error.clear();
  std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    std::string v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    try {
      return std::stoi(clean);
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "string" || spec.type == "list") {
    return clean;
  }
  error = "unsupported type";
  return {};
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                                const std::string& value,
                                                std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  return convert_and_store(*spec, parsed, error);
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) {
    return spec->key;
  }
  return std::nullopt;
}

inline bool SettingsManager::is_list_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "list";
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
