#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// Every recognised option. "min"/"max" bound int settings, "choices" bounds
// string settings; "persistent" settings are written by save().
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","mode"},                 {"aliases", {"m"}},                  {"type","string"}, {"default",""},                {"choices", {"", "send", "receive"}}, {"description","send or receive"}, {"persistent", false}},
  {{"key","target"},               {"aliases", {"t"}},                  {"type","string"}, {"default",""},                {"description","File to send, or passcode to receive"}, {"persistent", false}},
  {{"key","passcode"},             {"aliases", {"code"}},               {"type","string"}, {"default",""},                {"description","Use this passcode instead of generating one (send)"}, {"persistent", false}},
  {{"key","discovery_mode"},       {"aliases", {"dm","discovery"}},     {"type","string"}, {"default","broadcast"},       {"choices", {"direct", "broadcast"}}, {"description","How peers find each other"}, {"persistent", true}},
  {{"key","peer_address"},         {"aliases", {"peer","pa"}},          {"type","string"}, {"default",""},                {"description","Sender address for direct mode (receive)"}, {"persistent", true}},
  {{"key","bind_address"},         {"aliases", {"bind","ba"}},          {"type","string"}, {"default","0.0.0.0"},         {"description","Local address to listen on"}, {"persistent", true}},
  {{"key","broadcast_address"},    {"aliases", {"bcast"}},              {"type","string"}, {"default","255.255.255.255"}, {"description","Where announcements are sent (broadcast mode)"}, {"persistent", true}},
  {{"key","transfer_port"},        {"aliases", {"port","tp"}},          {"type","int"},    {"default",9527},              {"min",0}, {"max",65535}, {"description","TCP port the sender listens on (0 = any)"}, {"persistent", true}},
  {{"key","discovery_port"},       {"aliases", {"dp"}},                 {"type","int"},    {"default",9528},              {"min",1}, {"max",65535}, {"description","UDP port for announcements"}, {"persistent", true}},
  {{"key","chunk_size"},           {"aliases", {"cs"}},                 {"type","int"},    {"default",65536},             {"min",1}, {"max",16777216}, {"description","Bytes per read/write"}, {"persistent", true}},
  {{"key","retry_budget"},         {"aliases", {"retries","rb"}},       {"type","int"},    {"default",30},                {"min",1}, {"max",100000}, {"description","Rendezvous attempts before giving up"}, {"persistent", true}},
  {{"key","retry_interval_ms"},    {"aliases", {"rim"}},                {"type","int"},    {"default",1000},              {"min",1}, {"max",3600000}, {"description","Spacing between rendezvous attempts"}, {"persistent", true}},
  {{"key","handshake_timeout_ms"}, {"aliases", {"htm"}},                {"type","int"},    {"default",5000},              {"min",1}, {"max",3600000}, {"description","Timeout for passcode and header steps"}, {"persistent", true}},
  {{"key","io_timeout_ms"},        {"aliases", {"itm"}},                {"type","int"},    {"default",120000},            {"min",1}, {"max",86400000}, {"description","Timeout for a single chunk read/write"}, {"persistent", true}},
  {{"key","session_retries"},      {"aliases", {"sr"}},                 {"type","int"},    {"default",3},                 {"min",0}, {"max",100}, {"description","Restarts after a transient network fault"}, {"persistent", true}},
  {{"key","passcode_alphabet"},    {"aliases", {"alphabet"}},           {"type","string"}, {"default","digits"},          {"choices", {"digits", "alphanumeric", "upper_alphanumeric"}}, {"description","Characters a passcode is drawn from"}, {"persistent", true}},
  {{"key","passcode_length"},      {"aliases", {"pl"}},                 {"type","int"},    {"default",6},                 {"min",4}, {"max",32}, {"description","Passcode length"}, {"persistent", true}},
  {{"key","output_dir"},           {"aliases", {"out","o"}},            {"type","string"}, {"default","."},               {"description","Directory received files are written to"}, {"persistent", true}},
  {{"key","atomic_write"},         {"aliases", {"atomic"}},             {"type","bool"},   {"default",false},             {"description","Receive into a temporary file and rename on success"}, {"persistent", true}},
  {{"key","progress_interval_ms"}, {"aliases", {"pim"}},                {"type","int"},    {"default",100},               {"min",1}, {"max",60000}, {"description","Minimum milliseconds between progress updates"}, {"persistent", true}},
  {{"key","transfer_progress"},    {"aliases", {"progress"}},           {"type","bool"},   {"default",true},              {"description","Show the progress meter"}, {"persistent", true}},
  {{"key","progress_meter_size"},  {"aliases", {"meter","pms"}},        {"type","int"},    {"default",40},                {"min",1}, {"max",400}, {"description","Characters used for the progress meter"}, {"persistent", true}},
  {{"key","verbose"},              {"aliases", {"v"}},                  {"type","bool"},   {"default",false},             {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","log_file"},             {"aliases", {"log"}},                {"type","string"}, {"default",""},                {"description","Also write logs to this file"}, {"persistent", true}},
  {{"key","help"},                 {"aliases", {"h","?"}},              {"type","bool"},   {"default",false},             {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                 {"aliases", {"persist"}},            {"type","bool"},   {"default",false},             {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    nlohmann::json default_value;
    std::optional<long long> min_value;
    std::optional<long long> max_value;
    std::vector<std::string> choices;
    std::string description;
    bool persistent = true;
  };

  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const {
    if(!has(key)) {
      throw std::runtime_error("Unknown setting: " + key);
    }
    return settings_.at(key).get<T>();
  }

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  const std::vector<SettingSpec>& specs() const { return setting_specs_; }
  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json get_json(bool persistent_only = true) const;

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static bool is_bool_literal(const std::string& value);

private:
  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  const SettingSpec* find_spec(const std::string& token) const;

  void apply_defaults();
  void merge_from_json(const nlohmann::json& doc);

  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json settings_;
  std::vector<SettingSpec> setting_specs_;
  std::filesystem::path settings_path_override_;
};
