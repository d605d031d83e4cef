#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace lgtv {

inline constexpr const char *kRegisterId = "register_0";

// Unsigned client manifest listing the permissions this client asks for.
// Configurations that need signed permissions (e.g. WRITE_SETTINGS on newer
// firmware) supply their own manifest through TvConfig::manifest.
inline nlohmann::json DefaultManifest() {
  return {
      {"manifestVersion", 1},
      {"appVersion", "1.1"},
      {"signed",
       {{"appId", "com.lge.test"},
        {"vendorId", "com.lge"},
        {"created", "20140509"},
        {"localizedAppNames", {{"", "LG Remote App"}}},
        {"localizedVendorNames", {{"", "LG Electronics"}}},
        {"permissions",
         {"TEST_SECURE", "CONTROL_INPUT_TEXT", "CONTROL_MOUSE_AND_KEYBOARD",
          "READ_INSTALLED_APPS", "READ_LGE_SDX", "READ_NOTIFICATIONS",
          "SEARCH", "WRITE_SETTINGS", "WRITE_NOTIFICATION_ALERT",
          "CONTROL_POWER", "READ_CURRENT_CHANNEL", "READ_RUNNING_APPS",
          "READ_UPDATE_INFO", "UPDATE_FROM_REMOTE_APP",
          "READ_LGE_TV_INPUT_EVENTS", "READ_TV_CURRENT_TIME"}}}},
      {"permissions",
       {"LAUNCH", "LAUNCH_WEBAPP", "APP_TO_APP", "CLOSE", "TEST_OPEN",
        "TEST_PROTECTED", "CONTROL_AUDIO", "CONTROL_DISPLAY",
        "CONTROL_INPUT_JOYSTICK", "CONTROL_INPUT_MEDIA_RECORDING",
        "CONTROL_INPUT_MEDIA_PLAYBACK", "CONTROL_INPUT_TV", "CONTROL_POWER",
        "READ_APP_STATUS", "READ_CURRENT_CHANNEL", "READ_INPUT_DEVICE_LIST",
        "READ_NETWORK_STATE", "READ_RUNNING_APPS", "READ_TV_CHANNEL_LIST",
        "WRITE_NOTIFICATION_TOAST", "READ_POWER_STATE", "READ_COUNTRY_INFO",
        "READ_SETTINGS", "CONTROL_TV_SCREEN", "CONTROL_TV_STANBY",
        "CONTROL_FAVORITE_GROUP", "CONTROL_USER_INFO",
        "CHECK_BLUETOOTH_DEVICE", "CONTROL_BLUETOOTH", "CONTROL_TIMER_INFO",
        "STB_INTERNAL_CONNECTION", "CONTROL_RECORDING",
        "READ_RECORDING_STATE", "WRITE_RECORDING_LIST",
        "READ_RECORDING_LIST", "READ_RECORDING_SCHEDULE",
        "WRITE_RECORDING_SCHEDULE", "READ_STORAGE_DEVICE_LIST",
        "READ_TV_PROGRAM_INFO", "CONTROL_BOX_CHANNEL",
        "READ_TV_ACR_AUTH_TOKEN", "READ_TV_CONTENT_STATE",
        "READ_TV_CURRENT_TIME", "ADD_LAUNCHER_CHANNEL", "SET_CHANNEL_SKIP",
        "RELEASE_CHANNEL_SKIP", "CONTROL_CHANNEL_BLOCK",
        "DELETE_SELECT_CHANNEL", "CONTROL_CHANNEL_GROUP", "SCAN_TV_CHANNELS",
        "CONTROL_TV_POWER", "CONTROL_WOL"}}};
}

// {"type":"register","id":"register_0","payload":{...,"client-key":KEY}}
inline nlohmann::json
MakeRegisterMessage(const std::string &clientKey,
                    const std::optional<nlohmann::json> &manifest = {}) {
  return {{"type", "register"},
          {"id", kRegisterId},
          {"payload",
           {{"forcePairing", false},
            {"pairingType", "PROMPT"},
            {"client-key", clientKey},
            {"manifest", manifest.value_or(DefaultManifest())}}}};
}

} // namespace lgtv
