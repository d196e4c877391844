// ============================================================================
// config.cpp: implementation for config.hpp
// ============================================================================
#include "lorabroker/config.hpp"

#include "nlohmann/json.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace lorabroker {

fs::path default_config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return fs::path(xdg) / "lorabroker";
    const char* home = std::getenv("HOME");
    fs::path base = (home && *home) ? fs::path(home) / ".config" : fs::path(".config");
    return base / "lorabroker";
}

fs::path default_config_path() {
    return default_config_dir() / "config.json";
}

Error parse_config(const std::string& text, BrokerConfig& out) {
    json j = json::parse(text, nullptr, /*allow_exceptions*/false);
    if (j.is_discarded()) return Error(ErrorKind::Structural, "config: not valid JSON");
    if (!j.is_object())   return Error(ErrorKind::Structural, "config: top level is not an object");

    BrokerConfig cfg = out;

    if (auto it = j.find("registry_path"); it != j.end()) {
        if (!it->is_string()) return Error(ErrorKind::Structural, "config: registry_path must be a string");
        cfg.registry_path = it->get<std::string>();
    }
    if (auto it = j.find("log_level"); it != j.end()) {
        if (!it->is_string() || !parse_log_level(it->get<std::string>(), cfg.log_level))
            return Error(ErrorKind::Structural, "config: log_level must be debug|info|warn|error|off");
    }
    if (auto it = j.find("handler_fallback"); it != j.end()) {
        if (!it->is_string()) return Error(ErrorKind::Structural, "config: handler_fallback must be a string");
        cfg.handler_fallback = it->get<std::string>();
    }

    out = cfg;
    return Error();
}

Error load_config(const fs::path& path, BrokerConfig& out) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return Error();

    std::ifstream in(path);
    if (!in) return Error(ErrorKind::Operational, "config: cannot open " + path.string());
    std::ostringstream ss;
    ss << in.rdbuf();

    Error err = parse_config(ss.str(), out);
    if (err) err.reason += " (" + path.string() + ")";
    return err;
}

} // namespace lorabroker
