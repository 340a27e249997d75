#include "config.hpp"
#include "io.hpp"
#include "util.hpp"

static const int SYNC_INTERVALS[] = { 1, 2, 3, 5, 10, 30, 60 };

const char* sync_target_str(SyncTarget t) {
    switch (t) {
    case SyncTarget::NONE:   return "none";
    case SyncTarget::SERVER: return "server";
    case SyncTarget::FILE:   return "file";
    }
    return "none";
}

bool parse_sync_target(const std::string& s, SyncTarget& out) {
    std::string v = to_lower(s);
    if (v == "none")   { out = SyncTarget::NONE; return true; }
    if (v == "server") { out = SyncTarget::SERVER; return true; }
    if (v == "file")   { out = SyncTarget::FILE; return true; }
    return false;
}

bool valid_sync_interval(int minutes) {
    return std::find(std::begin(SYNC_INTERVALS), std::end(SYNC_INTERVALS), minutes) !=
        std::end(SYNC_INTERVALS);
}

static bool parse_int(const std::string& s, int& out) {
    if (s.empty() || s.size() > 9) return false;
    if (!std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    out = std::stoi(s);
    return true;
}

static bool valid_device_id(const std::string& id) {
    if (id.size() != 32) return false;
    return std::all_of(id.begin(), id.end(), [](unsigned char c) { return std::isxdigit(c); });
}

// '#' opens a comment at the start of a line or after whitespace, so
// tokens and paths may contain it
static size_t comment_start(const std::string& line) {
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '#' && (i == 0 || std::isspace(static_cast<unsigned char>(line[i - 1])))) {
            return i;
        }
    }
    return line.size();
}

ZkStatus validate_config(const SyncConfig& cfg) {
    if (!valid_sync_interval(cfg.interval_minutes)) return ZkStatus::VALIDATION_FAILURE;
    if (cfg.quiet_period_seconds < 0 || cfg.quiet_period_seconds > 3600) {
        return ZkStatus::VALIDATION_FAILURE;
    }
    if (!cfg.device_id.empty() && !valid_device_id(cfg.device_id)) {
        return ZkStatus::VALIDATION_FAILURE;
    }
    if (contains_control_or_tab_or_null(cfg.remote_url) ||
        contains_control_or_tab_or_null(cfg.credentials)) {
        return ZkStatus::VALIDATION_FAILURE;
    }

    switch (cfg.target) {
    case SyncTarget::NONE:
        break;
    case SyncTarget::SERVER:
        if (cfg.remote_url.rfind("http://", 0) != 0 && cfg.remote_url.rfind("https://", 0) != 0) {
            return ZkStatus::VALIDATION_FAILURE;
        }
        break;
    case SyncTarget::FILE:
        if (cfg.remote_url.empty()) return ZkStatus::VALIDATION_FAILURE;
        break;
    }
    return ZkStatus::OK;
}

ZkStatus parse_config(const std::string& text, SyncConfig& out) {
    SyncConfig cfg;
    std::istringstream in(text);
    std::string line;
    size_t lineno = 0;

    while (std::getline(in, line)) {
        lineno++;
        line.erase(comment_start(line));
        trim_spaces(line);
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            audit_log_level(LogLevel::WARN,
                "Config line " + std::to_string(lineno) + " has no '='",
                "config",
                "failure");
            return ZkStatus::VALIDATION_FAILURE;
        }
        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        trim_spaces(key);
        trim_spaces(value);

        bool good = true;
        if (key == "sync_target") {
            good = parse_sync_target(value, cfg.target);
        }
        else if (key == "sync_interval_minutes") {
            good = parse_int(value, cfg.interval_minutes);
        }
        else if (key == "quiet_period_seconds") {
            good = parse_int(value, cfg.quiet_period_seconds);
        }
        else if (key == "remote_url") {
            cfg.remote_url = value;
        }
        else if (key == "credentials") {
            cfg.credentials = value;
        }
        else if (key == "device_id") {
            cfg.device_id = to_lower(value);
        }
        else {
            audit_log_level(LogLevel::WARN,
                "Unknown config key: " + key,
                "config",
                "ignored");
        }

        if (!good) {
            audit_log_level(LogLevel::WARN,
                "Invalid value for config key: " + key,
                "config",
                "failure");
            return ZkStatus::VALIDATION_FAILURE;
        }
    }

    ZkStatus st = validate_config(cfg);
    if (!ok(st)) return st;
    out = cfg;
    return ZkStatus::OK;
}

std::string serialize_config(const SyncConfig& cfg) {
    std::ostringstream os;
    os << "# zknotes configuration\n";
    os << "sync_target = " << sync_target_str(cfg.target) << "\n";
    os << "sync_interval_minutes = " << cfg.interval_minutes << "\n";
    os << "remote_url = " << cfg.remote_url << "\n";
    os << "credentials = " << cfg.credentials << "\n";
    os << "device_id = " << cfg.device_id << "\n";
    os << "quiet_period_seconds = " << cfg.quiet_period_seconds << "\n";
    return os.str();
}

ZkStatus save_config(const std::string& path, const SyncConfig& cfg) {
    ZkStatus st = validate_config(cfg);
    if (!ok(st)) return st;
    if (!atomic_write_text(path, serialize_config(cfg))) {
        return ZkStatus::STORAGE_FAILURE;
    }
    return ZkStatus::OK;
}

ZkStatus load_or_create_config(const std::string& path, SyncConfig& out) {
    std::string text;
    bool missing = false;
    if (!read_file(path, text, missing)) return ZkStatus::STORAGE_FAILURE;

    SyncConfig cfg;
    if (!missing) {
        ZkStatus st = parse_config(text, cfg);
        if (!ok(st)) return st;
    }

    if (missing || cfg.device_id.empty()) {
        cfg.device_id = generate_device_id();
        ZkStatus st = save_config(path, cfg);
        if (!ok(st)) return st;
        audit_log_level(LogLevel::INFO,
            "Device id generated",
            "config",
            "success");
    }

    out = cfg;
    return ZkStatus::OK;
}
