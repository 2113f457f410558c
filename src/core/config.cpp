#include "core/config.hpp"

#include <fstream>
#include <sstream>

#include <opencv2/core.hpp>

namespace rover {

namespace {

template <typename T>
void readOrDefault(const cv::FileNode& node, const char* key, T& out) {
    const cv::FileNode child = node[key];
    if (!child.empty()) {
        child >> out;
    }
}

void readBoolOrDefault(const cv::FileNode& node, const char* key, bool& out) {
    const cv::FileNode child = node[key];
    if (child.empty()) {
        return;
    }
    int v = out ? 1 : 0;
    child >> v;
    out = (v != 0);
}

std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) {
        return {};
    }
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string unquote(std::string v) {
    v = trim(v);
    if (v.size() >= 2) {
        if ((v.front() == '"' && v.back() == '"') || (v.front() == '\'' && v.back() == '\'')) {
            v = v.substr(1, v.size() - 2);
        }
    }
    return v;
}

bool toBool(const std::string& v, bool& out) {
    const std::string t = trim(v);
    if (t == "true" || t == "True" || t == "1") {
        out = true;
        return true;
    }
    if (t == "false" || t == "False" || t == "0") {
        out = false;
        return true;
    }
    return false;
}

bool loadConfigPlainYaml(const std::string& path, AppConfig& out, std::string& error) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        error = "failed to open config file: " + path;
        return false;
    }

    std::string section;
    std::string line;
    while (std::getline(ifs, line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') {
            continue;
        }

        // section header, e.g. "camera:"
        if (t.back() == ':' && t.find(' ') == std::string::npos) {
            section = t.substr(0, t.size() - 1);
            continue;
        }

        const auto colon = t.find(':');
        if (colon == std::string::npos || section.empty()) {
            continue;
        }

        const std::string key = trim(t.substr(0, colon));
        std::string value = trim(t.substr(colon + 1));
        // strip inline comment
        const auto hash = value.find(" #");
        if (hash != std::string::npos) {
            value = trim(value.substr(0, hash));
        }
        value = unquote(value);

        try {
            if (section == "camera") {
                if (key == "source_mode") out.camera.source_mode = value;
                else if (key == "device_index") out.camera.device_index = std::stoi(value);
                else if (key == "gstreamer_pipeline") out.camera.gstreamer_pipeline = value;
                else if (key == "profiles") out.camera.profiles = value;
                else if (key == "left_view_only") {
                    bool b = out.camera.left_view_only;
                    if (toBool(value, b)) out.camera.left_view_only = b;
                }
            } else if (section == "stream") {
                if (key == "frame_interval_ms") out.stream.frame_interval_ms = std::stod(value);
                else if (key == "max_width") out.stream.max_width = std::stoi(value);
                else if (key == "quality") out.stream.quality = std::stoi(value);
                else if (key == "format") out.stream.format = value;
            } else if (section == "telemetry") {
                if (key == "interval_ms") out.telemetry.interval_ms = std::stoi(value);
                else if (key == "jitter_enabled") {
                    bool b = out.telemetry.jitter_enabled;
                    if (toBool(value, b)) out.telemetry.jitter_enabled = b;
                } else if (key == "jitter_seed") out.telemetry.jitter_seed = std::stoi(value);
                else if (key == "thermal_root") out.telemetry.thermal_root = value;
                else if (key == "cpu_zone") out.telemetry.cpu_zone = value;
                else if (key == "gpu_zone") out.telemetry.gpu_zone = value;
            } else if (section == "teleop") {
                if (key == "linear_speed") out.teleop.linear_speed = std::stod(value);
                else if (key == "angular_speed") out.teleop.angular_speed = std::stod(value);
                else if (key == "bridge_socket") out.teleop.bridge_socket = value;
            } else if (section == "slam") {
                if (key == "command") out.slam.command = value;
                else if (key == "shell") out.slam.shell = value;
                else if (key == "stop_timeout_ms") out.slam.stop_timeout_ms = std::stoi(value);
            } else if (section == "server") {
                if (key == "port") out.server.port = std::stoi(value);
                else if (key == "control_socket") out.server.control_socket = value;
            }
        } catch (const std::exception&) {
            // keep defaults/previous values on parse failure
        }
    }

    return validateConfig(out, error);
}

}  // namespace

bool parseCameraProfiles(const std::string& text, std::vector<CameraProfile>& out, std::string& error) {
    out.clear();
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (item.empty()) {
            continue;
        }
        CameraProfile p;
        char x = '\0';
        char at = '\0';
        std::istringstream is(item);
        if (!(is >> p.width >> x >> p.height >> at >> p.fps) || x != 'x' || at != '@') {
            error = "invalid camera profile '" + item + "', expected WIDTHxHEIGHT@FPS";
            out.clear();
            return false;
        }
        if (p.width <= 0 || p.height <= 0 || p.fps <= 0) {
            error = "camera profile '" + item + "' must have positive dimensions and fps";
            out.clear();
            return false;
        }
        out.push_back(p);
    }
    if (out.empty()) {
        error = "camera.profiles must list at least one profile";
        return false;
    }
    error.clear();
    return true;
}

bool validateConfig(const AppConfig& cfg, std::string& error) {
    if (cfg.camera.source_mode != "v4l2" && cfg.camera.source_mode != "gstreamer") {
        error = "camera.source_mode must be 'v4l2' or 'gstreamer'";
        return false;
    }
    if (cfg.camera.source_mode == "gstreamer" && cfg.camera.gstreamer_pipeline.empty()) {
        error = "camera.gstreamer_pipeline must not be empty when source_mode=gstreamer";
        return false;
    }
    if (cfg.camera.device_index < 0) {
        error = "camera.device_index must be >= 0";
        return false;
    }
    std::vector<CameraProfile> profiles;
    if (!parseCameraProfiles(cfg.camera.profiles, profiles, error)) {
        return false;
    }
    if (cfg.stream.frame_interval_ms <= 0.0 || cfg.stream.frame_interval_ms > 1000.0) {
        error = "stream.frame_interval_ms must be in (0, 1000]";
        return false;
    }
    if (cfg.stream.max_width <= 0) {
        error = "stream.max_width must be > 0";
        return false;
    }
    if (cfg.stream.quality < 1 || cfg.stream.quality > 100) {
        error = "stream.quality must be in [1,100]";
        return false;
    }
    if (cfg.stream.format != "jpeg" && cfg.stream.format != "webp") {
        error = "stream.format must be 'jpeg' or 'webp'";
        return false;
    }
    if (cfg.telemetry.interval_ms <= 0) {
        error = "telemetry.interval_ms must be > 0";
        return false;
    }
    if (cfg.teleop.linear_speed < 0.0 || cfg.teleop.angular_speed < 0.0) {
        error = "teleop speeds must be >= 0";
        return false;
    }
    if (cfg.slam.command.empty() || cfg.slam.shell.empty()) {
        error = "slam.command and slam.shell must not be empty";
        return false;
    }
    if (cfg.slam.stop_timeout_ms <= 0) {
        error = "slam.stop_timeout_ms must be > 0";
        return false;
    }
    if (cfg.server.port <= 0 || cfg.server.port > 65535) {
        error = "server.port must be in [1,65535]";
        return false;
    }
    error.clear();
    return true;
}

bool loadConfig(const std::string& path, AppConfig& out, std::string& error) {
    try {
        const cv::FileStorage fs(path, cv::FileStorage::READ);
        if (fs.isOpened()) {
            const cv::FileNode camera = fs["camera"];
            const cv::FileNode stream = fs["stream"];
            const cv::FileNode telemetry = fs["telemetry"];
            const cv::FileNode teleop = fs["teleop"];
            const cv::FileNode slam = fs["slam"];
            const cv::FileNode server = fs["server"];

            readOrDefault(camera, "source_mode", out.camera.source_mode);
            readOrDefault(camera, "device_index", out.camera.device_index);
            readOrDefault(camera, "gstreamer_pipeline", out.camera.gstreamer_pipeline);
            readOrDefault(camera, "profiles", out.camera.profiles);
            readBoolOrDefault(camera, "left_view_only", out.camera.left_view_only);

            readOrDefault(stream, "frame_interval_ms", out.stream.frame_interval_ms);
            readOrDefault(stream, "max_width", out.stream.max_width);
            readOrDefault(stream, "quality", out.stream.quality);
            readOrDefault(stream, "format", out.stream.format);

            readOrDefault(telemetry, "interval_ms", out.telemetry.interval_ms);
            readBoolOrDefault(telemetry, "jitter_enabled", out.telemetry.jitter_enabled);
            readOrDefault(telemetry, "jitter_seed", out.telemetry.jitter_seed);
            readOrDefault(telemetry, "thermal_root", out.telemetry.thermal_root);
            readOrDefault(telemetry, "cpu_zone", out.telemetry.cpu_zone);
            readOrDefault(telemetry, "gpu_zone", out.telemetry.gpu_zone);

            readOrDefault(teleop, "linear_speed", out.teleop.linear_speed);
            readOrDefault(teleop, "angular_speed", out.teleop.angular_speed);
            readOrDefault(teleop, "bridge_socket", out.teleop.bridge_socket);

            readOrDefault(slam, "command", out.slam.command);
            readOrDefault(slam, "shell", out.slam.shell);
            readOrDefault(slam, "stop_timeout_ms", out.slam.stop_timeout_ms);

            readOrDefault(server, "port", out.server.port);
            readOrDefault(server, "control_socket", out.server.control_socket);

            return validateConfig(out, error);
        }
    } catch (const cv::Exception&) {
        // fall through to plain YAML parser below
    }

    return loadConfigPlainYaml(path, out, error);
}

}  // namespace rover
