#include "SceneConfig.hpp"
#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <sys/stat.h>

namespace skyline {

// Simple JSON key reader (no external dependencies). Keys are matched
// including their quotes, so every key in skyline.json must be unique.
static size_t findValue(const std::string& json, const char* key, char opener) {
    std::string searchKey = std::string("\"") + key + "\"";
    size_t pos = json.find(searchKey);
    if (pos == std::string::npos) return std::string::npos;

    pos = json.find(opener, pos + searchKey.size());
    if (pos == std::string::npos) return std::string::npos;

    // Skip whitespace
    pos++;
    while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) pos++;
    return pos;
}

static bool isNumberChar(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == '-' || c == '+' || c == 'e' || c == 'E';
}

static bool parseFloat(const std::string& json, const char* key, float& outValue) {
    size_t pos = findValue(json, key, ':');
    if (pos == std::string::npos) return false;

    size_t endPos = pos;
    while (endPos < json.size() && isNumberChar(json[endPos])) endPos++;

    if (endPos > pos) {
        outValue = static_cast<float>(std::atof(json.substr(pos, endPos - pos).c_str()));
        return true;
    }
    return false;
}

static bool parseDouble(const std::string& json, const char* key, double& outValue) {
    float value = static_cast<float>(outValue);
    if (!parseFloat(json, key, value)) return false;
    outValue = value;
    return true;
}

static bool parseInt(const std::string& json, const char* key, int& outValue) {
    size_t pos = findValue(json, key, ':');
    if (pos == std::string::npos) return false;

    size_t endPos = pos;
    while (endPos < json.size() && (std::isdigit(static_cast<unsigned char>(json[endPos])) || json[endPos] == '-')) endPos++;

    if (endPos > pos) {
        outValue = std::atoi(json.substr(pos, endPos - pos).c_str());
        return true;
    }
    return false;
}

static bool parseSeed(const std::string& json, const char* key, uint32_t& outValue) {
    size_t pos = findValue(json, key, ':');
    if (pos == std::string::npos) return false;

    size_t endPos = pos;
    while (endPos < json.size() && std::isdigit(static_cast<unsigned char>(json[endPos]))) endPos++;

    if (endPos > pos) {
        outValue = static_cast<uint32_t>(std::strtoul(json.substr(pos, endPos - pos).c_str(), nullptr, 10));
        return true;
    }
    return false;
}

static bool parseBool(const std::string& json, const char* key, bool& outValue) {
    size_t pos = findValue(json, key, ':');
    if (pos == std::string::npos) return false;

    if (json.compare(pos, 4, "true") == 0) {
        outValue = true;
        return true;
    } else if (json.compare(pos, 5, "false") == 0) {
        outValue = false;
        return true;
    }
    return false;
}

static bool parseVec3(const std::string& json, const char* key, glm::vec3& outValue) {
    size_t pos = findValue(json, key, '[');
    if (pos == std::string::npos) return false;

    float x = 0.0f, y = 0.0f, z = 0.0f;
    if (std::sscanf(json.c_str() + pos, "%f , %f , %f", &x, &y, &z) != 3) return false;
    outValue = glm::vec3(x, y, z);
    return true;
}

// "#rrggbb" -> linear 0..1 components
static bool parseHexColor(const std::string& text, glm::vec3& outColor) {
    if (text.size() != 7 || text[0] != '#') return false;
    char* end = nullptr;
    unsigned long packed = std::strtoul(text.c_str() + 1, &end, 16);
    if (end != text.c_str() + 7) return false;
    outColor = glm::vec3(static_cast<float>((packed >> 16) & 0xff),
                         static_cast<float>((packed >> 8) & 0xff),
                         static_cast<float>(packed & 0xff)) / 255.0f;
    return true;
}

static bool parseColor(const std::string& json, const char* key, glm::vec3& outValue) {
    size_t pos = findValue(json, key, ':');
    if (pos == std::string::npos || pos >= json.size() || json[pos] != '"') return false;
    size_t endPos = json.find('"', pos + 1);
    if (endPos == std::string::npos) return false;
    return parseHexColor(json.substr(pos + 1, endPos - pos - 1), outValue);
}

static bool parseColorList(const std::string& json, const char* key, std::vector<glm::vec3>& outValue) {
    size_t pos = findValue(json, key, '[');
    if (pos == std::string::npos) return false;
    size_t endPos = json.find(']', pos);
    if (endPos == std::string::npos) return false;

    std::vector<glm::vec3> colors;
    size_t cursor = pos;
    while (true) {
        size_t open = json.find('"', cursor);
        if (open == std::string::npos || open > endPos) break;
        size_t close = json.find('"', open + 1);
        if (close == std::string::npos || close > endPos) break;
        glm::vec3 color;
        if (parseHexColor(json.substr(open + 1, close - open - 1), color)) {
            colors.push_back(color);
        }
        cursor = close + 1;
    }
    // An empty list would leave the generators without colors
    if (colors.empty()) return false;
    outValue = std::move(colors);
    return true;
}

static long getFileModTime(const char* path) {
    struct stat st;
    if (stat(path, &st) != 0) return 0;
    return static_cast<long>(st.st_mtime);
}

bool SceneConfig::loadFromFile(const char* path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::printf("Scene config not found: %s (using built-in defaults)\n", path);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();
    file.close();

    if (json.empty()) {
        std::fprintf(stderr, "Error: scene config file is empty: %s\n", path);
        return false;
    }

    parseInt(json, "building_count", buildingCount);
    parseInt(json, "mobile_building_count", mobileBuildingCount);
    parseFloat(json, "min_height", minHeight);
    parseFloat(json, "max_height", maxHeight);
    parseFloat(json, "min_width", minWidth);
    parseFloat(json, "max_width", maxWidth);
    parseFloat(json, "min_depth", minDepth);
    parseFloat(json, "max_depth", maxDepth);
    parseFloat(json, "landmark_chance", landmarkChance);
    parseFloat(json, "landmark_extra_height", landmarkExtraHeight);
    parseFloat(json, "beacon_height_threshold", beaconHeightThreshold);
    parseFloat(json, "fin_chance", finChance);

    parseFloat(json, "chunk_length", chunkLength);
    parseInt(json, "chunk_count", chunkCount);
    parseFloat(json, "lane_half_width", laneHalfWidth);
    parseFloat(json, "lateral_spread", lateralSpread);
    parseFloat(json, "ground_width", groundWidth);
    parseFloat(json, "seam_overlap", seamOverlap);

    parseColorList(json, "structure_colors", structureColors);
    parseColorList(json, "warm_window_colors", warmWindowColors);
    parseColorList(json, "cool_window_colors", coolWindowColors);
    parseColor(json, "wall_color", wallColor);
    parseColor(json, "dark_window_color", darkWindowColor);
    parseColor(json, "ground_color", groundColor);
    parseColor(json, "road_line_color", roadLineColor);
    parseColor(json, "roof_clutter_color", roofClutterColor);
    parseColor(json, "beacon_color", beaconColor);

    parseBool(json, "fog_enabled", fogEnabled);
    parseColor(json, "fog_color", fogColor);
    parseFloat(json, "fog_density", fogDensity);

    parseFloat(json, "fov_degrees", fovDegrees);
    parseFloat(json, "near_plane", nearPlane);
    parseFloat(json, "far_plane", farPlane);
    parseFloat(json, "camera_height", cameraHeight);
    parseFloat(json, "camera_look_drop", cameraLookDrop);
    parseFloat(json, "camera_look_distance", cameraLookDistance);
    parseFloat(json, "travel_per_frame", travelPerFrame);

    parseColor(json, "ambient_color", ambientColor);
    parseFloat(json, "ambient_intensity", ambientIntensity);
    parseColor(json, "sun_color", sunColor);
    parseFloat(json, "sun_intensity", sunIntensity);
    parseVec3(json, "sun_position", sunPosition);
    parseColor(json, "hemisphere_sky_color", hemisphereSkyColor);
    parseColor(json, "hemisphere_ground_color", hemisphereGroundColor);
    parseFloat(json, "hemisphere_intensity", hemisphereIntensity);

    parseColor(json, "sky_top_color", skyTopColor);
    parseColor(json, "sky_middle_color", skyMiddleColor);
    parseColor(json, "sky_bottom_color", skyBottomColor);
    parseFloat(json, "sky_offset", skyOffset);
    parseFloat(json, "sky_exponent", skyExponent);
    parseVec3(json, "sun_glow_position", sunGlowPosition);
    parseColor(json, "sun_glow_color", sunGlowColor);
    parseFloat(json, "sun_glow_intensity", sunGlowIntensity);

    parseFloat(json, "exposure", exposure);
    parseFloat(json, "emissive_intensity", emissiveIntensity);

    parseFloat(json, "mobile_pixel_ratio_cap", mobilePixelRatioCap);
    parseFloat(json, "desktop_pixel_ratio_cap", desktopPixelRatioCap);
    parseFloat(json, "target_fps", targetFps);
    parseInt(json, "fps_sample_interval", fpsSampleInterval);
    parseDouble(json, "fps_window_ms", fpsWindowMs);
    parseFloat(json, "pixel_ratio_step", pixelRatioStep);
    parseFloat(json, "min_pixel_ratio", minPixelRatio);
    parseFloat(json, "mobile_texture_scale", mobileTextureScale);
    parseInt(json, "mobile_width_threshold", mobileWidthThreshold);
    parseDouble(json, "resize_debounce_ms", resizeDebounceMs);

    parseSeed(json, "seed", seed);

    lastModTime_ = getFileModTime(path);

    int corrected = normalize();
    std::printf("Loaded scene config from: %s\n", path);
    std::printf("   Chunks: %d x %.0f, buildings per chunk: %d (mobile %d)\n",
                chunkCount, chunkLength, buildingCount, mobileBuildingCount);
    if (corrected > 0) {
        std::printf("   Corrected %d out-of-range field(s)\n", corrected);
    }
    return true;
}

bool SceneConfig::checkAndReload(const char* path) {
    long currentModTime = getFileModTime(path);
    if (currentModTime > lastModTime_) {
        std::printf("Scene config changed, reloading...\n");
        if (loadFromFile(path)) {
            return true;
        }
    }
    return false;
}

static int orderRange(float& lo, float& hi, const char* name) {
    if (lo <= hi) return 0;
    std::printf("Warning: %s range inverted (%.2f > %.2f), swapping\n", name, lo, hi);
    std::swap(lo, hi);
    return 1;
}

template <typename T>
static int clampAtLeast(T& value, T minimum, const char* name) {
    // NaN fails the compare and is clamped too
    if (value >= minimum) return 0;
    std::printf("Warning: %s below minimum, clamping\n", name);
    value = minimum;
    return 1;
}

static int clampAtMost(float& value, float maximum, const char* name) {
    if (value <= maximum) return 0;
    std::printf("Warning: %s above %.2f, clamping\n", name, maximum);
    value = maximum;
    return 1;
}

int SceneConfig::normalize() {
    int corrected = 0;
    corrected += orderRange(minHeight, maxHeight, "height");
    corrected += orderRange(minWidth, maxWidth, "width");
    corrected += orderRange(minDepth, maxDepth, "depth");

    corrected += clampAtLeast(minHeight, 1.0f, "min_height");
    corrected += clampAtLeast(maxHeight, minHeight, "max_height");
    corrected += clampAtLeast(minWidth, 1.0f, "min_width");
    corrected += clampAtLeast(maxWidth, minWidth, "max_width");
    corrected += clampAtLeast(minDepth, 1.0f, "min_depth");
    corrected += clampAtLeast(maxDepth, minDepth, "max_depth");

    corrected += clampAtLeast(chunkLength, 1.0f, "chunk_length");
    corrected += clampAtLeast(chunkCount, 1, "chunk_count");
    corrected += clampAtLeast(buildingCount, 0, "building_count");
    corrected += clampAtLeast(mobileBuildingCount, 0, "mobile_building_count");
    corrected += clampAtLeast(laneHalfWidth, 0.0f, "lane_half_width");
    corrected += clampAtLeast(lateralSpread, 0.0f, "lateral_spread");
    corrected += clampAtLeast(seamOverlap, 0.0f, "seam_overlap");

    corrected += clampAtLeast(minPixelRatio, 0.25f, "min_pixel_ratio");
    corrected += clampAtLeast(mobilePixelRatioCap, minPixelRatio, "mobile_pixel_ratio_cap");
    corrected += clampAtLeast(desktopPixelRatioCap, minPixelRatio, "desktop_pixel_ratio_cap");
    corrected += clampAtLeast(pixelRatioStep, 0.0f, "pixel_ratio_step");
    corrected += clampAtLeast(targetFps, 1.0f, "target_fps");
    corrected += clampAtLeast(fpsSampleInterval, 1, "fps_sample_interval");
    corrected += clampAtLeast(fpsWindowMs, 1.0, "fps_window_ms");
    corrected += clampAtLeast(resizeDebounceMs, 0.0, "resize_debounce_ms");
    corrected += clampAtLeast(mobileTextureScale, 0.0625f, "mobile_texture_scale");
    corrected += clampAtLeast(travelPerFrame, 0.0f, "travel_per_frame");
    // At most one chunk length per frame
    corrected += clampAtMost(travelPerFrame, chunkLength, "travel_per_frame");
    return corrected;
}

} // namespace skyline
