#include "EngineConfig.hpp"
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace kreeda {

// Global engine configuration instance
EngineConfig g_engineConfig;

// Minimal JSON scanner for flat config files (no external dependencies)
static size_t findValue(const std::string& json, const char* key) {
    std::string searchKey = std::string("\"") + key + "\"";
    size_t pos = json.find(searchKey);
    if (pos == std::string::npos) return std::string::npos;

    pos = json.find(':', pos + searchKey.size());
    if (pos == std::string::npos) return std::string::npos;

    // Skip whitespace
    pos++;
    while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) pos++;
    return pos;
}

static bool parseInt(const std::string& json, const char* key, int& outValue) {
    size_t pos = findValue(json, key);
    if (pos == std::string::npos) return false;

    const char* begin = json.c_str() + pos;
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(begin, &end, 10);
    if (end == begin) return false;

    // The number must end the value ("1-2" and "3.5" are rejected)
    const char* rest = end;
    while (*rest && std::isspace(static_cast<unsigned char>(*rest))) rest++;
    if (*rest != ',' && *rest != '}' && *rest != '\0') {
        printf("Warning: \"%s\" is not an integer\n", key);
        return false;
    }
    if (errno == ERANGE || value < INT_MIN || value > INT_MAX) {
        printf("Warning: \"%s\" is out of range\n", key);
        return false;
    }
    outValue = static_cast<int>(value);
    return true;
}

static bool parsePositiveInt(const std::string& json, const char* key, int& outValue) {
    int value = 0;
    if (!parseInt(json, key, value)) return false;
    if (value <= 0) {
        printf("Warning: ignoring non-positive \"%s\" (%d)\n", key, value);
        return false;
    }
    outValue = value;
    return true;
}

static bool parseVec4(const std::string& json, const char* key, float& r, float& g, float& b, float& a) {
    size_t pos = findValue(json, key);
    if (pos == std::string::npos || json[pos] != '[') return false;

    float v[4];
    if (sscanf(json.c_str() + pos + 1, " %f , %f , %f , %f", &v[0], &v[1], &v[2], &v[3]) != 4) {
        printf("Warning: \"%s\" must be an array of 4 numbers\n", key);
        return false;
    }
    r = v[0]; g = v[1]; b = v[2]; a = v[3];
    return true;
}

static bool parseBool(const std::string& json, const char* key, bool& outValue) {
    size_t pos = findValue(json, key);
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

static bool parseString(const std::string& json, const char* key, std::string& outValue) {
    size_t pos = findValue(json, key);
    if (pos == std::string::npos || json[pos] != '"') return false;

    std::string value;
    for (size_t i = pos + 1; i < json.size(); ++i) {
        char c = json[i];
        if (c == '"') {
            outValue = value;
            return true;
        }
        if (c == '\\' && i + 1 < json.size()) {
            c = json[++i];
        }
        value.push_back(c);
    }
    return false;  // unterminated
}

bool EngineConfig::loadFromFile(const char* path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        printf("Error: Could not open engine config file: %s\n", path);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();
    file.close();

    if (json.empty()) {
        printf("Error: Config file is empty: %s\n", path);
        return false;
    }

    parsePositiveInt(json, "width", width);
    parsePositiveInt(json, "height", height);
    parseString(json, "title", title);

    parseVec4(json, "clear_color", clearColorR, clearColorG, clearColorB, clearColorA);
    parsePositiveInt(json, "acquire_timeout_ms", acquireTimeoutMs);

    parseBool(json, "enable_validation", enableValidation);
    parseBool(json, "log_surface_info", logSurfaceInfo);

    printf("Loaded engine config from: %s\n", path);
    printf("   Window: %dx%d \"%s\"\n", width, height, title.c_str());
    printf("   Clear color: (%.2f, %.2f, %.2f, %.2f)\n", clearColorR, clearColorG, clearColorB, clearColorA);
    return true;
}

} // namespace kreeda
