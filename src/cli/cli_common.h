#ifndef FACESIG_CLI_COMMON_H
#define FACESIG_CLI_COMMON_H

/**
 * CLI Common Utilities and Includes
 *
 * Shared request/response plumbing for the JSON commands
 */

#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <cstdlib>
#include <json/json.h>

#include "../config.h"
#include "../engine_config.h"
#include "../errors.h"
#include "../face_engine.h"
#include "../image.h"
#include "../image_decoder.h"
#include "../logger.h"
#include "../detectors/cascade_detector.h"
#include "config_paths.h"
#include "commands.h"

namespace facesig {
namespace cli {

/**
 * Resolve the configuration file path
 *
 * Precedence: --config, then $FACESIG_CONFIG, then CONFIG_DIR/facesig.conf
 */
inline std::string resolveConfigPath(const CliOptions& options) {
    if (!options.config_path.empty()) {
        return options.config_path;
    }
    const char* env_path = std::getenv("FACESIG_CONFIG");
    if (env_path != nullptr && *env_path != '\0') {
        return env_path;
    }
    return std::string(CONFIG_DIR) + "/facesig.conf";
}

/**
 * Load configuration and apply the [logging] section
 *
 * A missing file is not an error: every setting has a default.
 * FACESIG_LOG_LEVEL wins over [logging] level.
 */
inline Config& loadConfig(const CliOptions& options) {
    Config& config = Config::getInstance();
    Logger& log = Logger::getInstance();

    std::string path = resolveConfigPath(options);
    if (!config.load(path)) {
        if (config.getValidationErrors().empty()) {
            log.debug("No configuration at " + path + ", using defaults");
        } else {
            log.warning("Invalid values in " + path + " fall back to their defaults");
        }
    }

    if (std::getenv("FACESIG_LOG_LEVEL") == nullptr) {
        if (auto level_name = config.getString("logging", "level")) {
            if (auto level = parseLogLevel(*level_name)) {
                log.setLogLevel(*level);
            }
        }
    }
    if (auto file = config.getString("logging", "file")) {
        log.setLogFile(*file);
    }
    if (auto max_lines = config.getInt("logging", "max_lines")) {
        if (*max_lines > 0 && *max_lines <= 1000000) {
            log.setMaxLogLines(static_cast<size_t>(*max_lines));
        }
    }

    return config;
}

/**
 * Detector + engine bundle shared by the image commands
 */
struct EngineContext {
    CascadeDetector detector;
    std::unique_ptr<FaceEngine> engine;

    bool init(const Config& config, std::string& error) {
        EngineConfig engine_config = EngineConfig::fromConfig(config);
        if (!detector.load(engine_config.detection.cascade_path)) {
            error = "Failed to load face cascade: " + engine_config.detection.cascade_path;
            return false;
        }
        engine = std::make_unique<FaceEngine>(detector, engine_config);
        return true;
    }
};

inline void writeResponse(const Json::Value& response) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    std::cout << Json::writeString(builder, response) << std::endl;
}

/**
 * Emit {"success": false, "error": message, "code": name}
 *
 * @return exit status 1, so callers can `return fail(...)`
 */
inline int fail(const std::string& message, ErrorCode code = ErrorCode::NONE) {
    Json::Value response;
    response["success"] = false;
    response["error"] = message;
    if (code != ErrorCode::NONE) {
        response["code"] = errorCodeToString(code);
    }
    Logger::getInstance().error(message);
    writeResponse(response);
    return 1;
}

/**
 * Read the whole of stdin as one JSON object
 */
inline bool readRequest(Json::Value& request, std::string& error) {
    std::string input((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    if (input.empty()) {
        error = "Empty request";
        return false;
    }

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string parse_errors;
    if (!reader->parse(input.data(), input.data() + input.size(), &request, &parse_errors)) {
        error = "Invalid JSON request: " + parse_errors;
        return false;
    }
    if (!request.isObject()) {
        error = "Request must be a JSON object";
        return false;
    }
    return true;
}

/**
 * Decode request[data_key] (base64) or, failing that, request[path_key] (file)
 */
inline bool loadImage(ImageDecoder& decoder, const Json::Value& request,
                      const std::string& data_key, const std::string& path_key,
                      Image& out, std::string& error) {
    if (request.isMember(data_key) && request[data_key].isString()) {
        return decoder.decodeBase64(request[data_key].asString(), out, error);
    }
    if (!path_key.empty() && request.isMember(path_key) && request[path_key].isString()) {
        return decoder.decodeFile(request[path_key].asString(), out, error);
    }
    error = "Missing '" + data_key + "'" + (path_key.empty() ? "" : " or '" + path_key + "'");
    return false;
}

inline Json::Value signatureToJson(const Signature& signature) {
    Json::Value array(Json::arrayValue);
    for (double v : signature) {
        array.append(v);
    }
    return array;
}

inline bool signatureFromJson(const Json::Value& value, Signature& out, std::string& error) {
    if (!value.isArray() || value.empty()) {
        error = "Encoding must be a non-empty array of numbers";
        return false;
    }
    out.clear();
    out.reserve(value.size());
    for (const auto& item : value) {
        if (!item.isNumeric()) {
            error = "Encoding contains a non-numeric value";
            return false;
        }
        out.push_back(item.asDouble());
    }
    return true;
}

inline Json::Value rectToJson(const Rect& r) {
    Json::Value v;
    v["x"] = r.x;
    v["y"] = r.y;
    v["width"] = r.width;
    v["height"] = r.height;
    return v;
}

} // namespace cli
} // namespace facesig

#endif // FACESIG_CLI_COMMON_H
