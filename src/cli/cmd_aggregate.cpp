#include "commands.h"
#include "cli_common.h"
#include <vector>

namespace facesig {

int cmd_aggregate(const CliOptions& options) {
    Config& config = cli::loadConfig(options);

    Json::Value request;
    std::string error;
    if (!cli::readRequest(request, error)) {
        return cli::fail(error);
    }

    const Json::Value& images = request["images"];
    if (!images.isArray() || images.empty()) {
        return cli::fail("'images' must be a non-empty array");
    }

    cli::EngineContext context;
    if (!context.init(config, error)) {
        return cli::fail(error);
    }

    // Undecodable payloads count as failed samples, like undetectable faces
    ImageDecoder decoder;
    std::vector<EnrollmentSample> samples(images.size());

    for (Json::ArrayIndex i = 0; i < images.size(); i++) {
        if (!images[i].isString()) {
            samples[i].decode_error = "not a string";
        } else if (!decoder.decodeBase64(images[i].asString(), samples[i].frame, samples[i].decode_error)) {
            samples[i].frame = Image();
        }
    }

    AggregateResult aggregate = context.engine->aggregate(samples);

    Json::Value diagnostics(Json::arrayValue);
    for (const auto& line : aggregate.diagnostics) {
        diagnostics.append(line);
    }

    if (!aggregate.success) {
        Json::Value response;
        response["success"] = false;
        response["error"] = aggregate.message;
        response["code"] = errorCodeToString(aggregate.error);
        response["failed_encodings"] = static_cast<Json::UInt64>(aggregate.failed_encodings);
        response["diagnostics"] = diagnostics;
        cli::writeResponse(response);
        return 1;
    }

    Json::Value samples(Json::arrayValue);
    for (const auto& s : aggregate.tmpl.samples) {
        samples.append(cli::signatureToJson(s));
    }

    Json::Value response;
    response["success"] = true;
    response["encoding"] = cli::signatureToJson(aggregate.tmpl.primary);
    response["samples"] = samples;
    response["tag"] = aggregate.tag;
    response["successful_encodings"] = static_cast<Json::UInt64>(aggregate.successful_encodings);
    response["failed_encodings"] = static_cast<Json::UInt64>(aggregate.failed_encodings);
    response["diagnostics"] = diagnostics;
    cli::writeResponse(response);
    return 0;
}

} // namespace facesig
