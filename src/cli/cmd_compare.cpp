#include "commands.h"
#include "cli_common.h"

namespace facesig {

// known_encoding is either a bare signature or an enrollment template object
static bool parseKnown(const Json::Value& known, EnrollmentTemplate& tmpl, bool& is_template,
                       std::string& error) {
    if (known.isObject()) {
        is_template = true;
        if (!cli::signatureFromJson(known["primary"], tmpl.primary, error)) {
            error = "known_encoding.primary: " + error;
            return false;
        }
        const Json::Value& samples = known["samples"];
        if (!samples.isNull() && !samples.isArray()) {
            error = "known_encoding.samples must be an array";
            return false;
        }
        for (const auto& item : samples) {
            Signature s;
            if (!cli::signatureFromJson(item, s, error)) {
                error = "known_encoding.samples: " + error;
                return false;
            }
            tmpl.samples.push_back(std::move(s));
        }
        return true;
    }

    is_template = false;
    return cli::signatureFromJson(known, tmpl.primary, error);
}

int cmd_compare(const CliOptions& options) {
    Config& config = cli::loadConfig(options);

    Json::Value request;
    std::string error;
    if (!cli::readRequest(request, error)) {
        return cli::fail(error);
    }

    if (!request.isMember("known_encoding")) {
        return cli::fail("Missing 'known_encoding'");
    }
    EnrollmentTemplate known;
    bool is_template = false;
    if (!parseKnown(request["known_encoding"], known, is_template, error)) {
        return cli::fail(error);
    }

    std::optional<double> tolerance;
    if (request.isMember("tolerance") && !request["tolerance"].isNull()) {
        if (!request["tolerance"].isNumeric() || request["tolerance"].asDouble() < 0.0) {
            return cli::fail("'tolerance' must be a non-negative number");
        }
        tolerance = request["tolerance"].asDouble();
    }

    ImageDecoder decoder;
    Image probe;
    if (!cli::loadImage(decoder, request, "unknown_image", "unknown_image_path", probe, error)) {
        return cli::fail(error, ErrorCode::INVALID_IMAGE);
    }

    cli::EngineContext context;
    if (!context.init(config, error)) {
        return cli::fail(error);
    }

    MatchResult match = is_template
        ? context.engine->compareTemplate(known, probe.view(), tolerance)
        : context.engine->compare(known.primary, probe.view(), tolerance);
    if (!match.success) {
        return cli::fail(match.message, match.error);
    }

    Json::Value components;
    components["euclidean"] = match.components.euclidean;
    components["cosine"] = match.components.cosine;
    components["manhattan"] = match.components.manhattan;

    Json::Value result;
    result["distance"] = match.distance;
    result["is_match"] = match.is_match;
    result["confidence"] = match.confidence_percent;
    result["tolerance"] = match.tolerance;
    result["components"] = components;
    result["compared_length"] = static_cast<Json::UInt64>(match.compared_length);

    Json::Value response;
    response["success"] = true;
    response["result"] = result;
    cli::writeResponse(response);
    return 0;
}

} // namespace facesig
