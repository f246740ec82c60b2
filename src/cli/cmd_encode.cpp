#include "commands.h"
#include "cli_common.h"

namespace facesig {

int cmd_encode(const CliOptions& options) {
    Config& config = cli::loadConfig(options);

    Json::Value request;
    std::string error;
    if (!cli::readRequest(request, error)) {
        return cli::fail(error);
    }

    ImageDecoder decoder;
    Image frame;
    if (!cli::loadImage(decoder, request, "image_data", "image_path", frame, error)) {
        return cli::fail(error, ErrorCode::INVALID_IMAGE);
    }

    cli::EngineContext context;
    if (!context.init(config, error)) {
        return cli::fail(error);
    }

    EncodeResult encoded = context.engine->encode(frame.view());
    if (!encoded.success) {
        return cli::fail(encoded.message, encoded.error);
    }

    Json::Value response;
    response["success"] = true;
    response["encoding"] = cli::signatureToJson(encoded.signature);
    response["quality"] = encoded.quality.confidence;
    response["face"] = cli::rectToJson(encoded.face);
    response["region"] = cli::rectToJson(encoded.region);
    if (encoded.degenerate) {
        response["warning"] = errorCodeToString(ErrorCode::DEGENERATE_SIGNATURE);
    }
    cli::writeResponse(response);
    return 0;
}

} // namespace facesig
