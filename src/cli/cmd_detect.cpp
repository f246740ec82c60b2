#include "commands.h"
#include "cli_common.h"

namespace facesig {

int cmd_detect(const CliOptions& options) {
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

    CaptureAssessment assessment = context.engine->assessCapture(frame.view());
    if (assessment.error != ErrorCode::NONE) {
        return cli::fail(assessment.message, assessment.error);
    }

    Json::Value details;
    details["brightness"] = assessment.brightness;
    details["sharpness"] = assessment.sharpness;
    details["face_size"] = assessment.face_size;

    Json::Value result;
    result["is_valid"] = assessment.is_valid;
    result["message"] = assessment.message;
    result["face_count"] = assessment.face_count;
    result["quality_score"] = assessment.quality_score;
    result["details"] = details;

    Json::Value response;
    response["success"] = true;
    response["result"] = result;
    cli::writeResponse(response);
    return 0;
}

} // namespace facesig
