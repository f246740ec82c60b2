#ifndef FACESIG_CLI_COMMANDS_H
#define FACESIG_CLI_COMMANDS_H

#include <string>

namespace facesig {

/**
 * Command Functions for the facesig CLI
 *
 * Every command reads one JSON request from stdin and writes one JSON
 * response to stdout. Each returns:
 *   - 0 on success
 *   - 1 on failure (the response carries "success": false)
 */

struct CliOptions {
    std::string config_path;    // --config, empty = FACESIG_CONFIG or the default path
};

/**
 * Encode the single face in an image
 *
 * Request:  {"image_data": "<base64>"} or {"image_path": "..."}
 * Response: {"success": true, "encoding": [...], "quality": q, "face": {...}}
 */
int cmd_encode(const CliOptions& options);

/**
 * Compare a stored encoding against the face in a probe image
 *
 * Request:  {"known_encoding": [...] | {"primary": [...], "samples": [[...]]},
 *            "unknown_image": "<base64>", "tolerance": t}
 * Response: {"success": true, "result": {"distance", "is_match", "confidence",
 *            "tolerance", "components"}}
 */
int cmd_compare(const CliOptions& options);

/**
 * Build one enrollment encoding from several captures of the same person
 *
 * Request:  {"images": ["<base64>", ...]}
 * Response: {"success": true, "encoding": [...], "samples": [[...]], "tag",
 *            "successful_encodings", "failed_encodings", "diagnostics"}
 */
int cmd_aggregate(const CliOptions& options);

/**
 * Check whether an image is suitable for registration
 *
 * Request:  {"image_data": "<base64>"}
 * Response: {"success": true, "result": {"is_valid", "message", "face_count",
 *            "quality_score", "details"}}
 */
int cmd_detect(const CliOptions& options);

/**
 * Print usage information and command help
 */
void print_usage();

} // namespace facesig

#endif // FACESIG_CLI_COMMANDS_H
