#ifndef FACESIG_IMAGE_DECODER_H
#define FACESIG_IMAGE_DECODER_H

#include "image.h"
#include <cstdint>
#include <string>
#include <vector>
#include <turbojpeg.h>

namespace facesig {

// Turns encoded image payloads into BGR frames.
// JPEG goes through TurboJPEG, everything else (PNG, BMP, GIF, ...) through stb_image.
// Failures return false and fill `error`; nothing is thrown.
class ImageDecoder {
public:
    ImageDecoder();
    ~ImageDecoder();

    ImageDecoder(const ImageDecoder&) = delete;
    ImageDecoder& operator=(const ImageDecoder&) = delete;

    // Raw base64 or a "data:image/...;base64," URL
    bool decodeBase64(const std::string& payload, Image& out, std::string& error);

    bool decodeFile(const std::string& path, Image& out, std::string& error);

    bool decodeBytes(const std::vector<uint8_t>& bytes, Image& out, std::string& error);

    // Strips a data-URL prefix and whitespace; false on characters outside the base64 alphabet
    static bool base64Decode(const std::string& text, std::vector<uint8_t>& out);

    static bool isJpeg(const std::vector<uint8_t>& bytes);

private:
    bool decodeJpeg(const std::vector<uint8_t>& bytes, Image& out, std::string& error);
    bool decodeOther(const std::vector<uint8_t>& bytes, Image& out, std::string& error);

    tjhandle tjhandle_;
};

} // namespace facesig

#endif // FACESIG_IMAGE_DECODER_H
