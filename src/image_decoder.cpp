#include "image_decoder.h"
#include "imgproc.h"
#include "logger.h"
#include <fstream>
#include <iterator>
#include <memory>

// stb_image for everything TurboJPEG doesn't handle (header-only library)
#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

namespace facesig {

ImageDecoder::ImageDecoder()
    : tjhandle_(tjInitDecompress()) {
    if (!tjhandle_) {
        Logger::getInstance().error("tjInitDecompress failed: " + std::string(tjGetErrorStr()));
    }
}

ImageDecoder::~ImageDecoder() {
    if (tjhandle_) {
        tjDestroy(tjhandle_);
    }
}

bool ImageDecoder::base64Decode(const std::string& text, std::vector<uint8_t>& out) {
    static const std::string alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    size_t begin = 0;
    if (text.compare(0, 5, "data:") == 0) {
        size_t comma = text.find(',');
        if (comma == std::string::npos) {
            return false;
        }
        begin = comma + 1;
    }

    out.clear();
    out.reserve((text.size() - begin) * 3 / 4);

    int val = 0;
    int valb = -8;
    for (size_t i = begin; i < text.size(); i++) {
        const char c = text[i];
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
        if (c == '=') break;

        size_t pos = alphabet.find(c);
        if (pos == std::string::npos) {
            return false;
        }

        val = ((val << 6) + static_cast<int>(pos)) & 0xFFFFFF;
        valb += 6;
        if (valb >= 0) {
            out.push_back(static_cast<uint8_t>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }

    return !out.empty();
}

bool ImageDecoder::isJpeg(const std::vector<uint8_t>& bytes) {
    return bytes.size() >= 3 && bytes[0] == 0xFF && bytes[1] == 0xD8 && bytes[2] == 0xFF;
}

bool ImageDecoder::decodeBase64(const std::string& payload, Image& out, std::string& error) {
    std::vector<uint8_t> bytes;
    if (!base64Decode(payload, bytes)) {
        error = "Invalid base64 image payload";
        return false;
    }
    return decodeBytes(bytes, out, error);
}

bool ImageDecoder::decodeFile(const std::string& path, Image& out, std::string& error) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        error = "Cannot open image file: " + path;
        return false;
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());
    return decodeBytes(bytes, out, error);
}

bool ImageDecoder::decodeBytes(const std::vector<uint8_t>& bytes, Image& out, std::string& error) {
    if (bytes.empty()) {
        error = "Image data is empty";
        return false;
    }

    bool ok = isJpeg(bytes) ? decodeJpeg(bytes, out, error) : decodeOther(bytes, out, error);
    if (ok) {
        Logger::getInstance().debug("Decoded " + std::to_string(out.width()) + "x" +
                                    std::to_string(out.height()) + " image (" +
                                    std::to_string(bytes.size()) + " bytes)");
    }
    return ok;
}

bool ImageDecoder::decodeJpeg(const std::vector<uint8_t>& bytes, Image& out, std::string& error) {
    if (!tjhandle_) {
        error = "JPEG decoder unavailable";
        return false;
    }

    auto* src = const_cast<unsigned char*>(bytes.data());
    const unsigned long size = static_cast<unsigned long>(bytes.size());

    int width, height, subsamp, colorspace;
    if (tjDecompressHeader3(tjhandle_, src, size, &width, &height, &subsamp, &colorspace) < 0) {
        error = "JPEG header decode failed: " + std::string(tjGetErrorStr());
        return false;
    }

    Image frame(width, height, 3);
    if (tjDecompress2(tjhandle_, src, size, frame.data(),
                      width, frame.stride(), height, TJPF_BGR, 0) < 0) {
        error = "JPEG decode failed: " + std::string(tjGetErrorStr());
        return false;
    }

    out = std::move(frame);
    return true;
}

bool ImageDecoder::decodeOther(const std::vector<uint8_t>& bytes, Image& out, std::string& error) {
    int width, height, channels;
    unsigned char* data = stbi_load_from_memory(bytes.data(), static_cast<int>(bytes.size()),
                                                &width, &height, &channels, 3);  // Force RGB
    if (!data) {
        error = "Unsupported or corrupt image: " + std::string(stbi_failure_reason());
        return false;
    }

    std::unique_ptr<unsigned char, void (*)(void*)> owned(data, stbi_image_free);
    out = rgbToBgr(ImageView(owned.get(), width, height, 3));
    return true;
}

} // namespace facesig
