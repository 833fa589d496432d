#pragma once

#include "cw/MediaSource.hpp"

#include <optional>
#include <string>

namespace cw {

// Decode a JPEG, PNG or BMP still into a YUV420P frame
std::optional<Frame> decodeImage(const std::string& bytes);

// Encode a frame as baseline JPEG; quality 1..100
std::optional<std::string> encodeJpeg(const Frame& frame, int quality);

// True when a response prefix looks like multipart/x-mixed-replace content
bool looksLikeMultipartStream(const std::string& prefix, const std::string& contentType = {});

bool looksLikeImage(const std::string& bytes);

} // namespace cw
