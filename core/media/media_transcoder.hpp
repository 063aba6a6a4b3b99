#pragma once

#include <string>

namespace lcdlink {
namespace media {

struct MediaInfo {
    int width = 0;
    int height = 0;
    int bitrate_kbps = 0;  // 0 for still images
    bool is_video = false;
};

// Device storage and decoder bandwidth are limited to a square frame at a fixed size
struct ReencodePolicy {
    int reference_resolution = 480;
    int max_bitrate_kbps = 2000;
};

// Videos are re-encoded when not square at the reference size or above the bitrate ceiling
bool needs_reencode(const MediaInfo &info, const ReencodePolicy &policy);

// External video collaborator; the core only decides when to call it
class IMediaTranscoder {
public:
    virtual ~IMediaTranscoder() = default;

    virtual bool probe(const std::string &path, MediaInfo &info, std::string &error) = 0;

    // Writes a policy-conforming copy of input to output
    virtual bool transcode(const std::string &input, const std::string &output, const ReencodePolicy &policy,
                           std::string &error) = 0;
};

}  // namespace media
}  // namespace lcdlink
