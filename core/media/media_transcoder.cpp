#include "media_transcoder.hpp"

namespace lcdlink {
namespace media {

bool needs_reencode(const MediaInfo &info, const ReencodePolicy &policy) {
    if (!info.is_video) {
        return false;
    }
    if (info.width != policy.reference_resolution || info.height != policy.reference_resolution) {
        return true;
    }
    return policy.max_bitrate_kbps > 0 && info.bitrate_kbps > policy.max_bitrate_kbps;
}

}  // namespace media
}  // namespace lcdlink
