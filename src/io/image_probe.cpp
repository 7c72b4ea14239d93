#include "io/image_probe.hpp"

#include <cstdint>
#include <fstream>

namespace mangashelf {

static const unsigned char kPngSignature[8] = {
    0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};

static uint32_t read_be32(const unsigned char* p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) |
           (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

static uint16_t read_be16(const unsigned char* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

static bool read_bytes(std::ifstream& in, unsigned char* buf, size_t n) {
    in.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(n));
    return static_cast<size_t>(in.gcount()) == n;
}

// Signature, then IHDR: length(4) type(4) width(4) height(4).
static bool probe_png(std::ifstream& in, ImageInfo& info, std::string& error_msg) {
    unsigned char ihdr[16];
    if (!read_bytes(in, ihdr, sizeof(ihdr))) {
        error_msg = "truncated PNG header";
        return false;
    }
    if (ihdr[4] != 'I' || ihdr[5] != 'H' || ihdr[6] != 'D' || ihdr[7] != 'R') {
        error_msg = "PNG without leading IHDR chunk";
        return false;
    }
    info.width = static_cast<int>(read_be32(ihdr + 8));
    info.height = static_cast<int>(read_be32(ihdr + 12));
    info.mime_type = "image/png";
    return true;
}

static bool is_sof_marker(unsigned char m) {
    // SOF0..SOF15 excluding DHT (C4), JPG (C8) and DAC (CC).
    return m >= 0xC0 && m <= 0xCF && m != 0xC4 && m != 0xC8 && m != 0xCC;
}

// Walk marker segments after SOI until a frame header is found.
static bool probe_jpeg(std::ifstream& in, ImageInfo& info, std::string& error_msg) {
    unsigned char b[2];
    while (true) {
        if (!read_bytes(in, b, 1)) break;
        if (b[0] != 0xFF) {
            error_msg = "malformed JPEG marker";
            return false;
        }
        unsigned char marker;
        do {
            if (!read_bytes(in, &marker, 1)) {
                error_msg = "truncated JPEG";
                return false;
            }
        } while (marker == 0xFF);

        if (marker == 0xD9 || marker == 0xDA) break;  // EOI / SOS before SOF
        if ((marker >= 0xD0 && marker <= 0xD7) || marker == 0x01) continue;

        if (!read_bytes(in, b, 2)) break;
        uint16_t seg_len = read_be16(b);
        if (seg_len < 2) {
            error_msg = "malformed JPEG segment length";
            return false;
        }

        if (is_sof_marker(marker)) {
            unsigned char sof[5];
            if (!read_bytes(in, sof, sizeof(sof))) break;
            info.height = read_be16(sof + 1);
            info.width = read_be16(sof + 3);
            info.mime_type = "image/jpeg";
            return true;
        }
        in.seekg(seg_len - 2, std::ios::cur);
        if (!in) break;
    }
    if (error_msg.empty()) error_msg = "no JPEG frame header found";
    return false;
}

bool probe_image(const std::string& path, ImageInfo& info, std::string& error_msg) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        error_msg = "cannot open " + path;
        return false;
    }

    unsigned char head[8];
    if (!read_bytes(in, head, 2)) {
        error_msg = "file too short";
        return false;
    }

    if (head[0] == 0xFF && head[1] == 0xD8) {
        return probe_jpeg(in, info, error_msg);
    }

    if (head[0] == kPngSignature[0] && head[1] == kPngSignature[1]) {
        if (!read_bytes(in, head + 2, 6)) {
            error_msg = "truncated PNG signature";
            return false;
        }
        for (int i = 2; i < 8; i++) {
            if (head[i] != kPngSignature[i]) {
                error_msg = "bad PNG signature";
                return false;
            }
        }
        return probe_png(in, info, error_msg);
    }

    error_msg = "unsupported image format";
    return false;
}

} // namespace mangashelf
