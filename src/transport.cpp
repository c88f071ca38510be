#include "schem/transport.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>

#include <zlib.h>
#include <zstd.h>

#include "schem/logging.hpp"

namespace schem::transport {

namespace {

constexpr uint8_t kRawCompoundKind = 0x0A;
constexpr size_t kInitialInflateCapacity = 64 * 1024;

bool StartsWith(util::ByteSpan input, const uint8_t* magic, size_t magic_size) {
    return input.size() >= magic_size && std::memcmp(input.data(), magic, magic_size) == 0;
}

util::Status SizeLimitExceeded(const char* envelope, size_t max_size) {
    return util::Status::TransportError(std::string(envelope) + " output exceeds limit of " +
                                        std::to_string(max_size) + " bytes");
}

// Owns an initialized z_stream for the duration of one inflate call.
class InflateStream {
public:
    InflateStream() { std::memset(&strm_, 0, sizeof(strm_)); }
    ~InflateStream() { if (initialized_) inflateEnd(&strm_); }
    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;

    int Init() {
        int ret = inflateInit2(&strm_, 16 + MAX_WBITS);  // gzip wrapper only
        initialized_ = (ret == Z_OK);
        return ret;
    }
    z_stream* get() { return &strm_; }

private:
    z_stream strm_;
    bool initialized_ = false;
};

struct ZstdDCtxDeleter {
    void operator()(ZSTD_DCtx* ctx) const { ZSTD_freeDCtx(ctx); }
};

util::StatusOr<util::byte_vec> Unwrap(util::ByteSpan input, Envelope envelope, size_t max_size) {
    switch (envelope) {
        case Envelope::kGzip: return InflateGzip(input, max_size);
        case Envelope::kZstd: return DecompressZstd(input, max_size);
        case Envelope::kNone:
            if (input.size() > max_size) return SizeLimitExceeded("raw", max_size);
            return util::byte_vec(input.begin(), input.end());
        case Envelope::kAuto: break;
    }
    return util::Status::TransportError("Envelope must be resolved before unwrapping");
}

}  // namespace

const char* EnvelopeName(Envelope envelope) {
    switch (envelope) {
        case Envelope::kAuto: return "auto";
        case Envelope::kGzip: return "gzip";
        case Envelope::kZstd: return "zstd";
        case Envelope::kNone: return "none";
    }
    return "unknown";
}

std::optional<Envelope> ParseEnvelope(std::string_view text) {
    if (text == "auto") return Envelope::kAuto;
    if (text == "gzip") return Envelope::kGzip;
    if (text == "zstd") return Envelope::kZstd;
    if (text == "none") return Envelope::kNone;
    return std::nullopt;
}

util::StatusOr<Envelope> DetectEnvelope(util::ByteSpan input) {
    if (StartsWith(input, kGzipMagic, sizeof(kGzipMagic))) return Envelope::kGzip;
    if (StartsWith(input, kZstdMagic, sizeof(kZstdMagic))) return Envelope::kZstd;
    if (!input.empty() && input[0] == kRawCompoundKind) return Envelope::kNone;
    if (input.empty()) return util::Status::TransportError("Empty input: no compression envelope to detect");
    char first[8];
    std::snprintf(first, sizeof(first), "0x%02x", input[0]);
    return util::Status::TransportError(std::string("Unrecognized compression envelope (first byte ") + first + ")");
}

util::StatusOr<util::byte_vec> Decompress(util::ByteSpan input, Envelope envelope, size_t max_size) {
    if (envelope == Envelope::kAuto) {
        SCHEM_ASSIGN_OR_RETURN(envelope, DetectEnvelope(input));
    }
    SCHEM_ASSIGN_OR_RETURN(util::byte_vec output, Unwrap(input, envelope, max_size));
    SCHEM_LOG_DEBUG("Transport", std::string(EnvelopeName(envelope)) + " envelope: " +
                                     std::to_string(input.size()) + " -> " +
                                     std::to_string(output.size()) + " bytes");
    return output;
}

util::StatusOr<util::byte_vec> InflateGzip(util::ByteSpan input, size_t max_size) {
    InflateStream stream;
    if (stream.Init() != Z_OK) return util::Status::TransportError("gzip inflateInit2 failed");
    z_stream* strm = stream.get();
    strm->next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    strm->avail_in = static_cast<uInt>(input.size());

    util::byte_vec out(std::min(max_size, std::max<size_t>(input.size() * 4, kInitialInflateCapacity)));
    while (true) {
        if (strm->total_out == out.size()) {
            if (out.size() >= max_size) return SizeLimitExceeded("gzip", max_size);
            out.resize(std::min(max_size, out.size() * 2));
        }
        strm->next_out = reinterpret_cast<Bytef*>(out.data() + strm->total_out);
        strm->avail_out = static_cast<uInt>(out.size() - strm->total_out);
        int ret = inflate(strm, Z_NO_FLUSH);
        if (ret == Z_STREAM_END) break;
        if (ret == Z_BUF_ERROR || ret == Z_OK) {
            // Out of input before the end-of-stream marker.
            if (strm->avail_in == 0 && strm->avail_out != 0) {
                return util::Status::TruncatedInput("gzip stream ended after " + std::to_string(input.size()) +
                                                    " compressed bytes without end-of-stream marker");
            }
            continue;
        }
        std::string reason = strm->msg ? strm->msg : "error code " + std::to_string(ret);
        return util::Status::TransportError("gzip inflate failed: " + reason);
    }
    out.resize(strm->total_out);
    return out;
}

util::StatusOr<util::byte_vec> DecompressZstd(util::ByteSpan input, size_t max_size) {
    std::unique_ptr<ZSTD_DCtx, ZstdDCtxDeleter> dctx(ZSTD_createDCtx());
    if (!dctx) return util::Status::TransportError("ZSTD_createDCtx failed");

    util::byte_vec out;
    unsigned long long content_size = ZSTD_getFrameContentSize(input.data(), input.size());
    if (content_size != ZSTD_CONTENTSIZE_ERROR && content_size != ZSTD_CONTENTSIZE_UNKNOWN) {
        if (content_size > max_size) return SizeLimitExceeded("zstd", max_size);
        out.reserve(static_cast<size_t>(content_size));
    }

    util::byte_vec chunk(ZSTD_DStreamOutSize());
    ZSTD_inBuffer in = {input.data(), input.size(), 0};
    while (true) {
        ZSTD_outBuffer ob = {chunk.data(), chunk.size(), 0};
        size_t ret = ZSTD_decompressStream(dctx.get(), &ob, &in);
        if (ZSTD_isError(ret)) {
            return util::Status::TransportError(std::string("ZSTD decompression failed: ") + ZSTD_getErrorName(ret));
        }
        if (out.size() + ob.pos > max_size) return SizeLimitExceeded("zstd", max_size);
        out.insert(out.end(), chunk.begin(), chunk.begin() + ob.pos);
        if (ret == 0 && in.pos == in.size) break;  // last frame complete
        if (in.pos == in.size && ob.pos < ob.size) {
            return util::Status::TruncatedInput("zstd frame ended after " + std::to_string(input.size()) +
                                                " compressed bytes before completion");
        }
    }
    return out;
}

}  // namespace schem::transport
