// SPDX-License-Identifier: MIT

// lib/stream/codec.cpp
#include "lib/stream/codec.hpp"

#include <zlib.h>
#include <zstd.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <stdexcept>
#include <string>

namespace wme_pipe {

namespace {

class GzipInflater final : public Inflater {
public:
    GzipInflater() {
        // 15 window bits + 16: gzip wrapper only
        if (inflateInit2(&zs_, 15 + 16) != Z_OK) {
            throw std::runtime_error("inflateInit2 failed");
        }
    }

    ~GzipInflater() override { inflateEnd(&zs_); }

    std::expected<InflateStep, Error> Inflate(std::span<const std::byte> in,
                                              std::span<std::byte> out) override {
        if (member_done_ && !in.empty()) {
            inflateReset(&zs_);
            member_done_ = false;
        }
        if (member_done_) return InflateStep{};

        zs_.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(in.data()));
        zs_.avail_in = static_cast<uInt>(std::min<size_t>(in.size(), UINT_MAX));
        zs_.next_out = reinterpret_cast<Bytef*>(out.data());
        zs_.avail_out = static_cast<uInt>(std::min<size_t>(out.size(), UINT_MAX));
        uInt avail_in = zs_.avail_in;
        uInt avail_out = zs_.avail_out;

        int ret = inflate(&zs_, Z_NO_FLUSH);
        InflateStep step{avail_in - zs_.avail_in, avail_out - zs_.avail_out};
        switch (ret) {
            case Z_OK:
            case Z_BUF_ERROR:  // no progress possible without more input
                return step;
            case Z_STREAM_END:
                member_done_ = true;
                return step;
            default:
                return std::unexpected(Error{ErrorCode::DecompressionError,
                    std::string("gzip: ") + (zs_.msg ? zs_.msg : "inflate failed")});
        }
    }

    bool AtBoundary() const override { return member_done_ || !Started(); }

    Codec Kind() const override { return Codec::Gzip; }

private:
    bool Started() const { return zs_.total_in > 0; }

    z_stream zs_{};
    bool member_done_ = false;
};

class ZstdInflater final : public Inflater {
public:
    ZstdInflater() : ds_(ZSTD_createDStream()) {
        if (!ds_) throw std::runtime_error("ZSTD_createDStream failed");
        size_t r = ZSTD_initDStream(ds_);
        if (ZSTD_isError(r)) {
            ZSTD_freeDStream(ds_);
            throw std::runtime_error(std::string("ZSTD_initDStream: ") + ZSTD_getErrorName(r));
        }
    }

    ~ZstdInflater() override { ZSTD_freeDStream(ds_); }

    std::expected<InflateStep, Error> Inflate(std::span<const std::byte> in,
                                              std::span<std::byte> out) override {
        ZSTD_inBuffer ib{in.data(), in.size(), 0};
        ZSTD_outBuffer ob{out.data(), out.size(), 0};
        size_t r = ZSTD_decompressStream(ds_, &ob, &ib);
        if (ZSTD_isError(r)) {
            return std::unexpected(Error{ErrorCode::DecompressionError,
                std::string("zstd: ") + ZSTD_getErrorName(r)});
        }
        last_hint_ = r;
        return InflateStep{ib.pos, ob.pos};
    }

    // 0 from ZSTD_decompressStream means a frame was fully decoded and flushed
    bool AtBoundary() const override { return last_hint_ == 0; }

    Codec Kind() const override { return Codec::Zstd; }

private:
    ZSTD_DStream* ds_;
    size_t last_hint_ = 0;
};

}  // namespace

Codec SniffCodec(std::span<const std::byte> head) {
    auto at = [&](size_t i) { return std::to_integer<unsigned>(head[i]); };
    if (head.size() >= 2 && at(0) == 0x1f && at(1) == 0x8b) return Codec::Gzip;
    if (head.size() >= 4 && at(0) == 0x28 && at(1) == 0xb5 && at(2) == 0x2f && at(3) == 0xfd) {
        return Codec::Zstd;
    }
    return Codec::Identity;
}

Codec CodecFromHint(std::string_view hint) {
    std::string lower(hint);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower.find("gzip") != std::string::npos) return Codec::Gzip;
    if (lower.find("zstd") != std::string::npos) return Codec::Zstd;
    if (lower == "identity") return Codec::Identity;
    return Codec::Auto;
}

std::unique_ptr<Inflater> MakeInflater(Codec codec) {
    switch (codec) {
        case Codec::Gzip: return std::make_unique<GzipInflater>();
        case Codec::Zstd: return std::make_unique<ZstdInflater>();
        case Codec::Auto:
        case Codec::Identity: break;
    }
    return nullptr;
}

}  // namespace wme_pipe
