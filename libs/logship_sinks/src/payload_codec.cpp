// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#include "logship/payload_codec.hpp"

#include <glog/logging.h>
#include <zstd.h>

#include <algorithm>
#include <cctype>

namespace logship {

namespace {

// Upper bound for frames that do not record their content size
constexpr size_t kMaxRecordSize = 4 * 1024 * 1024;

std::vector<uint8_t> as_bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

}  // namespace

const char* to_string(Codec codec) {
    switch (codec) {
        case Codec::None: return "none";
        case Codec::Zstd: return "zstd";
    }
    return "unknown";
}

std::optional<Codec> codec_from_string(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "none") return Codec::None;
    if (lower == "zstd") return Codec::Zstd;
    return std::nullopt;
}

// =============================================================================
// Encoders
// =============================================================================

std::vector<uint8_t> PlainEncoder::encode(const std::string& payload) {
    account(payload.size(), payload.size());
    return as_bytes(payload);
}

ZstdEncoder::ZstdEncoder(int level)
    : level_(std::clamp(level, 1, ZSTD_maxCLevel())) {
}

ZstdEncoder::~ZstdEncoder() {
    ZSTD_freeCCtx(ctx_);
}

bool ZstdEncoder::init() {
    if (ctx_) {
        return true;
    }
    ctx_ = ZSTD_createCCtx();
    if (!ctx_) {
        LOG(ERROR) << "Failed to create zstd compression context";
        return false;
    }
    return true;
}

std::vector<uint8_t> ZstdEncoder::encode(const std::string& payload) {
    if (!ctx_) {
        LOG_FIRST_N(WARNING, 1) << "zstd encoder not initialized, publishing plain JSON";
        stats_.failures++;
        account(payload.size(), payload.size());
        return as_bytes(payload);
    }

    std::vector<uint8_t> frame(ZSTD_compressBound(payload.size()));
    size_t written = ZSTD_compressCCtx(ctx_, frame.data(), frame.size(),
                                       payload.data(), payload.size(), level_);
    if (ZSTD_isError(written)) {
        LOG_EVERY_N(WARNING, 100) << "zstd compression failed: " << ZSTD_getErrorName(written);
        stats_.failures++;
        account(payload.size(), payload.size());
        return as_bytes(payload);
    }

    frame.resize(written);
    account(payload.size(), written);
    return frame;
}

std::unique_ptr<PayloadEncoder> make_encoder(Codec codec, int level) {
    if (codec == Codec::Zstd) {
        auto encoder = std::make_unique<ZstdEncoder>(level);
        if (!encoder->init()) {
            return nullptr;
        }
        return encoder;
    }
    return std::make_unique<PlainEncoder>();
}

// =============================================================================
// Decoders
// =============================================================================

ZstdDecoder::~ZstdDecoder() {
    ZSTD_freeDCtx(ctx_);
}

bool ZstdDecoder::init() {
    if (ctx_) {
        return true;
    }
    ctx_ = ZSTD_createDCtx();
    if (!ctx_) {
        LOG(ERROR) << "Failed to create zstd decompression context";
        return false;
    }
    return true;
}

std::optional<std::string> ZstdDecoder::decode(const std::vector<uint8_t>& bytes) {
    if (!ctx_ || bytes.empty()) {
        return std::nullopt;
    }

    unsigned long long content_size = ZSTD_getFrameContentSize(bytes.data(), bytes.size());
    if (content_size == ZSTD_CONTENTSIZE_ERROR) {
        VLOG(1) << "Not a zstd frame (" << bytes.size() << " bytes)";
        return std::nullopt;
    }
    if (content_size == ZSTD_CONTENTSIZE_UNKNOWN || content_size > kMaxRecordSize) {
        content_size = kMaxRecordSize;
    }

    std::string text(static_cast<size_t>(content_size), '\0');
    size_t written = ZSTD_decompressDCtx(ctx_, text.data(), text.size(), bytes.data(), bytes.size());
    if (ZSTD_isError(written)) {
        LOG(WARNING) << "zstd decompression failed: " << ZSTD_getErrorName(written);
        return std::nullopt;
    }

    text.resize(written);
    return text;
}

std::unique_ptr<PayloadDecoder> make_decoder(Codec codec) {
    if (codec == Codec::Zstd) {
        auto decoder = std::make_unique<ZstdDecoder>();
        if (!decoder->init()) {
            return nullptr;
        }
        return decoder;
    }
    return std::make_unique<PlainDecoder>();
}

}  // namespace logship
