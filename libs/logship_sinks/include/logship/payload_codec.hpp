// Copyright 2025 Vehicle Edge Platform Contributors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/// @file payload_codec.hpp
/// @brief Wire encoding of serialized log records
///
/// Sinks that publish records as opaque messages (MQTT) pass the JSON text
/// of each record through a PayloadEncoder. Consumers of those messages,
/// and the tests, turn them back into JSON text with the matching
/// PayloadDecoder.
///
/// Example:
/// @code
///   auto encoder = make_encoder(Codec::Zstd, 3);
///   auto bytes = encoder->encode(record_to_json(record).dump());
///   auto text = make_decoder(Codec::Zstd)->decode(bytes);
/// @endcode

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Forward declarations
struct ZSTD_CCtx_s;
typedef struct ZSTD_CCtx_s ZSTD_CCtx;
struct ZSTD_DCtx_s;
typedef struct ZSTD_DCtx_s ZSTD_DCtx;

namespace logship {

/// Payload codecs
enum class Codec {
    None,   ///< JSON text as-is
    Zstd    ///< Zstandard frame per record
};

/// Convert Codec to string
/// @return "none" or "zstd"
const char* to_string(Codec codec);

/// Parse Codec from string (case-insensitive)
/// @return Codec if valid, nullopt if unknown
std::optional<Codec> codec_from_string(const std::string& name);

/// Byte counts for one encoder
struct CodecStats {
    uint64_t payloads = 0;
    uint64_t bytes_in = 0;
    uint64_t bytes_out = 0;
    uint64_t failures = 0;   ///< Payloads sent unencoded after an error

    /// Output size relative to input (0.0 before any payload)
    double ratio() const {
        return bytes_in > 0 ? static_cast<double>(bytes_out) / bytes_in : 0.0;
    }
};

class PayloadEncoder {
public:
    virtual ~PayloadEncoder() = default;

    /// Encode the JSON text of one record
    virtual std::vector<uint8_t> encode(const std::string& payload) = 0;

    virtual Codec codec() const = 0;

    const CodecStats& stats() const { return stats_; }

protected:
    void account(size_t in, size_t out) {
        stats_.payloads++;
        stats_.bytes_in += in;
        stats_.bytes_out += out;
    }

    CodecStats stats_;
};

class PlainEncoder : public PayloadEncoder {
public:
    std::vector<uint8_t> encode(const std::string& payload) override;
    Codec codec() const override { return Codec::None; }
};

class ZstdEncoder : public PayloadEncoder {
public:
    /// @param level Compression level (1-19)
    explicit ZstdEncoder(int level = 3);
    ~ZstdEncoder() override;

    ZstdEncoder(const ZstdEncoder&) = delete;
    ZstdEncoder& operator=(const ZstdEncoder&) = delete;

    /// Allocate the compression context
    /// @return false if zstd could not allocate it
    bool init();

    /// Without a context, or on a zstd error, the payload goes out as plain
    /// text and the failure is counted.
    std::vector<uint8_t> encode(const std::string& payload) override;
    Codec codec() const override { return Codec::Zstd; }

    int level() const { return level_; }

private:
    int level_;
    ZSTD_CCtx* ctx_ = nullptr;
};

/// Create an initialized encoder
/// @return nullptr if the codec context could not be created
std::unique_ptr<PayloadEncoder> make_encoder(Codec codec, int level = 3);

class PayloadDecoder {
public:
    virtual ~PayloadDecoder() = default;

    /// Decode one message back into JSON text
    /// @return nullopt if the bytes are not a valid payload for this codec
    virtual std::optional<std::string> decode(const std::vector<uint8_t>& bytes) = 0;

    virtual Codec codec() const = 0;
};

class PlainDecoder : public PayloadDecoder {
public:
    std::optional<std::string> decode(const std::vector<uint8_t>& bytes) override {
        return std::string(bytes.begin(), bytes.end());
    }
    Codec codec() const override { return Codec::None; }
};

class ZstdDecoder : public PayloadDecoder {
public:
    ZstdDecoder() = default;
    ~ZstdDecoder() override;

    ZstdDecoder(const ZstdDecoder&) = delete;
    ZstdDecoder& operator=(const ZstdDecoder&) = delete;

    bool init();
    std::optional<std::string> decode(const std::vector<uint8_t>& bytes) override;
    Codec codec() const override { return Codec::Zstd; }

private:
    ZSTD_DCtx* ctx_ = nullptr;
};

/// Create an initialized decoder
/// @return nullptr if the codec context could not be created
std::unique_ptr<PayloadDecoder> make_decoder(Codec codec);

}  // namespace logship
