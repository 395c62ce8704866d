#include "riff_wave.h"

#include <algorithm>
#include <limits>

#include "../core/errors.h"

namespace polyglot {

namespace {

uint64_t padded(size_t size) { return size + (size & 1); }

// Taille RIFF (tout ce qui suit le champ taille) pour une liste de chunks.
uint64_t riff_size_of(const std::vector<RiffChunk> &chunks) {
    uint64_t size = 4;  // "WAVE"
    for (const auto &chunk : chunks) {
        size += 8 + padded(chunk.data.size());
    }
    return size;
}

} // namespace

bool has_wave_signature(ByteView data) {
    return data.size() >= kRiffHeaderSize &&
           std::equal(kRiffTag.begin(), kRiffTag.end(), data.begin()) &&
           std::equal(kWaveTag.begin(), kWaveTag.end(), data.begin() + 8);
}

std::optional<size_t> declared_length(ByteView data) {
    if (!has_wave_signature(data)) {
        return std::nullopt;
    }
    return size_t{read_scalar_le<uint32_t>(data, 4)} + 8;
}

RiffWave RiffWave::parse(ByteView data) {
    if (!has_wave_signature(data)) {
        throw PolyglotError(ErrorCode::BadSignature, "Signature RIFF/WAVE invalide");
    }
    const uint32_t riffSize = read_scalar_le<uint32_t>(data, 4);
    // La taille RIFF couvre au moins l'étiquette WAVE
    if (riffSize < 4) {
        throw PolyglotError(ErrorCode::Truncated,
                            "Taille RIFF déclarée trop petite (" +
                                std::to_string(riffSize) + ")");
    }
    const size_t end = size_t{riffSize} + 8;
    if (end > data.size()) {
        throw PolyglotError(ErrorCode::Truncated,
                            "Taille RIFF déclarée (" + std::to_string(end) +
                                ") supérieure au fichier (" +
                                std::to_string(data.size()) + ")");
    }

    std::vector<RiffChunk> chunks;
    size_t offset = kRiffHeaderSize;
    while (end - offset >= 8) {
        RiffChunk chunk;
        chunk.offset = offset;
        std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(offset), 4,
                    chunk.type.begin());
        const uint32_t size = read_scalar_le<uint32_t>(data, offset + 4);
        const size_t start = offset + 8;
        if (size > end - start) {
            throw PolyglotError(ErrorCode::Truncated,
                                "Le chunk " + chunk.tagName() +
                                    " dépasse la fin du RIFF",
                                chunk.tagName());
        }
        chunk.data.assign(data.begin() + static_cast<std::ptrdiff_t>(start),
                          data.begin() + static_cast<std::ptrdiff_t>(start + size));
        offset = std::min<size_t>(start + padded(size), end);
        chunks.push_back(std::move(chunk));
    }

    RiffWave wave(std::move(chunks), riffSize);
    if (!wave.findChunk(kFmtTag)) {
        throw PolyglotError(ErrorCode::MissingChunk, "Chunk fmt absent", "fmt ");
    }
    if (!wave.findChunk(kDataTag)) {
        throw PolyglotError(ErrorCode::MissingChunk, "Chunk data absent", "data");
    }
    return wave;
}

Bytes RiffWave::serialize() const {
    const uint64_t riffSize = riff_size_of(_chunks);
    if (riffSize > std::numeric_limits<uint32_t>::max()) {
        throw PolyglotError(ErrorCode::SizeOverflow,
                            "Taille RIFF hors limites (" +
                                std::to_string(riffSize) + " octets)");
    }
    Bytes out(kRiffTag.begin(), kRiffTag.end());
    out.reserve(static_cast<size_t>(riffSize) + 8);
    append_le32(out, static_cast<uint32_t>(riffSize));
    out.insert(out.end(), kWaveTag.begin(), kWaveTag.end());
    for (const auto &chunk : _chunks) {
        out.insert(out.end(), chunk.type.begin(), chunk.type.end());
        append_le32(out, static_cast<uint32_t>(chunk.data.size()));
        out.insert(out.end(), chunk.data.begin(), chunk.data.end());
        if (chunk.data.size() & 1) {
            out.push_back(0);
        }
    }
    return out;
}

RiffWave RiffWave::embedPng(ByteView png) && {
    const uint64_t grown = riff_size_of(_chunks) + 8 + padded(png.size());
    if (grown > std::numeric_limits<uint32_t>::max()) {
        throw PolyglotError(ErrorCode::SizeOverflow,
                            "PNG trop volumineux pour un chunk RIFF (" +
                                std::to_string(png.size()) + " octets)",
                            "pnG ");
    }
    auto dataIndex = findChunk(kDataTag);
    if (!dataIndex) {
        throw PolyglotError(ErrorCode::MissingChunk, "Chunk data absent", "data");
    }

    std::vector<RiffChunk> chunks = std::move(_chunks);
    RiffChunk inserted;
    inserted.type = kPngChunkTag;
    inserted.data.assign(png.begin(), png.end());
    chunks.insert(chunks.begin() + static_cast<std::ptrdiff_t>(*dataIndex + 1),
                  std::move(inserted));

    // Offsets recalculés comme dans le tampon sérialisé
    size_t offset = kRiffHeaderSize;
    for (auto &chunk : chunks) {
        chunk.offset = offset;
        offset += 8 + static_cast<size_t>(padded(chunk.data.size()));
    }
    return RiffWave(std::move(chunks), static_cast<uint32_t>(grown));
}

std::optional<size_t> RiffWave::findChunk(const FourCC &tag) const {
    for (size_t i = 0; i < _chunks.size(); ++i) {
        if (_chunks[i].type == tag) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<WaveFormat> RiffWave::format() const {
    auto index = findChunk(kFmtTag);
    if (!index || _chunks[*index].data.size() < 16) {
        return std::nullopt;
    }
    ByteView d(_chunks[*index].data);
    WaveFormat f;
    f.audioFormat = read_scalar_le<uint16_t>(d, 0);
    f.channels = read_scalar_le<uint16_t>(d, 2);
    f.sampleRate = read_scalar_le<uint32_t>(d, 4);
    f.byteRate = read_scalar_le<uint32_t>(d, 8);
    f.blockAlign = read_scalar_le<uint16_t>(d, 12);
    f.bitsPerSample = read_scalar_le<uint16_t>(d, 14);
    return f;
}

} // namespace polyglot
