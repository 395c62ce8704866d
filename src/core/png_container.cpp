#include "png_container.h"

#include <algorithm>

#include "errors.h"

namespace polyglot {

namespace {

void append_chunk(Bytes &out, Chunk &chunk) {
    chunk.offset = out.size();
    chunk.crc = chunk_crc(chunk.type, chunk.data);
    append_be32(out, static_cast<uint32_t>(chunk.data.size()));
    out.insert(out.end(), chunk.type.begin(), chunk.type.end());
    out.insert(out.end(), chunk.data.begin(), chunk.data.end());
    append_be32(out, chunk.crc);
}

} // namespace

uint32_t chunk_crc(const ChunkTag &type, ByteView data) {
    const uint32_t crc = crc32_of(ByteView(type.data(), type.size()));
    return crc32_update(crc, data);
}

bool has_png_signature(ByteView data) {
    return data.size() >= kPngSignature.size() &&
           std::equal(kPngSignature.begin(), kPngSignature.end(), data.begin());
}

ChunkInfo decode_chunk(const Chunk &chunk) {
    if (chunk.type == kTagIHDR && chunk.data.size() == 13) {
        ByteView d(chunk.data);
        ImageHeader h;
        h.width = read_scalar_be<uint32_t>(d, 0);
        h.height = read_scalar_be<uint32_t>(d, 4);
        h.bitDepth = d[8];
        h.colorType = d[9];
        h.compression = d[10];
        h.filter = d[11];
        h.interlace = d[12];
        return h;
    }
    if (chunk.type == kTagIDAT) {
        return ImageData{chunk.data.size()};
    }
    if (chunk.type == kTagIEND && chunk.data.empty()) {
        return ImageEnd{};
    }
    if (chunk.type == kTagTEXT) {
        auto sep = std::find(chunk.data.begin(), chunk.data.end(), uint8_t{0});
        // Mot-clé de 1 à 79 octets
        const auto keyLen = sep - chunk.data.begin();
        if (sep != chunk.data.end() && keyLen >= 1 && keyLen <= 79) {
            TextualData t;
            t.keyword.assign(chunk.data.begin(), sep);
            t.text.assign(sep + 1, chunk.data.end());
            return t;
        }
    }
    return UnknownChunk{chunk.type, chunk.data};
}

PngContainer PngContainer::parse(ByteView data) {
    if (!has_png_signature(data)) {
        throw PolyglotError(ErrorCode::BadSignature, "Signature PNG invalide");
    }

    std::vector<Chunk> chunks;
    size_t offset = kPngSignature.size();
    bool sawEnd = false;

    while (offset < data.size()) {
        if (data.size() - offset < kChunkOverhead) {
            throw PolyglotError(ErrorCode::Truncated,
                                "En-tête de chunk tronqué à l'offset " +
                                    std::to_string(offset));
        }
        const uint32_t length = read_scalar_be<uint32_t>(data, offset);
        Chunk chunk;
        chunk.offset = offset;
        std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(offset + 4), 4,
                    chunk.type.begin());

        const size_t remaining = data.size() - offset - kChunkOverhead;
        if (length > remaining) {
            throw PolyglotError(ErrorCode::Truncated,
                                "Les données du chunk " + chunk.tagName() +
                                    " dépassent la fin du fichier (" +
                                    std::to_string(length) + " > " +
                                    std::to_string(remaining) + ")",
                                chunk.tagName());
        }

        const size_t dataStart = offset + 8;
        chunk.data.assign(data.begin() + static_cast<std::ptrdiff_t>(dataStart),
                          data.begin() + static_cast<std::ptrdiff_t>(dataStart + length));
        chunk.crc = read_scalar_be<uint32_t>(data, dataStart + length);

        const uint32_t expected = chunk_crc(chunk.type, chunk.data);
        if (chunk.crc != expected) {
            throw PolyglotError(ErrorCode::ChecksumMismatch,
                                "CRC incohérent dans le chunk " + chunk.tagName(),
                                chunk.tagName());
        }

        offset = dataStart + length + 4;
        const bool isEnd = chunk.type == kTagIEND;
        chunks.push_back(std::move(chunk));
        if (isEnd) {
            sawEnd = true;
            break;
        }
    }

    if (chunks.empty() || chunks.front().type != kTagIHDR) {
        throw PolyglotError(ErrorCode::MissingChunk,
                            "Le premier chunk n'est pas IHDR", "IHDR");
    }
    if (!sawEnd) {
        throw PolyglotError(ErrorCode::MissingChunk, "Chunk IEND absent", "IEND");
    }

    Bytes raw(data.begin(), data.begin() + static_cast<std::ptrdiff_t>(offset));
    return PngContainer(std::move(raw), std::move(chunks));
}

PngContainer PngContainer::fromChunks(std::vector<Chunk> chunks) {
    if (chunks.empty() || chunks.front().type != kTagIHDR) {
        throw PolyglotError(ErrorCode::MissingChunk,
                            "Le premier chunk n'est pas IHDR", "IHDR");
    }
    if (chunks.back().type != kTagIEND) {
        throw PolyglotError(ErrorCode::MissingChunk, "Chunk IEND absent", "IEND");
    }

    Bytes raw(kPngSignature.begin(), kPngSignature.end());
    for (auto &chunk : chunks) {
        if (chunk.data.size() > kMaxChunkLength) {
            throw PolyglotError(ErrorCode::SizeOverflow,
                                "Chunk " + chunk.tagName() + " trop long",
                                chunk.tagName());
        }
        append_chunk(raw, chunk);
    }
    return PngContainer(std::move(raw), std::move(chunks));
}

Bytes PngContainer::serialize() const {
    Bytes out(kPngSignature.begin(), kPngSignature.end());
    for (const auto &chunk : _chunks) {
        Chunk copy = chunk;
        append_chunk(out, copy);
    }
    return out;
}

PngContainer PngContainer::appendToFirstChunk(const ChunkTag &tag,
                                              ByteView extra) && {
    auto index = findFirstChunk(tag);
    if (!index) {
        const std::string name = printable_tag(ByteView(tag.data(), tag.size()));
        throw PolyglotError(ErrorCode::MissingChunk,
                            "Aucun chunk " + name + " trouvé", name);
    }

    std::vector<Chunk> chunks = std::move(_chunks);
    Chunk &target = chunks[*index];
    if (extra.size() > kMaxChunkLength - target.data.size()) {
        throw PolyglotError(ErrorCode::SizeOverflow,
                            "Chunk " + target.tagName() +
                                " trop long après ajout de " +
                                std::to_string(extra.size()) + " octets",
                            target.tagName());
    }
    target.data.insert(target.data.end(), extra.begin(), extra.end());
    _raw.clear();
    return fromChunks(std::move(chunks));
}

PngContainer PngContainer::insertChunkBeforeEnd(const ChunkTag &tag,
                                                ByteView data) && {
    if (data.size() > kMaxChunkLength) {
        throw PolyglotError(ErrorCode::SizeOverflow,
                            "Charge utile trop longue pour un chunk (" +
                                std::to_string(data.size()) + " octets)");
    }

    std::vector<Chunk> chunks = std::move(_chunks);
    Chunk inserted;
    inserted.type = tag;
    inserted.data.assign(data.begin(), data.end());
    // fromChunks garantit que IEND est le dernier chunk
    auto endPos = chunks.empty() ? chunks.end() : chunks.end() - 1;
    chunks.insert(endPos, std::move(inserted));
    _raw.clear();
    return fromChunks(std::move(chunks));
}

std::optional<size_t> PngContainer::findFirstChunk(const ChunkTag &tag) const {
    for (size_t i = 0; i < _chunks.size(); ++i) {
        if (_chunks[i].type == tag) {
            return i;
        }
    }
    return std::nullopt;
}

size_t PngContainer::dataOffset(size_t index) const {
    if (index >= _chunks.size()) {
        throw std::out_of_range("Index de chunk hors limites: " +
                                std::to_string(index));
    }
    return _chunks[index].offset + 8;
}

} // namespace polyglot
