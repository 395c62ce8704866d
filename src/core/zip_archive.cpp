#include "zip_archive.h"

#include <algorithm>
#include <limits>

#include <zlib.h>

#include "errors.h"

namespace polyglot {

namespace {

// Date DOS du 1er janvier 1980 : aucune horloge n'entre dans la sortie.
constexpr uint16_t kDosEpochDate = (0 << 9) | (1 << 5) | 1;
constexpr uint16_t kVersionStored = 10;
constexpr uint16_t kVersionMadeByUnix = 0x030A;
constexpr uint16_t kFlagEncrypted = 0x0001;

bool has_zip64_sentinel(const DirectoryTrailer &t) {
    return t.entriesOnDisk == kZip64Count || t.entryCount == kZip64Count ||
           t.directorySize == kZip64Value || t.directoryOffset == kZip64Value;
}

bool has_zip64_sentinel(const DirectoryEntry &e) {
    return e.compressedSize == kZip64Value || e.uncompressedSize == kZip64Value ||
           e.localHeaderOffset == kZip64Value;
}

Bytes slice(ByteView data, size_t pos, size_t len) {
    return Bytes(data.begin() + static_cast<std::ptrdiff_t>(pos),
                 data.begin() + static_cast<std::ptrdiff_t>(pos + len));
}

// Position de l'en-tête local d'une entrée dans le tampon, bornes vérifiées.
size_t local_header_position(ByteView data, const DirectoryEntry &entry,
                             uint32_t anchor) {
    if (entry.localHeaderOffset < anchor) {
        throw PolyglotError(ErrorCode::EntryNotFound,
                            "En-tête local de " + entry.name +
                                " situé avant le début de l'archive",
                            entry.name);
    }
    const size_t pos = entry.localHeaderOffset - anchor;
    if (pos > data.size() || data.size() - pos < kLocalHeaderSize ||
        read_scalar_le<uint32_t>(data, pos) != kLocalHeaderSignature) {
        throw PolyglotError(ErrorCode::EntryNotFound,
                            "En-tête local introuvable pour " + entry.name +
                                " à l'offset " + std::to_string(pos),
                            entry.name);
    }
    return pos;
}

Bytes inflate_raw(ByteView compressed, uint32_t expectedSize,
                  const std::string &name) {
    Bytes out(std::max<size_t>(expectedSize, 1));
    z_stream strm{};
    if (inflateInit2(&strm, -MAX_WBITS) != Z_OK) {
        throw std::runtime_error("Échec de l'initialisation de zlib");
    }
    strm.next_in = const_cast<Bytef *>(compressed.data());
    strm.avail_in = static_cast<uInt>(compressed.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    const int ret = inflate(&strm, Z_FINISH);
    const uLong produced = strm.total_out;
    inflateEnd(&strm);

    if (ret != Z_STREAM_END || produced != expectedSize) {
        throw PolyglotError(ErrorCode::Truncated,
                            "Flux deflate corrompu dans " + name + " (" +
                                std::to_string(produced) + "/" +
                                std::to_string(expectedSize) + " octets)",
                            name);
    }
    out.resize(produced);
    return out;
}

} // namespace

std::optional<size_t> find_end_of_central_directory(ByteView data) {
    if (data.size() < kTrailerSize) {
        return std::nullopt;
    }
    const size_t last = data.size() - kTrailerSize;
    const size_t first = last > kMaxCommentLength ? last - kMaxCommentLength : 0;
    for (size_t pos = last + 1; pos-- > first;) {
        if (read_scalar_le<uint32_t>(data, pos) != kTrailerSignature) {
            continue;
        }
        const uint16_t commentLength = read_scalar_le<uint16_t>(data, pos + 20);
        if (commentLength <= data.size() - pos - kTrailerSize) {
            return pos;
        }
    }
    return std::nullopt;
}

DirectoryTrailer read_directory_trailer(ByteView data, size_t position) {
    if (position > data.size() || data.size() - position < kTrailerSize) {
        throw PolyglotError(ErrorCode::Truncated,
                            "Trailer EOCD tronqué à l'offset " +
                                std::to_string(position));
    }
    DirectoryTrailer t;
    t.position = position;
    t.diskNumber = read_scalar_le<uint16_t>(data, position + 4);
    t.directoryDisk = read_scalar_le<uint16_t>(data, position + 6);
    t.entriesOnDisk = read_scalar_le<uint16_t>(data, position + 8);
    t.entryCount = read_scalar_le<uint16_t>(data, position + 10);
    t.directorySize = read_scalar_le<uint32_t>(data, position + 12);
    t.directoryOffset = read_scalar_le<uint32_t>(data, position + kTrailerOffsetField);
    t.commentLength = read_scalar_le<uint16_t>(data, position + 20);
    if (t.commentLength > data.size() - position - kTrailerSize) {
        throw PolyglotError(ErrorCode::Truncated,
                            "Commentaire d'archive tronqué (" +
                                std::to_string(t.commentLength) + " octets)");
    }
    t.comment = slice(data, position + kTrailerSize, t.commentLength);
    return t;
}

std::vector<DirectoryEntry> locate_directory_entries(ByteView data,
                                                     const DirectoryTrailer &trailer,
                                                     uint32_t anchor) {
    std::vector<DirectoryEntry> entries;
    if (trailer.directoryOffset < anchor) {
        return entries;
    }
    size_t pos = trailer.directoryOffset - anchor;

    for (uint16_t i = 0; i < trailer.entryCount; ++i) {
        if (pos > data.size() || data.size() - pos < kDirectoryEntrySize) {
            break;
        }
        DirectoryEntry e;
        e.signature = read_scalar_le<uint32_t>(data, pos);
        if (e.signature != kDirectoryEntrySignature) {
            break;
        }
        e.position = pos;
        e.versionMadeBy = read_scalar_le<uint16_t>(data, pos + 4);
        e.versionNeeded = read_scalar_le<uint16_t>(data, pos + 6);
        e.flags = read_scalar_le<uint16_t>(data, pos + 8);
        e.method = read_scalar_le<uint16_t>(data, pos + 10);
        e.modTime = read_scalar_le<uint16_t>(data, pos + 12);
        e.modDate = read_scalar_le<uint16_t>(data, pos + 14);
        e.crc32 = read_scalar_le<uint32_t>(data, pos + 16);
        e.compressedSize = read_scalar_le<uint32_t>(data, pos + 20);
        e.uncompressedSize = read_scalar_le<uint32_t>(data, pos + 24);
        const uint16_t nameLength = read_scalar_le<uint16_t>(data, pos + 28);
        const uint16_t extraLength = read_scalar_le<uint16_t>(data, pos + 30);
        const uint16_t commentLength = read_scalar_le<uint16_t>(data, pos + 32);
        e.diskStart = read_scalar_le<uint16_t>(data, pos + 34);
        e.internalAttributes = read_scalar_le<uint16_t>(data, pos + 36);
        e.externalAttributes = read_scalar_le<uint32_t>(data, pos + 38);
        e.localHeaderOffset = read_scalar_le<uint32_t>(data, pos + kEntryOffsetField);

        const size_t variable = size_t{nameLength} + extraLength + commentLength;
        const size_t start = pos + kDirectoryEntrySize;
        if (data.size() - start < variable) {
            break;
        }
        e.name.assign(data.begin() + static_cast<std::ptrdiff_t>(start),
                      data.begin() + static_cast<std::ptrdiff_t>(start + nameLength));
        e.extra = slice(data, start + nameLength, extraLength);
        e.comment = slice(data, start + nameLength + extraLength, commentLength);

        pos += e.recordSize();
        entries.push_back(std::move(e));
    }
    return entries;
}

ZipArchive ZipArchive::readLayout(ByteView view, uint32_t anchor) {
    if (view.size() < kZipSignature.size() ||
        read_scalar_le<uint32_t>(view, 0) != kLocalHeaderSignature) {
        throw PolyglotError(ErrorCode::BadSignature, "Signature ZIP invalide");
    }

    auto trailerPos = find_end_of_central_directory(view);
    if (!trailerPos) {
        throw PolyglotError(ErrorCode::TrailerNotFound,
                            "Trailer EOCD introuvable");
    }
    DirectoryTrailer trailer = read_directory_trailer(view, *trailerPos);

    if (has_zip64_sentinel(trailer)) {
        throw PolyglotError(ErrorCode::Unsupported64Bit,
                            "Archive ZIP64 non supportée");
    }
    if (trailer.diskNumber != 0 || trailer.directoryDisk != 0 ||
        trailer.entriesOnDisk != trailer.entryCount) {
        throw PolyglotError(ErrorCode::MultiVolume,
                            "Archive multi-volumes non supportée");
    }
    if (trailer.directoryOffset < anchor) {
        throw PolyglotError(ErrorCode::Truncated,
                            "Répertoire central avant le début de l'archive "
                            "(offset " + std::to_string(trailer.directoryOffset) +
                                ", ancre " + std::to_string(anchor) + ")");
    }
    const size_t directoryStart = trailer.directoryOffset - anchor;
    if (directoryStart > trailer.position ||
        trailer.directorySize > trailer.position - directoryStart) {
        throw PolyglotError(ErrorCode::Truncated,
                            "Le répertoire central déborde sur le trailer "
                            "(offset " + std::to_string(directoryStart) +
                                ", taille " + std::to_string(trailer.directorySize) + ")");
    }

    auto entries = locate_directory_entries(view, trailer, anchor);
    if (entries.size() < trailer.entryCount) {
        throw PolyglotError(ErrorCode::EntryNotFound,
                            "Répertoire central incomplet (" +
                                std::to_string(entries.size()) + "/" +
                                std::to_string(trailer.entryCount) + " entrées)");
    }

    size_t span = 0;
    for (const auto &entry : entries) {
        if (has_zip64_sentinel(entry)) {
            throw PolyglotError(ErrorCode::Unsupported64Bit,
                                "Entrée ZIP64 non supportée: " + entry.name,
                                entry.name);
        }
        const size_t lh = local_header_position(view, entry, anchor);
        const uint16_t nameLength = read_scalar_le<uint16_t>(view, lh + 26);
        const size_t nameStart = lh + kLocalHeaderSize;
        if (nameLength != entry.name.size() || view.size() - nameStart < nameLength ||
            !std::equal(entry.name.begin(), entry.name.end(),
                        view.begin() + static_cast<std::ptrdiff_t>(nameStart))) {
            throw PolyglotError(ErrorCode::EntryNotFound,
                                "L'en-tête local ne correspond pas à l'entrée " +
                                    entry.name,
                                entry.name);
        }
        span += entry.recordSize();
    }
    if (span != trailer.directorySize) {
        throw PolyglotError(ErrorCode::InconsistentDirectory,
                            "Taille du répertoire central incohérente (" +
                                std::to_string(span) + " lus, " +
                                std::to_string(trailer.directorySize) + " déclarés)");
    }

    ZipArchive archive;
    archive._anchor = anchor;
    archive._trailer = std::move(trailer);
    archive._entries = std::move(entries);
    return archive;
}

ZipArchive ZipArchive::parse(Bytes data, uint32_t anchor) {
    ZipArchive archive = readLayout(data, anchor);
    archive._data = std::move(data);
    return archive;
}

ZipArchive ZipArchive::parse(ByteView data, uint32_t anchor) {
    ZipArchive archive = readLayout(data, anchor);
    archive._data.assign(data.begin(), data.end());
    return archive;
}

ZipArchive::ZipArchive(ZipArchive &&other) noexcept
    : _data(std::move(other._data)),
      _anchor(other._anchor),
      _trailer(std::move(other._trailer)),
      _entries(std::move(other._entries)),
      _consumed(other._consumed) {
    other._consumed = true;
}

ZipArchive &ZipArchive::operator=(ZipArchive &&other) noexcept {
    if (this != &other) {
        _data = std::move(other._data);
        _anchor = other._anchor;
        _trailer = std::move(other._trailer);
        _entries = std::move(other._entries);
        _consumed = other._consumed;
        other._consumed = true;
    }
    return *this;
}

size_t ZipArchive::archiveEnd() const {
    if (_consumed) {
        return 0;
    }
    return _trailer.position + kTrailerSize + _trailer.commentLength;
}

Bytes ZipArchive::readEntry(const DirectoryEntry &entry) const {
    ByteView view(_data);
    const size_t lh = local_header_position(view, entry, _anchor);
    if (entry.flags & kFlagEncrypted) {
        throw PolyglotError(ErrorCode::UnsupportedMethod,
                            "Entrée chiffrée: " + entry.name, entry.name);
    }
    const uint16_t nameLength = read_scalar_le<uint16_t>(view, lh + 26);
    const uint16_t extraLength = read_scalar_le<uint16_t>(view, lh + 28);
    const size_t dataStart = lh + kLocalHeaderSize + nameLength + extraLength;
    if (dataStart > view.size() || view.size() - dataStart < entry.compressedSize) {
        throw PolyglotError(ErrorCode::Truncated,
                            "Données de l'entrée " + entry.name + " tronquées",
                            entry.name);
    }
    ByteView compressed = view.subspan(dataStart, entry.compressedSize);

    Bytes content;
    switch (entry.method) {
    case kMethodStored:
        content.assign(compressed.begin(), compressed.end());
        break;
    case kMethodDeflate:
        content = inflate_raw(compressed, entry.uncompressedSize, entry.name);
        break;
    default:
        throw PolyglotError(ErrorCode::UnsupportedMethod,
                            "Méthode de compression " + std::to_string(entry.method) +
                                " non supportée pour " + entry.name,
                            entry.name);
    }

    if (crc32_of(content) != entry.crc32) {
        throw PolyglotError(ErrorCode::ChecksumMismatch,
                            "CRC incohérent pour l'entrée " + entry.name,
                            entry.name);
    }
    return content;
}

Bytes build_single_entry_archive(const std::string &name, ByteView payload) {
    if (payload.size() >= kZip64Value) {
        throw PolyglotError(ErrorCode::SizeOverflow,
                            "Charge utile trop volumineuse pour une entrée ZIP (" +
                                std::to_string(payload.size()) + " octets)",
                            name);
    }
    if (name.size() > std::numeric_limits<uint16_t>::max()) {
        throw PolyglotError(ErrorCode::SizeOverflow,
                            "Nom d'entrée trop long (" +
                                std::to_string(name.size()) + " octets)");
    }
    const auto size = static_cast<uint32_t>(payload.size());
    const auto nameLength = static_cast<uint16_t>(name.size());
    const uint32_t crc = crc32_of(payload);

    Bytes out;
    out.reserve(kLocalHeaderSize + kDirectoryEntrySize + kTrailerSize +
                2 * name.size() + payload.size());

    // En-tête local
    append_le32(out, kLocalHeaderSignature);
    append_le16(out, kVersionStored);
    append_le16(out, 0);               // flags
    append_le16(out, kMethodStored);
    append_le16(out, 0);               // heure
    append_le16(out, kDosEpochDate);
    append_le32(out, crc);
    append_le32(out, size);
    append_le32(out, size);
    append_le16(out, nameLength);
    append_le16(out, 0);               // extra
    out.insert(out.end(), name.begin(), name.end());
    out.insert(out.end(), payload.begin(), payload.end());

    const size_t directoryOffset = out.size();
    if (directoryOffset >= kZip64Value) {
        throw PolyglotError(ErrorCode::SizeOverflow,
                            "Archive trop volumineuse pour ZIP32", name);
    }

    // Répertoire central
    append_le32(out, kDirectoryEntrySignature);
    append_le16(out, kVersionMadeByUnix);
    append_le16(out, kVersionStored);
    append_le16(out, 0);
    append_le16(out, kMethodStored);
    append_le16(out, 0);
    append_le16(out, kDosEpochDate);
    append_le32(out, crc);
    append_le32(out, size);
    append_le32(out, size);
    append_le16(out, nameLength);
    append_le16(out, 0);               // extra
    append_le16(out, 0);               // commentaire
    append_le16(out, 0);               // disque
    append_le16(out, 0);               // attributs internes
    append_le32(out, 0);               // attributs externes
    append_le32(out, 0);               // offset de l'en-tête local
    out.insert(out.end(), name.begin(), name.end());

    const size_t directorySize = out.size() - directoryOffset;

    // Trailer EOCD
    append_le32(out, kTrailerSignature);
    append_le16(out, 0);
    append_le16(out, 0);
    append_le16(out, 1);
    append_le16(out, 1);
    append_le32(out, static_cast<uint32_t>(directorySize));
    append_le32(out, static_cast<uint32_t>(directoryOffset));
    append_le16(out, 0);
    return out;
}

} // namespace polyglot
