#include "zip_offsets.h"

#include <utility>

#include "errors.h"

namespace polyglot {

namespace {

constexpr int64_t kMaxOffset = 0xFFFFFFFE;

uint32_t shifted(uint32_t value, int64_t shift, const std::string &what) {
    const int64_t result = static_cast<int64_t>(value) + shift;
    if (result < 0 || result > kMaxOffset) {
        throw PolyglotError(ErrorCode::OffsetOverflow,
                            "Offset hors limites après décalage de " +
                                std::to_string(shift) + " pour " + what + " (" +
                                std::to_string(result) + ")",
                            what);
    }
    return static_cast<uint32_t>(result);
}

} // namespace

RelocatedArchive::RelocatedArchive(Bytes data, uint32_t anchor, int64_t shift,
                                   DirectoryTrailer trailer,
                                   std::vector<DirectoryEntry> entries)
    : _data(std::move(data)),
      _anchor(anchor),
      _shift(shift),
      _trailer(std::move(trailer)),
      _entries(std::move(entries)) {}

RelocatedArchive relocate(ZipArchive &&archive, int64_t shift) {
    if (!archive.valid()) {
        throw PolyglotError(ErrorCode::AlreadyRelocated,
                            "Archive déjà relocalisée ou consommée");
    }

    // Tous les nouveaux offsets sont calculés avant la moindre écriture.
    const uint32_t anchor = shifted(archive._anchor, shift, "ancre");
    std::vector<uint32_t> entryOffsets;
    entryOffsets.reserve(archive._entries.size());
    for (const auto &entry : archive._entries) {
        entryOffsets.push_back(shifted(entry.localHeaderOffset, shift, entry.name));
    }
    const uint32_t directoryOffset =
        shifted(archive._trailer.directoryOffset, shift, "répertoire central");

    Bytes data = std::move(archive._data);
    std::vector<DirectoryEntry> entries = std::move(archive._entries);
    DirectoryTrailer trailer = std::move(archive._trailer);
    archive._consumed = true;

    for (size_t i = 0; i < entries.size(); ++i) {
        entries[i].localHeaderOffset = entryOffsets[i];
        write_le32(data, entries[i].position + kEntryOffsetField, entryOffsets[i]);
    }
    trailer.directoryOffset = directoryOffset;
    write_le32(data, trailer.position + kTrailerOffsetField, directoryOffset);

    return RelocatedArchive(std::move(data), anchor, shift, std::move(trailer),
                            std::move(entries));
}

} // namespace polyglot
