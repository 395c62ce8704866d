/**
 * @file zip_archive.h
 * @brief Modèle d'archive ZIP indexée par son répertoire central
 *
 * Structure d'une archive :
 * - En-têtes locaux (PK\3\4, 30 octets fixes) suivis du nom, de l'extra
 *   et des données de chaque entrée
 * - Répertoire central : une entrée par fichier (PK\1\2, 46 octets fixes
 *   + nom + extra + commentaire) portant l'offset absolu de l'en-tête local
 * - Trailer EOCD (PK\5\6, 22 octets + commentaire) portant l'offset et la
 *   taille du répertoire
 *
 * Les offsets enregistrés sont relatifs à l'« ancre » : la position, dans
 * le fichier lu par le décodeur, du premier octet de l'archive. Une archive
 * autonome a l'ancre 0 ; une archive relocalisée dans un PNG à la position
 * P a l'ancre P.
 *
 * ZIP64 n'est pas supporté.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../utilities.hpp"

namespace polyglot {

inline constexpr uint32_t kLocalHeaderSignature = 0x04034B50;      // PK\3\4
inline constexpr uint32_t kDirectoryEntrySignature = 0x02014B50;   // PK\1\2
inline constexpr uint32_t kTrailerSignature = 0x06054B50;          // PK\5\6

inline constexpr std::array<uint8_t, 4> kZipSignature = {0x50, 0x4B, 0x03, 0x04};

inline constexpr size_t kLocalHeaderSize = 30;
inline constexpr size_t kDirectoryEntrySize = 46;
inline constexpr size_t kTrailerSize = 22;
inline constexpr size_t kMaxCommentLength = 0xFFFF;

// Valeurs réservées signalant l'extension ZIP64.
inline constexpr uint16_t kZip64Count = 0xFFFF;
inline constexpr uint32_t kZip64Value = 0xFFFFFFFF;

// Position des champs réécrits par la relocalisation.
inline constexpr size_t kEntryOffsetField = 42;
inline constexpr size_t kTrailerOffsetField = 16;

inline constexpr uint16_t kMethodStored = 0;
inline constexpr uint16_t kMethodDeflate = 8;

/**
 * @brief Entrée du répertoire central
 */
struct DirectoryEntry {
    uint32_t signature = kDirectoryEntrySignature;
    uint16_t versionMadeBy = 0;
    uint16_t versionNeeded = 0;
    uint16_t flags = 0;
    uint16_t method = 0;
    uint16_t modTime = 0;
    uint16_t modDate = 0;
    uint32_t crc32 = 0;
    uint32_t compressedSize = 0;
    uint32_t uncompressedSize = 0;
    uint16_t diskStart = 0;
    uint16_t internalAttributes = 0;
    uint32_t externalAttributes = 0;
    uint32_t localHeaderOffset = 0;  // Relatif à l'ancre
    std::string name;
    Bytes extra;
    Bytes comment;
    size_t position = 0;             // Position de l'entrée dans le tampon

    size_t recordSize() const {
        return kDirectoryEntrySize + name.size() + extra.size() + comment.size();
    }
};

/**
 * @brief Trailer EOCD (End Of Central Directory)
 */
struct DirectoryTrailer {
    uint16_t diskNumber = 0;
    uint16_t directoryDisk = 0;
    uint16_t entriesOnDisk = 0;
    uint16_t entryCount = 0;
    uint32_t directorySize = 0;
    uint32_t directoryOffset = 0;    // Relatif à l'ancre
    uint16_t commentLength = 0;
    Bytes comment;
    size_t position = 0;             // Position du trailer dans le tampon
};

/**
 * @brief Recherche bornée du trailer en partant de la fin
 *
 * Parcourt les positions de `len - 22` jusqu'à `len - 22 - 65535` et retient
 * la première signature dont la longueur de commentaire tient dans les
 * octets restants.
 *
 * @return Position du trailer, ou nullopt
 */
std::optional<size_t> find_end_of_central_directory(ByteView data);

// Lit le trailer situé à `position` (22 octets + commentaire).
// @throws PolyglotError Truncated
DirectoryTrailer read_directory_trailer(ByteView data, size_t position);

/**
 * @brief Parcourt les entrées du répertoire central
 *
 * Commence à `trailer.directoryOffset - anchor` ; s'arrête après
 * `trailer.entryCount` entrées, sur une signature inattendue ou sur une
 * entrée tronquée.
 */
std::vector<DirectoryEntry> locate_directory_entries(ByteView data,
                                                     const DirectoryTrailer &trailer,
                                                     uint32_t anchor = 0);

class RelocatedArchive;

class ZipArchive {
public:
    /**
     * @brief Parse une archive commençant au premier octet de `data`
     *
     * @param data    Octets de l'archive (des octets peuvent suivre le trailer)
     * @param anchor  Position absolue de l'archive dans le fichier de lecture
     * @throws PolyglotError BadSignature, TrailerNotFound, Unsupported64Bit,
     *         MultiVolume, Truncated, EntryNotFound, InconsistentDirectory
     */
    static ZipArchive parse(Bytes data, uint32_t anchor = 0);

    // Même contrôle sur une vue : les octets ne sont copiés qu'une fois
    // l'archive validée.
    static ZipArchive parse(ByteView data, uint32_t anchor = 0);

    ZipArchive(ZipArchive &&other) noexcept;
    ZipArchive &operator=(ZipArchive &&other) noexcept;
    ZipArchive(const ZipArchive &) = delete;
    ZipArchive &operator=(const ZipArchive &) = delete;

    const Bytes &bytes() const { return _data; }
    const DirectoryTrailer &trailer() const { return _trailer; }
    const std::vector<DirectoryEntry> &entries() const { return _entries; }
    uint32_t anchor() const { return _anchor; }

    // Fin exacte de l'archive : trailer + 22 + commentaire.
    size_t archiveEnd() const;

    // Octets de l'archive sans ce qui suit le trailer.
    ByteView archiveBytes() const { return ByteView(_data.data(), archiveEnd()); }

    /**
     * @brief Contenu décompressé d'une entrée
     *
     * Méthode 0 (stockée) ou 8 (deflate, zlib). Le CRC-32 est vérifié.
     * @throws PolyglotError UnsupportedMethod, Truncated, ChecksumMismatch
     */
    Bytes readEntry(const DirectoryEntry &entry) const;

    // false une fois l'archive consommée par relocate().
    bool valid() const { return !_consumed; }

private:
    ZipArchive() = default;

    // Trailer et répertoire validés, sans les octets.
    static ZipArchive readLayout(ByteView view, uint32_t anchor);

    friend RelocatedArchive relocate(ZipArchive &&archive, int64_t shift);

    Bytes _data;
    uint32_t _anchor = 0;
    DirectoryTrailer _trailer;
    std::vector<DirectoryEntry> _entries;
    bool _consumed = false;
};

/**
 * @brief Construit de zéro une archive à une seule entrée stockée
 *
 * En-tête local à l'offset 0, données, une entrée de répertoire, un trailer.
 * @throws PolyglotError SizeOverflow si le nom ou les données dépassent
 *         la largeur des champs
 */
Bytes build_single_entry_archive(const std::string &name, ByteView payload);

} // namespace polyglot
