/**
 * @file png_container.h
 * @brief Modèle de conteneur PNG : suite de chunks typés, préfixés par leur
 *        longueur et protégés par un CRC-32
 *
 * Format d'un chunk : longueur[4B BE] + type[4B] + données + CRC[4B BE],
 * le CRC couvrant type + données. Le parsing s'arrête au premier IEND.
 *
 * Un PngContainer n'est jamais modifié sur place : les transformations
 * consomment la valeur et en rendent une nouvelle, reconstruite, car tout
 * changement de taille décale les chunks suivants.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../utilities.hpp"

namespace polyglot {

using ChunkTag = std::array<uint8_t, 4>;

inline constexpr std::array<uint8_t, 8> kPngSignature = {
    0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};

inline constexpr ChunkTag kTagIHDR = {'I', 'H', 'D', 'R'};
inline constexpr ChunkTag kTagIDAT = {'I', 'D', 'A', 'T'};
inline constexpr ChunkTag kTagIEND = {'I', 'E', 'N', 'D'};
inline constexpr ChunkTag kTagTEXT = {'t', 'E', 'X', 't'};

// Longueur maximale d'un chunk autorisée par le format (2^31 - 1).
inline constexpr uint32_t kMaxChunkLength = 0x7FFFFFFFu;

// Longueur + type + CRC.
inline constexpr size_t kChunkOverhead = 12;

/**
 * @brief Chunk PNG
 */
struct Chunk {
    ChunkTag type{};
    Bytes data;
    uint32_t crc = 0;   // CRC stocké (recalculé à la sérialisation)
    size_t offset = 0;  // Position du champ longueur dans le tampon d'origine

    std::string tagName() const { return printable_tag(type); }
};

// Vues décodées d'un chunk, une par type connu.
struct ImageHeader {
    uint32_t width = 0;
    uint32_t height = 0;
    uint8_t bitDepth = 0;
    uint8_t colorType = 0;
    uint8_t compression = 0;
    uint8_t filter = 0;
    uint8_t interlace = 0;
};

struct ImageData {
    size_t size = 0;
};

struct TextualData {
    std::string keyword;
    Bytes text;
};

struct ImageEnd {};

// Chunk de type inconnu ou mal formé : conservé octet pour octet.
struct UnknownChunk {
    ChunkTag type{};
    Bytes raw;
};

using ChunkInfo =
    std::variant<ImageHeader, ImageData, TextualData, ImageEnd, UnknownChunk>;

// CRC-32 (zlib) de type + données.
uint32_t chunk_crc(const ChunkTag &type, ByteView data);

// Décode un chunk selon son type. Un IHDR de taille incorrecte ou un tEXt
// sans séparateur nul sont rendus en UnknownChunk.
ChunkInfo decode_chunk(const Chunk &chunk);

// true si le tampon commence par la signature PNG.
bool has_png_signature(ByteView data);

class PngContainer {
public:
    /**
     * @brief Parse un conteneur PNG complet
     *
     * @throws PolyglotError BadSignature, Truncated, ChecksumMismatch (le
     *         sujet est le type du chunk), MissingChunk si le premier chunk
     *         n'est pas IHDR ou si IEND est absent
     */
    static PngContainer parse(ByteView data);

    /**
     * Construit un conteneur à partir d'une liste de chunks. Les CRC sont
     * recalculés, la liste doit commencer par IHDR et finir par IEND.
     */
    static PngContainer fromChunks(std::vector<Chunk> chunks);

    // Signature + chunks, CRC recalculés à partir du contenu courant.
    Bytes serialize() const;

    /**
     * Ajoute `extra` aux données du premier chunk de type `tag`.
     * Le tampon entier est reconstruit.
     * @throws PolyglotError MissingChunk, SizeOverflow
     */
    PngContainer appendToFirstChunk(const ChunkTag &tag, ByteView extra) &&;

    /**
     * Insère un nouveau chunk juste avant IEND.
     * @throws PolyglotError SizeOverflow
     */
    PngContainer insertChunkBeforeEnd(const ChunkTag &tag, ByteView data) &&;

    // Index du premier chunk de type `tag`.
    std::optional<size_t> findFirstChunk(const ChunkTag &tag) const;

    // Position absolue des données du chunk `index` dans bytes().
    size_t dataOffset(size_t index) const;

    const std::vector<Chunk> &chunks() const { return _chunks; }
    const Bytes &bytes() const { return _raw; }

    // Nombre d'octets occupés par le PNG jusqu'à la fin de IEND.
    size_t byteLength() const { return _raw.size(); }

    Bytes release() && { return std::move(_raw); }

private:
    PngContainer(Bytes raw, std::vector<Chunk> chunks)
        : _raw(std::move(raw)), _chunks(std::move(chunks)) {}

    Bytes _raw;
    std::vector<Chunk> _chunks;
};

} // namespace polyglot
