/**
 * @file riff_wave.h
 * @brief Modèle RIFF/WAVE : lecture des chunks, PNG embarqué en chunk "pnG "
 *
 * Un fichier WAVE est un en-tête RIFF (étiquette, taille, "WAVE") suivi de
 * chunks étiquette + taille little-endian + données, complétés à une
 * longueur paire. Seuls "fmt " et "data" sont exigés.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../utilities.hpp"

namespace polyglot {

using FourCC = std::array<uint8_t, 4>;

inline constexpr FourCC kRiffTag = {'R', 'I', 'F', 'F'};
inline constexpr FourCC kWaveTag = {'W', 'A', 'V', 'E'};
inline constexpr FourCC kFmtTag = {'f', 'm', 't', ' '};
inline constexpr FourCC kDataTag = {'d', 'a', 't', 'a'};
// Chunk privé portant un PNG (ignoré par les lecteurs audio)
inline constexpr FourCC kPngChunkTag = {'p', 'n', 'G', ' '};

// "RIFF" + taille + "WAVE"
inline constexpr size_t kRiffHeaderSize = 12;

/**
 * Chunk RIFF : fourcc[4] + taille[4B LE] + données, complété à une
 * longueur paire par un octet nul non compté dans la taille.
 */
struct RiffChunk {
    FourCC type{};
    Bytes data;
    size_t offset = 0;  // Position de l'en-tête dans le tampon d'origine

    std::string tagName() const { return printable_tag(type); }
};

/**
 * Contenu du chunk "fmt " (PCM et dérivés)
 */
struct WaveFormat {
    uint16_t audioFormat = 0;
    uint16_t channels = 0;
    uint32_t sampleRate = 0;
    uint32_t byteRate = 0;
    uint16_t blockAlign = 0;
    uint16_t bitsPerSample = 0;
};

// true si le tampon commence par "RIFF" ....  "WAVE".
bool has_wave_signature(ByteView data);

// Longueur totale annoncée par l'en-tête RIFF (taille + 8), ou nullopt si
// l'en-tête est absent.
std::optional<size_t> declared_length(ByteView data);

/**
 * Fichier RIFF/WAVE réduit à sa liste de chunks.
 *
 * Le parsing est borné par la taille RIFF déclarée : les octets qui suivent
 * (par exemple la fin d'un chunk PNG quand le WAV est embarqué dans IDAT)
 * sont ignorés.
 */
class RiffWave {
public:
    /**
     * @throws PolyglotError BadSignature, Truncated, MissingChunk ("fmt "
     *         ou "data" absent)
     */
    static RiffWave parse(ByteView data);

    // En-tête RIFF recalculé + chunks complétés à une longueur paire.
    Bytes serialize() const;

    /**
     * Insère un chunk "pnG " portant `png` juste après le chunk "data".
     * @throws PolyglotError SizeOverflow si la taille RIFF dépasse 32 bits
     */
    RiffWave embedPng(ByteView png) &&;

    // Index du premier chunk `tag` ("pnG " pour le PNG embarqué).
    std::optional<size_t> findChunk(const FourCC &tag) const;
    std::optional<WaveFormat> format() const;

    const std::vector<RiffChunk> &chunks() const { return _chunks; }
    // Taille déclarée dans l'en-tête du tampon d'origine
    uint32_t riffSize() const { return _riffSize; }

private:
    RiffWave(std::vector<RiffChunk> chunks, uint32_t riffSize)
        : _chunks(std::move(chunks)), _riffSize(riffSize) {}

    std::vector<RiffChunk> _chunks;
    uint32_t _riffSize = 0;
};

} // namespace polyglot
