// Utilitaires généraux : lecture/écriture d'entiers sur des tampons mémoire,
// chargement et écriture de fichiers entiers, journalisation.
//
// Ce fichier fournit :
// - Lecture/écriture d'entiers avec gestion de l'endianness
// - Recherche de signatures dans un tampon
// - Lecture et écriture atomique de fichiers complets
// - Fonctions de journalisation (info, warn)
// - Gestion des chemins longs sous Windows
#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <bit>
#include <cstring>
#include <span>
#include <vector>
#include <algorithm>
#include <type_traits>
#include <limits>
#include <utility>

#ifdef _WIN32
#include <windows.h>
#endif

namespace polyglot {

using Bytes = std::vector<uint8_t>;
using ByteView = std::span<const uint8_t>;

// Taille maximale d'un fichier chargé en mémoire (1 Gio par défaut).
constexpr uint64_t kMaxInputSize = 1ull << 30;

// Options de comportement de l'outil.
// Remplies depuis la ligne de commande, il n'y a pas de fichier de configuration.
struct Options {
    bool quiet = false;                       // Désactive les messages de log
    bool verbose = false;                     // Détaille chunks et entrées
    std::string entryName = "image.png";      // Nom de l'entrée ZIP (méthode zip)
    uint64_t maxInputSize = kMaxInputSize;    // Plafond de lecture des fichiers
};

// Concept C++20 : restreint un type template aux types entiers uniquement.
template <typename T>
concept Integral = std::is_integral_v<T>;

namespace detail {

// Implémentation interne de lecture scalaire avec gestion de l'endianness.
template <Integral T>
T read_scalar_impl(const uint8_t *bytes, bool bigEndian) {
    T value;
    if constexpr (sizeof(T) == 1) {
        value = bytes[0];
    } else {
        if (bigEndian != (std::endian::native == std::endian::big)) {
            std::array<uint8_t, sizeof(T)> swapped_bytes;
            std::reverse_copy(bytes, bytes + sizeof(T), swapped_bytes.begin());
            std::memcpy(&value, swapped_bytes.data(), sizeof(T));
        } else {
            std::memcpy(&value, bytes, sizeof(T));
        }
    }
    return value;
}

} // namespace detail

// Lit un scalaire T à la position `offset` d'un tampon.
//
// @param data       Tampon source
// @param offset     Position du premier octet
// @param bigEndian  Si true, interprète en big-endian
// @return           La valeur lue de type T
// @throws runtime_error si le tampon est trop petit
template <Integral T>
inline T read_scalar(ByteView data, size_t offset, bool bigEndian) {
    constexpr size_t size = sizeof(T);
    if (offset > data.size() || data.size() - offset < size) {
        throw std::runtime_error("Échec de la lecture de " +
                                 std::to_string(size) +
                                 " octets à l'offset " +
                                 std::to_string(offset));
    }
    return detail::read_scalar_impl<T>(data.data() + offset, bigEndian);
}

template <Integral T>
inline T read_scalar_le(ByteView data, size_t offset) {
    return read_scalar<T>(data, offset, false);
}

template <Integral T>
inline T read_scalar_be(ByteView data, size_t offset) {
    return read_scalar<T>(data, offset, true);
}

// Ajoute un entier en little-endian ou big-endian à la fin d'un vecteur.
void append_le16(Bytes &out, uint16_t value);
void append_le32(Bytes &out, uint32_t value);
void append_be32(Bytes &out, uint32_t value);

// Écrit un entier à une position existante du tampon.
// @throws runtime_error si l'écriture déborde du tampon
void write_le16(Bytes &dst, size_t offset, uint16_t value);
void write_le32(Bytes &dst, size_t offset, uint32_t value);

// CRC-32 (zlib) : poursuit `crc` sur `data`, ou calcule celui d'un tampon.
uint32_t crc32_update(uint32_t crc, ByteView data);
uint32_t crc32_of(ByteView data);

// Cherche `needle` dans `haystack` à partir de `from`.
// Retourne la position absolue de la première occurrence.
std::optional<size_t> find_signature(ByteView haystack, ByteView needle,
                                     size_t from = 0);

// Toutes les occurrences de `needle` à partir de `from`, dans l'ordre.
std::vector<size_t> find_all_signatures(ByteView haystack, ByteView needle,
                                        size_t from = 0);

// Rend une étiquette de chunk (4 octets) lisible, les octets non
// imprimables étant remplacés par '?'.
std::string printable_tag(ByteView tag);

// Charge un fichier complet en mémoire.
//
// Le fichier est ouvert, lu intégralement puis fermé dans tous les cas.
// @throws PolyglotError (IoFailure) si le fichier est illisible,
//         PolyglotError (SizeOverflow) s'il dépasse opt.maxInputSize
Bytes read_file(const std::filesystem::path &path, const Options &opt);

// Écrit un fichier complet.
//
// Les données sont écrites dans un fichier temporaire voisin puis renommées :
// en cas d'échec, aucun fichier partiel ne subsiste.
// @throws PolyglotError (IoFailure)
void write_file(const std::filesystem::path &path, ByteView data);

// Fonctions de journalisation (info, avertissement).
// Toutes sont désactivées si Options::quiet est true.
void log_info(const std::filesystem::path &path, const std::string &msg,
              const Options &opt);
void log_warn(const std::filesystem::path &path, const std::string &msg,
              const Options &opt);

#ifdef _WIN32
// Convertit un chemin Windows en format long (\\?\...) pour dépasser
// la limite de 260 caractères.
std::wstring make_long_path(const std::wstring &path);
#endif

// Convertit un chemin en version compatible longs chemins (Windows uniquement).
// Retourne une paire : (chemin compatible, version UTF-8).
std::pair<std::filesystem::path, std::string>
to_long_path(const std::filesystem::path &path);

} // namespace polyglot
