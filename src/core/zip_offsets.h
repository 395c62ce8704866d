/**
 * @file zip_offsets.h
 * @brief Relocalisation des offsets absolus d'une archive ZIP
 *
 * Quand une archive est déplacée d'un bloc de `shift` octets à l'intérieur
 * d'un autre fichier, chaque offset d'en-tête local du répertoire central
 * (champ +42) et l'offset du répertoire dans le trailer (champ +16) doivent
 * être décalés d'autant pour que les lecteurs ZIP retrouvent les données.
 *
 * La transformation consomme l'archive source : une archive ne peut être
 * relocalisée qu'une fois. Le résultat n'offre aucune relocalisation ;
 * pour décaler à nouveau, il faut re-parser ses octets avec la nouvelle
 * ancre.
 */

#pragma once

#include <cstdint>
#include <vector>

#include "zip_archive.h"

namespace polyglot {

class RelocatedArchive {
public:
    const Bytes &bytes() const { return _data; }
    uint32_t anchor() const { return _anchor; }
    int64_t shift() const { return _shift; }
    const DirectoryTrailer &trailer() const { return _trailer; }
    const std::vector<DirectoryEntry> &entries() const { return _entries; }

    Bytes release() && { return std::move(_data); }

private:
    RelocatedArchive(Bytes data, uint32_t anchor, int64_t shift,
                     DirectoryTrailer trailer, std::vector<DirectoryEntry> entries);

    friend RelocatedArchive relocate(ZipArchive &&archive, int64_t shift);

    Bytes _data;
    uint32_t _anchor;
    int64_t _shift;
    DirectoryTrailer _trailer;
    std::vector<DirectoryEntry> _entries;
};

/**
 * @brief Décale tous les offsets absolus de l'archive de `shift` octets
 *
 * Les octets qui suivent le trailer sont conservés tels quels. L'ancre du
 * résultat vaut `archive.anchor() + shift`.
 *
 * @throws PolyglotError AlreadyRelocated si l'archive a déjà été consommée,
 *         OffsetOverflow si un offset sort de [0, 0xFFFFFFFE] (rien n'est
 *         alors modifié et l'archive reste utilisable)
 */
RelocatedArchive relocate(ZipArchive &&archive, int64_t shift);

} // namespace polyglot
