/**
 * @file polyglot_inspector.hpp
 * @brief Détection du format dominant, validation et extraction
 *
 * Le format dominant est celui dont la signature occupe l'octet 0. La
 * charge utile est cherchée à chaque occurrence de sa signature après
 * l'en-tête fixe du format externe ; pour une archive ZIP, les deux ancres
 * possibles sont essayées : 0 (offsets relatifs à l'archive, stratégie
 * tEXt) et la position de l'archive dans le fichier (stratégie IDAT).
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>

#include "utilities.hpp"
#include "validation_report.hpp"

namespace polyglot {

/**
 * Signature PNG : ContainerFirst (testé en premier). "PK\3\4" : ArchiveFirst.
 * "RIFF....WAVE" : AudioFirst. Sans signature reconnue, un en-tête de chunk
 * IHDR à l'offset 8 désigne un PNG endommagé (ContainerFirst) ; sinon
 * ArchiveFirst.
 */
Dominance detect_dominant(ByteView data);

/**
 * Valide les deux couches. Les deux analyses sont toujours tentées, même
 * quand la première échoue ; aucune exception de parsing ne sort d'ici.
 */
ValidationReport validate(ByteView data);

struct Extraction {
    PayloadKind kind = PayloadKind::Archive;
    Bytes bytes;
    size_t offset = 0;     // Position de la charge utile dans le polyglotte
    bool bounded = true;   // false : fin de la charge non déterminée
};

/**
 * Extrait la charge utile octet pour octet.
 *
 * Une archive aux offsets absolus est relocalisée de -ancre pour rendre
 * l'archive d'origine. Si une signature ZIP est trouvée sans trailer, la
 * fin du fichier est rendue avec bounded = false et un avertissement.
 *
 * @throws PolyglotError si le format externe est invalide,
 *         ExtractionError si la charge utile est absente ou corrompue
 */
Extraction extract(ByteView data, const Options &opts = {},
                   const std::filesystem::path &label = "polyglotte");

} // namespace polyglot
