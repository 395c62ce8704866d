/**
 * @file errors.h
 * @brief Taxonomie des erreurs du moteur de polyglottes PNG/ZIP
 *
 * Toutes les erreurs de parsing, de création et d'extraction sont levées
 * sous forme de PolyglotError (dérivée de std::runtime_error). Le code
 * précis (ErrorCode) se rattache à une famille (ErrorKind) que l'appelant
 * peut tester sans analyser le message.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace polyglot {

/**
 * @brief Familles d'erreurs
 */
enum class ErrorKind {
    MalformedInput,       // Signature absente, tampon tronqué
    IntegrityFailure,     // CRC incohérent
    StructuralNotFound,   // Trailer, entrée ou chunk attendu absent
    UnsupportedVariant,   // ZIP64, méthode de compression exotique
    CapacityExceeded,     // Offset ou taille hors de la largeur du champ
    SequencingViolation,  // Double relocalisation, stratégie inapplicable
    Io                    // Lecture ou écriture de fichier
};

/**
 * @brief Codes d'erreur détaillés
 */
enum class ErrorCode {
    BadSignature,
    Truncated,
    InconsistentDirectory,
    ChecksumMismatch,
    TrailerNotFound,
    EntryNotFound,
    MissingChunk,
    PayloadNotFound,
    Unsupported64Bit,
    UnsupportedMethod,
    MultiVolume,
    OffsetOverflow,
    SizeOverflow,
    AlreadyRelocated,
    AlreadyConsumed,
    StrategyMismatch,
    IoFailure
};

ErrorKind kind_of(ErrorCode code) noexcept;
const char *to_string(ErrorKind kind) noexcept;
const char *to_string(ErrorCode code) noexcept;

class PolyglotError : public std::runtime_error {
public:
    /**
     * @param code     Code détaillé
     * @param message  Message lisible (français)
     * @param subject  Chunk ou entrée fautif, vide si sans objet
     */
    PolyglotError(ErrorCode code, const std::string &message,
                  std::string subject = {});

    ErrorCode code() const noexcept { return _code; }
    ErrorKind kind() const noexcept { return kind_of(_code); }
    const std::string &subject() const noexcept { return _subject; }

private:
    ErrorCode _code;
    std::string _subject;
};

/**
 * @brief Échec portant sur la charge utile embarquée
 *
 * Distingue « le fichier externe est sain mais la charge utile est
 * corrompue ou introuvable » d'un échec de parsing du format externe.
 */
class ExtractionError : public PolyglotError {
public:
    using PolyglotError::PolyglotError;
    explicit ExtractionError(const PolyglotError &cause);
};

} // namespace polyglot
