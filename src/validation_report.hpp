// Rapport de validation d'un polyglotte : statut, échecs par couche et
// rendu texte ou JSON (nlohmann::json).
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/errors.h"

namespace polyglot {

// Format qui occupe l'octet 0 du fichier
enum class Dominance { ContainerFirst, ArchiveFirst, AudioFirst };

// Nature de la charge utile trouvée dans le format externe
enum class PayloadKind { Archive, Audio, Image };

enum class ValidationStatus { Valid, InvalidOuter, InvalidInner, InvalidBoth };

const char *to_string(Dominance dominance) noexcept;
const char *to_string(PayloadKind kind) noexcept;
const char *to_string(ValidationStatus status) noexcept;

// Nom court du format externe ("PNG", "ZIP", "WAV").
const char *outer_format_name(Dominance dominance) noexcept;
const char *payload_format_name(PayloadKind kind) noexcept;

struct Failure {
    ErrorCode code = ErrorCode::BadSignature;
    std::string message;
    std::string subject;

    ErrorKind kind() const { return kind_of(code); }
    static Failure from(const PolyglotError &error);
};

// Chunk ou entrée listé en mode détaillé
struct StructureItem {
    std::string name;
    size_t offset = 0;
    size_t size = 0;
    std::string detail;
};

struct ValidationReport {
    ValidationStatus status = ValidationStatus::Valid;
    Dominance dominance = Dominance::ContainerFirst;
    std::optional<Failure> outerFailure;
    std::optional<Failure> innerFailure;
    std::optional<PayloadKind> innerKind;
    std::optional<size_t> innerOffset;
    std::optional<uint32_t> innerAnchor;  // ZIP uniquement
    std::vector<StructureItem> outerItems;
    std::vector<StructureItem> innerItems;

    bool valid() const { return status == ValidationStatus::Valid; }
};

ValidationStatus status_of(bool outerOk, bool innerOk) noexcept;

// `verbose` ajoute la liste des chunks et des entrées.
nlohmann::json report_to_json(const ValidationReport &report, bool verbose);
std::string format_report(const ValidationReport &report, bool verbose);

} // namespace polyglot
