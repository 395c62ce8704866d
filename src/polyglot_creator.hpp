// Création de polyglottes : un PNG combiné à une archive ZIP ou à un WAV.
#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

#include "utilities.hpp"

namespace polyglot {

// Stratégies d'imbrication
enum class EmbedStrategy {
    AppendToImageData,       // "idat" : ZIP relocalisé ajouté au premier IDAT
    InsertTextChunk,         // "text" : ZIP comme charge d'un chunk tEXt
    WrapAsArchiveEntry,      // "zip"  : PNG stocké dans une archive neuve
    AppendAudioToImageData,  // "wav"  : WAV ajouté au premier IDAT
    EmbedInRiffChunk         // "riff" : PNG stocké dans un chunk "pnG " du WAV
};

// Nature du second fichier fourni avec le PNG
enum class SecondInput { Archive, Audio };

std::optional<EmbedStrategy> strategy_from_name(std::string_view name);
const char *to_string(EmbedStrategy strategy) noexcept;

// Stratégie par défaut selon le second fichier et l'extension de sortie.
EmbedStrategy default_strategy(SecondInput kind,
                               const std::filesystem::path &output);

// Orchestrateur à usage unique : create() consomme les deux entrées.
class PolyglotCreator {
public:
    PolyglotCreator(Bytes png, Bytes second, SecondInput kind,
                    const Options &opts = {},
                    std::filesystem::path label = "polyglotte");

    /**
     * Produit les octets du polyglotte.
     *
     * @throws PolyglotError AlreadyConsumed au second appel, StrategyMismatch
     *         si la stratégie ne correspond pas au second fichier, ainsi que
     *         toute erreur de parsing des entrées
     */
    Bytes create(EmbedStrategy strategy);

    bool consumed() const { return _consumed; }

private:
    Bytes appendArchiveToImageData();
    Bytes insertArchiveTextChunk();
    Bytes wrapImageInArchive();
    Bytes appendAudioToImageData();
    Bytes embedImageInRiff();

    Bytes _png;
    Bytes _second;
    SecondInput _kind;
    Options _opts;
    std::filesystem::path _label;
    bool _consumed = false;
};

} // namespace polyglot
