#include "polyglot_creator.hpp"

#include <utility>

#include "core/errors.h"
#include "core/png_container.h"
#include "core/zip_archive.h"
#include "core/zip_offsets.h"
#include "formats/riff_wave.h"

namespace polyglot {

namespace {

bool needs_archive(EmbedStrategy strategy) {
    return strategy == EmbedStrategy::AppendToImageData ||
           strategy == EmbedStrategy::InsertTextChunk;
}

bool needs_audio(EmbedStrategy strategy) {
    return strategy == EmbedStrategy::AppendAudioToImageData ||
           strategy == EmbedStrategy::EmbedInRiffChunk;
}

// Position absolue, dans le PNG sérialisé, de la fin des données du premier IDAT.
size_t end_of_first_image_data(const PngContainer &png) {
    auto index = png.findFirstChunk(kTagIDAT);
    if (!index) {
        throw PolyglotError(ErrorCode::MissingChunk, "Aucun chunk IDAT trouvé",
                            "IDAT");
    }
    return png.dataOffset(*index) + png.chunks()[*index].data.size();
}

} // namespace

std::optional<EmbedStrategy> strategy_from_name(std::string_view name) {
    if (name == "idat") return EmbedStrategy::AppendToImageData;
    if (name == "text") return EmbedStrategy::InsertTextChunk;
    if (name == "zip") return EmbedStrategy::WrapAsArchiveEntry;
    if (name == "wav") return EmbedStrategy::AppendAudioToImageData;
    if (name == "riff") return EmbedStrategy::EmbedInRiffChunk;
    return std::nullopt;
}

const char *to_string(EmbedStrategy strategy) noexcept {
    switch (strategy) {
    case EmbedStrategy::AppendToImageData: return "idat";
    case EmbedStrategy::InsertTextChunk: return "text";
    case EmbedStrategy::WrapAsArchiveEntry: return "zip";
    case EmbedStrategy::AppendAudioToImageData: return "wav";
    case EmbedStrategy::EmbedInRiffChunk: return "riff";
    }
    return "?";
}

EmbedStrategy default_strategy(SecondInput kind,
                               const std::filesystem::path &output) {
    const std::string ext = output.extension().string();
    if (kind == SecondInput::Audio) {
        return (ext == ".wav" || ext == ".WAV") ? EmbedStrategy::EmbedInRiffChunk
                                                : EmbedStrategy::AppendAudioToImageData;
    }
    if (ext == ".zip" || ext == ".ZIP") {
        return EmbedStrategy::WrapAsArchiveEntry;
    }
    return EmbedStrategy::InsertTextChunk;
}

PolyglotCreator::PolyglotCreator(Bytes png, Bytes second, SecondInput kind,
                                 const Options &opts, std::filesystem::path label)
    : _png(std::move(png)),
      _second(std::move(second)),
      _kind(kind),
      _opts(opts),
      _label(std::move(label)) {}

Bytes PolyglotCreator::create(EmbedStrategy strategy) {
    if (_consumed) {
        throw PolyglotError(ErrorCode::AlreadyConsumed,
                            "Les entrées ont déjà été consommées par une création");
    }
    if ((needs_archive(strategy) && _kind != SecondInput::Archive) ||
        (needs_audio(strategy) && _kind != SecondInput::Audio)) {
        throw PolyglotError(ErrorCode::StrategyMismatch,
                            std::string("La méthode ") + to_string(strategy) +
                                " ne s'applique pas à ce second fichier");
    }
    _consumed = true;

    switch (strategy) {
    case EmbedStrategy::AppendToImageData:
        return appendArchiveToImageData();
    case EmbedStrategy::InsertTextChunk:
        return insertArchiveTextChunk();
    case EmbedStrategy::WrapAsArchiveEntry:
        return wrapImageInArchive();
    case EmbedStrategy::AppendAudioToImageData:
        return appendAudioToImageData();
    case EmbedStrategy::EmbedInRiffChunk:
        return embedImageInRiff();
    }
    throw PolyglotError(ErrorCode::StrategyMismatch, "Méthode inconnue");
}

Bytes PolyglotCreator::appendArchiveToImageData() {
    PngContainer png = PngContainer::parse(_png);
    const size_t position = end_of_first_image_data(png);
    ZipArchive zip = ZipArchive::parse(std::move(_second));

    const int64_t shift = static_cast<int64_t>(position) - zip.anchor();
    log_info(_label, "Relocalisation de " + std::to_string(zip.entries().size()) +
                         " entrée(s) de +" + std::to_string(shift) + " octets",
             _opts);
    RelocatedArchive relocated = relocate(std::move(zip), shift);

    PngContainer out =
        std::move(png).appendToFirstChunk(kTagIDAT, relocated.bytes());
    return std::move(out).release();
}

Bytes PolyglotCreator::insertArchiveTextChunk() {
    PngContainer png = PngContainer::parse(_png);
    // Archive contrôlée puis embarquée entière, octets suivant le trailer compris
    const ZipArchive zip = ZipArchive::parse(ByteView(_second));
    log_info(_label, "Archive de " + std::to_string(_second.size()) + " octets (" +
                         std::to_string(zip.entries().size()) +
                         " entrée(s)) insérée dans un chunk tEXt",
             _opts);
    PngContainer out = std::move(png).insertChunkBeforeEnd(kTagTEXT, _second);
    return std::move(out).release();
}

Bytes PolyglotCreator::wrapImageInArchive() {
    PngContainer png = PngContainer::parse(_png);
    log_info(_label, "PNG stocké comme entrée " + _opts.entryName, _opts);
    return build_single_entry_archive(_opts.entryName, png.bytes());
}

Bytes PolyglotCreator::appendAudioToImageData() {
    PngContainer png = PngContainer::parse(_png);
    end_of_first_image_data(png);  // IDAT requis
    const RiffWave wave = RiffWave::parse(_second);
    const size_t length = size_t{wave.riffSize()} + 8;

    log_info(_label, "WAV de " + std::to_string(length) +
                         " octets ajouté au premier IDAT",
             _opts);
    PngContainer out = std::move(png).appendToFirstChunk(
        kTagIDAT, ByteView(_second.data(), length));
    return std::move(out).release();
}

Bytes PolyglotCreator::embedImageInRiff() {
    PngContainer png = PngContainer::parse(_png);
    RiffWave wave = RiffWave::parse(_second);
    log_info(_label, "PNG de " + std::to_string(png.byteLength()) +
                         " octets stocké dans un chunk pnG ",
             _opts);
    return std::move(wave).embedPng(png.bytes()).serialize();
}

} // namespace polyglot
