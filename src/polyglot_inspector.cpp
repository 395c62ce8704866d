#include "polyglot_inspector.hpp"

#include <algorithm>
#include <optional>
#include <utility>
#include <variant>

#include "core/errors.h"
#include "core/png_container.h"
#include "core/zip_archive.h"
#include "core/zip_offsets.h"
#include "formats/riff_wave.h"

namespace polyglot {

namespace {

constexpr std::array<uint8_t, 4> kRiffSignature = {'R', 'I', 'F', 'F'};

// Fin de l'en-tête fixe de chaque format externe : la recherche de la
// charge utile commence après.
size_t outer_header_size(Dominance dominance) {
    switch (dominance) {
    case Dominance::ContainerFirst: return kPngSignature.size();
    case Dominance::ArchiveFirst: return kZipSignature.size();
    case Dominance::AudioFirst: return kRiffHeaderSize;
    }
    return 0;
}

Bytes tail(ByteView data, size_t from) {
    return Bytes(data.begin() + static_cast<std::ptrdiff_t>(from), data.end());
}

std::string describe_png_chunk(const Chunk &chunk) {
    const ChunkInfo info = decode_chunk(chunk);
    if (const auto *h = std::get_if<ImageHeader>(&info)) {
        return std::to_string(h->width) + "x" + std::to_string(h->height) +
               ", " + std::to_string(h->bitDepth) + " bits, type " +
               std::to_string(h->colorType);
    }
    if (const auto *t = std::get_if<TextualData>(&info)) {
        return "mot-clé \"" + t->keyword + "\"";
    }
    return {};
}

std::vector<StructureItem> png_items(const PngContainer &png, size_t base) {
    std::vector<StructureItem> items;
    for (const auto &chunk : png.chunks()) {
        items.push_back({chunk.tagName(), base + chunk.offset, chunk.data.size(),
                         describe_png_chunk(chunk)});
    }
    return items;
}

std::vector<StructureItem> zip_items(const ZipArchive &zip) {
    std::vector<StructureItem> items;
    for (const auto &entry : zip.entries()) {
        items.push_back({entry.name, entry.localHeaderOffset, entry.compressedSize,
                         "méthode " + std::to_string(entry.method) + ", " +
                             std::to_string(entry.uncompressedSize) +
                             " octets décompressés"});
    }
    return items;
}

std::vector<StructureItem> riff_items(const RiffWave &wave, size_t base) {
    std::vector<StructureItem> items;
    for (const auto &chunk : wave.chunks()) {
        std::string detail;
        if (chunk.type == kFmtTag) {
            if (auto f = wave.format()) {
                detail = std::to_string(f->channels) + " canal(aux), " +
                         std::to_string(f->sampleRate) + " Hz, " +
                         std::to_string(f->bitsPerSample) + " bits";
            }
        }
        items.push_back({chunk.tagName(), base + chunk.offset, chunk.data.size(),
                         std::move(detail)});
    }
    return items;
}

// Résultat d'une recherche de charge utile
struct InnerMatch {
    PayloadKind kind = PayloadKind::Archive;
    size_t offset = 0;
    std::optional<uint32_t> anchor;
    std::vector<StructureItem> items;
};

struct InnerSearch {
    std::optional<InnerMatch> match;
    std::optional<PolyglotError> firstFailure;

    void fail(const PolyglotError &error) {
        if (!firstFailure) {
            firstFailure = error;
        }
    }
};

// Ancres essayées pour une archive à la position `pos` : 0 puis `pos`.
std::vector<uint32_t> candidate_anchors(size_t pos) {
    std::vector<uint32_t> anchors{0};
    if (pos != 0 && pos <= kZip64Value - 1) {
        anchors.push_back(static_cast<uint32_t>(pos));
    }
    return anchors;
}

void search_archive(ByteView data, size_t from, InnerSearch &search) {
    for (size_t pos : find_all_signatures(data, kZipSignature, from)) {
        for (uint32_t anchor : candidate_anchors(pos)) {
            try {
                ZipArchive zip = ZipArchive::parse(data.subspan(pos), anchor);
                search.match = InnerMatch{PayloadKind::Archive, pos, anchor,
                                          zip_items(zip)};
                return;
            } catch (const PolyglotError &e) {
                search.fail(e);
            }
        }
    }
}

void search_audio(ByteView data, size_t from, InnerSearch &search) {
    for (size_t pos : find_all_signatures(data, kRiffSignature, from)) {
        try {
            RiffWave wave = RiffWave::parse(data.subspan(pos));
            search.match =
                InnerMatch{PayloadKind::Audio, pos, std::nullopt, riff_items(wave, pos)};
            return;
        } catch (const PolyglotError &e) {
            search.fail(e);
        }
    }
}

void search_image(ByteView data, size_t from, InnerSearch &search) {
    for (size_t pos : find_all_signatures(data, kPngSignature, from)) {
        try {
            PngContainer png = PngContainer::parse(data.subspan(pos));
            search.match =
                InnerMatch{PayloadKind::Image, pos, std::nullopt, png_items(png, pos)};
            return;
        } catch (const PolyglotError &e) {
            search.fail(e);
        }
    }
}

// Entrées compressées d'une archive externe valide : la signature PNG
// n'apparaît qu'après décompression.
void search_image_in_entries(const ZipArchive &zip, InnerSearch &search) {
    for (const auto &entry : zip.entries()) {
        if (entry.method == kMethodStored) {
            continue;
        }
        try {
            Bytes content = zip.readEntry(entry);
            if (!has_png_signature(content)) {
                continue;
            }
            PngContainer png = PngContainer::parse(content);
            search.match = InnerMatch{PayloadKind::Image, entry.localHeaderOffset,
                                      std::nullopt, png_items(png, 0)};
            return;
        } catch (const PolyglotError &e) {
            search.fail(e);
        }
    }
}

Failure missing_payload(Dominance dominance) {
    return Failure{ErrorCode::PayloadNotFound,
                   std::string("Aucune charge utile trouvée dans le ") +
                       outer_format_name(dominance),
                   {}};
}

// Fin de la zone où peut s'étendre une archive commençant à `pos` : fin des
// données du chunk qui la contient, ou fin du fichier hors de tout chunk.
size_t archive_region_end(const PngContainer &png, size_t pos, size_t fileSize) {
    for (size_t i = 0; i < png.chunks().size(); ++i) {
        const size_t start = png.dataOffset(i);
        const size_t end = start + png.chunks()[i].data.size();
        if (pos >= start && pos < end) {
            return end;
        }
    }
    return fileSize;
}

Extraction extract_from_png(ByteView data, const Options &opts,
                            const std::filesystem::path &label) {
    const PngContainer png = PngContainer::parse(data);

    const size_t from = kPngSignature.size();
    std::vector<std::pair<size_t, PayloadKind>> candidates;
    for (size_t pos : find_all_signatures(data, kZipSignature, from)) {
        candidates.emplace_back(pos, PayloadKind::Archive);
    }
    for (size_t pos : find_all_signatures(data, kRiffSignature, from)) {
        candidates.emplace_back(pos, PayloadKind::Audio);
    }
    std::sort(candidates.begin(), candidates.end());

    std::optional<PolyglotError> firstFailure;
    std::optional<size_t> unboundedArchive;

    for (const auto &[pos, kind] : candidates) {
        if (kind == PayloadKind::Audio) {
            try {
                RiffWave::parse(data.subspan(pos));
                const size_t length = *declared_length(data.subspan(pos));
                return Extraction{PayloadKind::Audio,
                                  Bytes(data.begin() + static_cast<std::ptrdiff_t>(pos),
                                        data.begin() + static_cast<std::ptrdiff_t>(pos + length)),
                                  pos, true};
            } catch (const PolyglotError &e) {
                if (!firstFailure) firstFailure = e;
            }
            continue;
        }

        // Dans un chunk, tout le reste de ses données appartient à l'archive.
        // Sinon, ou si l'archive déborde du chunk, elle s'arrête à son trailer.
        const size_t chunkEnd = archive_region_end(png, pos, data.size());
        std::vector<size_t> ends{chunkEnd};
        if (chunkEnd != data.size()) {
            ends.push_back(data.size());
        }
        for (size_t end : ends) {
            const ByteView region = data.subspan(pos, end - pos);
            for (uint32_t anchor : candidate_anchors(pos)) {
                try {
                    ZipArchive zip = ZipArchive::parse(region, anchor);
                    const size_t length =
                        end == data.size() ? zip.archiveEnd() : region.size();
                    Bytes bytes;
                    if (anchor == 0) {
                        bytes.assign(region.begin(), region.end());
                    } else {
                        log_info(label, "Archive aux offsets absolus (ancre " +
                                            std::to_string(anchor) +
                                            "), relocalisation inverse",
                                 opts);
                        bytes = relocate(std::move(zip), -static_cast<int64_t>(anchor))
                                    .release();
                    }
                    bytes.resize(length);
                    return Extraction{PayloadKind::Archive, std::move(bytes), pos, true};
                } catch (const PolyglotError &e) {
                    if (!firstFailure) firstFailure = e;
                    if (e.code() == ErrorCode::TrailerNotFound && !unboundedArchive) {
                        unboundedArchive = pos;
                    }
                }
            }
        }
    }

    if (unboundedArchive) {
        log_warn(label, "Signature ZIP sans trailer à l'offset " +
                            std::to_string(*unboundedArchive) +
                            " : extraction jusqu'à la fin du fichier",
                 opts);
        return Extraction{PayloadKind::Archive, tail(data, *unboundedArchive),
                          *unboundedArchive, false};
    }
    if (firstFailure) {
        throw ExtractionError(*firstFailure);
    }
    throw ExtractionError(ErrorCode::PayloadNotFound,
                          "Aucune archive ni aucun WAV dans le PNG");
}

Extraction extract_from_zip(ByteView data) {
    ZipArchive zip = ZipArchive::parse(data);
    if (zip.entries().empty()) {
        throw ExtractionError(ErrorCode::PayloadNotFound, "Archive vide");
    }

    try {
        for (const auto &entry : zip.entries()) {
            Bytes content = zip.readEntry(entry);
            if (has_png_signature(content)) {
                return Extraction{PayloadKind::Image, std::move(content),
                                  entry.localHeaderOffset, true};
            }
        }
        const DirectoryEntry &first = zip.entries().front();
        return Extraction{PayloadKind::Image, zip.readEntry(first),
                          first.localHeaderOffset, true};
    } catch (const PolyglotError &e) {
        throw ExtractionError(e);
    }
}

Extraction extract_from_wav(ByteView data) {
    RiffWave wave = RiffWave::parse(data);
    auto index = wave.findChunk(kPngChunkTag);
    if (!index) {
        throw ExtractionError(ErrorCode::PayloadNotFound,
                              "Aucun chunk pnG dans le WAV", "pnG ");
    }
    const RiffChunk &chunk = wave.chunks()[*index];
    return Extraction{PayloadKind::Image, chunk.data, chunk.offset + 8, true};
}

} // namespace

Dominance detect_dominant(ByteView data) {
    if (has_png_signature(data)) {
        return Dominance::ContainerFirst;
    }
    if (data.size() >= kZipSignature.size() &&
        std::equal(kZipSignature.begin(), kZipSignature.end(), data.begin())) {
        return Dominance::ArchiveFirst;
    }
    if (has_wave_signature(data)) {
        return Dominance::AudioFirst;
    }
    // PNG à la signature endommagée : IHDR de 13 octets juste après
    const size_t ihdr = kPngSignature.size();
    if (data.size() >= ihdr + 8 && read_scalar_be<uint32_t>(data, ihdr) == 13 &&
        std::equal(kTagIHDR.begin(), kTagIHDR.end(), data.begin() + ihdr + 4)) {
        return Dominance::ContainerFirst;
    }
    return Dominance::ArchiveFirst;
}

ValidationReport validate(ByteView data) {
    ValidationReport report;
    report.dominance = detect_dominant(data);

    std::optional<ZipArchive> outerZip;
    try {
        switch (report.dominance) {
        case Dominance::ContainerFirst:
            report.outerItems = png_items(PngContainer::parse(data), 0);
            break;
        case Dominance::ArchiveFirst:
            outerZip.emplace(ZipArchive::parse(data));
            report.outerItems = zip_items(*outerZip);
            break;
        case Dominance::AudioFirst:
            report.outerItems = riff_items(RiffWave::parse(data), 0);
            break;
        }
    } catch (const PolyglotError &e) {
        report.outerFailure = Failure::from(e);
    }

    InnerSearch search;
    const size_t from = std::min(outer_header_size(report.dominance), data.size());
    switch (report.dominance) {
    case Dominance::ContainerFirst:
        search_archive(data, from, search);
        if (!search.match) {
            search_audio(data, from, search);
        }
        break;
    case Dominance::ArchiveFirst:
        search_image(data, from, search);
        if (!search.match && outerZip) {
            search_image_in_entries(*outerZip, search);
        }
        break;
    case Dominance::AudioFirst:
        search_image(data, from, search);
        break;
    }

    if (search.match) {
        report.innerKind = search.match->kind;
        report.innerOffset = search.match->offset;
        report.innerAnchor = search.match->anchor;
        report.innerItems = std::move(search.match->items);
    } else if (search.firstFailure) {
        report.innerFailure = Failure::from(*search.firstFailure);
    } else {
        report.innerFailure = missing_payload(report.dominance);
    }

    report.status = status_of(!report.outerFailure, !report.innerFailure);
    return report;
}

Extraction extract(ByteView data, const Options &opts,
                   const std::filesystem::path &label) {
    switch (detect_dominant(data)) {
    case Dominance::ContainerFirst:
        return extract_from_png(data, opts, label);
    case Dominance::ArchiveFirst:
        return extract_from_zip(data);
    case Dominance::AudioFirst:
        return extract_from_wav(data);
    }
    throw PolyglotError(ErrorCode::BadSignature, "Format externe inconnu");
}

} // namespace polyglot
