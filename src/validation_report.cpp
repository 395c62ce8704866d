#include "validation_report.hpp"

#include <sstream>

namespace polyglot {

namespace {

nlohmann::json failure_to_json(const std::optional<Failure> &failure) {
    if (!failure) {
        return nullptr;
    }
    nlohmann::json j;
    j["kind"] = to_string(failure->kind());
    j["code"] = to_string(failure->code);
    j["message"] = failure->message;
    if (!failure->subject.empty()) {
        j["subject"] = failure->subject;
    }
    return j;
}

nlohmann::json items_to_json(const std::vector<StructureItem> &items) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto &item : items) {
        nlohmann::json j;
        j["name"] = item.name;
        j["offset"] = item.offset;
        j["size"] = item.size;
        if (!item.detail.empty()) {
            j["detail"] = item.detail;
        }
        list.push_back(std::move(j));
    }
    return list;
}

void write_failure(std::ostringstream &out, const Failure &failure) {
    out << "ÉCHEC [" << to_string(failure.kind()) << "/"
        << to_string(failure.code) << "] " << failure.message;
    if (!failure.subject.empty()) {
        out << " (" << failure.subject << ")";
    }
    out << '\n';
}

void write_items(std::ostringstream &out, const std::vector<StructureItem> &items) {
    for (const auto &item : items) {
        out << "    - " << item.name << " @" << item.offset << " (" << item.size
            << " octets)";
        if (!item.detail.empty()) {
            out << " " << item.detail;
        }
        out << '\n';
    }
}

} // namespace

const char *to_string(Dominance dominance) noexcept {
    switch (dominance) {
    case Dominance::ContainerFirst: return "ContainerFirst";
    case Dominance::ArchiveFirst: return "ArchiveFirst";
    case Dominance::AudioFirst: return "AudioFirst";
    }
    return "?";
}

const char *to_string(PayloadKind kind) noexcept {
    switch (kind) {
    case PayloadKind::Archive: return "Archive";
    case PayloadKind::Audio: return "Audio";
    case PayloadKind::Image: return "Image";
    }
    return "?";
}

const char *to_string(ValidationStatus status) noexcept {
    switch (status) {
    case ValidationStatus::Valid: return "Valid";
    case ValidationStatus::InvalidOuter: return "InvalidOuter";
    case ValidationStatus::InvalidInner: return "InvalidInner";
    case ValidationStatus::InvalidBoth: return "InvalidBoth";
    }
    return "?";
}

const char *outer_format_name(Dominance dominance) noexcept {
    switch (dominance) {
    case Dominance::ContainerFirst: return "PNG";
    case Dominance::ArchiveFirst: return "ZIP";
    case Dominance::AudioFirst: return "WAV";
    }
    return "?";
}

const char *payload_format_name(PayloadKind kind) noexcept {
    switch (kind) {
    case PayloadKind::Archive: return "ZIP";
    case PayloadKind::Audio: return "WAV";
    case PayloadKind::Image: return "PNG";
    }
    return "?";
}

Failure Failure::from(const PolyglotError &error) {
    return Failure{error.code(), error.what(), error.subject()};
}

ValidationStatus status_of(bool outerOk, bool innerOk) noexcept {
    if (outerOk && innerOk) return ValidationStatus::Valid;
    if (innerOk) return ValidationStatus::InvalidOuter;
    if (outerOk) return ValidationStatus::InvalidInner;
    return ValidationStatus::InvalidBoth;
}

nlohmann::json report_to_json(const ValidationReport &report, bool verbose) {
    nlohmann::json j;
    j["status"] = to_string(report.status);
    j["valid"] = report.valid();
    j["dominance"] = to_string(report.dominance);
    j["outer"] = {{"format", outer_format_name(report.dominance)},
                  {"failure", failure_to_json(report.outerFailure)}};

    nlohmann::json inner;
    inner["format"] = report.innerKind ? payload_format_name(*report.innerKind) : "";
    inner["offset"] = report.innerOffset ? nlohmann::json(*report.innerOffset)
                                         : nlohmann::json(nullptr);
    if (report.innerAnchor) {
        inner["anchor"] = *report.innerAnchor;
    }
    inner["failure"] = failure_to_json(report.innerFailure);
    j["inner"] = std::move(inner);

    if (verbose) {
        j["outer"]["items"] = items_to_json(report.outerItems);
        j["inner"]["items"] = items_to_json(report.innerItems);
    }
    return j;
}

std::string format_report(const ValidationReport &report, bool verbose) {
    std::ostringstream out;
    out << "Statut : " << (report.valid() ? "VALIDE" : "INVALIDE") << " ("
        << to_string(report.status) << ")\n";

    out << "Format externe " << outer_format_name(report.dominance) << " : ";
    if (report.outerFailure) {
        write_failure(out, *report.outerFailure);
    } else {
        out << "OK\n";
    }
    if (verbose) {
        write_items(out, report.outerItems);
    }

    out << "Charge utile";
    if (report.innerKind) {
        out << " " << payload_format_name(*report.innerKind);
    }
    if (report.innerOffset) {
        out << " @" << *report.innerOffset;
    }
    if (report.innerAnchor) {
        out << " (ancre " << *report.innerAnchor << ")";
    }
    out << " : ";
    if (report.innerFailure) {
        write_failure(out, *report.innerFailure);
    } else {
        out << "OK\n";
    }
    if (verbose) {
        write_items(out, report.innerItems);
    }
    return out.str();
}

} // namespace polyglot
