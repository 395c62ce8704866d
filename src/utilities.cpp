// Implémentation des utilitaires (I/O, journalisation, endianness)
#include "utilities.hpp"

#include <fstream>
#include <iostream>
#include <mutex>
#include <system_error>

#include <zlib.h>

#include "core/errors.h"

namespace polyglot {

void append_le16(Bytes &out, uint16_t value) {
    for (int i = 0; i < 2; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

void append_le32(Bytes &out, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

void append_be32(Bytes &out, uint32_t value) {
    for (int i = 3; i >= 0; --i) {
        out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

void write_le16(Bytes &dst, size_t offset, uint16_t value) {
    if (offset > dst.size() || dst.size() - offset < 2) {
        throw std::runtime_error("Écriture hors tampon à l'offset " +
                                 std::to_string(offset));
    }
    dst[offset] = static_cast<uint8_t>(value & 0xFF);
    dst[offset + 1] = static_cast<uint8_t>((value >> 8) & 0xFF);
}

void write_le32(Bytes &dst, size_t offset, uint32_t value) {
    if (offset > dst.size() || dst.size() - offset < 4) {
        throw std::runtime_error("Écriture hors tampon à l'offset " +
                                 std::to_string(offset));
    }
    dst[offset] = static_cast<uint8_t>(value & 0xFF);
    dst[offset + 1] = static_cast<uint8_t>((value >> 8) & 0xFF);
    dst[offset + 2] = static_cast<uint8_t>((value >> 16) & 0xFF);
    dst[offset + 3] = static_cast<uint8_t>((value >> 24) & 0xFF);
}

uint32_t crc32_update(uint32_t crc, ByteView data) {
    // zlib prend des longueurs uInt : les gros tampons sont traités par tranches.
    constexpr size_t kSlice = std::numeric_limits<uInt>::max();
    uLong value = crc;
    size_t pos = 0;
    while (pos < data.size()) {
        const size_t n = std::min(kSlice, data.size() - pos);
        value = crc32(value, data.data() + pos, static_cast<uInt>(n));
        pos += n;
    }
    return static_cast<uint32_t>(value);
}

uint32_t crc32_of(ByteView data) {
    return crc32_update(static_cast<uint32_t>(crc32(0L, Z_NULL, 0)), data);
}

std::optional<size_t> find_signature(ByteView haystack, ByteView needle,
                                     size_t from) {
    if (needle.empty() || from > haystack.size()) {
        return std::nullopt;
    }
    auto it = std::search(haystack.begin() + static_cast<std::ptrdiff_t>(from),
                          haystack.end(), needle.begin(), needle.end());
    if (it == haystack.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - haystack.begin());
}

std::vector<size_t> find_all_signatures(ByteView haystack, ByteView needle,
                                        size_t from) {
    std::vector<size_t> positions;
    auto pos = find_signature(haystack, needle, from);
    while (pos) {
        positions.push_back(*pos);
        pos = find_signature(haystack, needle, *pos + 1);
    }
    return positions;
}

std::string printable_tag(ByteView tag) {
    std::string out;
    for (uint8_t c : tag) {
        out.push_back((c >= 0x20 && c < 0x7F) ? static_cast<char>(c) : '?');
    }
    return out;
}

Bytes read_file(const std::filesystem::path &path, const Options &opt) {
    auto [fsPath, pathStr] = to_long_path(path);
    std::error_code ec;
    const auto size = std::filesystem::file_size(fsPath, ec);
    if (ec) {
        throw PolyglotError(ErrorCode::IoFailure,
                            "Impossible de lire " + pathStr + ": " + ec.message(),
                            pathStr);
    }
    if (size > opt.maxInputSize) {
        throw PolyglotError(ErrorCode::SizeOverflow,
                            "Fichier trop volumineux (" + std::to_string(size) +
                                " octets): " + pathStr,
                            pathStr);
    }

    std::ifstream in(fsPath, std::ios::binary);
    if (!in) {
        throw PolyglotError(ErrorCode::IoFailure,
                            "Échec de l'ouverture de " + pathStr, pathStr);
    }
    Bytes data(static_cast<size_t>(size));
    if (!data.empty()) {
        in.read(reinterpret_cast<char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
        if (in.gcount() != static_cast<std::streamsize>(data.size())) {
            throw PolyglotError(ErrorCode::IoFailure,
                                "Lecture incomplète (" +
                                    std::to_string(in.gcount()) + "/" +
                                    std::to_string(data.size()) + " octets): " +
                                    pathStr,
                                pathStr);
        }
    }
    return data;
}

void write_file(const std::filesystem::path &path, ByteView data) {
    auto [fsPath, pathStr] = to_long_path(path);
    std::filesystem::path tmpPath = fsPath;
    tmpPath += ".tmp";

    {
        std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
        if (out) {
            out.write(reinterpret_cast<const char *>(data.data()),
                      static_cast<std::streamsize>(data.size()));
            out.flush();
        }
        if (!out) {
            out.close();
            std::error_code ec;
            std::filesystem::remove(tmpPath, ec);
            throw PolyglotError(ErrorCode::IoFailure,
                                std::string("Échec de l'écriture de ") + pathStr,
                                pathStr);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmpPath, fsPath, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmpPath, ignored);
        throw PolyglotError(ErrorCode::IoFailure,
                            "Échec du renommage vers " + pathStr + ": " +
                                ec.message(),
                            pathStr);
    }
}

namespace {

std::mutex g_logMutex;

void log(const std::filesystem::path &path, const std::string &msg,
         const char *prefix, const Options &opt) {
    if (opt.quiet) return;
    std::lock_guard lock(g_logMutex);
    std::cerr << prefix << path.string() << ": " << msg << '\n';
}

} // namespace

void log_info(const std::filesystem::path &path, const std::string &msg,
              const Options &opt) {
    log(path, msg, "", opt);
}

void log_warn(const std::filesystem::path &path, const std::string &msg,
              const Options &opt) {
    log(path, msg, "AVERTISSEMENT: ", opt);
}

#ifdef _WIN32
std::wstring make_long_path(const std::wstring &path) {
    namespace fs = std::filesystem;
    fs::path absPath = fs::absolute(path);
    std::wstring abs = absPath.native();

    if (abs.rfind(L"\\\\?\\", 0) == 0) {
        return abs;
    }

    bool isUnc = abs.rfind(L"\\\\", 0) == 0;
    if (!isUnc && abs.length() >= MAX_PATH) {
        return L"\\\\?\\" + abs;
    }
    return abs;
}
#endif

#ifdef _WIN32
std::pair<std::filesystem::path, std::string>
to_long_path(const std::filesystem::path &path) {
    auto longPath = make_long_path(path.wstring());
    std::filesystem::path fsPath{longPath};
    auto pathUtf8 = fsPath.u8string();
    return {fsPath, std::string(pathUtf8.begin(), pathUtf8.end())};
}
#else
std::pair<std::filesystem::path, std::string>
to_long_path(const std::filesystem::path &path) {
    return {path, path.string()};
}
#endif

} // namespace polyglot
