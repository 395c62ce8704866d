#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <zlib.h>

#include "core/png_container.h"
#include "stb_image_write.h"

using polyglot::Bytes;

inline void push16(Bytes &v, uint16_t x) {
  v.push_back(static_cast<uint8_t>(x & 0xFF));
  v.push_back(static_cast<uint8_t>((x >> 8) & 0xFF));
}

inline void push32(Bytes &v, uint32_t x) {
  v.push_back(static_cast<uint8_t>(x & 0xFF));
  v.push_back(static_cast<uint8_t>((x >> 8) & 0xFF));
  v.push_back(static_cast<uint8_t>((x >> 16) & 0xFF));
  v.push_back(static_cast<uint8_t>((x >> 24) & 0xFF));
}

inline void push32be(Bytes &v, uint32_t x) {
  v.push_back(static_cast<uint8_t>((x >> 24) & 0xFF));
  v.push_back(static_cast<uint8_t>((x >> 16) & 0xFF));
  v.push_back(static_cast<uint8_t>((x >> 8) & 0xFF));
  v.push_back(static_cast<uint8_t>(x & 0xFF));
}

inline void push_text(Bytes &v, const std::string &s) {
  v.insert(v.end(), s.begin(), s.end());
}

inline void push_png_chunk(Bytes &png, const char *tag, const Bytes &data) {
  polyglot::ChunkTag type{};
  std::copy_n(tag, 4, type.begin());
  push32be(png, static_cast<uint32_t>(data.size()));
  png.insert(png.end(), type.begin(), type.end());
  png.insert(png.end(), data.begin(), data.end());
  push32be(png, polyglot::chunk_crc(type, data));
}

// PNG 1x1 RGB : signature, IHDR, un IDAT compressé par zlib, IEND.
inline Bytes minimal_png() {
  Bytes png(polyglot::kPngSignature.begin(), polyglot::kPngSignature.end());

  Bytes ihdr;
  push32be(ihdr, 1); // largeur
  push32be(ihdr, 1); // hauteur
  ihdr.push_back(8); // profondeur
  ihdr.push_back(2); // RGB
  ihdr.push_back(0);
  ihdr.push_back(0);
  ihdr.push_back(0);
  push_png_chunk(png, "IHDR", ihdr);

  const Bytes scanline = {0, 0xFF, 0x00, 0x00}; // filtre 0 + pixel rouge
  uLongf compressedSize = compressBound(static_cast<uLong>(scanline.size()));
  Bytes idat(compressedSize);
  REQUIRE(compress2(idat.data(), &compressedSize, scanline.data(),
                    static_cast<uLong>(scanline.size()), 9) == Z_OK);
  idat.resize(compressedSize);
  push_png_chunk(png, "IDAT", idat);

  push_png_chunk(png, "IEND", {});
  return png;
}

namespace detail {
inline void append_to_vector(void *context, void *data, int size) {
  auto *out = static_cast<Bytes *>(context);
  auto *bytes = static_cast<uint8_t *>(data);
  out->insert(out->end(), bytes, bytes + size);
}
} // namespace detail

// Vrai PNG produit par stb_image_write (dégradé RGBA).
inline Bytes stb_png(int width, int height) {
  std::vector<unsigned char> pixels(static_cast<size_t>(width) * height * 4);
  for (size_t i = 0; i < pixels.size(); ++i) {
    pixels[i] = static_cast<unsigned char>((i * 37) & 0xFF);
  }
  Bytes out;
  REQUIRE(stbi_write_png_to_func(detail::append_to_vector, &out, width, height,
                                 4, pixels.data(), width * 4) != 0);
  return out;
}

// Flux deflate brut (sans en-tête zlib), comme dans une entrée ZIP méthode 8.
inline Bytes deflate_raw(const Bytes &input) {
  z_stream strm{};
  REQUIRE(deflateInit2(&strm, 9, Z_DEFLATED, -MAX_WBITS, 8,
                       Z_DEFAULT_STRATEGY) == Z_OK);
  Bytes out(deflateBound(&strm, static_cast<uLong>(input.size())) + 16);
  strm.next_in = const_cast<Bytef *>(input.data());
  strm.avail_in = static_cast<uInt>(input.size());
  strm.next_out = out.data();
  strm.avail_out = static_cast<uInt>(out.size());
  const int ret = deflate(&strm, Z_FINISH);
  out.resize(strm.total_out);
  deflateEnd(&strm);
  REQUIRE(ret == Z_STREAM_END);
  return out;
}

struct ZipFixtureEntry {
  std::string name;
  Bytes content;
  bool deflate = false;
};

// Archive ZIP autonome (ancre 0), entrées stockées ou deflate.
inline Bytes build_zip(const std::vector<ZipFixtureEntry> &entries,
                       const std::string &comment = {}) {
  Bytes zip;
  std::vector<uint32_t> offsets;
  std::vector<Bytes> payloads;
  for (const auto &e : entries) {
    Bytes payload = e.deflate ? deflate_raw(e.content) : e.content;
    offsets.push_back(static_cast<uint32_t>(zip.size()));
    push32(zip, 0x04034B50);
    push16(zip, 20);
    push16(zip, 0);
    push16(zip, e.deflate ? 8 : 0);
    push16(zip, 0);
    push16(zip, 0x21);
    push32(zip, polyglot::crc32_of(e.content));
    push32(zip, static_cast<uint32_t>(payload.size()));
    push32(zip, static_cast<uint32_t>(e.content.size()));
    push16(zip, static_cast<uint16_t>(e.name.size()));
    push16(zip, 0);
    push_text(zip, e.name);
    zip.insert(zip.end(), payload.begin(), payload.end());
    payloads.push_back(std::move(payload));
  }

  const auto cdOffset = static_cast<uint32_t>(zip.size());
  for (size_t i = 0; i < entries.size(); ++i) {
    const auto &e = entries[i];
    push32(zip, 0x02014B50);
    push16(zip, 0x031E);
    push16(zip, 20);
    push16(zip, 0);
    push16(zip, e.deflate ? 8 : 0);
    push16(zip, 0);
    push16(zip, 0x21);
    push32(zip, polyglot::crc32_of(e.content));
    push32(zip, static_cast<uint32_t>(payloads[i].size()));
    push32(zip, static_cast<uint32_t>(e.content.size()));
    push16(zip, static_cast<uint16_t>(e.name.size()));
    push16(zip, 0); // extra
    push16(zip, 0); // commentaire
    push16(zip, 0); // disque
    push16(zip, 0);
    push32(zip, 0);
    push32(zip, offsets[i]);
    push_text(zip, e.name);
  }
  const auto cdSize = static_cast<uint32_t>(zip.size() - cdOffset);

  push32(zip, 0x06054B50);
  push16(zip, 0);
  push16(zip, 0);
  push16(zip, static_cast<uint16_t>(entries.size()));
  push16(zip, static_cast<uint16_t>(entries.size()));
  push32(zip, cdSize);
  push32(zip, cdOffset);
  push16(zip, static_cast<uint16_t>(comment.size()));
  push_text(zip, comment);
  return zip;
}

inline Bytes sample_zip() {
  return build_zip({{"a.txt", {'a', 'l', 'p', 'h', 'a'}},
                    {"dir/b.bin", {1, 2, 3, 4, 5, 6, 7}},
                    {"c.txt", Bytes(300, 'c'), true}});
}

// WAV PCM 16 bits mono, `samples` échantillons nuls.
inline Bytes minimal_wav(uint32_t samples = 2) {
  Bytes wav;
  push_text(wav, "RIFF");
  push32(wav, 36 + samples * 2);
  push_text(wav, "WAVE");
  push_text(wav, "fmt ");
  push32(wav, 16);
  push16(wav, 1);      // PCM
  push16(wav, 1);      // canaux
  push32(wav, 44100);  // fréquence
  push32(wav, 88200);  // octets par seconde
  push16(wav, 2);      // alignement
  push16(wav, 16);     // bits
  push_text(wav, "data");
  push32(wav, samples * 2);
  wav.resize(wav.size() + samples * 2, 0);
  return wav;
}
