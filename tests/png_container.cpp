#include <catch2/catch_test_macros.hpp>
#include <string>
#include <variant>

#include "core/errors.h"
#include "core/png_container.h"
#include "polyglot_fixtures.hpp"

using namespace polyglot;

namespace {

ErrorCode parse_error(const Bytes &data) {
  try {
    PngContainer::parse(data);
  } catch (const PolyglotError &e) {
    return e.code();
  }
  FAIL("Le parsing aurait dû échouer");
  return ErrorCode::IoFailure;
}

} // namespace

TEST_CASE("Minimal PNG parses into typed chunks") {
  const Bytes data = minimal_png();
  PngContainer png = PngContainer::parse(data);

  REQUIRE(png.chunks().size() == 3);
  CHECK(png.chunks()[0].tagName() == "IHDR");
  CHECK(png.chunks()[1].tagName() == "IDAT");
  CHECK(png.chunks()[2].tagName() == "IEND");
  CHECK(png.chunks()[0].offset == 8);
  CHECK(png.dataOffset(1) == png.chunks()[1].offset + 8);
  CHECK(png.bytes() == data);

  const ChunkInfo header = decode_chunk(png.chunks()[0]);
  REQUIRE(std::holds_alternative<ImageHeader>(header));
  CHECK(std::get<ImageHeader>(header).width == 1);
  CHECK(std::get<ImageHeader>(header).colorType == 2);
  CHECK(std::holds_alternative<ImageData>(decode_chunk(png.chunks()[1])));
  CHECK(std::holds_alternative<ImageEnd>(decode_chunk(png.chunks()[2])));
}

TEST_CASE("Real PNG written by stb_image_write parses") {
  const Bytes data = stb_png(16, 9);
  PngContainer png = PngContainer::parse(data);
  const ChunkInfo header = decode_chunk(png.chunks().front());
  REQUIRE(std::holds_alternative<ImageHeader>(header));
  CHECK(std::get<ImageHeader>(header).width == 16);
  CHECK(std::get<ImageHeader>(header).height == 9);
  CHECK(png.serialize() == data);
}

TEST_CASE("Serialized chunks always carry a matching CRC") {
  PngContainer png = PngContainer::parse(minimal_png());
  const Bytes extra = {'h', 'e', 'l', 'l', 'o'};
  PngContainer grown =
      std::move(png).insertChunkBeforeEnd(kTagTEXT, extra);

  for (const auto &chunk : grown.chunks()) {
    CHECK(chunk.crc == chunk_crc(chunk.type, chunk.data));
  }
  CHECK(grown.serialize() == grown.bytes());
}

TEST_CASE("Single-byte corruption of chunk data is an integrity failure") {
  Bytes data = minimal_png();
  PngContainer png = PngContainer::parse(data);
  const size_t idatData = png.dataOffset(1);

  for (size_t i = 0; i < png.chunks()[1].data.size(); ++i) {
    Bytes corrupt = data;
    corrupt[idatData + i] ^= 0x01;
    try {
      PngContainer::parse(corrupt);
      FAIL("CRC non détecté à l'octet " + std::to_string(i));
    } catch (const PolyglotError &e) {
      CHECK(e.kind() == ErrorKind::IntegrityFailure);
      CHECK(e.subject() == "IDAT");
      CHECK(std::string(e.what()).find("CRC incohérent") != std::string::npos);
    }
  }
}

TEST_CASE("Malformed PNG inputs are rejected") {
  const Bytes data = minimal_png();

  SECTION("Bad signature") {
    Bytes bad = data;
    bad[1] = 'X';
    CHECK(parse_error(bad) == ErrorCode::BadSignature);
  }

  SECTION("Declared length beyond the buffer") {
    Bytes bad = data;
    bad.resize(bad.size() - 20);
    CHECK(parse_error(bad) == ErrorCode::Truncated);
  }

  SECTION("Missing IEND") {
    Bytes bad(data.begin(), data.end() - 12);
    CHECK(parse_error(bad) == ErrorCode::MissingChunk);
  }

  SECTION("First chunk is not IHDR") {
    Bytes bad(kPngSignature.begin(), kPngSignature.end());
    push_png_chunk(bad, "IDAT", {1, 2, 3});
    push_png_chunk(bad, "IEND", {});
    CHECK(parse_error(bad) == ErrorCode::MissingChunk);
  }
}

TEST_CASE("Bytes after IEND are ignored") {
  Bytes data = minimal_png();
  const size_t length = data.size();
  data.insert(data.end(), {'j', 'u', 'n', 'k'});
  PngContainer png = PngContainer::parse(data);
  CHECK(png.byteLength() == length);
}

TEST_CASE("Appending to the first IDAT rebuilds the chunk") {
  PngContainer png = PngContainer::parse(minimal_png());
  const size_t before = png.chunks()[1].data.size();
  const size_t iendBefore = png.chunks()[2].offset;
  const Bytes extra(10, 0xAB);

  PngContainer out = std::move(png).appendToFirstChunk(kTagIDAT, extra);
  const Chunk &idat = out.chunks()[1];
  CHECK(idat.data.size() == before + extra.size());
  CHECK(out.chunks()[2].offset == iendBefore + extra.size());

  // Le résultat se re-parse avec des CRC valides
  PngContainer reparsed = PngContainer::parse(out.bytes());
  CHECK(reparsed.chunks()[1].data == idat.data);
}

TEST_CASE("Appending to an absent chunk type fails") {
  PngContainer png = PngContainer::parse(minimal_png());
  const ChunkTag tag = {'z', 'T', 'X', 't'};
  try {
    std::move(png).appendToFirstChunk(tag, Bytes{1});
    FAIL("Le chunk absent aurait dû être signalé");
  } catch (const PolyglotError &e) {
    CHECK(e.code() == ErrorCode::MissingChunk);
    CHECK(e.subject() == "zTXt");
  }
}

TEST_CASE("Text chunk is inserted right before IEND") {
  PngContainer png = PngContainer::parse(minimal_png());
  Bytes text;
  push_text(text, "Comment");
  text.push_back(0);
  push_text(text, "bonjour");

  PngContainer out = std::move(png).insertChunkBeforeEnd(kTagTEXT, text);
  REQUIRE(out.chunks().size() == 4);
  CHECK(out.chunks()[2].tagName() == "tEXt");
  CHECK(out.chunks()[3].tagName() == "IEND");

  const ChunkInfo info = decode_chunk(out.chunks()[2]);
  REQUIRE(std::holds_alternative<TextualData>(info));
  CHECK(std::get<TextualData>(info).keyword == "Comment");

  // Sans mot-clé, le chunk est conservé tel quel
  Chunk raw = out.chunks()[2];
  raw.data = {0, 'x'};
  CHECK(std::holds_alternative<UnknownChunk>(decode_chunk(raw)));
}
