#include <catch2/catch_test_macros.hpp>
#include <vector>

#include "core/errors.h"
#include "core/zip_archive.h"
#include "core/zip_offsets.h"
#include "polyglot_fixtures.hpp"

using namespace polyglot;

TEST_CASE("Relocation shifts every entry by exactly the shift") {
  const Bytes original = sample_zip();
  ZipArchive zip = ZipArchive::parse(original);

  std::vector<uint32_t> before;
  for (const auto &e : zip.entries()) {
    before.push_back(e.localHeaderOffset);
  }
  REQUIRE(before.size() == 3);
  CHECK(before[0] != before[1]);
  const uint32_t directoryBefore = zip.trailer().directoryOffset;

  const int64_t shift = 1234;
  RelocatedArchive relocated = relocate(std::move(zip), shift);

  REQUIRE(relocated.entries().size() == before.size());
  for (size_t i = 0; i < before.size(); ++i) {
    const auto &entry = relocated.entries()[i];
    CHECK(entry.localHeaderOffset == before[i] + shift);
    CHECK(read_scalar_le<uint32_t>(relocated.bytes(), entry.position + 42) ==
          before[i] + shift);
  }
  CHECK(relocated.trailer().directoryOffset == directoryBefore + shift);
  CHECK(relocated.anchor() == shift);
  CHECK(relocated.shift() == shift);
  CHECK(relocated.bytes().size() == original.size());
}

TEST_CASE("Re-parsing behind a stub and relocating back restores the archive") {
  const Bytes original = sample_zip();
  const int64_t shift = 517;

  Bytes patched = relocate(ZipArchive::parse(original), shift).bytes();

  // Le fichier lu par un décodeur : un préfixe de `shift` octets puis l'archive
  Bytes file(static_cast<size_t>(shift), 0x5A);
  file.insert(file.end(), patched.begin(), patched.end());
  Bytes tail(file.begin() + shift, file.end());

  ZipArchive reparsed = ZipArchive::parse(tail, static_cast<uint32_t>(shift));
  CHECK(reparsed.readEntry(reparsed.entries()[0]) ==
        Bytes{'a', 'l', 'p', 'h', 'a'});

  RelocatedArchive restored = relocate(std::move(reparsed), -shift);
  CHECK(restored.anchor() == 0);
  CHECK(std::move(restored).release() == original);
}

TEST_CASE("Relocating the same archive twice is rejected") {
  ZipArchive zip = ZipArchive::parse(sample_zip());
  RelocatedArchive first = relocate(std::move(zip), 64);
  CHECK_FALSE(zip.valid());

  try {
    relocate(std::move(zip), 64);
    FAIL("Double relocalisation acceptée");
  } catch (const PolyglotError &e) {
    CHECK(e.code() == ErrorCode::AlreadyRelocated);
    CHECK(e.kind() == ErrorKind::SequencingViolation);
  }
  // Le premier résultat n'a pas été décalé une seconde fois
  CHECK(first.trailer().directoryOffset ==
        ZipArchive::parse(sample_zip()).trailer().directoryOffset + 64);
}

TEST_CASE("Overflowing offsets are rejected without writing") {
  const Bytes original = sample_zip();

  SECTION("Past the 32-bit field") {
    ZipArchive zip = ZipArchive::parse(original);
    try {
      relocate(std::move(zip), 0xFFFFFFF0LL);
      FAIL("Débordement accepté");
    } catch (const PolyglotError &e) {
      CHECK(e.code() == ErrorCode::OffsetOverflow);
      CHECK(e.kind() == ErrorKind::CapacityExceeded);
    }
    // Rien n'a été consommé ni écrit
    REQUIRE(zip.valid());
    CHECK(zip.bytes() == original);
    CHECK_NOTHROW(relocate(std::move(zip), 8));
  }

  SECTION("Below zero") {
    ZipArchive zip = ZipArchive::parse(original);
    CHECK_THROWS_AS(relocate(std::move(zip), -1), PolyglotError);
    CHECK(zip.valid());
  }
}

TEST_CASE("Relocation keeps bytes following the trailer") {
  Bytes data = sample_zip();
  const size_t length = data.size();
  data.insert(data.end(), {'X', 'Y', 'Z'});

  RelocatedArchive relocated = relocate(ZipArchive::parse(data), 40);
  REQUIRE(relocated.bytes().size() == length + 3);
  CHECK(relocated.bytes()[length] == 'X');
  CHECK(relocated.bytes().back() == 'Z');

  ZipArchive shifted = ZipArchive::parse(relocated.bytes(), 40);
  CHECK(relocate(std::move(shifted), -40).release() == data);
}
