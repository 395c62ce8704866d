#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "core/errors.h"
#include "utilities.hpp"

namespace fs = std::filesystem;
using namespace polyglot;

TEST_CASE("Endian helpers read and write scalars") {
  Bytes buf;
  append_le16(buf, 0x1234);
  append_le32(buf, 0xA1B2C3D4);
  append_be32(buf, 0x01020304);
  REQUIRE(buf.size() == 10);

  CHECK(read_scalar_le<uint16_t>(buf, 0) == 0x1234);
  CHECK(read_scalar_le<uint32_t>(buf, 2) == 0xA1B2C3D4);
  CHECK(read_scalar_be<uint32_t>(buf, 6) == 0x01020304);
  CHECK(buf[6] == 0x01);

  write_le32(buf, 2, 0xDEADBEEF);
  CHECK(read_scalar_le<uint32_t>(buf, 2) == 0xDEADBEEF);
  write_le16(buf, 0, 0xFFFE);
  CHECK(read_scalar_le<uint16_t>(buf, 0) == 0xFFFE);

  CHECK_THROWS_AS(read_scalar_le<uint32_t>(buf, 7), std::runtime_error);
  CHECK_THROWS_AS(write_le32(buf, 8, 0), std::runtime_error);
}

TEST_CASE("Signature search returns every occurrence") {
  const Bytes hay = {'x', 'P', 'K', 'P', 'K', 'y', 'P', 'K'};
  const Bytes needle = {'P', 'K'};

  auto first = find_signature(hay, needle);
  REQUIRE(first);
  CHECK(*first == 1);
  CHECK(*find_signature(hay, needle, 2) == 3);
  CHECK_FALSE(find_signature(hay, needle, 7));
  CHECK_FALSE(find_signature(hay, needle, 100));

  auto all = find_all_signatures(hay, needle);
  REQUIRE(all.size() == 3);
  CHECK(all[2] == 6);
}

TEST_CASE("CRC-32 matches the reference value") {
  const std::string text = "123456789";
  Bytes data(text.begin(), text.end());
  CHECK(crc32_of(data) == 0xCBF43926u);

  const uint32_t partial = crc32_of(ByteView(data.data(), 4));
  CHECK(crc32_update(partial, ByteView(data.data() + 4, 5)) == 0xCBF43926u);
}

TEST_CASE("printable_tag masks control bytes") {
  const Bytes tag = {'p', 'n', 0x01, ' '};
  CHECK(printable_tag(tag) == "pn? ");
}

TEST_CASE("Whole-file I/O") {
  fs::path tmpDir = fs::temp_directory_path();
  Options opts;

  SECTION("Round trip leaves no temporary file") {
    fs::path path = tmpDir / "polyglot_io_roundtrip.bin";
    const Bytes data = {0, 1, 2, 3, 0xFF};
    write_file(path, data);
    CHECK(read_file(path, opts) == data);
    CHECK_FALSE(fs::exists(fs::path(path.string() + ".tmp")));
    fs::remove(path);
  }

  SECTION("Missing file is an I/O failure") {
    fs::path path = tmpDir / "polyglot_io_missing.bin";
    fs::remove(path);
    try {
      read_file(path, opts);
      FAIL("read_file aurait dû échouer");
    } catch (const PolyglotError &e) {
      CHECK(e.kind() == ErrorKind::Io);
      CHECK(std::string(e.what()).find("Impossible de lire") != std::string::npos);
    }
  }

  SECTION("Size ceiling is enforced") {
    fs::path path = tmpDir / "polyglot_io_ceiling.bin";
    write_file(path, Bytes(64, 0x42));
    opts.maxInputSize = 16;
    try {
      read_file(path, opts);
      FAIL("read_file aurait dû refuser le fichier");
    } catch (const PolyglotError &e) {
      CHECK(e.code() == ErrorCode::SizeOverflow);
      CHECK(e.kind() == ErrorKind::CapacityExceeded);
    }
    fs::remove(path);
  }

  SECTION("Unwritable destination fails without partial output") {
    fs::path path = tmpDir / "polyglot_no_such_dir" / "out.bin";
    CHECK_THROWS_AS(write_file(path, Bytes{1, 2, 3}), PolyglotError);
    CHECK_FALSE(fs::exists(path));
  }
}

TEST_CASE("Logging honours the quiet option") {
  std::ostringstream captured;
  auto *old = std::cerr.rdbuf(captured.rdbuf());

  Options opts;
  log_warn("fichier.png", "message visible", opts);
  opts.quiet = true;
  log_info("fichier.png", "message masqué", opts);

  std::cerr.rdbuf(old);
  const std::string out = captured.str();
  CHECK(out.find("AVERTISSEMENT: fichier.png: message visible") != std::string::npos);
  CHECK(out.find("message masqué") == std::string::npos);
}
