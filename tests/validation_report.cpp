#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <string>

#include "polyglot_creator.hpp"
#include "polyglot_fixtures.hpp"
#include "polyglot_inspector.hpp"
#include "validation_report.hpp"

using namespace polyglot;

namespace {

Bytes idat_polyglot() {
  Options opts;
  opts.quiet = true;
  PolyglotCreator creator(minimal_png(), sample_zip(), SecondInput::Archive, opts);
  return creator.create(EmbedStrategy::AppendToImageData);
}

} // namespace

TEST_CASE("Status combines both layers") {
  CHECK(status_of(true, true) == ValidationStatus::Valid);
  CHECK(status_of(false, true) == ValidationStatus::InvalidOuter);
  CHECK(status_of(true, false) == ValidationStatus::InvalidInner);
  CHECK(status_of(false, false) == ValidationStatus::InvalidBoth);
}

TEST_CASE("JSON report of a valid polyglot") {
  const ValidationReport report = validate(idat_polyglot());
  nlohmann::json j = report_to_json(report, false);

  CHECK(j["status"] == "Valid");
  CHECK(j["valid"] == true);
  CHECK(j["dominance"] == "ContainerFirst");
  CHECK(j["outer"]["format"] == "PNG");
  CHECK(j["outer"]["failure"].is_null());
  CHECK(j["inner"]["format"] == "ZIP");
  CHECK(j["inner"]["anchor"] == j["inner"]["offset"]);
  CHECK_FALSE(j["outer"].contains("items"));

  nlohmann::json verbose = report_to_json(report, true);
  REQUIRE(verbose["outer"]["items"].size() == 3);
  CHECK(verbose["outer"]["items"][0]["name"] == "IHDR");
  CHECK(verbose["outer"]["items"][0]["detail"] == "1x1, 8 bits, type 2");
  REQUIRE(verbose["inner"]["items"].size() == 3);
  CHECK(verbose["inner"]["items"][1]["name"] == "dir/b.bin");

  // Le rendu se relit tel quel
  CHECK(nlohmann::json::parse(verbose.dump(2)) == verbose);
}

TEST_CASE("JSON report carries failure kinds and codes") {
  Bytes out = idat_polyglot();
  out[2] = 'X';
  const ValidationReport report = validate(out);
  nlohmann::json j = report_to_json(report, false);

  CHECK(j["status"] == "InvalidOuter");
  CHECK(j["valid"] == false);
  CHECK(j["outer"]["failure"]["kind"] == "MalformedInput");
  CHECK(j["outer"]["failure"]["code"] == "BadSignature");
  CHECK(j["inner"]["failure"].is_null());
}

TEST_CASE("Text report lists chunks and entries in verbose mode") {
  const ValidationReport report = validate(idat_polyglot());

  const std::string brief = format_report(report, false);
  CHECK(brief.find("Statut : VALIDE (Valid)") != std::string::npos);
  CHECK(brief.find("Format externe PNG : OK") != std::string::npos);
  CHECK(brief.find("IHDR") == std::string::npos);

  const std::string detailed = format_report(report, true);
  CHECK(detailed.find("- IHDR @8 (13 octets)") != std::string::npos);
  CHECK(detailed.find("- c.txt") != std::string::npos);

  const ValidationReport plain = validate(minimal_png());
  const std::string failed = format_report(plain, false);
  CHECK(failed.find("INVALIDE (InvalidInner)") != std::string::npos);
  CHECK(failed.find("ÉCHEC [StructuralNotFound/PayloadNotFound]") != std::string::npos);
}
