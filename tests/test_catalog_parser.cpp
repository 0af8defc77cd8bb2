/// @file test_catalog_parser.cpp
/// @brief Unit tests for starlight::catalog::CatalogParser and row promotion.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "catalog/catalog_parser.hpp"
#include "catalog/catalog_record.hpp"
#include "core/logger.hpp"
#include "test_support.hpp"

#include <string>

using namespace starlight;
using namespace starlight::catalog;

int main(int argc, char** argv)
{
    starlight::core::Logger::init("starlight_tests.log");
    const int result = doctest::Context(argc, argv).run();
    starlight::core::Logger::shutdown();
    return result;
}

// =================================================================
// Full payloads
// =================================================================

TEST_CASE("HYG rows are parsed into records")
{
    const auto report = CatalogParser::parse_csv(test::kSummerTriangleCsv);

    REQUIRE(report.records.size() == 4);
    CHECK(report.data_rows == 4);
    CHECK(report.malformed == 0);

    const auto& vega = report.records[0];
    CHECK(vega.id == 91262);
    REQUIRE(vega.proper_name.has_value());
    CHECK(*vega.proper_name == "Vega");
    CHECK(vega.ra == doctest::Approx(18.615649));
    CHECK(vega.dec == doctest::Approx(38.783692));
    CHECK(vega.distance == doctest::Approx(7.68));
    CHECK(vega.magnitude == doctest::Approx(0.03));
    CHECK(vega.absolute_magnitude == doctest::Approx(0.604));
    CHECK(vega.spectral_class == "A0V");
    CHECK_FALSE(vega.is_variable);
    CHECK(vega.cartesian.y == doctest::Approx(-7.0));
    CHECK(vega.constellation == "Lyr");
    CHECK(vega.bayer == "Alp");

    const auto& deneb = report.records[2];
    CHECK(deneb.is_variable);

    const auto& unnamed = report.records[3];
    CHECK_FALSE(unnamed.proper_name.has_value());
    CHECK_FALSE(unnamed.is_named());
    CHECK(unnamed.display_name() == "HYG 1");
    CHECK_FALSE(unnamed.bayer.has_value());
}

TEST_CASE("Row with non-numeric ra is skipped and counted")
{
    const std::string csv =
        "id,proper,ra,dec,dist,mag\n"
        "1,Good,1.0,2.0,10.0,3.0\n"
        "2,Bad,abc,2.0,10.0,3.0\n"
        "3,AlsoGood,4.0,5.0,10.0,6.0\n";

    const auto report = CatalogParser::parse_csv(csv);

    REQUIRE(report.records.size() == 2);
    CHECK(report.records[0].id == 1);
    CHECK(report.records[1].id == 3);
    CHECK(report.malformed == 1);
    CHECK(report.data_rows == 3);
}

TEST_CASE("Rows missing id or magnitude, or with the wrong width, are malformed")
{
    const std::string csv =
        "id,proper,ra,dec,mag\n"
        ",NoId,1.0,2.0,3.0\n"
        "x7,BadId,1.0,2.0,3.0\n"
        "8,NoMag,1.0,2.0,\n"
        "9,Short,1.0\n"
        "10,Fine,1.0,2.0,3.0\n";

    const auto report = CatalogParser::parse_csv(csv);

    REQUIRE(report.records.size() == 1);
    CHECK(report.records[0].id == 10);
    CHECK(report.malformed == 4);
}

TEST_CASE("BOM, CRLF, comments and blank lines are tolerated")
{
    const std::string csv =
        "\xEF\xBB\xBF# exported catalog\r\n"
        "id,proper,ra,dec,mag\r\n"
        "\r\n"
        "# comment between rows\r\n"
        "5,Sirius,6.752481,-16.716116,-1.44\r\n";

    const auto report = CatalogParser::parse_csv(csv);

    REQUIRE(report.records.size() == 1);
    CHECK(report.records[0].proper_name == "Sirius");
    CHECK(report.records[0].magnitude == doctest::Approx(-1.44));
    CHECK(report.malformed == 0);
}

TEST_CASE("Columns are located by header name")
{
    const std::string csv =
        "mag,extra,dec,ra,id,proper\n"
        "0.03,ignored,38.78,18.61,91262,Vega\n";

    const auto report = CatalogParser::parse_csv(csv);

    REQUIRE(report.records.size() == 1);
    CHECK(report.records[0].id == 91262);
    CHECK(report.records[0].ra == doctest::Approx(18.61));
    CHECK(report.records[0].distance == 0.0);
}

TEST_CASE("Header without required columns yields no records")
{
    const auto report = CatalogParser::parse_csv("name,ra\nVega,18.6\n");

    CHECK(report.records.empty());
    CHECK(report.malformed == 1);
}

// =================================================================
// Field helpers
// =================================================================

TEST_CASE("Quoted fields keep embedded commas and quotes")
{
    const auto fields = CatalogParser::split_csv_line(R"(1,"Alpha, ""Prime""",3)");

    REQUIRE(fields.size() == 3);
    CHECK(fields[1] == R"(Alpha, "Prime")");
}

TEST_CASE("Numeric helpers reject partial or non-finite input")
{
    CHECK(CatalogParser::parse_f64("1.5") == 1.5);
    CHECK_FALSE(CatalogParser::parse_f64("1.5x").has_value());
    CHECK_FALSE(CatalogParser::parse_f64("inf").has_value());
    CHECK_FALSE(CatalogParser::parse_f64("").has_value());
    CHECK(CatalogParser::parse_i64("-42") == -42);
    CHECK_FALSE(CatalogParser::parse_i64("4.2").has_value());
}

TEST_CASE("Blank proper name is treated as unnamed")
{
    RawCatalogRow row;
    row.id = 7;
    row.proper = "   ";
    row.ra = 1.0;
    row.dec = 2.0;
    row.mag = 3.0;
    row.dist = -1.0;

    const auto record = promote(row);

    REQUIRE(record.has_value());
    CHECK_FALSE(record->proper_name.has_value());
    CHECK(record->distance == 0.0);
}

TEST_CASE("Promotion requires id, ra, dec and mag")
{
    RawCatalogRow row;
    row.id = 7;
    row.ra = 1.0;
    row.dec = 2.0;

    CHECK_FALSE(promote(row).has_value());
}
