/// @file test_catalog_index.cpp
/// @brief Unit tests for starlight::catalog::CatalogIndex queries.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "catalog/catalog_index.hpp"
#include "core/logger.hpp"
#include "test_support.hpp"

#include <string>
#include <vector>

using namespace starlight;
using namespace starlight::catalog;

int main(int argc, char** argv)
{
    starlight::core::Logger::init("starlight_tests.log");
    const int result = doctest::Context(argc, argv).run();
    starlight::core::Logger::shutdown();
    return result;
}

namespace
{

CatalogRecord make_record(i64 id, const char* name, f64 mag)
{
    CatalogRecord r;
    r.id = id;
    if (name != nullptr)
    {
        r.proper_name = name;
    }
    r.magnitude = mag;
    return r;
}

std::vector<i64> ids_of(const std::vector<const CatalogRecord*>& records)
{
    std::vector<i64> ids;
    for (const auto* r : records)
    {
        ids.push_back(r->id);
    }
    return ids;
}

} // namespace

// =================================================================
// Summer Triangle fixture
// =================================================================

TEST_CASE("Named stars come back brightest first")
{
    const auto index = test::make_index(test::kSummerTriangleCsv);

    CHECK(index->total_count() == 4);

    const auto& named = index->get_named_stars();
    REQUIRE(named.size() == 3);
    CHECK(named[0]->proper_name == "Vega");
    CHECK(named[1]->proper_name == "Altair");
    CHECK(named[2]->proper_name == "Deneb");
}

TEST_CASE("Name search is case-insensitive substring")
{
    const auto index = test::make_index(test::kSummerTriangleCsv);

    SUBCASE("exact lower-case query")
    {
        const auto hits = index->search_by_name("vega");
        REQUIRE(hits.size() == 1);
        CHECK(hits[0]->id == 91262);
    }

    SUBCASE("substring shared by two names keeps catalog order")
    {
        CHECK(ids_of(index->search_by_name("E")) == std::vector<i64>{91262, 102098});
    }

    SUBCASE("no match")
    {
        CHECK(index->search_by_name("Polaris").empty());
    }

    SUBCASE("blank query")
    {
        CHECK(index->search_by_name("").empty());
        CHECK(index->search_by_name("   ").empty());
    }
}

TEST_CASE("Exact name lookup ignores case and surrounding whitespace")
{
    const auto index = test::make_index(test::kSummerTriangleCsv);

    const auto hits = index->find_by_exact_name("  ALTAIR ");
    REQUIRE(hits.size() == 1);
    CHECK(hits[0]->id == 97649);
    CHECK(index->find_by_exact_name("Alt").empty());
}

TEST_CASE("Lookup by id")
{
    const auto index = test::make_index(test::kSummerTriangleCsv);

    const CatalogRecord* deneb = index->get_by_id(102098);
    REQUIRE(deneb != nullptr);
    CHECK(deneb->proper_name == "Deneb");
    CHECK(index->get_by_id(424242) == nullptr);
}

TEST_CASE("Magnitude range is inclusive and sorted")
{
    const auto index = test::make_index(test::kSummerTriangleCsv);

    CHECK(ids_of(index->get_by_magnitude_range(0.0, 1.0)) == std::vector<i64>{91262, 97649});
    CHECK(ids_of(index->get_by_magnitude_range(0.76, 1.25)) == std::vector<i64>{97649, 102098});
    CHECK(index->get_by_magnitude_range(20.0, 30.0).empty());
    CHECK(index->get_by_magnitude_range(5.0, 1.0).empty());
}

TEST_CASE("Supplementary queries")
{
    const auto index = test::make_index(test::kSummerTriangleCsv);

    CHECK(ids_of(index->get_variable_stars()) == std::vector<i64>{102098});
    CHECK(ids_of(index->get_by_constellation("lyr")) == std::vector<i64>{91262});
    CHECK(ids_of(index->get_by_spectral_class("a")) == std::vector<i64>{91262, 97649, 102098});
    CHECK(ids_of(index->get_by_distance_range(5.0, 10.0)) == std::vector<i64>{91262, 97649});
}

// =================================================================
// Construction rules
// =================================================================

TEST_CASE("Equal magnitudes are ordered by ascending id")
{
    std::vector<CatalogRecord> records{
        make_record(30, "Gamma", 2.0),
        make_record(10, "Alpha", 2.0),
        make_record(20, nullptr, 2.0),
        make_record(5, "Bright", 1.0),
    };
    const CatalogIndex index(std::move(records));

    CHECK(ids_of(index.get_by_magnitude_range(0.0, 5.0)) == std::vector<i64>{5, 10, 20, 30});
    CHECK(ids_of(index.get_named_stars()) == std::vector<i64>{5, 10, 30});
}

TEST_CASE("Duplicate ids keep the first record")
{
    std::vector<CatalogRecord> records{
        make_record(1, "First", 1.0),
        make_record(1, "Second", 2.0),
        make_record(2, "Other", 3.0),
    };
    const CatalogIndex index(std::move(records));

    CHECK(index.total_count() == 2);
    CHECK(index.duplicate_count() == 1);
    REQUIRE(index.get_by_id(1) != nullptr);
    CHECK(index.get_by_id(1)->proper_name == "First");
    CHECK(index.search_by_name("second").empty());
}

TEST_CASE("Whitespace-only names are not named stars")
{
    std::vector<CatalogRecord> records{make_record(1, "  ", 1.0), make_record(2, "Real", 2.0)};
    const CatalogIndex index(std::move(records));

    CHECK(ids_of(index.get_named_stars()) == std::vector<i64>{2});
}

TEST_CASE("Identical input gives identical query results")
{
    const auto a = test::make_index(test::make_named_catalog_csv(20));
    const auto b = test::make_index(test::make_named_catalog_csv(20));

    CHECK(ids_of(a->get_named_stars()) == ids_of(b->get_named_stars()));
    CHECK(ids_of(a->search_by_name("star01")) == ids_of(b->search_by_name("star01")));
}
