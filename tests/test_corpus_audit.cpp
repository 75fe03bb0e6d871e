// EN: Unit tests for the CorpusAuditor and the CountryIndex - filters, summaries, url alias clashes and country lookup
// FR: Tests unitaires du CorpusAuditor et du CountryIndex - filtres, résumés, collisions d'url_alias et recherche de pays

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "geo/country_index.hpp"
#include "lint/corpus_audit.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>

using namespace ARL;
using namespace ARL::Lint;
using nlohmann::json;

namespace {

const std::string kBase = "https://static.btcmap.org/images/areas/";

json boxPolygon(double min_lon, double min_lat, double max_lon, double max_lat) {
    json ring = json::array({
        json::array({min_lon, min_lat}), json::array({max_lon, min_lat}),
        json::array({max_lon, max_lat}), json::array({min_lon, max_lat}),
        json::array({min_lon, min_lat})});
    json coordinates = json::array();
    coordinates.push_back(ring);
    return json{{"type", "Polygon"}, {"coordinates", coordinates}};
}

AreaRecord country(const std::string& id, const std::string& name, const json& geometry) {
    AreaRecord record;
    record.id = id;
    record.type = AreaType::COUNTRY;
    record.tags = TagMap{{"name", name}, {"geo_json", geometry}};
    return record;
}

AreaRecord community(const std::string& id, TagMap extra) {
    AreaRecord record;
    record.id = id;
    record.type = AreaType::COMMUNITY;
    record.tags = TagMap{{"name", id}, {"population", "1000"}, {"population:date", "2024-01-01"}};
    for (auto& [key, value] : extra) {
        record.tags[key] = value;
    }
    return record;
}

std::vector<std::string> ids(const std::vector<AreaAuditResult>& results) {
    std::vector<std::string> out;
    for (const auto& result : results) {
        out.push_back(result.area_id);
    }
    return out;
}

} // namespace

// EN: Corpus: two countries, three live communities (two sharing an alias), one deleted and one invalid.
// FR: Corpus : deux pays, trois communautés actives (deux partageant un alias), une supprimée et une invalide.
class CorpusAuditTest : public ::testing::Test {
protected:
    void SetUp() override {
        now_ = *parseTimestamp("2025-06-01T00:00:00Z");
        rules_ = LintRuleSet::createDefault(LintSettings{}, [this] { return now_; });
        cache_ = std::make_unique<LintCache>(*rules_, LintCacheConfig{}, [this] { return now_; });
        auditor_ = std::make_unique<CorpusAuditor>(validator_, *cache_, [this] { return now_; });

        AreaRecord old_area = community("old", {{"url_alias", "berlin"}});
        old_area.deleted_at = parseTimestamp("2024-01-01");

        AreaRecord broken = community("broken", {});
        broken.tags.erase("population");

        corpus_ = {
            country("de", "Germany", boxPolygon(5, 47, 15, 55)),
            country("fr", "france", boxPolygon(-5, 42, 5, 50)),
            community("berlin", {{"url_alias", "berlin"},
                                 {"icon:square", kBase + "berlin.png"},
                                 {"verified:date", "2025-05-01"},
                                 {"geo_json", boxPolygon(13, 52, 13.5, 52.5)}}),
            community("berlin-2", {{"url_alias", "berlin"}}),
            community("paris", {{"url_alias", "paris"},
                                {"icon:square", "https://i.imgur.com/paris.png"},
                                {"verified:date", "2025-05-01"},
                                {"geo_json", boxPolygon(2, 48.5, 2.5, 49)}}),
            old_area,
            broken,
        };
        auditor_->rebuild(corpus_);
    }

    TimePoint now_;
    Validation::SchemaValidator validator_;
    std::unique_ptr<LintRuleSet> rules_;
    std::unique_ptr<LintCache> cache_;
    std::unique_ptr<CorpusAuditor> auditor_;
    std::vector<AreaRecord> corpus_;
};

TEST_F(CorpusAuditTest, DefaultFilterListsLiveAreasWithIssues) {
    auto results = auditor_->getResults();
    EXPECT_EQ(ids(results), (std::vector<std::string>{"de", "fr", "berlin", "berlin-2", "paris"}));
    EXPECT_EQ(auditor_->size(), 7u);
}

TEST_F(CorpusAuditTest, AreasAreLocatedInCountries) {
    AuditFilter filter;
    filter.issues_only = false;
    auto results = auditor_->getResults(filter);

    auto find = [&results](const std::string& id) {
        return *std::find_if(results.begin(), results.end(),
                             [&id](const AreaAuditResult& r) { return r.area_id == id; });
    };
    EXPECT_EQ(find("berlin").country_id, std::optional<std::string>("de"));
    EXPECT_EQ(find("berlin").country_name, "Germany");
    EXPECT_EQ(find("paris").country_id, std::optional<std::string>("fr"));
    EXPECT_FALSE(find("berlin-2").country_id.has_value());
    EXPECT_EQ(find("berlin-2").country_name, "Unknown");
    EXPECT_FALSE(find("de").country_id.has_value());
}

TEST_F(CorpusAuditTest, UrlAliasClashFlagsEveryLiveHolder) {
    AuditFilter filter;
    filter.rule_id = "url-alias-clash";
    auto results = auditor_->getResults(filter);

    ASSERT_EQ(ids(results), (std::vector<std::string>{"berlin", "berlin-2"}));
    ASSERT_EQ(results[0].issues.size(), 1u);
    const LintIssue& issue = results[0].issues[0];
    EXPECT_EQ(issue.severity, Severity::ERROR);
    EXPECT_EQ(issue.message, "Duplicate url_alias shared by 2 areas");
    EXPECT_EQ(issue.current_value, std::optional<std::string>("berlin"));
    EXPECT_EQ(issue.extra["clashing_area_ids"], json::array({"berlin-2"}));
    EXPECT_EQ(issue.extra["clashing_area_names"], json::array({"berlin-2"}));
}

TEST_F(CorpusAuditTest, DeletedAndInvalidAreasCarryNoLintIssues) {
    AuditFilter filter;
    filter.issues_only = false;
    filter.include_deleted = true;
    auto results = auditor_->getResults(filter);
    ASSERT_EQ(results.size(), 7u);

    const AreaAuditResult& old_area = results[5];
    EXPECT_EQ(old_area.area_id, "old");
    EXPECT_TRUE(old_area.is_deleted);
    EXPECT_TRUE(old_area.issues.empty());

    const AreaAuditResult& broken = results[6];
    EXPECT_FALSE(broken.isValid());
    ASSERT_EQ(broken.validation_errors.size(), 1u);
    EXPECT_EQ(broken.validation_errors[0].field, "population");
    EXPECT_TRUE(broken.issues.empty());
    EXPECT_EQ(broken.area_name, "broken");
    EXPECT_FALSE(auditor_->normalizedRecord("broken").has_value());
}

TEST_F(CorpusAuditTest, SummaryCountsIssuesBySeverityAndType) {
    AuditFilter filter;
    filter.issues_only = false;
    AuditSummary summary = auditor_->getSummary(filter);

    EXPECT_EQ(summary.total_all_areas, 7u);
    EXPECT_EQ(summary.deleted_areas, 1u);
    EXPECT_EQ(summary.total_areas, 6u);
    EXPECT_EQ(summary.invalid_areas, 1u);
    EXPECT_EQ(summary.areas_with_issues, 5u);
    EXPECT_EQ(summary.total_issues, 10u);
    EXPECT_EQ(summary.issues_by_severity.at("error"), 5u);
    EXPECT_EQ(summary.issues_by_severity.at("warning"), 4u);
    EXPECT_EQ(summary.issues_by_severity.at("info"), 1u);
    EXPECT_EQ(summary.issues_by_rule.at("url-alias-clash"), 2u);
    EXPECT_EQ(summary.issues_by_rule.at("icon-legacy-url"), 1u);
    EXPECT_EQ(summary.areas_by_type.at("community"), 4u);
    EXPECT_EQ(summary.areas_by_type.at("country"), 2u);
    EXPECT_EQ(summary.last_sync, std::optional<TimePoint>(now_));
}

TEST_F(CorpusAuditTest, SeverityFilterNarrowsIssues) {
    AuditFilter filter;
    filter.severity = Severity::INFO;
    auto results = auditor_->getResults(filter);
    ASSERT_EQ(ids(results), (std::vector<std::string>{"berlin-2"}));
    ASSERT_EQ(results[0].issues.size(), 1u);
    EXPECT_EQ(results[0].issues[0].rule_id, "geo-json-missing");
}

TEST_F(CorpusAuditTest, CountryFilterAppliesToNonCountryAreas) {
    AuditFilter filter;
    filter.country_id = "de";
    EXPECT_EQ(ids(auditor_->getResults(filter)), (std::vector<std::string>{"de", "fr", "berlin"}));

    filter.area_type = AreaType::COMMUNITY;
    EXPECT_EQ(ids(auditor_->getResults(filter)), (std::vector<std::string>{"berlin"}));
}

TEST_F(CorpusAuditTest, TagFiltersSupportExistenceExactAndWildcard) {
    AuditFilter filter;
    filter.issues_only = false;
    filter.area_type = AreaType::COMMUNITY;

    filter.tag_filters = {TagFilter::parse("icon:square")};
    EXPECT_EQ(ids(auditor_->getResults(filter)), (std::vector<std::string>{"berlin", "paris"}));

    filter.tag_filters = {TagFilter::parse("url_alias=ber*")};
    EXPECT_EQ(ids(auditor_->getResults(filter)), (std::vector<std::string>{"berlin", "berlin-2"}));

    filter.tag_filters = {TagFilter::parse("url_alias=paris")};
    EXPECT_EQ(ids(auditor_->getResults(filter)), (std::vector<std::string>{"paris"}));

    // EN: Normalized integers compare by their text form
    // FR: Les entiers normalisés se comparent par leur forme texte
    filter.tag_filters = {TagFilter::parse("population=1000"), TagFilter::parse("url_alias=ber*")};
    EXPECT_EQ(ids(auditor_->getResults(filter)), (std::vector<std::string>{"berlin", "berlin-2"}));
}

TEST(TagFilterTest, ParsesKeyAndPattern) {
    TagFilter bare = TagFilter::parse("continent");
    EXPECT_EQ(bare.key, "continent");
    EXPECT_FALSE(bare.pattern.has_value());

    TagFilter valued = TagFilter::parse("name=a=b");
    EXPECT_EQ(valued.key, "name");
    EXPECT_EQ(valued.pattern, std::optional<std::string>("a=b"));

    TagMap tags{{"name", "x"}, {"note", nullptr}};
    EXPECT_FALSE(CorpusAuditor::matchesTagFilters(tags, {TagFilter::parse("note")}));
    EXPECT_TRUE(CorpusAuditor::matchesTagFilters(tags, {}));
}

TEST_F(CorpusAuditTest, AvailableTagsExcludeGeometry) {
    auto tags = auditor_->getAvailableTags();
    EXPECT_TRUE(std::is_sorted(tags.begin(), tags.end()));
    EXPECT_THAT(tags, testing::Contains("url_alias"));
    EXPECT_THAT(tags, testing::Contains("area_km2"));
    EXPECT_THAT(tags, testing::Not(testing::Contains("geo_json")));
}

TEST_F(CorpusAuditTest, CountriesWithCommunitiesSortedByName) {
    auto countries = auditor_->getCountriesWithCommunities();
    ASSERT_EQ(countries.size(), 2u);
    EXPECT_EQ(countries[0].id, "fr");
    EXPECT_EQ(countries[0].name, "france");
    EXPECT_EQ(countries[1].id, "de");
}

TEST_F(CorpusAuditTest, DeletedCommunityStillMarksItsCountry) {
    auditor_->updateArea(country("it", "Italy", boxPolygon(7, 37, 18, 46)));
    AreaRecord roma = community("roma", {{"geo_json", boxPolygon(12.4, 41.8, 12.6, 42)}});
    roma.deleted_at = parseTimestamp("2024-06-01");
    AreaAuditResult stored = auditor_->updateArea(roma);
    EXPECT_TRUE(stored.is_deleted);
    EXPECT_TRUE(stored.issues.empty());
    EXPECT_EQ(stored.country_id, std::optional<std::string>("it"));

    auto countries = auditor_->getCountriesWithCommunities();
    ASSERT_EQ(countries.size(), 3u);
    EXPECT_EQ(countries[0].id, "fr");
    EXPECT_EQ(countries[1].id, "de");
    EXPECT_EQ(countries[2].id, "it");
}

TEST_F(CorpusAuditTest, UpdatingAliasResolvesClash) {
    AreaAuditResult updated = auditor_->updateArea(community("berlin-2", {{"url_alias", "kreuzberg"}}));
    for (const auto& issue : updated.issues) {
        EXPECT_NE(issue.rule_id, "url-alias-clash");
    }

    AuditFilter filter;
    filter.rule_id = "url-alias-clash";
    EXPECT_TRUE(auditor_->getResults(filter).empty());
}

TEST_F(CorpusAuditTest, UpdatingCountryRelocatesAreas) {
    auditor_->updateArea(country("de", "Germany", boxPolygon(20, 47, 30, 55)));

    AuditFilter filter;
    filter.issues_only = false;
    filter.country_id = "de";
    filter.area_type = AreaType::COMMUNITY;
    EXPECT_TRUE(auditor_->getResults(filter).empty());

    auto countries = auditor_->getCountriesWithCommunities();
    ASSERT_EQ(countries.size(), 1u);
    EXPECT_EQ(countries[0].id, "fr");
}

TEST_F(CorpusAuditTest, NewAreaIsAppendedAndLocated) {
    AreaAuditResult added = auditor_->updateArea(community("munich", {{"geo_json", boxPolygon(11.4, 48, 11.7, 48.2)}}));
    EXPECT_EQ(added.country_id, std::optional<std::string>("de"));
    EXPECT_EQ(auditor_->size(), 8u);
    ASSERT_TRUE(auditor_->normalizedRecord("munich").has_value());
}

TEST_F(CorpusAuditTest, ClearEmptiesTheCorpus) {
    auditor_->clear();
    EXPECT_EQ(auditor_->size(), 0u);
    EXPECT_FALSE(auditor_->getSummary(AuditFilter{}).last_sync.has_value());
}

TEST(CountryIndexTest, LocatesByCentroid) {
    Geo::CountryIndex index;
    EXPECT_TRUE(index.addCountry("nl", "Netherlands", boxPolygon(3, 50, 7, 54)));
    EXPECT_FALSE(index.addCountry("xx", "Nowhere", json{{"type", "Point"}, {"coordinates", json::array({0, 0})}}));
    index.build();
    EXPECT_EQ(index.size(), 1u);

    auto inside = index.locate(boxPolygon(4.8, 52.3, 5.0, 52.4));
    ASSERT_TRUE(inside.has_value());
    EXPECT_EQ(inside->id, "nl");

    EXPECT_FALSE(index.locate(boxPolygon(20, 20, 21, 21)).has_value());

    index.clear();
    EXPECT_TRUE(index.empty());
}

// EN: Main test runner
// FR: Lanceur de test principal
int main(int argc, char** argv) {
    ARL::Logger::getInstance().setLogLevel(ARL::LogLevel::ERROR);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
