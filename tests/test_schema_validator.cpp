// EN: Unit tests for the area SchemaValidator - required fields, normalization and tag passthrough
// FR: Tests unitaires du SchemaValidator de zones - champs requis, normalisation et transmission des tags

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "validation/schema_validator.hpp"
#include "infrastructure/logging/logger.hpp"

using namespace ARL;
using namespace ARL::Validation;
using nlohmann::json;

namespace {

json reversedSquare() {
    // EN: Clockwise exterior, to be rewound
    // FR: Extérieur horaire, à réorienter
    return json{{"type", "Polygon"},
                {"coordinates", json::array({json::array({
                    json::array({13.0, 52.0}), json::array({13.0, 52.5}), json::array({13.5, 52.5}),
                    json::array({13.5, 52.0}), json::array({13.0, 52.0})})})}};
}

} // namespace

// EN: Test fixture for SchemaValidator tests
// FR: Fixture de test pour les tests SchemaValidator
class SchemaValidatorTest : public ::testing::Test {
protected:
    AreaRecord community(TagMap tags) {
        AreaRecord record;
        record.id = "town";
        record.type = AreaType::COMMUNITY;
        record.tags = std::move(tags);
        return record;
    }

    TagMap completeTags() {
        return TagMap{{"name", "Town"}, {"population", "1000"}, {"population:date", "2024-01-15"}};
    }

    SchemaValidator validator_;
};

TEST_F(SchemaValidatorTest, RegistersBothAreaTypes) {
    const AreaSchema* community_schema = validator_.getSchema(AreaType::COMMUNITY);
    const AreaSchema* country_schema = validator_.getSchema(AreaType::COUNTRY);
    ASSERT_NE(community_schema, nullptr);
    ASSERT_NE(country_schema, nullptr);

    EXPECT_EQ(community_schema->getRequiredKeys(),
              (std::vector<std::string>{"name", "population", "population:date"}));
    EXPECT_EQ(country_schema->getRequiredKeys(), (std::vector<std::string>{"name"}));
    ASSERT_NE(community_schema->getField("geo_json"), nullptr);
    EXPECT_EQ(community_schema->getField("geo_json")->kind, ValueKind::GEOMETRY);
}

TEST_F(SchemaValidatorTest, TownWithReversedPolygonIsNormalized) {
    TagMap tags = completeTags();
    tags["geo_json"] = reversedSquare();

    SchemaValidationResult result = validator_.validate(community(tags));
    ASSERT_TRUE(result.is_valid);
    EXPECT_TRUE(result.errors.empty());
    ASSERT_TRUE(result.record.has_value());

    const NormalizedRecord& record = *result.record;
    EXPECT_EQ(record.fields.at("population").get<int64_t>(), 1000);
    EXPECT_EQ(record.fields.at("name").get<std::string>(), "Town");
    ASSERT_EQ(record.fields.count("area_km2"), 1u);
    EXPECT_GT(record.fields.at("area_km2").get<double>(), 0.0);

    const json& ring = record.fields.at("geo_json")["coordinates"][0];
    EXPECT_EQ(ring[1], json::array({13.5, 52.0}));
}

TEST_F(SchemaValidatorTest, MissingPopulationIsTheOnlyError) {
    TagMap tags = completeTags();
    tags.erase("population");

    SchemaValidationResult result = validator_.validate(community(tags));
    EXPECT_FALSE(result.is_valid);
    EXPECT_FALSE(result.record.has_value());
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].field, "population");
    EXPECT_EQ(result.errors[0].kind, ErrorKind::MISSING);
}

TEST_F(SchemaValidatorTest, NullTagCountsAsMissing) {
    TagMap tags = completeTags();
    tags["population:date"] = nullptr;

    SchemaValidationResult result = validator_.validate(community(tags));
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].field, "population:date");
    EXPECT_EQ(result.errors[0].kind, ErrorKind::MISSING);
}

TEST_F(SchemaValidatorTest, LineStringGivesSingleGeometryError) {
    TagMap tags = completeTags();
    tags["geo_json"] = json{{"type", "LineString"},
                            {"coordinates", json::array({json::array({0, 0}), json::array({1, 1})})}};

    SchemaValidationResult result = validator_.validate(community(tags));
    EXPECT_FALSE(result.is_valid);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, ErrorKind::GEOMETRY_INVALID);
    EXPECT_EQ(result.errors[0].field, "geo_json");
}

TEST_F(SchemaValidatorTest, EveryFieldIsCheckedWithoutShortCircuit) {
    TagMap tags{{"name", "  "}, {"population", "-4"}, {"population:date", "2024-02-30"},
                {"contact:email", "nope"}, {"continent", "atlantis"}};

    SchemaValidationResult result = validator_.validate(community(tags));
    ASSERT_EQ(result.errors.size(), 5u);
    EXPECT_EQ(result.errors[0].field, "name");
    EXPECT_EQ(result.errors[1].kind, ErrorKind::OUT_OF_RANGE);
    EXPECT_EQ(result.errors[2].kind, ErrorKind::FORMAT_INVALID);
    EXPECT_EQ(result.errors[3].kind, ErrorKind::NOT_ALLOWED);
    EXPECT_EQ(result.errors[4].field, "contact:email");
}

TEST_F(SchemaValidatorTest, UnknownTagsPassThroughUntouched) {
    TagMap tags = completeTags();
    tags["x-custom"] = json{{"nested", json::array({1, 2})}};
    tags["type"] = "community";

    SchemaValidationResult result = validator_.validate(community(tags));
    ASSERT_TRUE(result.is_valid);
    EXPECT_EQ(result.record->custom_tags.at("x-custom"), tags["x-custom"]);
    EXPECT_EQ(result.record->custom_tags.at("type"), "community");
    EXPECT_EQ(result.record->fields.count("x-custom"), 0u);
}

TEST_F(SchemaValidatorTest, DerivedAreaOverridesSuppliedArea) {
    TagMap tags = completeTags();
    tags["area_km2"] = "1.00";
    SchemaValidationResult without_geometry = validator_.validate(community(tags));
    ASSERT_TRUE(without_geometry.is_valid);
    EXPECT_DOUBLE_EQ(without_geometry.record->fields.at("area_km2").get<double>(), 1.0);

    tags["geo_json"] = reversedSquare().dump();
    SchemaValidationResult with_geometry = validator_.validate(community(tags));
    ASSERT_TRUE(with_geometry.is_valid);
    EXPECT_GT(with_geometry.record->fields.at("area_km2").get<double>(), 1000.0);
}

TEST_F(SchemaValidatorTest, BadSuppliedAreaOnlyWarnsWhenGeometryIsValid) {
    TagMap tags = completeTags();
    tags["area_km2"] = "abc";
    SchemaValidationResult without_geometry = validator_.validate(community(tags));
    EXPECT_FALSE(without_geometry.is_valid);
    ASSERT_EQ(without_geometry.errors.size(), 1u);
    EXPECT_EQ(without_geometry.errors[0].field, "area_km2");

    tags["geo_json"] = reversedSquare();
    SchemaValidationResult with_geometry = validator_.validate(community(tags));
    ASSERT_TRUE(with_geometry.is_valid);
    EXPECT_TRUE(with_geometry.errors.empty());
    EXPECT_GT(with_geometry.record->fields.at("area_km2").get<double>(), 1000.0);
    ASSERT_EQ(with_geometry.warnings.size(), 1u);
    EXPECT_EQ(with_geometry.warnings[0].field, "area_km2");
    EXPECT_FALSE(with_geometry.warnings[0].isError());
    EXPECT_THAT(with_geometry.warnings[0].message, testing::HasSubstr("derived from geo_json"));

    tags["area_km2"] = -5;
    with_geometry = validator_.validate(community(tags));
    EXPECT_TRUE(with_geometry.is_valid);
    ASSERT_EQ(with_geometry.warnings.size(), 1u);
    EXPECT_EQ(with_geometry.warnings[0].kind, ErrorKind::OUT_OF_RANGE);

    tags["geo_json"] = json{{"type", "LineString"}, {"coordinates", json::array()}};
    SchemaValidationResult bad_geometry = validator_.validate(community(tags));
    EXPECT_FALSE(bad_geometry.is_valid);
    EXPECT_EQ(bad_geometry.errors.size(), 2u);
}

TEST_F(SchemaValidatorTest, SelectValueTakesRegistryCasing) {
    TagMap tags = completeTags();
    tags["continent"] = "Europe";

    SchemaValidationResult result = validator_.validate(community(tags));
    ASSERT_TRUE(result.is_valid);
    EXPECT_EQ(result.record->fields.at("continent"), "europe");
}

TEST_F(SchemaValidatorTest, TimestampsAreCarriedOver) {
    AreaRecord record = community(completeTags());
    record.updated_at = parseTimestamp("2024-03-01T10:00:00Z");
    record.deleted_at = parseTimestamp("2024-04-01");

    SchemaValidationResult result = validator_.validate(record);
    ASSERT_TRUE(result.is_valid);
    EXPECT_EQ(result.record->updated_at, record.updated_at);
    EXPECT_TRUE(result.record->isDeleted());
}

TEST_F(SchemaValidatorTest, CountryNeedsOnlyName) {
    AreaRecord country;
    country.id = "de";
    country.type = AreaType::COUNTRY;
    country.tags = TagMap{{"name", "Germany"}};

    SchemaValidationResult result = validator_.validate(country);
    EXPECT_TRUE(result.is_valid);
}

TEST_F(SchemaValidatorTest, SchemaRejectsDuplicateAndSecondGeometryField) {
    AreaSchema schema(AreaType::COMMUNITY, "custom");
    schema.addField(SchemaUtils::createField("name", ValueKind::TEXT, true));
    schema.addField(SchemaUtils::createField("boundary", ValueKind::GEOMETRY));

    EXPECT_THROW(schema.addField(SchemaUtils::createField("name", ValueKind::TEXT)), std::invalid_argument);
    EXPECT_THROW(schema.addField(SchemaUtils::createField("shape", ValueKind::GEOMETRY)), std::invalid_argument);
    EXPECT_EQ(schema.getFields().size(), 2u);
}

TEST_F(SchemaValidatorTest, RegisteredSchemaReplacesDefault) {
    auto schema = std::make_unique<AreaSchema>(AreaType::COUNTRY, "strict-country");
    schema->addField(SchemaUtils::createField("name", ValueKind::TEXT, true));
    schema->addField(SchemaUtils::createField("capital", ValueKind::TEXT, true));
    validator_.registerSchema(std::move(schema));

    AreaRecord country;
    country.id = "fr";
    country.type = AreaType::COUNTRY;
    country.tags = TagMap{{"name", "France"}};

    SchemaValidationResult result = validator_.validate(country);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].field, "capital");

    EXPECT_THROW(validator_.registerSchema(nullptr), std::invalid_argument);
}

TEST_F(SchemaValidatorTest, DescribeListsFields) {
    const std::string doc = validator_.describe(AreaType::COMMUNITY);
    EXPECT_THAT(doc, testing::HasSubstr("=== Schema Documentation ==="));
    EXPECT_THAT(doc, testing::HasSubstr("Field: population"));
    EXPECT_THAT(doc, testing::HasSubstr("Kind: integer"));
    EXPECT_THAT(doc, testing::HasSubstr("north-america"));
}

// EN: Main test runner
// FR: Lanceur de test principal
int main(int argc, char** argv) {
    ARL::Logger::getInstance().setLogLevel(ARL::LogLevel::ERROR);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
