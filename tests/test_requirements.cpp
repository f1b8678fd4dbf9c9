/**
 * Unit tests for the requirements document and its JSON form
 */

#include "reconcile/requirements.h"
#include <gtest/gtest.h>

using namespace autoscale::reconcile;

class RequirementsDocumentTest : public ::testing::Test {
protected:
    RequirementsDocument document_{ProfileRequirement("web", 3, {"db"}),
                                   ProfileRequirement("db", 1)};
};

TEST_F(RequirementsDocumentTest, KeepsDeclarationOrder) {
    ASSERT_EQ(document_.size(), 2u);
    EXPECT_EQ(document_.profile_requirements()[0].profile, "web");
    EXPECT_EQ(document_.profile_requirements()[1].profile, "db");
}

TEST_F(RequirementsDocumentTest, AddOrReplaceKeepsProfilesUnique) {
    document_.add_or_replace(ProfileRequirement("web", 5));

    ASSERT_EQ(document_.size(), 2u);
    EXPECT_EQ(document_.profile_requirements()[0].minimum_instances, 5);
    EXPECT_TRUE(document_.profile_requirements()[0].dependent_profiles.empty());
}

TEST_F(RequirementsDocumentTest, FindAndRemove) {
    ASSERT_NE(document_.find("db"), nullptr);
    EXPECT_EQ(document_.find("queue"), nullptr);

    EXPECT_TRUE(document_.remove("db"));
    EXPECT_FALSE(document_.remove("db"));
    EXPECT_EQ(document_.find("db"), nullptr);
}

TEST_F(RequirementsDocumentTest, GetOrCreateAppendsEmptyRequirement) {
    auto &existing = document_.get_or_create_profile_requirement("db");
    EXPECT_EQ(existing.minimum_instances, 1);

    auto &created = document_.get_or_create_profile_requirement("queue");
    EXPECT_EQ(created.profile, "queue");
    EXPECT_FALSE(created.has_minimum());
    EXPECT_TRUE(created.dependent_profiles.empty());
    EXPECT_EQ(document_.size(), 3u);
    EXPECT_EQ(document_.profile_requirements().back().profile, "queue");
}

// ============================================================================
// JSON
// ============================================================================

TEST(RequirementsJsonTest, ParsesDocument) {
    auto parsed = parse_requirements(R"({
        "profileRequirements": [
            {"profile": "web", "minimumInstances": 3, "dependentProfiles": ["db"]},
            {"profile": "db", "minimumInstances": 1},
            {"profile": "cache"}
        ]
    })");

    ASSERT_TRUE(parsed.is_ok()) << parsed.error();
    const auto &document = parsed.value();
    ASSERT_EQ(document.size(), 3u);
    EXPECT_EQ(*document.find("web"), ProfileRequirement("web", 3, {"db"}));
    EXPECT_EQ(*document.find("db"), ProfileRequirement("db", 1));
    EXPECT_FALSE(document.find("cache")->has_minimum());
}

TEST(RequirementsJsonTest, NullMinimumMeansUnmanaged) {
    auto parsed = parse_requirements(
        R"({"profileRequirements": [{"profile": "web", "minimumInstances": null}]})");

    ASSERT_TRUE(parsed.is_ok());
    EXPECT_FALSE(parsed.value().find("web")->has_minimum());
}

TEST(RequirementsJsonTest, EmptyObjectIsEmptyDocument) {
    auto parsed = parse_requirements("{}");

    ASSERT_TRUE(parsed.is_ok());
    EXPECT_TRUE(parsed.value().empty());
}

TEST(RequirementsJsonTest, RejectsMalformedInput) {
    EXPECT_TRUE(parse_requirements("not json").is_err());
    EXPECT_TRUE(parse_requirements("[]").is_err());
    EXPECT_TRUE(parse_requirements(R"({"profileRequirements": {}})").is_err());
    EXPECT_TRUE(
        parse_requirements(R"({"profileRequirements": [{"minimumInstances": 1}]})")
            .is_err());
    EXPECT_TRUE(parse_requirements(
                    R"({"profileRequirements": [{"profile": "web", "minimumInstances": "3"}]})")
                    .is_err());
    EXPECT_TRUE(parse_requirements(
                    R"({"profileRequirements": [{"profile": "web", "dependentProfiles": [1]}]})")
                    .is_err());
}

TEST(RequirementsJsonTest, RejectsNegativeMinimum) {
    auto parsed = parse_requirements(
        R"({"profileRequirements": [{"profile": "web", "minimumInstances": -1}]})");

    ASSERT_TRUE(parsed.is_err());
    EXPECT_NE(parsed.error().find("must not be negative"), std::string::npos);
}

TEST(RequirementsJsonTest, RejectsMinimumBeyondIntRange) {
    auto parsed = parse_requirements(
        R"({"profileRequirements": [{"profile": "web", "minimumInstances": 4294967298}]})");
    ASSERT_TRUE(parsed.is_err());
    EXPECT_NE(parsed.error().find("out of range"), std::string::npos);

    auto largest = parse_requirements(
        R"({"profileRequirements": [{"profile": "web", "minimumInstances": 2147483647}]})");
    ASSERT_TRUE(largest.is_ok()) << largest.error();
    EXPECT_EQ(largest.value().find("web")->minimum_instances, 2147483647);

    EXPECT_TRUE(parse_requirements(
                    R"({"profileRequirements": [{"profile": "web", "minimumInstances": 2147483648}]})")
                    .is_err());
}

TEST(RequirementsJsonTest, RejectsDuplicateProfiles) {
    auto parsed = parse_requirements(R"({"profileRequirements": [
        {"profile": "web", "minimumInstances": 1},
        {"profile": "web", "minimumInstances": 2}
    ]})");

    ASSERT_TRUE(parsed.is_err());
    EXPECT_NE(parsed.error().find("duplicate"), std::string::npos);
}

TEST(RequirementsJsonTest, SerializesOnlyDeclaredFields) {
    RequirementsDocument document({ProfileRequirement("web", 2, {"db"}),
                                   ProfileRequirement("cache")});

    auto json = to_json(document);

    const auto &list = json.at("profileRequirements");
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].at("minimumInstances"), 2);
    EXPECT_EQ(list[0].at("dependentProfiles")[0], "db");
    EXPECT_FALSE(list[1].contains("minimumInstances"));
    EXPECT_FALSE(list[1].contains("dependentProfiles"));

    auto reparsed = requirements_from_json(json);
    ASSERT_TRUE(reparsed.is_ok());
    EXPECT_EQ(reparsed.value(), document);
}
