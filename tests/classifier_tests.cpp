#include "TestHarness.hpp"

#include "AccessErrors.hpp"
#include "core/CellClassifier.hpp"

using namespace popaccess;

static void TestSignPolicy() {
    SignClassifier classifier;
    EXPECT_TRUE(classifier.policy() == ClassificationPolicy::SIGN);

    auto urban = classifier.classify(100.0);
    ASSERT_TRUE(urban.has_value());
    EXPECT_TRUE(urban->urban_class == UrbanClass::URBAN);
    EXPECT_EQ(urban->population, 100.0);

    auto rural = classifier.classify(-50.0);
    ASSERT_TRUE(rural.has_value());
    EXPECT_TRUE(rural->urban_class == UrbanClass::RURAL);
    EXPECT_EQ(rural->population, 50.0);

    EXPECT_FALSE(classifier.classify(0.0).has_value());
    EXPECT_FALSE(classifier.rejects(-50.0));
}

static void TestThresholdPolicy() {
    ThresholdClassifier classifier(300.0);
    EXPECT_TRUE(classifier.policy() == ClassificationPolicy::THRESHOLD);

    auto at_threshold = classifier.classify(300.0);
    ASSERT_TRUE(at_threshold.has_value());
    EXPECT_TRUE(at_threshold->urban_class == UrbanClass::URBAN);

    auto below = classifier.classify(299.5);
    ASSERT_TRUE(below.has_value());
    EXPECT_TRUE(below->urban_class == UrbanClass::RURAL);
    EXPECT_EQ(below->population, 299.5);

    EXPECT_FALSE(classifier.classify(0.0).has_value());
    EXPECT_TRUE(classifier.rejects(-3.0));
    EXPECT_FALSE(classifier.rejects(0.0));

    EXPECT_THROW(ThresholdClassifier(0.0), ConfigurationError);
    EXPECT_THROW(ThresholdClassifier(-10.0), ConfigurationError);
}

static void TestMakeClassifier() {
    AnalysisConfig config;
    auto default_classifier = make_classifier(config);
    EXPECT_TRUE(default_classifier->policy() == ClassificationPolicy::THRESHOLD);
    const auto* threshold = dynamic_cast<const ThresholdClassifier*>(default_classifier.get());
    ASSERT_TRUE(threshold != nullptr);
    EXPECT_EQ(threshold->threshold(), kDefaultUrbanThreshold);

    config.density_threshold = 1500.0;
    auto custom = make_classifier(config);
    EXPECT_EQ(dynamic_cast<const ThresholdClassifier&>(*custom).threshold(), 1500.0);

    // Mixing the policies is a configuration error
    config.classification_policy = ClassificationPolicy::SIGN;
    EXPECT_THROW(make_classifier(config), ConfigurationError);

    config.density_threshold.reset();
    EXPECT_TRUE(make_classifier(config)->policy() == ClassificationPolicy::SIGN);
}

static void TestBandsClosedUpperEnd() {
    DistanceBands bands;
    EXPECT_EQ(bands.band_count(), static_cast<size_t>(8));

    EXPECT_EQ(bands.band_of(0.0), static_cast<size_t>(0));
    EXPECT_EQ(bands.band_of(1.0), static_cast<size_t>(0));
    EXPECT_EQ(bands.band_of(1.0000001), static_cast<size_t>(1));
    EXPECT_EQ(bands.band_of(2.0), static_cast<size_t>(1));
    EXPECT_EQ(bands.band_of(100.0), static_cast<size_t>(6));
    EXPECT_EQ(bands.band_of(100.5), static_cast<size_t>(7));

    EXPECT_EQ(bands.label(0), std::string("0-1km"));
    EXPECT_EQ(bands.label(2), std::string("2-5km"));
    EXPECT_EQ(bands.label(7), std::string(">100km"));
    EXPECT_EQ(bands.lower_km(3), 5.0);
    EXPECT_TRUE(bands.upper_km(3).has_value());
    EXPECT_FALSE(bands.upper_km(7).has_value());

    DistanceBands custom({0.5, 2.5});
    EXPECT_EQ(custom.labels().size(), static_cast<size_t>(3));
    EXPECT_EQ(custom.label(1), std::string("0.5-2.5km"));
}

static void TestBandValidation() {
    EXPECT_THROW(DistanceBands(std::vector<double>{}), ConfigurationError);
    EXPECT_THROW(DistanceBands(std::vector<double>{1.0, 1.0}), ConfigurationError);
    EXPECT_THROW(DistanceBands(std::vector<double>{5.0, 2.0}), ConfigurationError);
    EXPECT_THROW(DistanceBands(std::vector<double>{0.0, 2.0}), ConfigurationError);
}

int main() {
    TestSignPolicy();
    TestThresholdPolicy();
    TestMakeClassifier();
    TestBandsClosedUpperEnd();
    TestBandValidation();
    return ReportResult("popaccess_classifier_tests");
}
