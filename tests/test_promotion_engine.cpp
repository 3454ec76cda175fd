#include "core/errors.hpp"
#include "promotion/promotion_engine.hpp"
#include "registry/in_memory_registry.hpp"

#include <gtest/gtest.h>
#include <memory>

namespace {

RegistrationRequest candidate(double accuracy) {
  RegistrationRequest request;
  request.artifact_uri = "/models/candidate.json";
  request.metric = accuracy;
  return request;
}

// Registry whose alias writes fail after registration went through
class AliasOutageRegistry : public InMemoryRegistry {
public:
  void set_alias(const std::string &, Alias, uint64_t) override {
    throw RegistryUnavailableError("alias endpoint down");
  }
};

size_t production_count(IRegistryClient &registry, const std::string &model) {
  size_t count = 0;
  for (const auto &v : registry.list_versions(model))
    if (v.alias == Alias::PRODUCTION)
      ++count;
  return count;
}

} // namespace

class PromotionEngineTest : public ::testing::Test {
protected:
  std::shared_ptr<InMemoryRegistry> registry =
      std::make_shared<InMemoryRegistry>();
  PromotionEngine engine{registry, "accuracy"};
};

TEST_F(PromotionEngineTest, StrictComparison) {
  EXPECT_TRUE(PromotionEngine::should_promote(0.91, 0.90));
  EXPECT_FALSE(PromotionEngine::should_promote(0.90, 0.90));
  EXPECT_FALSE(PromotionEngine::should_promote(0.89, 0.90));
  // Without production the baseline is 0.0, so any positive metric wins
  EXPECT_TRUE(PromotionEngine::should_promote(0.01, 0.0));
  EXPECT_FALSE(PromotionEngine::should_promote(0.0, 0.0));
}

TEST_F(PromotionEngineTest, FirstModelBecomesProduction) {
  EXPECT_DOUBLE_EQ(engine.current_production_metric("iris"), 0.0);

  auto outcome = engine.register_and_decide("iris", candidate(0.93));
  EXPECT_TRUE(outcome.promoted);
  EXPECT_EQ(outcome.alias, Alias::PRODUCTION);
  EXPECT_EQ(outcome.version, 1u);
  EXPECT_DOUBLE_EQ(outcome.baseline, 0.0);

  auto production = registry->get_version_by_alias("iris", Alias::PRODUCTION);
  ASSERT_TRUE(production.has_value());
  EXPECT_EQ(production->version, 1u);
  EXPECT_EQ(production->description, "Accuracy: 0.9300");
}

TEST_F(PromotionEngineTest, BetterModelReplacesProduction) {
  engine.register_and_decide("iris", candidate(0.90));
  auto outcome = engine.register_and_decide("iris", candidate(0.95));

  EXPECT_TRUE(outcome.promoted);
  EXPECT_DOUBLE_EQ(outcome.baseline, 0.90);
  EXPECT_EQ(registry->get_version_by_alias("iris", Alias::PRODUCTION)->version, 2u);
  EXPECT_EQ(production_count(*registry, "iris"), 1u);
}

TEST_F(PromotionEngineTest, EqualOrWorseModelBecomesChallenger) {
  engine.register_and_decide("iris", candidate(0.90));

  auto equal = engine.register_and_decide("iris", candidate(0.90));
  EXPECT_FALSE(equal.promoted);
  EXPECT_EQ(equal.alias, Alias::CHALLENGER);

  auto worse = engine.register_and_decide("iris", candidate(0.80));
  EXPECT_FALSE(worse.promoted);

  // Production untouched; the challenger alias moved to the newest loser
  EXPECT_EQ(registry->get_version_by_alias("iris", Alias::PRODUCTION)->version, 1u);
  EXPECT_EQ(registry->get_version_by_alias("iris", Alias::CHALLENGER)->version, 3u);
  auto versions = registry->list_versions("iris");
  EXPECT_EQ(versions[1].alias, Alias::NONE);
}

TEST_F(PromotionEngineTest, BaselineReadFromProductionRun) {
  RegistrationRequest first = candidate(0.5);
  first.run_id = "train-1";
  engine.register_and_decide("iris", first);

  // A later run metric update is what counts
  RegistrationRequest rerun = candidate(0.97);
  rerun.run_id = "train-1";
  registry->register_version("iris", rerun);

  EXPECT_DOUBLE_EQ(engine.current_production_metric("iris"), 0.97);
  EXPECT_FALSE(engine.register_and_decide("iris", candidate(0.96)).promoted);
}

TEST_F(PromotionEngineTest, ExplicitDescriptionIsKept) {
  RegistrationRequest request = candidate(0.8);
  request.description = "nightly";
  auto outcome = engine.register_and_decide("iris", request);
  EXPECT_EQ(registry->list_versions("iris")[outcome.version - 1].description,
            "nightly");
}

TEST(PromotionEngineFailureTest, FailedAliasStepLeavesVersionUnaliased) {
  auto registry = std::make_shared<AliasOutageRegistry>();
  PromotionEngine engine(registry, "accuracy");

  EXPECT_THROW(engine.register_and_decide("iris", candidate(0.9)),
               RegistryUnavailableError);

  auto versions = registry->list_versions("iris");
  ASSERT_EQ(versions.size(), 1u);
  EXPECT_EQ(versions[0].alias, Alias::NONE);
  EXPECT_FALSE(registry->get_version_by_alias("iris", Alias::PRODUCTION));
}

TEST(PromotionEngineFailureTest, RequiresRegistry) {
  EXPECT_THROW(PromotionEngine(nullptr, "accuracy"), std::invalid_argument);
}
