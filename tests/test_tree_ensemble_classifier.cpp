#include "core/errors.hpp"
#include "serving/tree_ensemble_classifier.hpp"
#include "test_models.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <unistd.h>

using json = nlohmann::json;

TEST(TreeEnsembleClassifierTest, PredictsIrisClasses) {
  auto model = TreeEnsembleClassifier::from_json(iris_tree_document());
  EXPECT_EQ(model->feature_count(), 4u);
  EXPECT_EQ(model->tree_count(), 1u);
  EXPECT_STREQ(model->get_kind(), "tree-ensemble");

  EXPECT_EQ(model->predict({5.1, 3.5, 1.4, 0.2}), 0);
  EXPECT_EQ(model->predict({6.0, 2.9, 4.5, 1.5}), 1);
  EXPECT_EQ(model->predict({6.9, 3.1, 5.4, 2.1}), 2);
  // Splits send equal values left
  EXPECT_EQ(model->predict({5.0, 3.0, 2.45, 0.2}), 0);
}

TEST(TreeEnsembleClassifierTest, VotesAreSummedAcrossTrees) {
  json doc = {{"n_features", 1},
              {"classes", {10, 20}},
              {"trees",
               {{{"nodes", {{{"value", {0.6, 0.4}}}}}},
                {{"nodes", {{{"value", {0.0, 1.0}}}}}}}}};
  auto model = TreeEnsembleClassifier::from_json(doc);
  EXPECT_EQ(model->predict({0.0}), 20);
}

TEST(TreeEnsembleClassifierTest, TiesGoToFirstClass) {
  json doc = {{"n_features", 1},
              {"classes", {3, 4}},
              {"trees", {{{"nodes", {{{"value", {0.5, 0.5}}}}}}}}};
  EXPECT_EQ(TreeEnsembleClassifier::from_json(doc)->predict({1.0}), 3);
}

TEST(TreeEnsembleClassifierTest, WrongArityIsRejected) {
  auto model = TreeEnsembleClassifier::from_json(iris_tree_document());
  EXPECT_THROW(model->predict({1.0, 2.0}), std::invalid_argument);
}

TEST(TreeEnsembleClassifierTest, MalformedDocumentsFailToLoad) {
  json bad_feature = iris_tree_document();
  bad_feature["trees"][0]["nodes"][0]["feature"] = 9;
  EXPECT_THROW(TreeEnsembleClassifier::from_json(bad_feature), ModelLoadError);

  json bad_leaf = iris_tree_document();
  bad_leaf["trees"][0]["nodes"][1]["value"] = json::array({1.0});
  EXPECT_THROW(TreeEnsembleClassifier::from_json(bad_leaf), ModelLoadError);

  json cycle = iris_tree_document();
  cycle["trees"][0]["nodes"][2]["left"] = 0;
  EXPECT_THROW(TreeEnsembleClassifier::from_json(cycle), ModelLoadError);

  json dangling = iris_tree_document();
  dangling["trees"][0]["nodes"][0]["right"] = 42;
  EXPECT_THROW(TreeEnsembleClassifier::from_json(dangling), ModelLoadError);

  EXPECT_THROW(TreeEnsembleClassifier::from_json(json::object()), ModelLoadError);

  json no_trees = iris_tree_document();
  no_trees["trees"] = json::array();
  EXPECT_THROW(TreeEnsembleClassifier::from_json(no_trees), ModelLoadError);
}

TEST(TreeEnsembleClassifierTest, LoadsFromFile) {
  auto path = std::filesystem::temp_directory_path() /
              ("tree_ensemble_" + std::to_string(::getpid()) + ".json");
  write_document(path.string(), iris_tree_document());
  auto model = TreeEnsembleClassifier::from_file(path.string());
  EXPECT_EQ(model->predict({6.9, 3.1, 5.4, 2.1}), 2);
  std::filesystem::remove(path);

  EXPECT_THROW(TreeEnsembleClassifier::from_file(path.string()), ModelLoadError);
}
