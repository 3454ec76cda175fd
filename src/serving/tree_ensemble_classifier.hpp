#ifndef TREE_ENSEMBLE_CLASSIFIER_HPP
#define TREE_ENSEMBLE_CLASSIFIER_HPP

#include "serving/classifier_model.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct TreeNode {
  int feature_index = -1;   // Which feature from the vector to check
  double split_value = 0.0; // Go left when feature <= split_value
  std::unique_ptr<TreeNode> left_child;
  std::unique_ptr<TreeNode> right_child;

  bool is_leaf = false;
  std::vector<double> class_values; // One entry per class, leaves only
};

class DecisionTree {
public:
  explicit DecisionTree(std::unique_ptr<TreeNode> root)
      : root_(std::move(root)) {}

  const std::vector<double> &predict(const std::vector<double> &features) const;

private:
  std::unique_ptr<TreeNode> root_;
};

// Random-forest style ensemble read from a JSON document:
//
//   {"n_features": 4, "classes": [0, 1, 2],
//    "trees": [{"nodes": [{"feature": 2, "threshold": 2.45,
//                          "left": 1, "right": 2},
//                         {"value": [1.0, 0.0, 0.0]}, ...]}]}
//
// Node 0 is the root of each tree. The class with the highest summed leaf
// value wins; ties go to the class listed first.
class TreeEnsembleClassifier : public IClassifierModel {
public:
  // Throws ModelLoadError on unreadable or malformed documents
  static std::unique_ptr<TreeEnsembleClassifier>
  from_file(const std::string &path);
  static std::unique_ptr<TreeEnsembleClassifier>
  from_json(const nlohmann::json &doc);

  int predict(const std::vector<double> &features) const override;
  size_t feature_count() const override { return n_features_; }
  const char *get_kind() const override { return "tree-ensemble"; }

  size_t tree_count() const { return trees_.size(); }

private:
  TreeEnsembleClassifier(size_t n_features, std::vector<int> classes,
                         std::vector<DecisionTree> trees);

  size_t n_features_;
  std::vector<int> classes_;
  std::vector<DecisionTree> trees_;
};

#endif // TREE_ENSEMBLE_CLASSIFIER_HPP
