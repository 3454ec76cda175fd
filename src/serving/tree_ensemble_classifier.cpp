#include "serving/tree_ensemble_classifier.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace {

// Builds the subtree rooted at nodes[index]; `depth` guards against cycles
std::unique_ptr<TreeNode> build_node(const json &nodes, size_t index,
                                     size_t n_features, size_t n_classes,
                                     size_t depth) {
  if (index >= nodes.size())
    throw ModelLoadError("Tree node index " + std::to_string(index) +
                         " out of range");
  if (depth > nodes.size())
    throw ModelLoadError("Tree nodes form a cycle");

  const json &node_json = nodes[index];
  auto node = std::make_unique<TreeNode>();

  if (node_json.contains("value")) {
    node->is_leaf = true;
    node->class_values = node_json.at("value").get<std::vector<double>>();
    if (node->class_values.size() != n_classes)
      throw ModelLoadError("Leaf " + std::to_string(index) + " has " +
                           std::to_string(node->class_values.size()) +
                           " values for " + std::to_string(n_classes) +
                           " classes");
    return node;
  }

  node->feature_index = node_json.at("feature").get<int>();
  if (node->feature_index < 0 ||
      static_cast<size_t>(node->feature_index) >= n_features)
    throw ModelLoadError("Node " + std::to_string(index) +
                         " splits on unknown feature " +
                         std::to_string(node->feature_index));
  node->split_value = node_json.at("threshold").get<double>();
  node->left_child = build_node(nodes, node_json.at("left").get<size_t>(),
                                n_features, n_classes, depth + 1);
  node->right_child = build_node(nodes, node_json.at("right").get<size_t>(),
                                 n_features, n_classes, depth + 1);
  return node;
}

} // namespace

const std::vector<double> &
DecisionTree::predict(const std::vector<double> &features) const {
  const TreeNode *node = root_.get();
  while (!node->is_leaf) {
    if (features[node->feature_index] <= node->split_value)
      node = node->left_child.get();
    else
      node = node->right_child.get();
  }
  return node->class_values;
}

TreeEnsembleClassifier::TreeEnsembleClassifier(size_t n_features,
                                               std::vector<int> classes,
                                               std::vector<DecisionTree> trees)
    : n_features_(n_features), classes_(std::move(classes)),
      trees_(std::move(trees)) {}

std::unique_ptr<TreeEnsembleClassifier>
TreeEnsembleClassifier::from_json(const json &doc) {
  try {
    size_t n_features = doc.at("n_features").get<size_t>();
    std::vector<int> classes = doc.at("classes").get<std::vector<int>>();
    if (n_features == 0)
      throw ModelLoadError("n_features must be positive");
    if (classes.empty())
      throw ModelLoadError("classes must not be empty");

    std::vector<DecisionTree> trees;
    for (const auto &tree : doc.at("trees")) {
      const json &nodes = tree.at("nodes");
      if (!nodes.is_array() || nodes.empty())
        throw ModelLoadError("Tree without nodes");
      trees.emplace_back(build_node(nodes, 0, n_features, classes.size(), 0));
    }
    if (trees.empty())
      throw ModelLoadError("Ensemble has no trees");

    return std::unique_ptr<TreeEnsembleClassifier>(new TreeEnsembleClassifier(
        n_features, std::move(classes), std::move(trees)));
  } catch (const json::exception &e) {
    throw ModelLoadError(std::string("Malformed tree ensemble: ") + e.what());
  }
}

std::unique_ptr<TreeEnsembleClassifier>
TreeEnsembleClassifier::from_file(const std::string &path) {
  LOG(LogLevel::INFO, LogComponent::ML_LIFECYCLE,
      "Loading tree ensemble from: " << path);
  std::ifstream f(path);
  if (!f.is_open())
    throw ModelLoadError("Could not open model file: " + path);

  json doc;
  try {
    doc = json::parse(f);
  } catch (const json::exception &e) {
    throw ModelLoadError("Could not parse model file " + path + ": " +
                         e.what());
  }

  auto model = from_json(doc);
  LOG(LogLevel::DEBUG, LogComponent::ML_LIFECYCLE,
      "Tree ensemble with " << model->tree_count() << " trees over "
                            << model->feature_count() << " features loaded.");
  return model;
}

int TreeEnsembleClassifier::predict(const std::vector<double> &features) const {
  if (features.size() != n_features_)
    throw std::invalid_argument("Expected " + std::to_string(n_features_) +
                                " features, got " +
                                std::to_string(features.size()));

  std::vector<double> totals(classes_.size(), 0.0);
  for (const auto &tree : trees_) {
    const std::vector<double> &values = tree.predict(features);
    for (size_t i = 0; i < totals.size(); ++i)
      totals[i] += values[i];
  }

  size_t best = 0;
  for (size_t i = 1; i < totals.size(); ++i) {
    if (totals[i] > totals[best])
      best = i;
  }
  return classes_[best];
}
