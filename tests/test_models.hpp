#ifndef TEST_MODELS_HPP
#define TEST_MODELS_HPP

#include <fstream>
#include <nlohmann/json.hpp>
#include <string>

// Model documents shared by the serving tests

// Classic iris split: petal length, then petal width
inline nlohmann::json iris_tree_document() {
  return {{"n_features", 4},
          {"classes", {0, 1, 2}},
          {"trees",
           {{{"nodes",
              {{{"feature", 2}, {"threshold", 2.45}, {"left", 1}, {"right", 2}},
               {{"value", {1.0, 0.0, 0.0}}},
               {{"feature", 3}, {"threshold", 1.75}, {"left", 3}, {"right", 4}},
               {{"value", {0.0, 0.9, 0.1}}},
               {{"value", {0.0, 0.1, 0.9}}}}}}}}};
}

// Always answers `label`; lets tests tell versions apart
inline nlohmann::json constant_document(int label) {
  return {{"n_features", 4},
          {"classes", {label}},
          {"trees", {{{"nodes", {{{"value", {1.0}}}}}}}}};
}

inline void write_document(const std::string &path, const nlohmann::json &doc) {
  std::ofstream out(path);
  out << doc.dump();
}

#endif // TEST_MODELS_HPP
