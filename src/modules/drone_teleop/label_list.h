#pragma once
#include <string>
#include <vector>

// Ordered class names, indexed by classifier output position.
class LabelList {
 public:
  LabelList() = default;
  explicit LabelList(std::vector<std::string> labels) : labels_(std::move(labels)) {}

  // Newline-delimited file, one label per line. Throws ConfigError when the
  // file cannot be read or holds no labels.
  static LabelList load(const std::string& path);

  // Out-of-range (or negative) index yields the "Unknown" sentinel.
  const std::string& at(int index) const;

  std::size_t size() const { return labels_.size(); }
  bool empty() const { return labels_.empty(); }

 private:
  std::vector<std::string> labels_;
};
