#include "label_list.h"

#include <fstream>
#include <iostream>

#include "config.h"
#include "errors.h"

LabelList LabelList::load(const std::string& path) {
  std::ifstream f(path);
  if (!f.is_open()) {
    throw ConfigError("cannot open label list: " + path);
  }

  std::vector<std::string> lines;
  std::string line;
  while (std::getline(f, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(line);
  }
  if (f.bad()) {
    throw ConfigError("error reading label list: " + path);
  }
  if (lines.empty()) {
    throw ConfigError("label list is empty: " + path);
  }

  std::cout << "[Config] Loaded " << lines.size() << " labels from " << path << "\n";
  return LabelList(std::move(lines));
}

const std::string& LabelList::at(int index) const {
  static const std::string kUnknown = Config::unknown_label;
  if (index < 0 || static_cast<std::size_t>(index) >= labels_.size()) return kUnknown;
  return labels_[static_cast<std::size_t>(index)];
}
