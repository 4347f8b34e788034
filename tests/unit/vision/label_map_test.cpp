#include <vinfer/vision/label_map.hpp>
#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <fstream>

namespace vv = vinfer::vision;

TEST(LabelMap, UnknownIdRendersAsNumber) {
  vv::LabelMap labels(std::vector<std::string>{"cat", "dog"});
  EXPECT_EQ(labels.label_for(0), "cat");
  EXPECT_EQ(labels.label_for(1), "dog");
  EXPECT_EQ(labels.label_for(7), "7");
  EXPECT_EQ(vv::LabelMap{}.label_for(-1), "-1");
}

TEST(LabelMap, ParsesExporterNamesMetadata) {
  auto labels = vv::LabelMap::parse_names_metadata("{0: 'person', 1: \"bi cycle\", 5: 'it\\'s'}");
  ASSERT_TRUE(labels.has_value());
  EXPECT_EQ(labels->size(), 3u);
  EXPECT_EQ(labels->label_for(0), "person");
  EXPECT_EQ(labels->label_for(1), "bi cycle");
  EXPECT_EQ(labels->label_for(5), "it's");
  EXPECT_EQ(labels->label_for(2), "2");
}

TEST(LabelMap, RejectsMalformedMetadata) {
  EXPECT_FALSE(vv::LabelMap::parse_names_metadata("").has_value());
  EXPECT_FALSE(vv::LabelMap::parse_names_metadata("[0, 1]").has_value());
  EXPECT_FALSE(vv::LabelMap::parse_names_metadata("{0: cat}").has_value());
  EXPECT_FALSE(vv::LabelMap::parse_names_metadata("{0: 'cat'").has_value());
  EXPECT_TRUE(vv::LabelMap::parse_names_metadata("{}").has_value());
}

TEST(LabelMap, LoadsOneLabelPerLine) {
  const auto path = std::filesystem::temp_directory_path() / "vinfer_labels_test.txt";
  {
    std::ofstream f(path);
    f << "background\r\nwidget\n\n";
  }
  auto labels = vv::LabelMap::load_file(path.string());
  std::filesystem::remove(path);
  ASSERT_TRUE(labels.has_value());
  EXPECT_EQ(labels->size(), 2u);
  EXPECT_EQ(labels->label_for(1), "widget");
  EXPECT_FALSE(vv::LabelMap::load_file("/nonexistent/vinfer/labels.txt").has_value());
}
