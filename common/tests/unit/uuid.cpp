#include <lemu/common/uuid.hpp>

#include <set>

#include <gtest/gtest.h>

using namespace lemu::common;

TEST(UUID, GeneratedIdentifiers)
{
  UUID generator;

  std::set<std::string> ids;
  for (int i = 0; i < 100; ++i) {

    auto id = generator.generate_str();
    EXPECT_EQ(id.length(), 36);

    auto parsed = uuids::uuid::from_string(id);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(uuids::to_string(parsed.value()), id);

    ids.insert(id);
  }

  EXPECT_EQ(ids.size(), 100);
}
