#include "minitest.hpp"
#include "util/RingBuffer.hpp"
#include <string>

TEST(ring_buffer_fills_in_order) {
  sysgraph::util::RingBuffer<int, 4> rb;
  ASSERT_TRUE(rb.empty());
  rb.push(1); rb.push(2); rb.push(3);
  ASSERT_EQ(rb.size(), 3u);
  ASSERT_FALSE(rb.full());
  ASSERT_EQ(rb[0], 1);
  ASSERT_EQ(rb[2], 3);
  ASSERT_EQ(rb.front(), 1);
  ASSERT_EQ(rb.back(), 3);
}

TEST(ring_buffer_evicts_oldest_when_full) {
  sysgraph::util::RingBuffer<int, 3> rb;
  for (int i = 1; i <= 3; ++i) rb.push(i);
  ASSERT_TRUE(rb.full());
  rb.push(4);
  ASSERT_EQ(rb.size(), 3u);
  ASSERT_EQ(rb.front(), 2);
  ASSERT_EQ(rb.back(), 4);
}

TEST(ring_buffer_wraps_many_times) {
  sysgraph::util::RingBuffer<int, 5> rb;
  for (int i = 0; i < 103; ++i) rb.push(i);
  auto v = rb.to_vector();
  ASSERT_EQ(v.size(), 5u);
  for (int i = 0; i < 5; ++i) ASSERT_EQ(v[i], 98 + i);
}

TEST(ring_buffer_holds_strings) {
  sysgraph::util::RingBuffer<std::string, 2> rb;
  rb.push("a"); rb.push("b"); rb.push("c");
  auto v = rb.to_vector();
  ASSERT_EQ(v.size(), 2u);
  ASSERT_EQ(v[0], "b");
  ASSERT_EQ(v[1], "c");
  ASSERT_EQ(decltype(rb)::capacity(), 2u);
}

TEST(ring_buffer_single_element_is_front_and_back) {
  sysgraph::util::RingBuffer<int, 3> rb;
  ASSERT_TRUE(rb.empty());
  ASSERT_TRUE(rb.to_vector().empty());
  rb.push(7);
  ASSERT_FALSE(rb.empty());
  ASSERT_EQ(rb.front(), 7);
  ASSERT_EQ(rb.back(), 7);
}
