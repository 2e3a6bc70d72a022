#include <stdexcept>
#include <string>
#include <vector>

#include "unity.h"
#include "helpers.h"
#include "file_digest.hpp"

void setUp(void) {}
void tearDown(void) {}

static std::vector<uint8_t> bytesOf(const std::string& text) {
  return std::vector<uint8_t>(text.begin(), text.end());
}

void test_md5_known_vectors(void) {
  TEST_ASSERT_EQUAL_STRING("d41d8cd98f00b204e9800998ecf8427e", md5_hex({}).c_str());
  TEST_ASSERT_EQUAL_STRING("900150983cd24fb0d6963f7d28e17f72", md5_hex(bytesOf("abc")).c_str());
}

void test_expect_md5_accepts_matching_buffer_in_any_case(void) {
  Reassembler::DigestCheck lower = expect_md5("900150983cd24fb0d6963f7d28e17f72");
  Reassembler::DigestCheck upper = expect_md5("900150983CD24FB0D6963F7D28E17F72");

  TEST_ASSERT_TRUE(lower(bytesOf("abc")));
  TEST_ASSERT_TRUE(upper(bytesOf("abc")));
  TEST_ASSERT_FALSE(lower(bytesOf("abd")));
}

void test_expect_md5_rejects_bad_hex(void) {
  const char* bad[] = {"", "900150983cd24fb0", "900150983cd24fb0d6963f7d28e17f7g",
                       "900150983cd24fb0d6963f7d28e17f7200"};

  for (const char* hex : bad) {
    bool threw = false;
    try {
      expect_md5(hex);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    TEST_ASSERT_TRUE_MESSAGE(threw, hex);
  }
}

void test_digest_check_through_reassembler(void) {
  std::vector<uint8_t> data = sampleData(450);

  ChunkStore store(SAMPLE_FILE_ID);
  store.put(0, std::vector<uint8_t>(data.begin(), data.begin() + 200));
  store.put(1, std::vector<uint8_t>(data.begin() + 200, data.begin() + 400));
  store.put(2, std::vector<uint8_t>(data.begin() + 400, data.end()));

  Reassembler good(expect_md5(md5_hex(data)));
  TEST_ASSERT_EQUAL(450, good.assemble(store, 3).size());

  Reassembler wrong(expect_md5(md5_hex(sampleData(450, 1))));
  bool threw = false;
  try {
    wrong.assemble(store, 3);
  } catch (const DigestMismatch&) {
    threw = true;
  }
  TEST_ASSERT_TRUE(threw);
}

int main(void) {
  UNITY_BEGIN();
  RUN_TEST(test_md5_known_vectors);
  RUN_TEST(test_expect_md5_accepts_matching_buffer_in_any_case);
  RUN_TEST(test_expect_md5_rejects_bad_hex);
  RUN_TEST(test_digest_check_through_reassembler);
  return UNITY_END();
}
