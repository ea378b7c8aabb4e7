#include <gtest/gtest.h>

#include <utf8.h>

#include "ragkit_core/text/text_chunker.hpp"

namespace ragkit_core {

TEST(TextChunkerTest, Constructor_RejectsInvalidSizes) {
  EXPECT_THROW(TextChunker(0, 0), std::invalid_argument);
  EXPECT_THROW(TextChunker(100, 100), std::invalid_argument);
  EXPECT_THROW(TextChunker(100, 150), std::invalid_argument);
  EXPECT_NO_THROW(TextChunker(100, 99));
}

TEST(TextChunkerTest, Chunk_BlankTextYieldsNothing) {
  TextChunker chunker(100, 20);
  EXPECT_TRUE(chunker.chunk("").empty());
  EXPECT_TRUE(chunker.chunk(" \n\n\t  \n").empty());
}

TEST(TextChunkerTest, Chunk_RejectsInvalidUtf8) {
  TextChunker chunker(100, 20);
  EXPECT_THROW(chunker.chunk("valid then \xc3\x28 broken"), std::invalid_argument);
}

TEST(TextChunkerTest, Chunk_MergesShortParagraphs) {
  TextChunker chunker(100, 20);

  auto chunks = chunker.chunk("Short para.\n\nAnother short one.");

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].chunk_index, 0);
  EXPECT_EQ(chunks[0].content, "Short para.\n\nAnother short one.");
}

TEST(TextChunkerTest, Chunk_KeepsLargeParagraphsSeparate) {
  TextChunker chunker(100, 20);
  const std::string first(50, 'A');
  const std::string second(50, 'B');

  auto chunks = chunker.chunk(first + "\n\n" + second);

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].content.substr(0, 50), first);
  EXPECT_EQ(chunks[1].content, second);
  EXPECT_EQ(chunks[1].chunk_index, 1);
}

TEST(TextChunkerTest, Chunk_SplitsLongSectionIntoOverlappingWindows) {
  TextChunker chunker(100, 20);
  std::string text;
  for (int i = 0; i < 250; ++i) {
    text.push_back(static_cast<char>('a' + i % 26));
  }

  auto chunks = chunker.chunk(text);

  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0].content, text.substr(0, 100));
  EXPECT_EQ(chunks[1].content, text.substr(80, 100));
  EXPECT_EQ(chunks[2].content, text.substr(160));
  for (size_t i = 0; i < chunks.size(); ++i) {
    EXPECT_EQ(chunks[i].chunk_index, static_cast<int>(i));
  }
}

TEST(TextChunkerTest, SplitIntoWindows_NeverSplitsCodePoints) {
  TextChunker chunker(11, 2);
  std::string text;
  for (int i = 0; i < 20; ++i) {
    text += "\xc3\xa9";  // é
  }

  auto windows = chunker.split_into_windows(text);

  ASSERT_FALSE(windows.empty());
  for (const auto &window : windows) {
    EXPECT_TRUE(utf8::is_valid(window.begin(), window.end()));
    EXPECT_LE(window.size(), 11u);
    EXPECT_FALSE(window.empty());
  }
  EXPECT_EQ(windows.back().substr(windows.back().size() - 2), "\xc3\xa9");
}

TEST(TextChunkerTest, Chunk_IndicesAreConsecutive) {
  TextChunker chunker(40, 10);
  std::string text;
  for (int i = 0; i < 6; ++i) {
    text += "Paragraph number " + std::to_string(i) + " has some words in it.\n\n";
  }

  auto chunks = chunker.chunk(text);

  ASSERT_GE(chunks.size(), 6u);
  for (size_t i = 0; i < chunks.size(); ++i) {
    EXPECT_EQ(chunks[i].chunk_index, static_cast<int>(i));
    EXPECT_FALSE(chunks[i].content.empty());
  }
}

TEST(TextChunkerTest, Chunk_KeepsShortTrailingParagraph) {
  TextChunker chunker(100, 20);

  auto chunks = chunker.chunk("Hi.\n\n");

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].content, "Hi.\n\n");
}

TEST(TextChunkerTest, Chunk_HandlesLongWhitespaceRunBetweenParagraphs) {
  TextChunker chunker(100, 20);
  const std::string text = "intro\n" + std::string(100000, ' ') + "\nbody";

  auto chunks = chunker.chunk(text);

  ASSERT_GE(chunks.size(), 2u);
  EXPECT_EQ(chunks.front().content.rfind("intro", 0), 0u);
  EXPECT_EQ(chunks.back().content, "body");
}

TEST(TextChunkerTest, Chunk_WhitespaceOnlyLinesSeparateParagraphs) {
  TextChunker chunker(40, 10);
  const std::string first(30, 'a');
  const std::string second(30, 'b');

  auto chunks = chunker.chunk(first + "\n \t\n\n" + second);

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].content, first + "\n \t\n\n");
  EXPECT_EQ(chunks[1].content, second);
}

}  // namespace ragkit_core
