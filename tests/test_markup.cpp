#include <gtest/gtest.h>

#include "markup.hpp"

using Segments = std::vector<std::string>;

TEST(MarkupTest, SplitsLeftAndRight) {
    AlignedSegments segments = parse_markup("^lhello^rworld");

    EXPECT_EQ(segments.left, Segments({ "hello" }));
    EXPECT_TRUE(segments.center.empty());
    EXPECT_EQ(segments.right, Segments({ "world" }));
}

TEST(MarkupTest, EmptyLinesProduceNothing) {
    EXPECT_TRUE(parse_markup("").empty());
    EXPECT_TRUE(parse_markup("^").empty());
    EXPECT_TRUE(parse_markup("^^^").empty());
}

TEST(MarkupTest, UnknownTagsAreDropped) {
    AlignedSegments segments = parse_markup("^xignored^lkept");

    EXPECT_EQ(segments.left, Segments({ "kept" }));
    EXPECT_TRUE(segments.center.empty());
    EXPECT_TRUE(segments.right.empty());
}

TEST(MarkupTest, KeepsInputOrderWithinAnAlignment) {
    AlignedSegments segments = parse_markup("^lone^rA^ltwo^cmid^rB^lthree");

    EXPECT_EQ(segments.left, Segments({ "one", "two", "three" }));
    EXPECT_EQ(segments.center, Segments({ "mid" }));
    EXPECT_EQ(segments.right, Segments({ "A", "B" }));
}

TEST(MarkupTest, ExampleStatusLine) {
    AlignedSegments segments = parse_markup("^lclock: 10:32^ccpu: 12%^rbattery: 91%");

    EXPECT_EQ(segments.left, Segments({ "clock: 10:32" }));
    EXPECT_EQ(segments.center, Segments({ "cpu: 12%" }));
    EXPECT_EQ(segments.right, Segments({ "battery: 91%" }));
}

TEST(MarkupTest, PangoMarkupIsPassedThrough) {
    AlignedSegments segments = parse_markup("^c<span foreground=\"#ff0000\">alert</span> <b>now</b>");

    EXPECT_EQ(segments.center, Segments({ "<span foreground=\"#ff0000\">alert</span> <b>now</b>" }));
}

TEST(MarkupTest, TagWithoutBodyGivesEmptySegment) {
    AlignedSegments segments = parse_markup("^l^rtext");

    EXPECT_EQ(segments.left, Segments({ "" }));
    EXPECT_EQ(segments.right, Segments({ "text" }));
}

TEST(MarkupTest, TagsAreCaseSensitive) {
    EXPECT_TRUE(parse_markup("^Lupper^Ccase^Rtags").empty());
}

TEST(MarkupTest, TextBeforeTheFirstDelimiterIsAField) {
    AlignedSegments segments = parse_markup("rstart^lnext");

    EXPECT_EQ(segments.right, Segments({ "start" }));
    EXPECT_EQ(segments.left, Segments({ "next" }));
}

TEST(MarkupTest, IndexingByAlignment) {
    AlignedSegments segments = parse_markup("^la^cb^rc");

    EXPECT_EQ(&segments[Alignment::LEFT], &segments.left);
    EXPECT_EQ(&segments[Alignment::CENTER], &segments.center);
    EXPECT_EQ(&segments[Alignment::RIGHT], &segments.right);
    EXPECT_STREQ(alignment_name(Alignment::CENTER), "center");
}
